// src/JvmVendor.cpp
#include <JvmProbe/JvmVendor.hpp>

#include <algorithm>
#include <cctype>
#include <regex>

namespace JvmProbe {

namespace {
    std::optional<std::filesystem::path> noClassesJar(const std::filesystem::path&) {
        return std::nullopt;
    }

    // Apple JDK 6: <framework>/Versions/1.6/Home with the classes in ../Classes/classes.jar
    std::optional<std::filesystem::path> appleClassesJar(const std::filesystem::path& javaHome) {
        std::filesystem::path jar = javaHome.parent_path() / "Classes" / "classes.jar";
        std::error_code ec;
        if (std::filesystem::is_regular_file(jar, ec)) {
            return jar;
        }
        return std::nullopt;
    }

    bool inheritAll(const std::string&) {
        return true;
    }

    // The Apple launcher injects these for the running process only
    bool appleInherits(const std::string& variable) {
        static const std::regex s_launcherVariables(R"((APP_NAME|JAVA_MAIN_CLASS)_\d+)");
        return !std::regex_match(variable, s_launcherVariables);
    }

    const VendorBehavior s_behaviors[] = {
        {JvmVendor::GENERIC, false, &noClassesJar, &inheritAll},
        {JvmVendor::APPLE, false, &appleClassesJar, &appleInherits},
        {JvmVendor::IBM, true, &noClassesJar, &inheritAll},
    };
}

std::string to_string(JvmVendor vendor) {
    switch (vendor) {
        case JvmVendor::GENERIC: return "generic";
        case JvmVendor::APPLE: return "apple";
        case JvmVendor::IBM: return "ibm";
    }
    return "generic";
}

JvmVendor vendorFromString(const std::string& vendorString) {
    std::string lower = vendorString;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower.find("apple") != std::string::npos) {
        return JvmVendor::APPLE;
    }
    if (lower.find("ibm") != std::string::npos) {
        return JvmVendor::IBM;
    }
    return JvmVendor::GENERIC;
}

const VendorBehavior& vendorBehavior(JvmVendor vendor) {
    for (const auto& behavior : s_behaviors) {
        if (behavior.vendor == vendor) {
            return behavior;
        }
    }
    return s_behaviors[0];
}

} // namespace JvmProbe
