// src/SystemProperties.cpp
#include <JvmProbe/SystemProperties.hpp>
#include <JvmProbe/Errors.hpp>
#include <JvmProbe/InstallationClassifier.hpp>
#include <JvmProbe/Utils/Logger.hpp>

#include <cstdlib>
#include <fstream>

namespace JvmProbe {

namespace {
    std::optional<std::string> fromEnv(const char* name) {
        const char* value = std::getenv(name);
        if (value == nullptr || *value == '\0') {
            return std::nullopt;
        }
        return std::string(value);
    }

    std::string trim(const std::string& s) {
        const auto first = s.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) {
            return "";
        }
        const auto last = s.find_last_not_of(" \t\r\n");
        return s.substr(first, last - first + 1);
    }

    // Home of the java executable found on the PATH, following /usr/bin/java style symlinks
    std::optional<std::filesystem::path> homeFromPath(const Utils::OperatingSystem& os) {
        auto javaExe = os.findInPath(os.executableName("java"));
        if (!javaExe) {
            return std::nullopt;
        }
        std::error_code ec;
        std::filesystem::path resolved = std::filesystem::canonical(*javaExe, ec);
        if (ec) {
            resolved = *javaExe;
        }
        if (resolved.parent_path().filename() != "bin") {
            return std::nullopt;
        }
        return resolved.parent_path().parent_path();
    }
}

std::map<std::string, std::string> SystemProperties::parseReleaseFile(const std::filesystem::path& file) {
    static auto s_logger = Utils::Logger::GetOrCreateLogger("SystemProperties");
    std::map<std::string, std::string> values;
    std::ifstream in(file);
    if (!in) {
        return values;
    }
    std::string line;
    size_t lineNumber = 0;
    while (std::getline(in, line)) {
        ++lineNumber;
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        const auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) {
            s_logger->warn("Skipping malformed line {} in {}: {}", lineNumber, file.string(), line);
            continue;
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
        values[key] = value;
    }
    return values;
}

SystemProperties SystemProperties::detect(const Config& config, const Utils::OperatingSystem& os) {
    static auto s_logger = Utils::Logger::GetOrCreateLogger("SystemProperties");
    SystemProperties props;

    std::optional<std::filesystem::path> home = config.javaHome;
    if (!home) {
        if (auto env = fromEnv("JAVA_HOME")) {
            home = std::filesystem::path(*env);
            s_logger->trace("Using JAVA_HOME: {}", env->c_str());
        }
    }
    if (!home) {
        home = homeFromPath(os);
        if (home) {
            s_logger->trace("Using java home of the java executable on the PATH: {}", home->string());
        }
    }
    if (!home && !os.isWindows()) {
        for (const char* candidate : {"/usr/lib/jvm/default-java", "/usr/lib/jvm/default-runtime"}) {
            std::error_code ec;
            if (std::filesystem::is_directory(candidate, ec)) {
                home = std::filesystem::path(candidate);
                s_logger->trace("Using conventional default JVM directory: {}", candidate);
                break;
            }
        }
    }
    if (!home) {
        throw ConfigException("Unable to determine the current java home. Set JAVA_HOME or put java on the PATH.");
    }
    props.javaHome = InstallationClassifier::normalize(*home);

    std::optional<std::string> version = config.javaVersion;
    if (!version) version = fromEnv("JVMPROBE_JAVA_VERSION");
    std::optional<std::string> vendor = config.javaVendor;
    if (!vendor) vendor = fromEnv("JVMPROBE_JAVA_VENDOR");

    if (!version || !vendor) {
        auto release = parseReleaseFile(props.javaHome / "release");
        if (release.empty() && props.javaHome.filename() == "jre") {
            // A JRE embedded in a JDK carries no release file of its own
            release = parseReleaseFile(props.javaHome.parent_path() / "release");
        }
        if (!version && release.count("JAVA_VERSION")) version = release["JAVA_VERSION"];
        if (!vendor && release.count("IMPLEMENTOR")) vendor = release["IMPLEMENTOR"];
        if (release.count("JAVA_RUNTIME_VERSION")) props.javaVmVersion = release["JAVA_RUNTIME_VERSION"];
    }

    if (!version) {
        s_logger->warn("Could not determine the java version of {}. Assuming a pre-Java 9 installation.", props.javaHome.string());
    }
    props.javaVersion = version.value_or("0");
    props.javaVmVendor = vendor.value_or("");
    return props;
}

} // namespace JvmProbe
