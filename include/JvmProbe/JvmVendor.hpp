// include/JvmProbe/JvmVendor.hpp
#ifndef JVMPROBE_JVM_VENDOR_HPP
#define JVMPROBE_JVM_VENDOR_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace JvmProbe {

    enum class JvmVendor {
        GENERIC,
        APPLE,
        IBM
    };

    std::string to_string(JvmVendor vendor);

    // Case-insensitive: "apple" selects APPLE, "ibm" selects IBM, anything else GENERIC
    JvmVendor vendorFromString(const std::string& vendorString);

    /**
     * The few points where vendor JVMs differ from the generic layout rules.
     */
    struct VendorBehavior {
        JvmVendor vendor;
        bool ibm;
        // Legacy jar holding the runtime (and tools) classes when the vendor moves it out of lib/
        std::optional<std::filesystem::path> (*classesJar)(const std::filesystem::path& javaHome);
        // Whether an environment variable may be passed on to a forked JVM
        bool (*isInheritable)(const std::string& variable);
    };

    const VendorBehavior& vendorBehavior(JvmVendor vendor);

} // namespace JvmProbe

#endif //JVMPROBE_JVM_VENDOR_HPP
