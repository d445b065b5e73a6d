// include/JvmProbe/SystemProperties.hpp
#ifndef JVMPROBE_SYSTEM_PROPERTIES_HPP
#define JVMPROBE_SYSTEM_PROPERTIES_HPP

#include <JvmProbe/Config.hpp>
#include <JvmProbe/Utils/OS.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace JvmProbe {

    /**
     * Snapshot of what the host reports about "the current Java": its home directory,
     * version and vendor. Detection of the current JVM is a function of this value only.
     */
    struct SystemProperties {
        std::filesystem::path javaHome;
        std::string javaVersion;
        std::string javaVmVendor;
        std::string javaVmVersion;

        /**
         * Builds a snapshot from, in order of precedence: the explicit Config values,
         * JAVA_HOME / JVMPROBE_JAVA_VERSION / JVMPROBE_JAVA_VENDOR, the java executable on
         * the PATH, the conventional default JVM directories, and the home's release file.
         * Throws ConfigException when no java home can be found.
         */
        static SystemProperties detect(const Config& config = {},
                                       const Utils::OperatingSystem& os = *Utils::OperatingSystem::current());

        // Key/value pairs of a JDK "release" file, quotes stripped. Empty when unreadable.
        static std::map<std::string, std::string> parseReleaseFile(const std::filesystem::path& file);
    };

} // namespace JvmProbe

#endif //JVMPROBE_SYSTEM_PROPERTIES_HPP
