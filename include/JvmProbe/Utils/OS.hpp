// include/JvmProbe/Utils/OS.hpp
#ifndef JVMPROBE_OS_UTIL_HPP
#define JVMPROBE_OS_UTIL_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/logger.h>

namespace JvmProbe {
    namespace Utils {

        enum class OSFamily {
            WINDOWS,
            MACOS,
            LINUX,
            UNKNOWN
        };

        OSFamily getCurrentOS();
        std::string osFamilyName(OSFamily family);

        /**
         * @brief Host operating system services used while resolving a JVM: executable name
         * suffixing and PATH search. Methods are virtual so tests can script the answers.
         */
        class OperatingSystem {
        public:
            OperatingSystem(OSFamily family, std::string pathVariable);
            virtual ~OperatingSystem() = default;

            // Shared instance describing the machine this process runs on
            static std::shared_ptr<const OperatingSystem> current();

            OSFamily family() const { return m_family; }
            std::string name() const { return osFamilyName(m_family); }
            bool isWindows() const { return m_family == OSFamily::WINDOWS; }
            bool isMacOs() const { return m_family == OSFamily::MACOS; }

            /**
             * @brief Platform file name for an executable. Windows appends ".exe" unless the name
             * already carries an executable extension. Accepts bare names and paths.
             */
            virtual std::string executableName(const std::string& baseName) const;

            /**
             * @brief Searches the PATH entries for a regular file called @p name.
             * @return Absolute path of the first match, or std::nullopt.
             */
            virtual std::optional<std::filesystem::path> findInPath(const std::string& name) const;

            std::vector<std::filesystem::path> pathEntries() const;

        private:
            OSFamily m_family;
            std::string m_pathVariable;
            std::shared_ptr<spdlog::logger> m_logger;
        };

    } // namespace Utils
} // namespace JvmProbe

#endif //JVMPROBE_OS_UTIL_HPP
