// include/JvmProbe/InstallationClassifier.hpp
#ifndef JVMPROBE_INSTALLATION_CLASSIFIER_HPP
#define JVMPROBE_INSTALLATION_CLASSIFIER_HPP

#include <JvmProbe/InstallationLayout.hpp>
#include <JvmProbe/Types/JavaVersion.hpp>
#include <JvmProbe/Utils/OS.hpp>

#include <filesystem>
#include <optional>
#include <spdlog/logger.h>
#include <vector>

namespace JvmProbe {

    /**
     * @brief Decides which installation layout a claimed java home follows.
     *
     * Layout rules are tried in order and the first one that matches builds the result:
     *   1. embedded-jre   - path is <jdk>/jre and <jdk> has bin/java and lib/tools.jar (before Java 9)
     *   2. macos-bundle   - path is .../Contents/Home with bin, lib and conf, no jre/ and no tools.jar
     *   3. jdk            - path has lib/tools.jar
     *   4. standalone-jre - anything else
     * On Windows, before Java 9, the result is then refined by the jre<version>/jdk<version>
     * sibling directory convention.
     *
     * From Java 9 onward no embedded JRE or tools.jar is ever reported.
     */
    class InstallationClassifier {
    public:
        struct Rule {
            const char* name;
            bool (InstallationClassifier::*matches)(const std::filesystem::path& home) const;
            InstallationLayout (InstallationClassifier::*build)(const std::filesystem::path& home) const;
        };

        InstallationClassifier(const Utils::OperatingSystem& os, JavaVersion javaVersion);

        // Throws InvalidHomeException when the path is missing or not a directory
        InstallationLayout classify(const std::filesystem::path& home) const;

        static const std::vector<Rule>& rules();

        // Absolute with symlinks resolved and without a trailing separator
        static std::filesystem::path normalize(const std::filesystem::path& path);

    private:
        const Utils::OperatingSystem& m_os;
        JavaVersion m_javaVersion;
        std::shared_ptr<spdlog::logger> m_logger;

        InstallationLayout classifyByShape(const std::filesystem::path& home) const;
        void applyWindowsSiblingConvention(InstallationLayout& layout) const;
        std::optional<std::filesystem::path> findSiblingJdk(const std::filesystem::path& jreHome) const;
        std::optional<std::filesystem::path> findSiblingJre(const std::filesystem::path& jdkHome) const;

        bool hasToolsJar(const std::filesystem::path& home) const;
        bool hasJavaExecutable(const std::filesystem::path& home) const;
        bool looksLikeJre(const std::filesystem::path& dir) const;

        bool isEmbeddedJre(const std::filesystem::path& home) const;
        InstallationLayout buildEmbeddedJre(const std::filesystem::path& home) const;
        bool isMacOsBundle(const std::filesystem::path& home) const;
        InstallationLayout buildMacOsBundle(const std::filesystem::path& home) const;
        bool isJdk(const std::filesystem::path& home) const;
        InstallationLayout buildJdk(const std::filesystem::path& home) const;
        bool isStandaloneJre(const std::filesystem::path& home) const;
        InstallationLayout buildStandaloneJre(const std::filesystem::path& home) const;
    };

} // namespace JvmProbe

#endif //JVMPROBE_INSTALLATION_CLASSIFIER_HPP
