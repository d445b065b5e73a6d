// include/JvmProbe/InstallationLayout.hpp
#ifndef JVMPROBE_INSTALLATION_LAYOUT_HPP
#define JVMPROBE_INSTALLATION_LAYOUT_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace JvmProbe {

    enum class InstallationKind {
        STANDALONE_JRE,
        JDK,
        JDK_WITH_EMBEDDED_JRE,
        MACOS_BUNDLE_JDK
    };

    std::string to_string(InstallationKind kind);

    /**
     * Result of classifying a java home. Computed once from a single look at the
     * filesystem and never updated afterwards.
     *
     * - STANDALONE_JRE never has a toolsJarPath.
     * - JDK_WITH_EMBEDDED_JRE always has an embeddedJreHome, and javaHome is the owning
     *   JDK (the parent of jre/), never the embedded JRE itself.
     * - MACOS_BUNDLE_JDK behaves as a JDK with neither embedded JRE nor tools.jar.
     */
    struct InstallationLayout {
        InstallationKind kind = InstallationKind::STANDALONE_JRE;
        std::filesystem::path javaHome;
        std::optional<std::filesystem::path> embeddedJreHome;
        std::optional<std::filesystem::path> peerJreHome; // Windows jre<version> sibling
        std::optional<std::filesystem::path> toolsJarPath;

        bool isJdk() const { return kind != InstallationKind::STANDALONE_JRE; }
    };

} // namespace JvmProbe

#endif //JVMPROBE_INSTALLATION_LAYOUT_HPP
