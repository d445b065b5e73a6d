// src/InstallationClassifier.cpp
#include <JvmProbe/InstallationClassifier.hpp>
#include <JvmProbe/Errors.hpp>
#include <JvmProbe/Utils/Logger.hpp>

#include <regex>

namespace fs = std::filesystem;

namespace JvmProbe {

namespace {
    bool isFile(const fs::path& p) {
        std::error_code ec;
        return fs::is_regular_file(p, ec);
    }

    bool isDirectory(const fs::path& p) {
        std::error_code ec;
        return fs::is_directory(p, ec);
    }

    const std::regex& versionedJreName() {
        static const std::regex s_pattern(R"(jre(\d+|\d+\.\d+\.\d+(_\d+)?))");
        return s_pattern;
    }

    const std::regex& versionedJdkName() {
        static const std::regex s_pattern(R"(jdk(\d+\.\d+\.\d+(_\d+)?))");
        return s_pattern;
    }
}

std::string to_string(InstallationKind kind) {
    switch (kind) {
        case InstallationKind::STANDALONE_JRE: return "standalone-jre";
        case InstallationKind::JDK: return "jdk";
        case InstallationKind::JDK_WITH_EMBEDDED_JRE: return "jdk-with-embedded-jre";
        case InstallationKind::MACOS_BUNDLE_JDK: return "macos-bundle-jdk";
    }
    return "unknown";
}

InstallationClassifier::InstallationClassifier(const Utils::OperatingSystem& os, JavaVersion javaVersion)
    : m_os(os), m_javaVersion(std::move(javaVersion)) {
    m_logger = Utils::Logger::GetOrCreateLogger("Classifier");
}

const std::vector<InstallationClassifier::Rule>& InstallationClassifier::rules() {
    static const std::vector<Rule> s_rules = {
        {"embedded-jre", &InstallationClassifier::isEmbeddedJre, &InstallationClassifier::buildEmbeddedJre},
        {"macos-bundle", &InstallationClassifier::isMacOsBundle, &InstallationClassifier::buildMacOsBundle},
        {"jdk", &InstallationClassifier::isJdk, &InstallationClassifier::buildJdk},
        {"standalone-jre", &InstallationClassifier::isStandaloneJre, &InstallationClassifier::buildStandaloneJre},
    };
    return s_rules;
}

fs::path InstallationClassifier::normalize(const fs::path& path) {
    // Symlinked homes such as /usr/lib/jvm/default-java resolve to the installation they point at
    std::error_code ec;
    fs::path normalized = fs::weakly_canonical(fs::absolute(path), ec);
    if (ec) {
        normalized = fs::absolute(path).lexically_normal();
    }
    if (normalized.filename().empty() && normalized.has_relative_path()) {
        normalized = normalized.parent_path();
    }
    return normalized;
}

InstallationLayout InstallationClassifier::classify(const fs::path& home) const {
    if (home.empty() || !isDirectory(home)) {
        throw InvalidHomeException("Supplied javaHome must be a valid directory. You supplied: " + home.string());
    }
    InstallationLayout layout = classifyByShape(normalize(home));
    if (m_os.isWindows() && !m_javaVersion.isJava9Compatible()) {
        applyWindowsSiblingConvention(layout);
    }
    return layout;
}

InstallationLayout InstallationClassifier::classifyByShape(const fs::path& home) const {
    for (const auto& rule : rules()) {
        if ((this->*rule.matches)(home)) {
            m_logger->trace("{} classified by rule '{}'", home.string(), rule.name);
            return (this->*rule.build)(home);
        }
    }
    // standalone-jre always matches
    return buildStandaloneJre(home);
}

bool InstallationClassifier::hasToolsJar(const fs::path& home) const {
    return isFile(home / "lib" / "tools.jar");
}

bool InstallationClassifier::hasJavaExecutable(const fs::path& home) const {
    return isFile(home / "bin" / m_os.executableName("java"));
}

bool InstallationClassifier::looksLikeJre(const fs::path& dir) const {
    return isDirectory(dir) && (isDirectory(dir / "lib") || isDirectory(dir / "bin"));
}

bool InstallationClassifier::isEmbeddedJre(const fs::path& home) const {
    if (m_javaVersion.isJava9Compatible() || home.filename() != "jre") {
        return false;
    }
    const fs::path owner = home.parent_path();
    return hasJavaExecutable(owner) && hasToolsJar(owner);
}

InstallationLayout InstallationClassifier::buildEmbeddedJre(const fs::path& home) const {
    InstallationLayout layout;
    layout.kind = InstallationKind::JDK_WITH_EMBEDDED_JRE;
    layout.javaHome = home.parent_path();
    layout.embeddedJreHome = home;
    layout.toolsJarPath = layout.javaHome / "lib" / "tools.jar";
    return layout;
}

bool InstallationClassifier::isMacOsBundle(const fs::path& home) const {
    return home.filename() == "Home"
        && home.parent_path().filename() == "Contents"
        && isDirectory(home / "bin")
        && isDirectory(home / "lib")
        && isDirectory(home / "conf")
        && !isDirectory(home / "jre")
        && !hasToolsJar(home);
}

InstallationLayout InstallationClassifier::buildMacOsBundle(const fs::path& home) const {
    InstallationLayout layout;
    layout.kind = InstallationKind::MACOS_BUNDLE_JDK;
    layout.javaHome = home;
    return layout;
}

bool InstallationClassifier::isJdk(const fs::path& home) const {
    return hasToolsJar(home);
}

InstallationLayout InstallationClassifier::buildJdk(const fs::path& home) const {
    InstallationLayout layout;
    layout.javaHome = home;
    if (m_javaVersion.isJava9Compatible()) {
        // Leftover lib/tools.jar or jre/ from an older install
        layout.kind = InstallationKind::JDK;
        return layout;
    }
    layout.kind = InstallationKind::JDK;
    layout.toolsJarPath = home / "lib" / "tools.jar";
    if (looksLikeJre(home / "jre")) {
        layout.embeddedJreHome = home / "jre";
    }
    return layout;
}

bool InstallationClassifier::isStandaloneJre(const fs::path&) const {
    return true;
}

InstallationLayout InstallationClassifier::buildStandaloneJre(const fs::path& home) const {
    InstallationLayout layout;
    layout.kind = InstallationKind::STANDALONE_JRE;
    layout.javaHome = home;
    return layout;
}

void InstallationClassifier::applyWindowsSiblingConvention(InstallationLayout& layout) const {
    if (layout.kind == InstallationKind::STANDALONE_JRE) {
        auto jdkHome = findSiblingJdk(layout.javaHome);
        if (!jdkHome) {
            return;
        }
        m_logger->trace("Using sibling JDK {} for JRE {}", jdkHome->string(), layout.javaHome.string());
        const fs::path jreHome = layout.javaHome;
        layout = buildJdk(*jdkHome);
        layout.peerJreHome = jreHome;
        return;
    }
    if (!layout.peerJreHome) {
        layout.peerJreHome = findSiblingJre(layout.javaHome);
        if (layout.peerJreHome) {
            m_logger->trace("Found sibling JRE {} for JDK {}", layout.peerJreHome->string(), layout.javaHome.string());
        }
    }
}

std::optional<fs::path> InstallationClassifier::findSiblingJdk(const fs::path& jreHome) const {
    std::smatch match;
    const std::string name = jreHome.filename().string();
    if (!std::regex_match(name, match, versionedJreName())) {
        return std::nullopt;
    }
    // jre6 carries only the major version, jre1.5.0_22 the full one
    std::vector<std::string> candidates;
    if (match[1].str().find('.') != std::string::npos) {
        candidates.push_back("jdk" + match[1].str());
    }
    candidates.push_back("jdk" + m_javaVersion.raw());
    for (const auto& candidate : candidates) {
        fs::path sibling = jreHome.parent_path() / candidate;
        if (hasToolsJar(sibling)) {
            return sibling;
        }
    }
    return std::nullopt;
}

std::optional<fs::path> InstallationClassifier::findSiblingJre(const fs::path& jdkHome) const {
    std::smatch match;
    const std::string name = jdkHome.filename().string();
    if (!std::regex_match(name, match, versionedJdkName())) {
        return std::nullopt;
    }
    std::vector<std::string> candidates = {"jre" + match[1].str()};
    try {
        candidates.push_back("jre" + std::to_string(JavaVersion::parse(match[1].str()).majorVersion()));
    } catch (const std::invalid_argument& e) {
        m_logger->trace("Ignoring version of {}: {}", name, e.what());
    }
    for (const auto& candidate : candidates) {
        fs::path sibling = jdkHome.parent_path() / candidate;
        if (isDirectory(sibling)) {
            return sibling;
        }
    }
    return std::nullopt;
}

} // namespace JvmProbe
