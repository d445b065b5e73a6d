// src/Jvm.cpp
#include <JvmProbe/Jvm.hpp>
#include <JvmProbe/Errors.hpp>
#include <JvmProbe/InstallationClassifier.hpp>
#include <JvmProbe/JvmFactory.hpp>
#include <JvmProbe/Utils/Logger.hpp>

#include <mutex>
#include <stdexcept>
#include <sstream>

namespace fs = std::filesystem;

namespace JvmProbe {

namespace {
    std::mutex s_currentMutex;
    std::shared_ptr<const Jvm> s_current;
    Jvm::SystemPropertiesProvider s_propertiesProvider;

    struct ResolvingGuard {
        explicit ResolvingGuard(bool& flag) : m_flag(flag) { m_flag = true; }
        ~ResolvingGuard() { m_flag = false; }
        bool& m_flag;
    };

    bool isFile(const fs::path& p) {
        std::error_code ec;
        return fs::is_regular_file(p, ec);
    }

    std::optional<JavaVersion> versionFromReleaseFile(const fs::path& home) {
        auto release = SystemProperties::parseReleaseFile(home / "release");
        if (release.empty() && home.filename() == "jre") {
            release = SystemProperties::parseReleaseFile(home.parent_path() / "release");
        }
        auto it = release.find("JAVA_VERSION");
        if (it == release.end()) {
            return std::nullopt;
        }
        try {
            return JavaVersion::parse(it->second);
        } catch (const std::invalid_argument& e) {
            JVMPROBE_LOG_WARN("[Jvm] Ignoring release file of {}: {}", home.string(), e.what());
            return std::nullopt;
        }
    }
}

Jvm::Jvm(std::shared_ptr<const Utils::OperatingSystem> os,
         const fs::path& suppliedHome,
         JavaVersion javaVersion,
         JvmVendor vendor,
         std::string vendorName,
         bool userSupplied)
    : m_os(std::move(os)),
      m_suppliedHome(suppliedHome),
      m_javaVersion(std::move(javaVersion)),
      m_layout(InstallationClassifier(*m_os, m_javaVersion).classify(suppliedHome)),
      m_behavior(&vendorBehavior(vendor)),
      m_vendorName(std::move(vendorName)),
      m_userSupplied(userSupplied) {
    m_logger = Utils::Logger::GetOrCreateLogger("Jvm");
    m_logger->trace("Resolved {} to java home {} ({})", m_suppliedHome.string(), m_layout.javaHome.string(), to_string(m_layout.kind));
}

std::shared_ptr<const Jvm> Jvm::current() {
    // Set while this thread runs the provider, which may itself query the current JVM
    thread_local bool s_resolving = false;
    SystemPropertiesProvider provider;
    {
        std::lock_guard<std::mutex> lock(s_currentMutex);
        if (s_current) {
            return s_current;
        }
        provider = s_propertiesProvider;
    }
    if (s_resolving) {
        throw std::logic_error("Jvm::current() was called while the current JVM is being resolved");
    }

    // The provider and the file system probes run unlocked
    std::shared_ptr<const Jvm> created;
    {
        ResolvingGuard guard(s_resolving);
        SystemProperties props = provider ? provider() : SystemProperties::detect();
        created = JvmFactory::create(props);
    }

    std::lock_guard<std::mutex> lock(s_currentMutex);
    if (!s_current) {
        s_current = std::move(created);
    }
    return s_current;
}

void Jvm::resetCurrent() {
    std::lock_guard<std::mutex> lock(s_currentMutex);
    s_current.reset();
}

void Jvm::setSystemPropertiesProvider(SystemPropertiesProvider provider) {
    std::lock_guard<std::mutex> lock(s_currentMutex);
    s_propertiesProvider = std::move(provider);
}

SystemProperties Jvm::currentSystemProperties() {
    SystemPropertiesProvider provider;
    {
        std::lock_guard<std::mutex> lock(s_currentMutex);
        provider = s_propertiesProvider;
    }
    return provider ? provider() : SystemProperties::detect();
}

std::shared_ptr<const Jvm> Jvm::forHome(const fs::path& javaHome) {
    return forHome(javaHome, Utils::OperatingSystem::current());
}

std::shared_ptr<const Jvm> Jvm::forHome(const fs::path& javaHome,
                                        std::shared_ptr<const Utils::OperatingSystem> os,
                                        std::optional<JavaVersion> javaVersion) {
    std::error_code ec;
    if (javaHome.empty() || !fs::is_directory(javaHome, ec)) {
        throw InvalidHomeException("Supplied javaHome must be a valid directory. You supplied: " + javaHome.string());
    }
    if (!javaVersion) {
        javaVersion = versionFromReleaseFile(InstallationClassifier::normalize(javaHome));
    }
    auto jvm = std::make_shared<const Jvm>(std::move(os), javaHome,
                                           javaVersion.value_or(JavaVersion::parse("0")),
                                           JvmVendor::GENERIC, "", true);
    {
        std::lock_guard<std::mutex> lock(s_currentMutex);
        // Only an instance probing through the same operating system can stand in for this one
        if (s_current && *s_current == *jvm && s_current->m_os == jvm->m_os) {
            return s_current;
        }
    }
    // The primary executable must exist; everything else degrades gracefully
    jvm->requireExecutable("java");
    return jvm;
}

std::optional<fs::path> Jvm::findInHome(const std::string& name) const {
    fs::path candidate = javaHome() / "bin" / m_os->executableName(name);
    if (isFile(candidate)) {
        return candidate;
    }
    return std::nullopt;
}

fs::path Jvm::requireExecutable(const std::string& name) const {
    if (auto executable = findInHome(name)) {
        return *executable;
    }
    fs::path tried = javaHome() / "bin" / m_os->executableName(name);
    throw JavaHomeException("The supplied javaHome seems to be invalid. I cannot find the " + name
                            + " executable. Tried location: " + tried.string());
}

fs::path Jvm::getExecutable(const std::string& name) const {
    if (auto executable = findInHome(name)) {
        return *executable;
    }
    const std::string executableName = m_os->executableName(name);
    if (auto onPath = m_os->findInPath(executableName)) {
        m_logger->info("Unable to find the '{}' executable using home: {}. We found it on the PATH: {}.",
                       name, javaHome().string(), onPath->string());
        return *onPath;
    }
    m_logger->warn("Unable to find the '{}' executable. Tried the java home: {} and the PATH."
                   " We will assume the executable can be run in the current working folder.",
                   name, javaHome().string());
    return fs::path(executableName);
}

std::optional<fs::path> Jvm::toolsJar() const {
    if (m_layout.toolsJarPath) {
        return m_layout.toolsJarPath;
    }
    if (m_javaVersion.isJava9Compatible()) {
        return std::nullopt;
    }
    return m_behavior->classesJar(javaHome());
}

std::optional<fs::path> Jvm::runtimeJar() const {
    if (m_javaVersion.isJava9Compatible()) {
        return std::nullopt;
    }
    if (auto classesJar = m_behavior->classesJar(javaHome())) {
        return classesJar;
    }
    fs::path runtimeJar = InstallationClassifier::normalize(m_suppliedHome) / "lib" / "rt.jar";
    if (isFile(runtimeJar)) {
        return runtimeJar;
    }
    if (m_layout.embeddedJreHome && isFile(*m_layout.embeddedJreHome / "lib" / "rt.jar")) {
        return *m_layout.embeddedJreHome / "lib" / "rt.jar";
    }
    return std::nullopt;
}

std::optional<Jre> Jvm::jre() const {
    if (m_javaVersion.isJava9Compatible()) {
        return std::nullopt;
    }
    if (m_layout.embeddedJreHome) {
        return Jre{*m_layout.embeddedJreHome};
    }
    if (m_layout.peerJreHome) {
        return Jre{*m_layout.peerJreHome};
    }
    if (m_layout.kind == InstallationKind::STANDALONE_JRE) {
        return Jre{javaHome()};
    }
    return std::nullopt;
}

std::optional<Jre> Jvm::standaloneJre() const {
    if (m_javaVersion.isJava9Compatible()) {
        return std::nullopt;
    }
    if (m_layout.peerJreHome) {
        return Jre{*m_layout.peerJreHome};
    }
    if (m_layout.kind == InstallationKind::STANDALONE_JRE) {
        return Jre{javaHome()};
    }
    return std::nullopt;
}

std::map<std::string, std::string> Jvm::inheritableEnvironmentVariables(const std::map<std::string, std::string>& env) const {
    std::map<std::string, std::string> inherited;
    for (const auto& [name, value] : env) {
        if (m_behavior->isInheritable(name)) {
            inherited.emplace(name, value);
        }
    }
    return inherited;
}

std::string Jvm::toString() const {
    if (m_userSupplied) {
        return "User-supplied java: " + m_suppliedHome.string();
    }
    std::ostringstream out;
    out << "Java " << m_javaVersion.name();
    if (!m_vendorName.empty()) {
        out << " (" << m_vendorName << ")";
    }
    out << " at " << javaHome().string();
    return out.str();
}

std::ostream& operator<<(std::ostream& out, const Jvm& jvm) {
    return out << jvm.toString();
}

void to_json(nlohmann::json& j, const Jvm& jvm) {
    auto optionalPath = [](const std::optional<fs::path>& p) -> nlohmann::json {
        return p ? nlohmann::json(p->string()) : nlohmann::json(nullptr);
    };
    auto optionalJre = [](const std::optional<Jre>& jre) -> nlohmann::json {
        return jre ? nlohmann::json(jre->homeDir.string()) : nlohmann::json(nullptr);
    };
    j = nlohmann::json{
        {"javaHome", jvm.javaHome().string()},
        {"javaVersion", jvm.javaVersion().raw()},
        {"majorVersion", jvm.javaVersion().majorVersion()},
        {"kind", to_string(jvm.layout().kind)},
        {"vendor", to_string(jvm.vendor())},
        {"toolsJar", optionalPath(jvm.toolsJar())},
        {"runtimeJar", optionalPath(jvm.runtimeJar())},
        {"jre", optionalJre(jvm.jre())},
        {"standaloneJre", optionalJre(jvm.standaloneJre())},
        {"java", jvm.javaExecutable().string()},
        {"javac", jvm.javacExecutable().string()},
        {"javadoc", jvm.javadocExecutable().string()},
    };
}

} // namespace JvmProbe
