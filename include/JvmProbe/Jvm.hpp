// include/JvmProbe/Jvm.hpp
#ifndef JVMPROBE_JVM_HPP
#define JVMPROBE_JVM_HPP

#include <JvmProbe/InstallationLayout.hpp>
#include <JvmProbe/JvmVendor.hpp>
#include <JvmProbe/SystemProperties.hpp>
#include <JvmProbe/Types/JavaVersion.hpp>
#include <JvmProbe/Utils/OS.hpp>

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

namespace JvmProbe {

    // A JRE that belongs to a Jvm, either embedded in it or installed beside it
    struct Jre {
        std::filesystem::path homeDir;

        bool operator==(const Jre& other) const { return homeDir == other.homeDir; }
        bool operator!=(const Jre& other) const { return !(*this == other); }
    };

    /**
     * @brief A resolved Java installation: its real home, executables, tools.jar and related JREs.
     *
     * Instances are immutable. Two instances are equal when they resolve to the same java home,
     * whatever vendor or version they were created with.
     */
    class Jvm {
    public:
        using SystemPropertiesProvider = std::function<SystemProperties()>;

        /**
         * The JVM described by the current system properties. Detected once and cached for the
         * rest of the process; resetCurrent() forces the next call to detect again.
         * The provider runs without any lock held. Calling current() from inside it throws
         * std::logic_error.
         */
        static std::shared_ptr<const Jvm> current();
        static void resetCurrent();

        // Replaces the snapshot source used by current(). An empty function restores the default.
        static void setSystemPropertiesProvider(SystemPropertiesProvider provider);
        static SystemProperties currentSystemProperties();

        /**
         * A JVM for a user-supplied home directory. Returns the cached current JVM when it
         * resolves to the same home and uses the same OperatingSystem instance.
         * @throws InvalidHomeException if javaHome is not an existing directory.
         * @throws JavaHomeException if the java executable cannot be found inside it.
         */
        static std::shared_ptr<const Jvm> forHome(const std::filesystem::path& javaHome);
        static std::shared_ptr<const Jvm> forHome(const std::filesystem::path& javaHome,
                                                  std::shared_ptr<const Utils::OperatingSystem> os,
                                                  std::optional<JavaVersion> javaVersion = std::nullopt);

        Jvm(std::shared_ptr<const Utils::OperatingSystem> os,
            const std::filesystem::path& suppliedHome,
            JavaVersion javaVersion,
            JvmVendor vendor = JvmVendor::GENERIC,
            std::string vendorName = "",
            bool userSupplied = false);

        const std::filesystem::path& javaHome() const { return m_layout.javaHome; }
        const std::filesystem::path& suppliedHome() const { return m_suppliedHome; }
        const JavaVersion& javaVersion() const { return m_javaVersion; }
        const InstallationLayout& layout() const { return m_layout; }
        JvmVendor vendor() const { return m_behavior->vendor; }
        const std::string& vendorName() const { return m_vendorName; }
        bool isIbmJvm() const { return m_behavior->ibm; }
        bool isUserSupplied() const { return m_userSupplied; }

        std::optional<std::filesystem::path> toolsJar() const;
        std::optional<std::filesystem::path> runtimeJar() const;
        std::optional<Jre> jre() const;
        std::optional<Jre> standaloneJre() const;

        std::filesystem::path javaExecutable() const { return getExecutable("java"); }
        std::filesystem::path javacExecutable() const { return getExecutable("javac"); }
        std::filesystem::path javadocExecutable() const { return getExecutable("javadoc"); }

        /**
         * Looks for the executable in <javaHome>/bin, then on the PATH, and finally falls back to
         * the bare platform name, relying on the OS to resolve it at invocation time. Never throws.
         */
        std::filesystem::path getExecutable(const std::string& name) const;

        /**
         * Strict lookup used for the primary java executable: only <javaHome>/bin is searched.
         * @throws JavaHomeException naming the executable and the home directory.
         */
        std::filesystem::path requireExecutable(const std::string& name) const;

        // Environment to hand to a forked JVM
        std::map<std::string, std::string> inheritableEnvironmentVariables(const std::map<std::string, std::string>& env) const;

        std::string toString() const;

        bool operator==(const Jvm& other) const { return javaHome() == other.javaHome(); }
        bool operator!=(const Jvm& other) const { return !(*this == other); }

    private:
        std::shared_ptr<const Utils::OperatingSystem> m_os;
        std::filesystem::path m_suppliedHome;
        JavaVersion m_javaVersion;
        InstallationLayout m_layout;
        const VendorBehavior* m_behavior;
        std::string m_vendorName;
        bool m_userSupplied;
        std::shared_ptr<spdlog::logger> m_logger;

        std::optional<std::filesystem::path> findInHome(const std::string& name) const;
    };

    std::ostream& operator<<(std::ostream& out, const Jvm& jvm);

    void to_json(nlohmann::json& j, const Jvm& jvm);

} // namespace JvmProbe

namespace std {
    template <>
    struct hash<JvmProbe::Jvm> {
        size_t operator()(const JvmProbe::Jvm& jvm) const noexcept {
            return std::filesystem::hash_value(jvm.javaHome());
        }
    };
}

#endif //JVMPROBE_JVM_HPP
