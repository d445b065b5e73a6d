// include/JvmProbe/Types/JavaVersion.hpp
#ifndef JVMPROBE_JAVAVERSION_HPP
#define JVMPROBE_JAVAVERSION_HPP

#include <string>
#include <nlohmann/json.hpp>

namespace JvmProbe {
    using json = nlohmann::json;

    /**
     * @brief A Java version understood well enough to branch on. Accepts both the legacy
     * "1.x" scheme ("1.5", "1.6.0", "1.5.0_22", "1.9") and the modern one ("9", "9-ea",
     * "11.0.2", "17.0.1+12").
     */
    class JavaVersion {
    public:
        // Throws std::invalid_argument when the string has no leading version number
        static JavaVersion parse(const std::string& version);
        static JavaVersion from_json(const json& j);

        unsigned int majorVersion() const { return m_major; }
        const std::string& raw() const { return m_raw; }

        // "1.6" for the legacy scheme, "11" from Java 9 onward
        std::string name() const;

        bool isJava5() const { return m_major == 5; }
        bool isJava6() const { return m_major == 6; }
        bool isJava7() const { return m_major == 7; }
        bool isJava8() const { return m_major == 8; }
        bool isJava8Compatible() const { return m_major >= 8; }
        bool isJava9Compatible() const { return m_major >= 9; }

        bool operator==(const JavaVersion& other) const { return m_major == other.m_major; }
        bool operator!=(const JavaVersion& other) const { return !(*this == other); }
        bool operator<(const JavaVersion& other) const { return m_major < other.m_major; }

    private:
        JavaVersion(unsigned int major, std::string raw) : m_major(major), m_raw(std::move(raw)) {}

        unsigned int m_major;
        std::string m_raw;
    };

} // namespace JvmProbe

#endif //JVMPROBE_JAVAVERSION_HPP
