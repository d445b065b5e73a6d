// include/JvmProbe/Config.hpp
#ifndef JVMPROBE_CONFIG_HPP
#define JVMPROBE_CONFIG_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include <spdlog/common.h>

namespace JvmProbe {
    using json = nlohmann::json;

    struct LoggingConfig {
        spdlog::level::level_enum level = spdlog::level::warn;
        std::filesystem::path directory; // Empty: console only
        std::string file = "jvmprobe.log";

        static LoggingConfig from_json(const json& j);

        // Throws ConfigException for names spdlog does not know
        static spdlog::level::level_enum parseLevel(const std::string& levelName);
    };

    /**
     * User configuration. Every java setting is optional; whatever is left unset is
     * detected from the environment by SystemProperties::detect().
     */
    struct Config {
        std::optional<std::filesystem::path> javaHome;
        std::optional<std::string> javaVersion;
        std::optional<std::string> javaVendor;
        LoggingConfig logging;

        static Config from_json(const json& j);

        // Throws ConfigException on I/O or parse errors
        static Config load(const std::filesystem::path& file);
    };
}
#endif
