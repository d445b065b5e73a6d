// src/Config.cpp
#include <JvmProbe/Config.hpp>
#include <JvmProbe/Errors.hpp>
#include <JvmProbe/Types/JavaVersion.hpp>
#include <JvmProbe/Utils/Logger.hpp>

#include <fstream>
#include <stdexcept>

namespace JvmProbe {

spdlog::level::level_enum LoggingConfig::parseLevel(const std::string& levelName) {
    const auto level = spdlog::level::from_str(levelName);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && levelName != "off") {
        throw ConfigException("Unknown logging level: " + levelName);
    }
    return level;
}

LoggingConfig LoggingConfig::from_json(const json& j) {
    LoggingConfig logging;
    if (j.contains("level")) logging.level = parseLevel(j.at("level").get<std::string>());
    if (j.contains("directory")) logging.directory = j.at("directory").get<std::string>();
    if (j.contains("file")) logging.file = j.at("file").get<std::string>();
    return logging;
}

Config Config::from_json(const json& j) {
    Config config;
    if (j.contains("javaHome")) config.javaHome = std::filesystem::path(j.at("javaHome").get<std::string>());
    if (j.contains("javaVersion")) {
        try {
            config.javaVersion = JavaVersion::from_json(j.at("javaVersion")).raw();
        } catch (const std::invalid_argument& e) {
            throw ConfigException(std::string("Invalid javaVersion: ") + e.what());
        }
    }
    if (j.contains("javaVendor")) config.javaVendor = j.at("javaVendor").get<std::string>();
    if (j.contains("logging")) config.logging = LoggingConfig::from_json(j.at("logging"));
    return config;
}

Config Config::load(const std::filesystem::path& file) {
    std::ifstream in(file);
    if (!in) {
        throw ConfigException("Could not open configuration file " + file.string());
    }
    try {
        json j = json::parse(in);
        Config config = from_json(j);
        JVMPROBE_LOG_TRACE("[Config] Loaded configuration from {}", file.string());
        return config;
    } catch (const json::exception& e) {
        throw ConfigException("Invalid configuration file " + file.string() + ": " + e.what());
    }
}

} // namespace JvmProbe
