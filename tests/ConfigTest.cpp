// tests/ConfigTest.cpp
#include <JvmProbe/Config.hpp>
#include <JvmProbe/Errors.hpp>
#include "TestDirectory.hpp"

#include <gtest/gtest.h>

using JvmProbe::Config;
using JvmProbe::ConfigException;
using JvmProbe::Testing::TestDirectory;
using json = nlohmann::json;

TEST(ConfigTest, EverythingIsOptional) {
    Config config = Config::from_json(json::object());
    EXPECT_FALSE(config.javaHome.has_value());
    EXPECT_FALSE(config.javaVersion.has_value());
    EXPECT_FALSE(config.javaVendor.has_value());
    EXPECT_EQ(spdlog::level::warn, config.logging.level);
}

TEST(ConfigTest, ReadsJavaAndLoggingSettings) {
    Config config = Config::from_json(json::parse(R"({
        "javaHome": "/opt/jdk1.8.0",
        "javaVersion": "1.8.0_202",
        "javaVendor": "Oracle Corporation",
        "logging": {"level": "debug", "directory": "logs", "file": "probe.log"}
    })"));
    EXPECT_EQ(std::filesystem::path("/opt/jdk1.8.0"), *config.javaHome);
    EXPECT_EQ("1.8.0_202", *config.javaVersion);
    EXPECT_EQ("Oracle Corporation", *config.javaVendor);
    EXPECT_EQ(spdlog::level::debug, config.logging.level);
    EXPECT_EQ(std::filesystem::path("logs"), config.logging.directory);
    EXPECT_EQ("probe.log", config.logging.file);
}

TEST(ConfigTest, AcceptsNumericJavaVersion) {
    Config config = Config::from_json(json::parse(R"({"javaVersion": 17})"));
    EXPECT_EQ("17", *config.javaVersion);
}

TEST(ConfigTest, RejectsUnparseableJavaVersion) {
    EXPECT_THROW(Config::from_json(json::parse(R"({"javaVersion": "latest"})")), ConfigException);
}

TEST(ConfigTest, ParsesLevelNames) {
    EXPECT_EQ(spdlog::level::debug, JvmProbe::LoggingConfig::parseLevel("debug"));
    EXPECT_EQ(spdlog::level::off, JvmProbe::LoggingConfig::parseLevel("off"));
    EXPECT_THROW(JvmProbe::LoggingConfig::parseLevel("bogus"), ConfigException);
}

TEST(ConfigTest, RejectsUnknownLogLevel) {
    EXPECT_THROW(Config::from_json(json::parse(R"({"logging": {"level": "loud"}})")), ConfigException);
}

TEST(ConfigTest, LoadReportsTheOffendingFile) {
    TestDirectory tmp;
    auto file = tmp.createFile("broken.json", "{ not json");
    try {
        Config::load(file);
        FAIL() << "Expected ConfigException";
    } catch (const ConfigException& e) {
        EXPECT_NE(std::string(e.what()).find("broken.json"), std::string::npos);
    }
    EXPECT_THROW(Config::load(tmp.file("missing.json")), ConfigException);
}

TEST(ConfigTest, LoadsFile) {
    TestDirectory tmp;
    auto file = tmp.createFile("jvmprobe.json", R"({"javaVendor": "IBM Corporation"})");
    EXPECT_EQ("IBM Corporation", *Config::load(file).javaVendor);
}
