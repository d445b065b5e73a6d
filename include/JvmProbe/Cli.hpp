// include/JvmProbe/Cli.hpp
#ifndef JVMPROBE_CLI_HPP
#define JVMPROBE_CLI_HPP

#include <spdlog/common.h>

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace JvmProbe::Cli {

    constexpr int EXIT_OK = 0;
    constexpr int EXIT_JAVA_HOME = 1; // JavaHomeException or ConfigException
    constexpr int EXIT_USAGE = 2;     // bad arguments or InvalidHomeException

    struct Options {
        std::optional<std::filesystem::path> home;
        std::optional<std::filesystem::path> configFile;
        std::optional<std::string> javaVersion;
        std::optional<std::string> vendor;
        std::optional<spdlog::level::level_enum> logLevel;
        std::vector<std::string> executables;
        bool help = false;
    };

    // Throws std::invalid_argument for unknown options, missing values and bad log levels
    Options parseArguments(const std::vector<std::string>& args);

    void printUsage(std::ostream& out);

    /**
     * Runs jvmprobe with the arguments that follow the program name. The JSON description goes
     * to out, usage errors to err. Returns the process exit code.
     */
    int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace JvmProbe::Cli

#endif //JVMPROBE_CLI_HPP
