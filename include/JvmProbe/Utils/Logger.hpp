// include/JvmProbe/Utils/Logger.hpp
#ifndef JVMPROBE_LOGGER_HPP
#define JVMPROBE_LOGGER_HPP

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <vector>
#include <filesystem>
#include <string>

namespace JvmProbe::Utils {

    class Logger {
    public:
        // Call this once at the beginning of the program. Console output goes to stderr,
        // stdout belongs to the command line tool's JSON output.
        static void Init(const std::filesystem::path &logDir = "",
                         const std::string &logFileName = "jvmprobe.log",
                         spdlog::level::level_enum consoleLevel = spdlog::level::warn,
                         spdlog::level::level_enum fileLevel = spdlog::level::trace);

        static std::shared_ptr<spdlog::logger> &GetCoreLogger();

        // Creates the logger on first use, sharing the sinks set up by Init()
        static std::shared_ptr<spdlog::logger> GetOrCreateLogger(const std::string &name);

    private:
        static std::vector<spdlog::sink_ptr> s_GlobalSinks;
        static std::shared_ptr<spdlog::logger> s_CoreLogger;
    };

} // namespace JvmProbe::Utils

#define JVMPROBE_LOG_TRACE(...)    if(auto& logger = ::JvmProbe::Utils::Logger::GetCoreLogger(); logger) { logger->trace(__VA_ARGS__); }
#define JVMPROBE_LOG_INFO(...)     if(auto& logger = ::JvmProbe::Utils::Logger::GetCoreLogger(); logger) { logger->info(__VA_ARGS__); }
#define JVMPROBE_LOG_WARN(...)     if(auto& logger = ::JvmProbe::Utils::Logger::GetCoreLogger(); logger) { logger->warn(__VA_ARGS__); }
#define JVMPROBE_LOG_ERROR(...)    if(auto& logger = ::JvmProbe::Utils::Logger::GetCoreLogger(); logger) { logger->error(__VA_ARGS__); }
#define JVMPROBE_LOG_CRITICAL(...) if(auto& logger = ::JvmProbe::Utils::Logger::GetCoreLogger(); logger) { logger->critical(__VA_ARGS__); }

#endif // JVMPROBE_LOGGER_HPP
