// src/Cli.cpp
#include <JvmProbe/Cli.hpp>
#include <JvmProbe/Config.hpp>
#include <JvmProbe/Errors.hpp>
#include <JvmProbe/Jvm.hpp>
#include <JvmProbe/SystemProperties.hpp>
#include <JvmProbe/Utils/Logger.hpp>

#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace JvmProbe::Cli {

void printUsage(std::ostream& out) {
    out << "Usage: jvmprobe [options]\n"
           "  --home DIR          describe the JVM installed in DIR instead of the current one\n"
           "  --config FILE       read settings from a JSON configuration file\n"
           "  --java-version V    reported java version of the current JVM\n"
           "  --vendor V          reported vendor of the current JVM\n"
           "  --executable NAME   also resolve the named tool (repeatable)\n"
           "  --log-level LEVEL   console log level (trace, debug, info, warn, error, off)\n"
           "  --help              show this help\n";
}

Options parseArguments(const std::vector<std::string>& args) {
    Options options;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument("Missing value for " + arg);
            }
            return args[++i];
        };
        if (arg == "--help" || arg == "-h") options.help = true;
        else if (arg == "--home") options.home = std::filesystem::path(value());
        else if (arg == "--config") options.configFile = std::filesystem::path(value());
        else if (arg == "--java-version") options.javaVersion = value();
        else if (arg == "--vendor") options.vendor = value();
        else if (arg == "--executable") options.executables.push_back(value());
        else if (arg == "--log-level") {
            try {
                options.logLevel = LoggingConfig::parseLevel(value());
            } catch (const ConfigException& e) {
                throw std::invalid_argument(e.what());
            }
        }
        else throw std::invalid_argument("Unknown option: " + arg);
    }
    return options;
}

int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    Options options;
    try {
        options = parseArguments(args);
    } catch (const std::invalid_argument& e) {
        err << "jvmprobe: " << e.what() << "\n";
        printUsage(err);
        return EXIT_USAGE;
    }
    if (options.help) {
        printUsage(out);
        return EXIT_OK;
    }

    Config config;
    try {
        if (options.configFile) {
            config = Config::load(*options.configFile);
        }
    } catch (const ConfigException& e) {
        err << "jvmprobe: " << e.what() << "\n";
        return EXIT_JAVA_HOME;
    }
    if (options.javaVersion) config.javaVersion = options.javaVersion;
    if (options.vendor) config.javaVendor = options.vendor;
    if (options.logLevel) config.logging.level = *options.logLevel;

    Utils::Logger::Init(config.logging.directory, config.logging.file, config.logging.level, spdlog::level::trace);
    JVMPROBE_LOG_TRACE("jvmprobe starting with {} requested executables", options.executables.size());

    Jvm::setSystemPropertiesProvider([config]() {
        return SystemProperties::detect(config);
    });

    try {
        std::shared_ptr<const Jvm> jvm = options.home ? Jvm::forHome(*options.home) : Jvm::current();
        JVMPROBE_LOG_INFO("Describing {}", jvm->toString());

        json description = *jvm;
        for (const auto& name : options.executables) {
            description["executables"][name] = jvm->getExecutable(name).string();
        }
        out << description.dump(2) << std::endl;
    } catch (const InvalidHomeException& e) {
        JVMPROBE_LOG_ERROR("{}", e.what());
        return EXIT_USAGE;
    } catch (const JavaHomeException& e) {
        JVMPROBE_LOG_ERROR("{}", e.what());
        return EXIT_JAVA_HOME;
    } catch (const ConfigException& e) {
        JVMPROBE_LOG_CRITICAL("{}", e.what());
        return EXIT_JAVA_HOME;
    }
    return EXIT_OK;
}

} // namespace JvmProbe::Cli
