// src/main.cpp
#include <JvmProbe/Cli.hpp>
#include <spdlog/spdlog.h> // For spdlog::shutdown()

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    const int exitCode = JvmProbe::Cli::run(args, std::cout, std::cerr);
    spdlog::shutdown();
    return exitCode;
}
