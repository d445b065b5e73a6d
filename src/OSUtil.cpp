// src/OSUtil.cpp
#include <JvmProbe/Utils/OS.hpp>
#include <JvmProbe/Utils/Logger.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace JvmProbe {
namespace Utils {

OSFamily getCurrentOS() {
    #if defined(_WIN32) || defined(_WIN64)
        return OSFamily::WINDOWS;
    #elif defined(__APPLE__) || defined(__MACH__)
        return OSFamily::MACOS;
    #elif defined(__linux__)
        return OSFamily::LINUX;
    #else
        return OSFamily::UNKNOWN;
    #endif
}

std::string osFamilyName(OSFamily family) {
    switch (family) {
        case OSFamily::WINDOWS: return "windows";
        case OSFamily::MACOS: return "mac";
        case OSFamily::LINUX: return "linux";
        default: return "unknown";
    }
}

OperatingSystem::OperatingSystem(OSFamily family, std::string pathVariable)
    : m_family(family), m_pathVariable(std::move(pathVariable)) {
    m_logger = Logger::GetOrCreateLogger("OperatingSystem");
}

std::shared_ptr<const OperatingSystem> OperatingSystem::current() {
    static const std::shared_ptr<const OperatingSystem> s_current = [] {
        const char* path = std::getenv("PATH");
        return std::make_shared<const OperatingSystem>(getCurrentOS(), path ? path : "");
    }();
    return s_current;
}

std::string OperatingSystem::executableName(const std::string& baseName) const {
    if (!isWindows()) {
        return baseName;
    }
    std::string lower = baseName;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const char* extension : {".exe", ".bat", ".cmd"}) {
        const std::string ext(extension);
        if (lower.size() > ext.size() && lower.compare(lower.size() - ext.size(), ext.size(), ext) == 0) {
            return baseName;
        }
    }
    return baseName + ".exe";
}

std::vector<std::filesystem::path> OperatingSystem::pathEntries() const {
    std::vector<std::filesystem::path> entries;
    const char separator = isWindows() ? ';' : ':';
    std::istringstream iss(m_pathVariable);
    std::string item;
    while (std::getline(iss, item, separator)) {
        if (!item.empty()) {
            entries.emplace_back(item);
        }
    }
    return entries;
}

std::optional<std::filesystem::path> OperatingSystem::findInPath(const std::string& name) const {
    for (const auto& dir : pathEntries()) {
        std::filesystem::path candidate = dir / name;
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec)) {
            m_logger->trace("Found '{}' on the PATH: {}", name, candidate.string());
            return std::filesystem::absolute(candidate, ec).lexically_normal();
        }
    }
    m_logger->trace("'{}' not found in {} PATH entries", name, pathEntries().size());
    return std::nullopt;
}

} // namespace Utils
} // namespace JvmProbe
