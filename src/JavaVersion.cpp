// src/JavaVersion.cpp
#include <JvmProbe/Types/JavaVersion.hpp>

#include <cctype>
#include <stdexcept>

namespace JvmProbe {

namespace {
    // Reads the digits starting at pos, advancing pos past them
    bool readNumber(const std::string& s, size_t& pos, unsigned int& out) {
        size_t start = pos;
        unsigned long value = 0;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            value = value * 10 + static_cast<unsigned long>(s[pos] - '0');
            if (value > 10000) {
                return false;
            }
            ++pos;
        }
        out = static_cast<unsigned int>(value);
        return pos > start;
    }
}

JavaVersion JavaVersion::parse(const std::string& version) {
    size_t pos = 0;
    unsigned int first = 0;
    if (!readNumber(version, pos, first)) {
        throw std::invalid_argument("Could not determine java version from '" + version + "'.");
    }
    if (first != 1) {
        return JavaVersion(first, version);
    }

    // Legacy "1.x" scheme: the feature release is the second component
    unsigned int second = 0;
    if (pos < version.size() && version[pos] == '.') {
        ++pos;
        if (readNumber(version, pos, second) && second > 0) {
            return JavaVersion(second, version);
        }
    }
    throw std::invalid_argument("Could not determine java version from '" + version + "'.");
}

JavaVersion JavaVersion::from_json(const json& j) {
    if (j.is_number_unsigned()) {
        return parse(std::to_string(j.get<unsigned int>()));
    }
    if (j.is_number_float()) {
        // "1.8" written without quotes
        return parse(j.dump());
    }
    return parse(j.get<std::string>());
}

std::string JavaVersion::name() const {
    if (m_major < 9) {
        return "1." + std::to_string(m_major);
    }
    return std::to_string(m_major);
}

} // namespace JvmProbe
