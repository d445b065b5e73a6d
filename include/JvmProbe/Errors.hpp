// include/JvmProbe/Errors.hpp
#ifndef JVMPROBE_ERRORS_HPP
#define JVMPROBE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace JvmProbe {

    // The supplied java home does not exist or is not a directory
    class InvalidHomeException : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    // The java home exists but a required executable cannot be found inside it
    class JavaHomeException : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Unreadable configuration, or no java home could be detected at all
    class ConfigException : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

} // namespace JvmProbe

#endif //JVMPROBE_ERRORS_HPP
