#pragma once

#include <stdexcept>
#include <string>

namespace rw::projection {

// A path that was not valid at the requested instant is not an error; the
// resolver reports it as std::nullopt.
enum class ErrorKind {
    InvalidPath,        // out-of-contract relative path
    ConfigurationError  // projection root missing or not a directory
};

class Error : public std::runtime_error {
public:
    Error(const ErrorKind kind, const int errnum, const std::string& message)
        : std::runtime_error(message), kind_(kind), errnum_(errnum) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

    /// errno value the filesystem boundary should report (EINVAL, ENOENT or ENOTDIR).
    [[nodiscard]] int errnum() const noexcept { return errnum_; }

private:
    ErrorKind kind_;
    int errnum_;
};

inline std::string to_string(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidPath: return "invalid_path";
        case ErrorKind::ConfigurationError: return "configuration_error";
    }
    return "unknown";
}

}
