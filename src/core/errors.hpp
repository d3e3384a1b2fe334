#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace flowscope {

/// Failure categories handled by the engine
enum class ErrorKind {
    DataGap,             // Missing/out-of-order events, thin baseline history
    ComputationFailure,  // Unexpected failure while scoring one key
    PersistenceFailure,  // Durable baseline storage unreachable
    ConfigurationError   // Invalid configuration, fatal at construction
};

[[nodiscard]] inline std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::DataGap: return "DataGap";
        case ErrorKind::ComputationFailure: return "ComputationFailure";
        case ErrorKind::PersistenceFailure: return "PersistenceFailure";
        case ErrorKind::ConfigurationError: return "ConfigurationError";
    }
    return "Unknown";
}

struct Error {
    ErrorKind kind;
    std::string message;

    [[nodiscard]] std::string describe() const {
        return std::string(to_string(kind)) + ": " + message;
    }
};

/// Thrown by constructors that receive a Config failing validation
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what)
        : std::invalid_argument("invalid configuration: " + what) {}
};

}  // namespace flowscope
