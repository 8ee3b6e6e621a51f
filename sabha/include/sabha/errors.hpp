#pragma once
// Error taxonomy
//
// Validation: malformed record or event, never persisted.
// Timeout: agent or tick deadline exceeded, excluded for that tick.
// DegradedDependency: embedder or store partially unavailable.
// Configuration: fatal at boot, the coordinator does not start.

#include <stdexcept>
#include <string>

namespace sabha {

enum class ErrorKind {
    Validation,
    Timeout,
    DegradedDependency,
    Configuration,
};

inline const char* error_kind_name(ErrorKind k) {
    switch (k) {
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::DegradedDependency: return "degraded_dependency";
        case ErrorKind::Configuration: return "configuration";
    }
    return "unknown";
}

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message)
        : Error(ErrorKind::Validation, message) {}
};

class TimeoutError : public Error {
public:
    explicit TimeoutError(const std::string& message)
        : Error(ErrorKind::Timeout, message) {}
};

class DegradedDependencyError : public Error {
public:
    explicit DegradedDependencyError(const std::string& message)
        : Error(ErrorKind::DegradedDependency, message) {}
};

class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& message)
        : Error(ErrorKind::Configuration, message) {}
};

} // namespace sabha
