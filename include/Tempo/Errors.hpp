// =================================================================
// include/Tempo/Errors.hpp
// =================================================================
// Exception types raised across the optimization layer.

#pragma once

#include <stdexcept>
#include <string>

namespace Tempo {

/**
 * @brief Failure categories surfaced to callers of RequestOptimizer
 */
enum class ErrorKind {
    CAPACITY,         ///< No worker slot became free before the deadline
    TRANSIENT,        ///< Backend failed in a way a retry may fix
    TIMEOUT,          ///< Generation did not finish within the request timeout
    CANCELLED,        ///< Caller cancelled the request
    INVALID_REQUEST,  ///< Request failed validation
    FATAL             ///< Backend failed permanently
};

/**
 * @brief Get a stable name for an error kind
 * @param kind Error kind
 * @return Lower-case name such as "capacity"
 */
inline std::string errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CAPACITY: return "capacity";
        case ErrorKind::TRANSIENT: return "transient";
        case ErrorKind::TIMEOUT: return "timeout";
        case ErrorKind::CANCELLED: return "cancelled";
        case ErrorKind::INVALID_REQUEST: return "invalid_request";
        case ErrorKind::FATAL: return "fatal";
        default: return "unknown";
    }
}

/**
 * @brief Typed failure of a single optimize() call
 */
class OptimizationError : public std::runtime_error {
public:
    OptimizationError(ErrorKind kind, const std::string& message)
        : std::runtime_error(errorKindName(kind) + ": " + message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

    /**
     * @brief Whether the caller may reasonably retry the same request
     */
    bool retryable() const {
        return m_kind == ErrorKind::CAPACITY || m_kind == ErrorKind::TRANSIENT ||
               m_kind == ErrorKind::TIMEOUT;
    }

private:
    ErrorKind m_kind;
};

/**
 * @brief Raised by generation backends
 */
class BackendError : public std::runtime_error {
public:
    BackendError(const std::string& message, bool transient)
        : std::runtime_error(message), m_transient(transient) {}

    bool transient() const { return m_transient; }

private:
    bool m_transient;
};

/**
 * @brief Raised eagerly when configuration values are invalid
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error("configuration error: " + message) {}
};

} // namespace Tempo
