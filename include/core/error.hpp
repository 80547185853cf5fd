#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace agentcore {

/**
 * @brief Error categories for the agent core
 */
enum class ErrorCategory {
    NONE,
    ISOLATION_VIOLATION,
    CONTEXT_VALIDATION,
    FACTORY_ERROR,
    CIRCUIT_OPEN,
    SERVICE_UNAVAILABLE,
    INTERNAL_ERROR
};

inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "NONE";
        case ErrorCategory::ISOLATION_VIOLATION: return "ISOLATION_VIOLATION";
        case ErrorCategory::CONTEXT_VALIDATION: return "CONTEXT_VALIDATION";
        case ErrorCategory::FACTORY_ERROR: return "FACTORY_ERROR";
        case ErrorCategory::CIRCUIT_OPEN: return "CIRCUIT_OPEN";
        case ErrorCategory::SERVICE_UNAVAILABLE: return "SERVICE_UNAVAILABLE";
        case ErrorCategory::INTERNAL_ERROR: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Result type for operations that can fail or degrade
 *
 * Three outcomes:
 * - ok:       value produced by the operation
 * - degraded: value produced by a fallback; error fields say why
 * - error:    no value
 *
 * Circuit-open and unavailable dependencies are steady-state conditions,
 * so they surface here instead of as exceptions.
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.status_ = Status::OK;
        r.value_ = std::move(value);
        return r;
    }

    static Result degraded(T value, ErrorCategory category, std::string message) {
        Result r;
        r.status_ = Status::DEGRADED;
        r.value_ = std::move(value);
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.status_ = Status::ERROR;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return status_ == Status::OK; }
    bool is_degraded() const { return status_ == Status::DEGRADED; }
    bool is_error() const { return status_ == Status::ERROR; }
    bool has_value() const { return value_.has_value(); }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    enum class Status { OK, DEGRADED, ERROR };

    Status status_ = Status::ERROR;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

// ============================================================================
// Exception hierarchy (programming and request errors)
// ============================================================================

class AgentCoreError : public std::runtime_error {
public:
    AgentCoreError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    ErrorCategory category() const noexcept { return category_; }

private:
    ErrorCategory category_;
};

/// An operation tried to cross user boundaries. Never retried.
class IsolationViolationError : public AgentCoreError {
public:
    explicit IsolationViolationError(const std::string& message)
        : AgentCoreError(ErrorCategory::ISOLATION_VIOLATION, message) {}
};

/// Execution context is missing required fields. Raised before any mutation.
class ContextValidationError : public AgentCoreError {
public:
    explicit ContextValidationError(const std::string& message)
        : AgentCoreError(ErrorCategory::CONTEXT_VALIDATION, message) {}
};

/// Factory unregistered, threw, or was cancelled. Session left unmodified.
class FactoryError : public AgentCoreError {
public:
    explicit FactoryError(const std::string& message)
        : AgentCoreError(ErrorCategory::FACTORY_ERROR, message) {}
};

class CircuitOpenError : public AgentCoreError {
public:
    explicit CircuitOpenError(const std::string& message)
        : AgentCoreError(ErrorCategory::CIRCUIT_OPEN, message) {}
};

class ServiceUnavailableError : public AgentCoreError {
public:
    explicit ServiceUnavailableError(const std::string& message)
        : AgentCoreError(ErrorCategory::SERVICE_UNAVAILABLE, message) {}
};

/**
 * @brief Take the value of a Result, raising for the error outcome
 *
 * For callers that prefer the exception form: CIRCUIT_OPEN raises
 * CircuitOpenError, anything else ServiceUnavailableError. A degraded
 * result yields its fallback value.
 */
template<typename T>
T unwrap(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    if (result.error_category() == ErrorCategory::CIRCUIT_OPEN) {
        throw CircuitOpenError(result.error_message());
    }
    throw ServiceUnavailableError(result.error_message());
}

} // namespace agentcore
