#pragma once

#include <string>
#include <stdexcept>
#include <cstddef>

namespace mcpdb {

// Base class of every error the gateway reports to its caller
class GatewayError : public std::runtime_error {
public:
    explicit GatewayError(const std::string& message) : std::runtime_error(message) {}

    // Stable name of the error kind, used in tool responses
    virtual const char* kind() const noexcept { return "GatewayError"; }
};

// Database name not configured
class UnknownTargetError : public GatewayError {
public:
    explicit UnknownTargetError(const std::string& name);

    const std::string& target() const { return m_target; }
    const char* kind() const noexcept override { return "UnknownTargetError"; }

private:
    std::string m_target;
};

// No free connection within the acquire timeout (or the pool is closed)
class PoolExhaustedError : public GatewayError {
public:
    using GatewayError::GatewayError;
    const char* kind() const noexcept override { return "PoolExhaustedError"; }
};

// Write statement blocked by read-only mode
class ReadOnlyViolationError : public GatewayError {
public:
    using GatewayError::GatewayError;
    const char* kind() const noexcept override { return "ReadOnlyViolationError"; }
};

// Placeholder/argument mismatch or unsupported argument type
class ParameterBindingError : public GatewayError {
public:
    using GatewayError::GatewayError;
    const char* kind() const noexcept override { return "ParameterBindingError"; }
};

// Deadline exceeded mid-operation
class TimeoutError : public GatewayError {
public:
    using GatewayError::GatewayError;
    const char* kind() const noexcept override { return "TimeoutError"; }
};

// Driver-reported failure; the message is sanitized on construction
class ExecutionError : public GatewayError {
public:
    ExecutionError(unsigned int errorCode, const std::string& message);

    unsigned int errorCode() const { return m_errorCode; }
    const char* kind() const noexcept override { return "ExecutionError"; }

private:
    unsigned int m_errorCode;
};

// MySQL error classification and message hygiene
class ErrorHandler {
public:
    // Maximum length of driver text surfaced to callers
    static constexpr size_t kMaxMessageLength = 512;

    // Check if error is retryable
    static bool isRetryable(unsigned int mysqlError);

    // Check if error indicates connection issue
    static bool isConnectionError(unsigned int mysqlError);

    // Check if error is a server-side statement timeout
    static bool isTimeoutError(unsigned int mysqlError);

    // Get human-readable error message
    static std::string getErrorMessage(unsigned int mysqlError);

    // Redact credential-looking fragments and cap the length
    static std::string sanitizeMessage(const std::string& message,
                                       size_t maxLength = kMaxMessageLength);
};

// RAII wrapper for setting/clearing error context
class ErrorContext {
public:
    explicit ErrorContext(const std::string& context);
    ~ErrorContext();

    ErrorContext(const ErrorContext&) = delete;
    ErrorContext& operator=(const ErrorContext&) = delete;

    static std::string current();

private:
    static thread_local std::string s_currentContext;
    std::string m_previous;
};

}  // namespace mcpdb
