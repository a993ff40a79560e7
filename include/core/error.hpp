#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace dbaccess {

/**
 * @brief Error kinds surfaced to callers of the access layer
 */
enum class ErrorCode {
    NONE,
    INVALID_ARGUMENT,   // malformed request parameters (caller bug)
    NOT_FOUND,          // unknown connection id or table/collection
    CONNECTION_ERROR,   // cannot establish or has lost a connection
    QUERY_SYNTAX_ERROR, // backend rejected the query text
    DRIVER_ERROR,       // backend-reported runtime fault
    TIMEOUT,            // deadline exceeded
    INTERNAL_ERROR
};

[[nodiscard]] inline std::string_view error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "none";
        case ErrorCode::INVALID_ARGUMENT: return "invalid_argument";
        case ErrorCode::NOT_FOUND: return "not_found";
        case ErrorCode::CONNECTION_ERROR: return "connection_error";
        case ErrorCode::QUERY_SYNTAX_ERROR: return "query_syntax_error";
        case ErrorCode::DRIVER_ERROR: return "driver_error";
        case ErrorCode::TIMEOUT: return "timeout";
        case ErrorCode::INTERNAL_ERROR: return "internal_error";
        default: return "unknown";
    }
}

// ============================================================================
// Typed exceptions (thrown inside the layer, translated at the adapters)
// ============================================================================

class DbError : public std::runtime_error {
public:
    DbError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

class InvalidArgumentError : public DbError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : DbError(ErrorCode::INVALID_ARGUMENT, message) {}
};

class NotFoundError : public DbError {
public:
    explicit NotFoundError(const std::string& message)
        : DbError(ErrorCode::NOT_FOUND, message) {}
};

class ConnectionError : public DbError {
public:
    explicit ConnectionError(const std::string& message)
        : DbError(ErrorCode::CONNECTION_ERROR, message) {}
};

class QuerySyntaxError : public DbError {
public:
    explicit QuerySyntaxError(const std::string& message)
        : DbError(ErrorCode::QUERY_SYNTAX_ERROR, message) {}
};

class DriverError : public DbError {
public:
    explicit DriverError(const std::string& message)
        : DbError(ErrorCode::DRIVER_ERROR, message) {}
};

class TimeoutError : public DbError {
public:
    explicit TimeoutError(const std::string& message)
        : DbError(ErrorCode::TIMEOUT, message) {}
};

// ============================================================================
// Result type returned across the dispatcher boundary
// ============================================================================

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCode code, std::string message) {
        Result r;
        r.success_ = false;
        r.error_code_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCode error_code() const { return error_code_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCode error_code_ = ErrorCode::NONE;
    std::string error_message_;
};

/// Result of an operation that yields no value
struct Unit {};

} // namespace dbaccess
