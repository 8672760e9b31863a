#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace sqlrunner {

/**
 * @brief Error categories surfaced by the execution engine
 */
enum class ErrorCategory {
    NONE,
    CONNECTION_ERROR,      // Pool/session/tunnel establishment failed
    STATEMENT_ERROR,       // A single statement failed on the server
    CANCELLATION_ERROR,    // Out-of-band cancel/terminate request failed
    CONFIG_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "none";
        case ErrorCategory::CONNECTION_ERROR: return "connection_error";
        case ErrorCategory::STATEMENT_ERROR: return "statement_error";
        case ErrorCategory::CANCELLATION_ERROR: return "cancellation_error";
        case ErrorCategory::CONFIG_ERROR: return "config_error";
        case ErrorCategory::INTERNAL_ERROR: return "internal_error";
        default: return "unknown";
    }
}

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

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

/**
 * @brief Base exception for database failures that must propagate
 */
class DbError : public std::runtime_error {
public:
    DbError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    [[nodiscard]] ErrorCategory category() const noexcept { return category_; }

private:
    ErrorCategory category_;
};

/**
 * @brief Connection could not be established (pool, session or SSH tunnel)
 *
 * Never retried automatically; the caller decides.
 */
class ConnectionError : public DbError {
public:
    explicit ConnectionError(const std::string& message)
        : DbError(ErrorCategory::CONNECTION_ERROR, message) {}
};

/**
 * @brief A statement failed on the server
 */
class StatementError : public DbError {
public:
    explicit StatementError(const std::string& message)
        : DbError(ErrorCategory::STATEMENT_ERROR, message) {}
};

} // namespace sqlrunner
