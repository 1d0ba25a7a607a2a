#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <utility>

namespace dbgate {

/**
 * @brief Error categories surfaced by gateway operations
 */
enum class ErrorCategory {
    NONE,
    NOT_CONNECTED,
    CONNECT_ERROR,
    TIMEOUT_ERROR,
    AUTH_UNSUPPORTED,
    QUERY_ERROR,
    INVALID_REQUEST,
    INTERNAL_ERROR
};

[[nodiscard]] inline std::string_view error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:             return "None";
        case ErrorCategory::NOT_CONNECTED:    return "NotConnected";
        case ErrorCategory::CONNECT_ERROR:    return "ConnectError";
        case ErrorCategory::TIMEOUT_ERROR:    return "TimeoutError";
        case ErrorCategory::AUTH_UNSUPPORTED: return "AuthUnsupported";
        case ErrorCategory::QUERY_ERROR:      return "QueryError";
        case ErrorCategory::INVALID_REQUEST:  return "InvalidRequest";
        case ErrorCategory::INTERNAL_ERROR:   return "InternalError";
    }
    return "InternalError";
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
        r.value_.emplace(std::move(value));
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    // Re-wrap the error of a Result with a different value type
    template<typename U>
    static Result error_from(const Result<U>& other) {
        return error(other.error_category(), other.error_message());
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

template<>
class Result<void> {
public:
    static Result ok() {
        Result r;
        r.success_ = true;
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    template<typename U>
    static Result error_from(const Result<U>& other) {
        return error(other.error_category(), other.error_message());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

} // namespace dbgate
