#pragma once

#include <string>
#include <optional>

namespace urlscope {

/**
 * @brief Error categories surfaced by the request pipeline
 */
enum class ErrorCategory {
    NONE,
    MALFORMED_INPUT,
    POOL_REJECTED,
    POOL_TIMEOUT,
    SESSION_CREATE_FAILED,
    CAPTURE_FAILED,
    NETWORK_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                  return "none";
        case ErrorCategory::MALFORMED_INPUT:       return "malformed_input";
        case ErrorCategory::POOL_REJECTED:         return "pool_rejected";
        case ErrorCategory::POOL_TIMEOUT:          return "pool_timeout";
        case ErrorCategory::SESSION_CREATE_FAILED: return "session_create_failed";
        case ErrorCategory::CAPTURE_FAILED:        return "capture_failed";
        case ErrorCategory::NETWORK_ERROR:         return "network_error";
        case ErrorCategory::INTERNAL_ERROR:        return "internal_error";
    }
    return "unknown";
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

} // namespace urlscope
