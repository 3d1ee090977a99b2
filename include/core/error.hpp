#pragma once

#include <optional>
#include <string>

namespace piiguard {

/**
 * @brief Error categories for sanitization operations
 *
 * REMOTE_UNAVAILABLE and REMOTE_PROTOCOL_ERROR are recovered by local
 * fallback and never reach callers of the orchestrator.
 */
enum class ErrorCategory {
    NONE,
    REMOTE_UNAVAILABLE,
    REMOTE_PROTOCOL_ERROR,
    INVALID_INPUT,
    VALIDATION_FAILED,
    CONFIG_ERROR,
    INTERNAL_ERROR
};

inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                  return "none";
        case ErrorCategory::REMOTE_UNAVAILABLE:    return "remote_unavailable";
        case ErrorCategory::REMOTE_PROTOCOL_ERROR: return "remote_protocol_error";
        case ErrorCategory::INVALID_INPUT:         return "invalid_input";
        case ErrorCategory::VALIDATION_FAILED:     return "validation_failed";
        case ErrorCategory::CONFIG_ERROR:          return "config_error";
        case ErrorCategory::INTERNAL_ERROR:        return "internal_error";
        default:                                   return "unknown";
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

} // namespace piiguard
