#pragma once

#include <string>
#include <optional>

namespace sentinel {

/**
 * @brief Error categories for detection and batch processing
 */
enum class ErrorCategory {
    NONE,
    INVALID_PATTERN,
    PATTERN_COMPLEXITY_REJECTED,
    UNSUPPORTED_DOCUMENT,
    PATTERN_EVALUATION,
    INVALID_REQUEST,
    CONFIG_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                        return "none";
        case ErrorCategory::INVALID_PATTERN:             return "invalid_pattern";
        case ErrorCategory::PATTERN_COMPLEXITY_REJECTED: return "pattern_complexity_rejected";
        case ErrorCategory::UNSUPPORTED_DOCUMENT:        return "unsupported_document";
        case ErrorCategory::PATTERN_EVALUATION:          return "pattern_evaluation";
        case ErrorCategory::INVALID_REQUEST:             return "invalid_request";
        case ErrorCategory::CONFIG_ERROR:                return "config_error";
        case ErrorCategory::INTERNAL_ERROR:              return "internal_error";
    }
    return "internal_error";
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

} // namespace sentinel
