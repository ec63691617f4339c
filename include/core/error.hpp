#pragma once

#include <string>
#include <optional>

namespace ztgate {

/**
 * @brief Error categories for the gateway
 */
enum class ErrorCategory {
    NONE,
    CONFIG_ERROR,
    MALFORMED_REQUEST,
    ADAPTER_FAILURE,
    AUDIT_WRITE_FAILURE
};

inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "NONE";
        case ErrorCategory::CONFIG_ERROR: return "CONFIG_ERROR";
        case ErrorCategory::MALFORMED_REQUEST: return "MALFORMED_REQUEST";
        case ErrorCategory::ADAPTER_FAILURE: return "ADAPTER_FAILURE";
        case ErrorCategory::AUDIT_WRITE_FAILURE: return "AUDIT_WRITE_FAILURE";
        default: return "UNKNOWN";
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

} // namespace ztgate
