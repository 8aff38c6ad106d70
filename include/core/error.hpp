#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace airlock {

/**
 * @brief Error categories surfaced to callers of the airlock
 */
enum class ErrorCategory {
    NONE,
    RECOGNITION_ERROR,
    SECRET_BLOCKED,
    STORE_ERROR,
    CONFIG_ERROR,
    INVALID_REQUEST,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:              return "none";
        case ErrorCategory::RECOGNITION_ERROR: return "recognition_error";
        case ErrorCategory::SECRET_BLOCKED:    return "secret_blocked";
        case ErrorCategory::STORE_ERROR:       return "store_error";
        case ErrorCategory::CONFIG_ERROR:      return "config_error";
        case ErrorCategory::INVALID_REQUEST:   return "invalid_request";
        case ErrorCategory::INTERNAL_ERROR:    return "internal_error";
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

/**
 * @brief Entity recognition could not complete; anonymization must not proceed
 */
class RecognitionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Mapping store backend failed (connection, serialization, protocol)
 */
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace airlock
