#pragma once

#include <string>
#include <optional>

namespace snapredact {

/**
 * @brief Error categories for snapshot operations
 */
enum class ErrorCategory {
    NONE,
    UNKNOWN_PRESET,
    EMPTY_SNAPSHOT,
    UNKNOWN_IDENTIFIER,
    NO_MATCHING_PROJECTS,
    STORAGE_ERROR,
    CONFIG_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::NONE:                 return "none";
        case ErrorCategory::UNKNOWN_PRESET:       return "unknown_preset";
        case ErrorCategory::EMPTY_SNAPSHOT:       return "empty_snapshot";
        case ErrorCategory::UNKNOWN_IDENTIFIER:   return "unknown_identifier";
        case ErrorCategory::NO_MATCHING_PROJECTS: return "no_matching_projects";
        case ErrorCategory::STORAGE_ERROR:        return "storage_error";
        case ErrorCategory::CONFIG_ERROR:         return "config_error";
        case ErrorCategory::INTERNAL_ERROR:       return "internal_error";
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

} // namespace snapredact
