#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace anonymizer {

/**
 * @brief Error categories for the anonymizer boundary
 *
 * BAD_REQUEST:    payload absent, unparseable or not the expected shape
 * INVALID_PARAM:  payload present but a field is semantically invalid
 * INTERNAL_ERROR: anything unanticipated (never echoed to the caller)
 */
enum class ErrorCategory {
    NONE,
    BAD_REQUEST,
    INVALID_PARAM,
    INTERNAL_ERROR
};

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

    // Re-wrap another result's failure
    template<typename U>
    static Result error_from(const Result<U>& other) {
        return error(other.error_category(), other.error_message());
    }

    [[nodiscard]] bool is_ok() const { return success_; }
    [[nodiscard]] bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    [[nodiscard]] ErrorCategory error_category() const { return error_category_; }
    [[nodiscard]] const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

/**
 * @brief Value-less result (validation steps)
 */
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

    [[nodiscard]] bool is_ok() const { return success_; }
    [[nodiscard]] bool is_error() const { return !success_; }

    [[nodiscard]] ErrorCategory error_category() const { return error_category_; }
    [[nodiscard]] const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

using Status = Result<void>;

// Shorthand for the most common failure of this service
template<typename T>
[[nodiscard]] inline Result<T> invalid_param(std::string message) {
    return Result<T>::error(ErrorCategory::INVALID_PARAM, std::move(message));
}

} // namespace anonymizer
