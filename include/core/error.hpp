#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace schemaport {

/**
 * @brief Error categories for the conversion pipeline
 *
 * NOT_FOUND, CONNECTION_ERROR, STORE_ERROR and CONFIG_ERROR end a run.
 * EXTRACTION_ERROR and SYNTHESIS_COLLISION are logged and the run continues.
 */
enum class ErrorCategory {
    NONE,
    NOT_FOUND,
    CONNECTION_ERROR,
    EXTRACTION_ERROR,
    TARGET_CONFLICT,
    SYNTHESIS_COLLISION,
    STORE_ERROR,
    CONFIG_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline std::string_view error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                return "none";
        case ErrorCategory::NOT_FOUND:           return "not_found";
        case ErrorCategory::CONNECTION_ERROR:    return "connection_error";
        case ErrorCategory::EXTRACTION_ERROR:    return "extraction_error";
        case ErrorCategory::TARGET_CONFLICT:     return "target_conflict";
        case ErrorCategory::SYNTHESIS_COLLISION: return "synthesis_collision";
        case ErrorCategory::STORE_ERROR:         return "store_error";
        case ErrorCategory::CONFIG_ERROR:        return "config_error";
        case ErrorCategory::INTERNAL_ERROR:      return "internal_error";
        default:                                 return "unknown";
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
 * @brief Exception thrown by source readers and the store wrapper
 *
 * Caught by the stage that owns the failure policy and turned into a
 * Result or a skipped table.
 */
class MigrationError : public std::runtime_error {
public:
    MigrationError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    ErrorCategory category() const noexcept { return category_; }

private:
    ErrorCategory category_;
};

} // namespace schemaport
