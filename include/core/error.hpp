#pragma once

#include <optional>
#include <string>
#include <utility>

namespace pgquery {

/**
 * @brief Error categories surfaced to callers
 *
 * PLAN_ANALYSIS_ERROR is never returned from a public call; it only tags
 * log lines for failures of the optional statistics phase.
 */
enum class ErrorCategory {
    NONE,
    VALIDATION_ERROR,
    CONNECTION_ERROR,
    QUERY_ERROR,
    PLAN_ANALYSIS_ERROR,
    CONFIG_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline constexpr const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "None";
        case ErrorCategory::VALIDATION_ERROR: return "ValidationError";
        case ErrorCategory::CONNECTION_ERROR: return "ConnectionError";
        case ErrorCategory::QUERY_ERROR: return "QueryError";
        case ErrorCategory::PLAN_ANALYSIS_ERROR: return "PlanAnalysisError";
        case ErrorCategory::CONFIG_ERROR: return "ConfigError";
        case ErrorCategory::INTERNAL_ERROR: return "InternalError";
    }
    return "Unknown";
}

/**
 * @brief Structured error returned by a failed call
 *
 * Built once per failure and not modified afterwards. For QUERY_ERROR the
 * optional fields mirror what the server reported (line/position possibly
 * corrected by ErrorNormalizer).
 */
struct QueryError {
    ErrorCategory category = ErrorCategory::INTERNAL_ERROR;
    std::string message;
    std::optional<int> line;
    std::optional<int> position;
    std::optional<std::string> detail;
    std::optional<std::string> where;
    std::optional<std::string> code;
    std::optional<std::string> hint;

    static QueryError make(ErrorCategory category, std::string message) {
        QueryError e;
        e.category = category;
        e.message = std::move(message);
        return e;
    }
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

    static Result error(QueryError err) {
        Result r;
        r.success_ = false;
        r.error_ = std::move(err);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        return error(QueryError::make(category, std::move(message)));
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    // Moves the value out; the Result is left without a value
    T take() { return std::move(*value_); }

    ErrorCategory error_category() const { return error_.category; }
    const std::string& error_message() const { return error_.message; }
    const QueryError& error() const { return error_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    QueryError error_ = QueryError::make(ErrorCategory::NONE, {});
};

} // namespace pgquery
