#pragma once

#include <stdexcept>
#include <string>

namespace threnody {

/**
 * Structured error reporting for the traversal engine.
 * Every exception carries a code, the failing context and, where one exists,
 * a hint for the operator of an unattended installation.
 */

enum class ErrorCode {
    // General errors
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,
    CONFIG_INVALID = 2,
    VALIDATION_FAILED = 3,

    // Store errors
    STORE_UNAVAILABLE = 100,
    QUERY_FAILED = 101,

    // Internal errors
    INTERNAL_ERROR = 500,
    INVARIANT_VIOLATION = 501
};

class ThrenodyException : public std::runtime_error {
public:
    explicit ThrenodyException(ErrorCode code, const std::string& message,
                               const std::string& context = "",
                               const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "Threnody error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
    std::string suggestion_;
};

class InvalidArgumentError : public ThrenodyException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : ThrenodyException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

class ConfigError : public ThrenodyException {
public:
    explicit ConfigError(const std::string& message,
                         const std::string& context = "",
                         const std::string& suggestion = "")
        : ThrenodyException(ErrorCode::CONFIG_INVALID, message, context, suggestion) {}
};

// Rejected submission content (empty, too long, not UTF-8)
class ValidationError : public ThrenodyException {
public:
    explicit ValidationError(const std::string& message,
                             const std::string& context = "",
                             const std::string& suggestion = "")
        : ThrenodyException(ErrorCode::VALIDATION_FAILED, message, context, suggestion) {}
};

// Transient store failure. Raised by backends; the gateway retries these and
// re-raises once its attempts are exhausted.
class StoreUnavailableError : public ThrenodyException {
public:
    explicit StoreUnavailableError(const std::string& message,
                                   const std::string& context = "",
                                   const std::string& suggestion = "")
        : ThrenodyException(ErrorCode::STORE_UNAVAILABLE, message, context, suggestion) {}
};

// Non-transient store failure (bad SQL, schema mismatch). Never retried.
class DatabaseError : public ThrenodyException {
public:
    explicit DatabaseError(const std::string& message,
                           const std::string& context = "",
                           const std::string& suggestion = "")
        : ThrenodyException(ErrorCode::QUERY_FAILED, message, context, suggestion) {}
};

class InvariantViolationError : public ThrenodyException {
public:
    explicit InvariantViolationError(const std::string& message,
                                     const std::string& context = "",
                                     const std::string& suggestion = "")
        : ThrenodyException(ErrorCode::INVARIANT_VIOLATION, message, context, suggestion) {}
};

class ErrorHandler {
public:
    static void check_condition(bool condition, ErrorCode code,
                                const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "") {
        if (!condition) {
            throw ThrenodyException(code, message, context, suggestion);
        }
    }

    static void check_argument(bool condition, const std::string& message,
                               const std::string& context = "") {
        if (!condition) {
            throw InvalidArgumentError(message, context);
        }
    }
};

#define THRENODY_CHECK(condition, code, message) \
    threnody::ErrorHandler::check_condition(condition, code, message, __func__)

#define THRENODY_CHECK_ARGUMENT(condition, message) \
    threnody::ErrorHandler::check_argument(condition, message, __func__)

#define THRENODY_THROW_INVARIANT(message) \
    throw threnody::InvariantViolationError(message, __func__)

} // namespace threnody
