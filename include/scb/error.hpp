#pragma once

/**
 * @file error.hpp
 * @brief Error handling for scb operations
 *
 * Every fallible library operation returns a Result<T>. Fatal errors carry
 * an ErrorCode and a message that is prefixed with context (operation
 * name, path) as it propagates upward. Non-fatal conditions are never
 * reported through Error; they are collected as warning/issue lists on
 * the result values themselves.
 *
 * @example
 * ```cpp
 * auto state = scb::StatusDetector().check_installation("/work/project");
 * if (state.isErr()) {
 *     std::cerr << scb::user_message(state.error()) << "\n";
 * }
 * ```
 */

#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace scb {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    // Configuration
    VALIDATION_FAILED,

    // System / IO
    NOT_FOUND,
    PERMISSION_DENIED,
    ALREADY_EXISTS,
    INVALID_PATH,
    IO_ERROR,
    PARSE_ERROR,

    // Symlinks
    SYMLINK_INVALID,
    SYMLINK_CREATION_FAILED,

    // Installation lifecycle
    INSTALLATION_FAILED,
    BACKUP_FAILED,
    NOT_INSTALLED,
    USER_CANCELLED,

    // Collaborators
    SOURCE_NOT_FOUND,
    SOURCE_TRANSPORT,
    REVISION_NOT_FOUND,
    SCRIPT_FAILED,
};

const char* error_code_name(ErrorCode code);

/**
 * @brief Error type with code and message
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    std::string toString() const { return message_; }

private:
    ErrorCode code_;
    std::string message_;
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 *
 * Check isOk() before accessing value(), or isErr() before error().
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

    T valueOr(T default_value) const {
        if (has_value_) return value_.value();
        return default_value;
    }

    template<typename F>
    auto map(F func) -> Result<decltype(func(std::declval<T>())), E> {
        if (has_value_) {
            return Result<decltype(func(std::declval<T>())), E>::ok(func(value_.value()));
        }
        return Result<decltype(func(std::declval<T>())), E>::err(error_.value());
    }

    template<typename F>
    auto flatMap(F func) -> decltype(func(std::declval<T>())) {
        if (has_value_) {
            return func(value_.value());
        }
        return decltype(func(std::declval<T>()))::err(error_.value());
    }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

/**
 * @brief Specialization for operations that produce no value
 */
template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return !error_.has_value(); }
    bool isErr() const { return error_.has_value(); }

    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result() = default;
    explicit Result(E error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

using VoidResult = Result<void>;

// ============================================================================
// Helpers
// ============================================================================

// Map a filesystem error code onto the scb taxonomy, keeping the path and
// the system message in the error text.
Error error_from_errc(const std::error_code& ec, const std::string& path);

// Actionable one-line guidance for the operator.
std::string user_message(const Error& error);

// CLI exit code for an error.
int exit_code_for(const Error& error);

} // namespace scb
