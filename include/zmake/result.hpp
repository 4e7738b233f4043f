#pragma once

/**
 * @file result.hpp
 * @brief Error and Result types used across zmake
 *
 * Fallible operations return Result<T>. Errors carry an ErrorCode so the
 * orchestrator can decide whether the active execution policy may absorb
 * them or whether they must abort the run.
 */

#include <optional>
#include <string>
#include <utility>

namespace zmake {

// ============================================================================
// Error Handling
// ============================================================================

/**
 * @brief Error codes for zmake operations
 */
enum class ErrorCode {
    // System / IO
    IO_ERROR,

    // Load-time configuration errors (always fatal)
    PARSE_ERROR,
    CONSTRAINT_ERROR,

    // Run-time errors adjudicated by the execution policy
    COMMAND_FAILED,
    BLOCK_NOT_FOUND,

    // Run-time errors that are fatal regardless of policy
    SPAWN_FAILED,
    BLOCK_CYCLE,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::IO_ERROR: return "io_error";
        case ErrorCode::PARSE_ERROR: return "parse_error";
        case ErrorCode::CONSTRAINT_ERROR: return "constraint_error";
        case ErrorCode::COMMAND_FAILED: return "command_failed";
        case ErrorCode::BLOCK_NOT_FOUND: return "block_not_found";
        case ErrorCode::SPAWN_FAILED: return "spawn_failed";
        case ErrorCode::BLOCK_CYCLE: return "block_cycle";
        default: return "unknown";
    }
}

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
    std::string toString() const {
        return std::string(error_code_to_string(code_)) + ": " + message_;
    }

    // Errors no execution policy may absorb
    bool isFatal() const {
        return code_ == ErrorCode::SPAWN_FAILED || code_ == ErrorCode::BLOCK_CYCLE ||
               code_ == ErrorCode::IO_ERROR;
    }

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

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

} // namespace zmake
