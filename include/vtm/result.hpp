#pragma once

/**
 * @file result.hpp
 * @brief Error and Result types shared by every VTM operation
 *
 * Operations that can fail return Result<T>. Check isOk() before accessing
 * value(), or isErr() before error().
 *
 * @example
 * ```cpp
 * vtm::FileManifestStore store("vtm.json");
 * auto loaded = store.load();
 * if (loaded.isErr()) {
 *     std::cerr << loaded.error().message() << "\n";
 * }
 * ```
 */

#include <optional>
#include <string>
#include <utility>

namespace vtm {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    // Usage
    TASK_NOT_FOUND,
    TRANSACTION_NOT_FOUND,
    INVALID_FILTER,
    INVALID_SORT,
    INVALID_ARGUMENT,
    INVALID_BATCH,

    // Data integrity
    MANIFEST_NOT_FOUND,
    CORRUPT_MANIFEST,
    CORRUPT_HISTORY,
    CYCLE_DETECTED,
    DANGLING_DEPENDENCY,
    DUPLICATE_TASK_ID,

    // Preconditions
    NOT_READY,
    VALIDATION_INCOMPLETE,
    INVALID_TRANSITION,
    BLOCKED_BY_DEPENDENTS,
    ALREADY_REVERTED,

    // System / IO
    IO_ERROR,
};

enum class ErrorKind {
    Usage,
    DataIntegrity,
    Precondition,
    Io
};

const char* error_code_to_string(ErrorCode code);

ErrorKind error_kind(ErrorCode code);

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
    ErrorKind kind() const { return error_kind(code_); }
    const std::string& message() const { return message_; }

private:
    ErrorCode code_;
    std::string message_;
};

/// Process exit code for an error: 1 usage/precondition, 2 integrity/IO
int exit_code_for(const Error& error);

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
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

} // namespace vtm
