#pragma once

/**
 * @file result.hpp
 * @brief Error and Result types used across the cairn API
 *
 * Every fallible pool or storage operation returns a Result<T>. Expected
 * failures (validation, missing source files, corrupt records) are carried as
 * an Error value; nothing in the public surface throws for them.
 *
 * @example
 * ```cpp
 * auto acquired = pool.isManifestAcquired(id);
 * if (acquired.isOk() && acquired.value()) {
 *     // ...
 * } else if (acquired.isErr()) {
 *     std::cerr << acquired.error().message() << "\n";
 * }
 * ```
 */

#include <optional>
#include <string>
#include <utility>

namespace cairn {

// ============================================================================
// Error Handling
// ============================================================================

/**
 * @brief Error codes for cairn operations
 */
enum class ErrorCode {
    // Input
    INVALID_ID,
    VALIDATION_FAILED,
    PATH_TRAVERSAL,
    CONFIG_INVALID,

    // Pool state
    NOT_STORED,
    MANIFEST_NOT_FOUND,
    MANIFEST_CORRUPT,

    // Content
    SOURCE_MISSING,
    HASH_MISMATCH,
    SIZE_MISMATCH,
    HASH_FAILED,

    // System / IO
    IO_ERROR,
    CANCELLED,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_ID: return "INVALID_ID";
        case ErrorCode::VALIDATION_FAILED: return "VALIDATION_FAILED";
        case ErrorCode::PATH_TRAVERSAL: return "PATH_TRAVERSAL";
        case ErrorCode::CONFIG_INVALID: return "CONFIG_INVALID";
        case ErrorCode::NOT_STORED: return "NOT_STORED";
        case ErrorCode::MANIFEST_NOT_FOUND: return "MANIFEST_NOT_FOUND";
        case ErrorCode::MANIFEST_CORRUPT: return "MANIFEST_CORRUPT";
        case ErrorCode::SOURCE_MISSING: return "SOURCE_MISSING";
        case ErrorCode::HASH_MISMATCH: return "HASH_MISMATCH";
        case ErrorCode::SIZE_MISMATCH: return "SIZE_MISMATCH";
        case ErrorCode::HASH_FAILED: return "HASH_FAILED";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        case ErrorCode::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

/**
 * @brief Error type with code and message
 *
 * The message is never empty: an empty message is replaced by the code name.
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        if (message_.empty()) {
            message_ = error_code_to_string(code_);
        }
    }

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    std::string toString() const {
        return std::string(error_code_to_string(code_)) + ": " + message_;
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

} // namespace cairn
