#pragma once

#include "latbench/types.hpp"

#include <optional>
#include <string>
#include <utility>

namespace latbench {

// ============================================================================
// Error
// ============================================================================

/**
 * @brief Error that stops a run before the agent could execute
 *
 * Configuration errors carry the offending configuration key.
 */
class Error {
public:
    Error(ErrorKind kind, std::string message, std::string key = "")
        : kind_(kind), message_(std::move(message)), key_(std::move(key)) {}

    ErrorKind kind() const { return kind_; }
    const std::string& message() const { return message_; }
    const std::string& key() const { return key_; }

private:
    ErrorKind kind_;
    std::string message_;
    std::string key_;
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

} // namespace latbench
