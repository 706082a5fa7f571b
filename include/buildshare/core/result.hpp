/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file result.hpp
 * @brief Outcome type returned by every store operation.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace buildshare::core {

/**
 * @enum ErrorKind
 * @brief Failure classes a caller can act on.
 */
enum class ErrorKind {
    NONE,            ///< Success.
    VALIDATION,      ///< Bad input. Nothing was read or written.
    NOT_FOUND,       ///< No record has the given code.
    CONFLICT,        ///< Identifier space exhausted after bounded retries.
    DATA_CORRUPTION, ///< A stored payload cannot be decoded.
    INFRASTRUCTURE,  ///< Storage failure or unexpected exception.
    CANCELLED        ///< The caller withdrew the request.
};

const char* to_string(ErrorKind kind);

/// @brief Value type for operations that return nothing on success.
struct Unit {};

/**
 * @class OperationResult
 * @brief A success carrying a `T`, or a failure carrying an `ErrorKind`.
 *
 * Both outcomes carry a human-readable message.
 */
template <typename T>
class OperationResult {
  public:
    static OperationResult success(std::string message, T value)
    {
        return OperationResult(ErrorKind::NONE, std::move(message), std::move(value));
    }

    static OperationResult failure(ErrorKind kind, std::string message)
    {
        return OperationResult(kind, std::move(message), std::nullopt);
    }

    bool ok() const { return error_ == ErrorKind::NONE; }
    ErrorKind error() const { return error_; }
    const std::string& message() const { return message_; }

    /// @brief "Success" or "Failed".
    const char* status() const { return ok() ? "Success" : "Failed"; }

    /**
     * @throws std::logic_error If called on a failure.
     */
    const T& value() const
    {
        if (!value_) {
            throw std::logic_error("OperationResult: No value on a failed result");
        }
        return *value_;
    }

    T& value()
    {
        if (!value_) {
            throw std::logic_error("OperationResult: No value on a failed result");
        }
        return *value_;
    }

  private:
    OperationResult(ErrorKind kind, std::string message, std::optional<T> value)
        : error_(kind), message_(std::move(message)), value_(std::move(value))
    {
    }

    ErrorKind error_;
    std::string message_;
    std::optional<T> value_;
};

} // namespace buildshare::core
