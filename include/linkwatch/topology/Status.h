// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include <string>
#include <utility>

namespace linkwatch {

/**
 * @brief Failure classes reported by store and ingest operations.
 *
 * A rejected operation always leaves the store unchanged.
 */
enum class ErrorCode {
    Ok,
    Validation,          ///< Malformed payload or out-of-range field.
    NotFound,            ///< Unknown link or node id.
    AlreadyExists,       ///< Duplicate id insertion.
    FailedPrecondition,  ///< Referential integrity (node still owns links).
    Conflict,            ///< Explicit override older than the last one applied.
    Internal             ///< Invariant violation detected at runtime.
};

const char* to_string(ErrorCode code) noexcept;

/**
 * @brief Outcome of a mutating operation: an ErrorCode plus a human message.
 */
class Status {
public:
    Status() = default;
    Status(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    static Status ok() { return Status{}; }

    bool is_ok() const noexcept { return code_ == ErrorCode::Ok; }
    explicit operator bool() const noexcept { return is_ok(); }

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }

private:
    ErrorCode code_{ErrorCode::Ok};
    std::string message_{};
};

} // namespace linkwatch
