#ifndef XPECONOMY_CORE_ERRORS_HPP
#define XPECONOMY_CORE_ERRORS_HPP

#include <string>
#include <optional>
#include <stdexcept>
#include <utility>
#include <cstdint>

/**
 * @file errors.hpp
 * @brief Error taxonomy and the Result<T> type returned by every ledger operation.
 *
 * Ordinary failures (not enough XP, already owned, bad input) are values, not
 * exceptions. StoreError is the only exception type and never leaves the
 * transaction manager.
 */

namespace xpeconomy {
namespace core {

enum class ErrorCode {
    Ok = 0,
    InsufficientXP,
    AlreadyOwned,
    TransientConflict,
    InvariantViolation,
    ValidationError,
    NotFound,
    AccountFrozen,
    CommentLocked,
    PrerequisiteMissing,
    Timeout,
    StorageError
};

inline const char* errorCodeName(ErrorCode code)
{
    switch (code) {
    case ErrorCode::Ok:                  return "Ok";
    case ErrorCode::InsufficientXP:      return "InsufficientXP";
    case ErrorCode::AlreadyOwned:        return "AlreadyOwned";
    case ErrorCode::TransientConflict:   return "TransientConflict";
    case ErrorCode::InvariantViolation:  return "InvariantViolation";
    case ErrorCode::ValidationError:     return "ValidationError";
    case ErrorCode::NotFound:            return "NotFound";
    case ErrorCode::AccountFrozen:       return "AccountFrozen";
    case ErrorCode::CommentLocked:       return "CommentLocked";
    case ErrorCode::PrerequisiteMissing: return "PrerequisiteMissing";
    case ErrorCode::Timeout:             return "Timeout";
    case ErrorCode::StorageError:        return "StorageError";
    }
    return "Unknown";
}

/**
 * @class Result
 * @brief Either a value or an error code with a human readable reason.
 *
 * For InsufficientXP the exact shortfall is carried in shortfall().
 */
template <typename T>
class Result
{
public:
    static Result Ok(T value)
    {
        Result r;
        r.m_code = ErrorCode::Ok;
        r.m_value = std::move(value);
        return r;
    }

    static Result Fail(ErrorCode code, std::string message, int64_t shortfall = 0)
    {
        Result r;
        r.m_code = code;
        r.m_message = std::move(message);
        r.m_shortfall = shortfall;
        return r;
    }

    /// Re-type a failure from another Result, keeping code, message and shortfall.
    template <typename U>
    static Result From(const Result<U> &other)
    {
        return Fail(other.code(), other.message(), other.shortfall());
    }

    bool ok() const { return m_code == ErrorCode::Ok; }
    explicit operator bool() const { return ok(); }

    ErrorCode code() const { return m_code; }
    const std::string& message() const { return m_message; }
    int64_t shortfall() const { return m_shortfall; }

    /// @throw std::logic_error when called on a failed result.
    const T& value() const
    {
        if (!m_value) {
            throw std::logic_error(std::string("Result::value() on failure: ") + errorCodeName(m_code)
                                   + " " + m_message);
        }
        return *m_value;
    }

    T& value()
    {
        if (!m_value) {
            throw std::logic_error(std::string("Result::value() on failure: ") + errorCodeName(m_code)
                                   + " " + m_message);
        }
        return *m_value;
    }

private:
    Result() = default;

    ErrorCode m_code = ErrorCode::Ok;
    std::string m_message;
    int64_t m_shortfall = 0;
    std::optional<T> m_value;
};

/// Value type for operations that succeed without producing anything.
struct Unit {};

using Status = Result<Unit>;

inline Status OkStatus()
{
    return Status::Ok(Unit{});
}

/**
 * @class StoreError
 * @brief Raised by the SQLite layer. busy() marks SQLITE_BUSY / SQLITE_LOCKED,
 *        which the transaction manager retries.
 */
class StoreError : public std::runtime_error
{
public:
    StoreError(const std::string &what, int sqliteCode, bool busy)
        : std::runtime_error(what), m_sqliteCode(sqliteCode), m_busy(busy)
    {
    }

    int sqliteCode() const { return m_sqliteCode; }
    bool busy() const { return m_busy; }

private:
    int m_sqliteCode;
    bool m_busy;
};

} // namespace core
} // namespace xpeconomy

#endif // XPECONOMY_CORE_ERRORS_HPP
