#ifndef XPECONOMY_LEDGER_TRANSACTION_MANAGER_HPP
#define XPECONOMY_LEDGER_TRANSACTION_MANAGER_HPP

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <optional>
#include <functional>
#include <chrono>
#include <cstdint>
#include "config/economy_params.hpp"
#include "core/errors.hpp"
#include "core/types.hpp"
#include "storage/ledger_store.hpp"

/**
 * @file transaction_manager.hpp
 * @brief The only component that mutates account balances.
 *
 * Every earn and spend runs inside a unit of work:
 *   1. the account's mutex is taken (different accounts never wait on each other),
 *   2. a SQLite transaction is opened on the unit's own connection and the
 *      account row loaded,
 *   3. the caller's steps run against a LedgerSession,
 *   4. the account row is written back with a version compare-and-swap and the
 *      transaction commits.
 * A failed step, an expired deadline or a CAS mismatch rolls the whole unit back.
 * SQLite busy results and CAS mismatches are retried lockRetryLimit times, then
 * reported as TransientConflict.
 *
 * Example:
 *  @code
 *    TransactionManager tm(store, params);
 *    tm.CreateAccount("alice");
 *    auto earned = tm.Earn("alice", 120, core::sources::QuizCompletion, "Quiz on article 7");
 *    auto spent  = tm.Spend("alice", 100, core::sources::CommentPost, "Comment on article 7");
 *    if (!spent) {
 *        // spent.code() == ErrorCode::InsufficientXP, spent.shortfall() tells how much is missing
 *    }
 *  @endcode
 */

namespace xpeconomy {
namespace ledger {

using Deadline = std::chrono::steady_clock::time_point;

inline Deadline NoDeadline()
{
    return Deadline::max();
}

inline Deadline DeadlineIn(std::chrono::milliseconds budget)
{
    return std::chrono::steady_clock::now() + budget;
}

/**
 * Request keys the components derive for their own ledger steps look like
 * "<scope>:<requestId>[:<step>]". Caller-supplied request ids must not contain
 * ':', so the two can never collide.
 */
inline std::string DerivedRequestKey(const std::string &scope,
                                     const std::string &requestId,
                                     const std::string &step = "")
{
    if (requestId.empty()) {
        return std::string();
    }
    return scope + ":" + requestId + (step.empty() ? std::string() : ":" + step);
}

inline bool IsReservedRequestKey(const std::string &requestId)
{
    return requestId.find(':') != std::string::npos;
}

/**
 * @class LedgerSession
 * @brief View of one locked account inside a unit of work.
 *
 * Earn/Spend append transactions and update the in-memory account; the account
 * row itself is written once when the unit commits.
 *
 * A request key that is already on the ledger replays the stored transaction,
 * but only when account, type, amount, source and refs all match; anything else
 * is a ValidationError.
 */
class LedgerSession
{
public:
    LedgerSession(storage::LedgerStore &store, const config::EconomyParams &params, core::Account account);

    const core::Account& Account() const { return m_account; }
    storage::LedgerStore& Store() { return m_store; }
    int64_t Now() const { return m_now; }
    bool Dirty() const { return m_dirty; }

    core::Result<core::Transaction> Earn(int64_t amount,
                                         const std::string &source,
                                         const std::string &description,
                                         const core::TransactionRefs &refs = {},
                                         const std::string &requestKey = "");

    core::Result<core::Transaction> Spend(int64_t amount,
                                          const std::string &purpose,
                                          const std::string &description,
                                          const core::TransactionRefs &refs = {},
                                          const std::string &requestKey = "");

    void SetCurrentWpm(int64_t wpm);
    void SetMaxWpm(int64_t wpm);
    void SetStreak(int64_t streakDays, int64_t lastEarnDay);

private:
    core::Result<core::Transaction> append(core::TransactionType type,
                                           int64_t amount,
                                           const std::string &source,
                                           const std::string &description,
                                           const core::TransactionRefs &refs,
                                           const std::string &requestKey);
    std::optional<core::Result<core::Transaction>> replay(core::TransactionType type,
                                                          int64_t signedAmount,
                                                          const std::string &source,
                                                          const core::TransactionRefs &refs,
                                                          const std::string &requestKey);
    core::Status validateAmount(int64_t amount, const std::string &source) const;

    storage::LedgerStore &m_store;
    const config::EconomyParams &m_params;
    core::Account m_account;
    int64_t m_now;
    bool m_dirty;
};

class TransactionManager
{
public:
    TransactionManager(storage::LedgerStore &store, const config::EconomyParams &params);

    /**
     * @brief Register an account at the configured starting speeds.
     * Duplicate ids are a ValidationError.
     */
    core::Result<core::Account> CreateAccount(const std::string &accountId);

    /// Increments accumulated and spendable XP and appends an EARN row.
    core::Result<core::Transaction> Earn(const std::string &accountId,
                                         int64_t amount,
                                         const std::string &source,
                                         const std::string &description,
                                         const core::TransactionRefs &refs = {},
                                         const std::string &requestKey = "",
                                         Deadline deadline = NoDeadline());

    /// Decrements spendable XP only; InsufficientXP (with shortfall) leaves everything untouched.
    core::Result<core::Transaction> Spend(const std::string &accountId,
                                          int64_t amount,
                                          const std::string &purpose,
                                          const std::string &description,
                                          const core::TransactionRefs &refs = {},
                                          const std::string &requestKey = "",
                                          Deadline deadline = NoDeadline());

    /**
     * @brief Run several ledger steps on one account as a single atomic unit.
     *
     * fn receives a LedgerSession& and returns core::Result<T>. A failed result
     * rolls the unit back and is returned unchanged.
     */
    template <typename T, typename Fn>
    core::Result<T> Execute(const std::string &accountId, Fn &&fn, Deadline deadline = NoDeadline())
    {
        std::optional<core::Result<T>> produced;
        core::Status status = runUnit(accountId, [&](LedgerSession &session) -> core::Status {
            produced.emplace(fn(session));
            if (!produced->ok()) {
                return core::Status::From(*produced);
            }
            return core::OkStatus();
        }, deadline);

        if (!status.ok()) {
            return core::Result<T>::From(status);
        }
        return std::move(*produced);
    }

    core::Status Freeze(const std::string &accountId, const std::string &reason);
    core::Status Unfreeze(const std::string &accountId);

    // Reads
    core::Result<core::Balance> GetBalance(const std::string &accountId);
    core::Result<core::Account> GetAccount(const std::string &accountId);
    core::Result<std::vector<core::Transaction>> GetHistory(const std::string &accountId,
                                                            std::optional<core::TransactionType> type = std::nullopt,
                                                            size_t limit = 50);
    core::Result<core::BalanceSummary> GetBalanceSummary(const std::string &accountId, size_t recentLimit = 10);

    const config::EconomyParams& Params() const { return m_params; }
    storage::LedgerStore& Store() { return m_store; }

private:
    core::Status runUnit(const std::string &accountId,
                         const std::function<core::Status(LedgerSession&)> &body,
                         Deadline deadline);
    std::shared_ptr<std::timed_mutex> accountMutex(const std::string &accountId);
    void backoff(uint32_t attempt, bool busy) const;

    storage::LedgerStore &m_store;
    const config::EconomyParams &m_params;

    std::mutex m_registryMutex;
    std::unordered_map<std::string, std::shared_ptr<std::timed_mutex>> m_accountLocks;
};

} // namespace ledger
} // namespace xpeconomy

#endif // XPECONOMY_LEDGER_TRANSACTION_MANAGER_HPP
