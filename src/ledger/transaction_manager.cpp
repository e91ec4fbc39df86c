#include "ledger/transaction_manager.hpp"
#include "ledger/audit_chain.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <thread>

namespace xpeconomy {
namespace ledger {

using core::ErrorCode;
using core::Result;
using core::Status;
using core::Transaction;
using core::TransactionType;

// -----------------------------------------------------------------------------
// LedgerSession
// -----------------------------------------------------------------------------
LedgerSession::LedgerSession(storage::LedgerStore &store, const config::EconomyParams &params, core::Account account)
    : m_store(store), m_params(params), m_account(std::move(account)), m_now(store.NowMillis()), m_dirty(false)
{
}

Result<Transaction> LedgerSession::Earn(int64_t amount,
                                        const std::string &source,
                                        const std::string &description,
                                        const core::TransactionRefs &refs,
                                        const std::string &requestKey)
{
    if (auto replayed = replay(TransactionType::Earn, amount, source, refs, requestKey)) {
        return *replayed;
    }
    Status valid = validateAmount(amount, source);
    if (!valid) {
        return Result<Transaction>::From(valid);
    }

    m_account.accumulatedXp += amount;
    m_account.spendableXp += amount;
    return append(TransactionType::Earn, amount, source, description, refs, requestKey);
}

Result<Transaction> LedgerSession::Spend(int64_t amount,
                                         const std::string &purpose,
                                         const std::string &description,
                                         const core::TransactionRefs &refs,
                                         const std::string &requestKey)
{
    if (auto replayed = replay(TransactionType::Spend, -amount, purpose, refs, requestKey)) {
        return *replayed;
    }
    Status valid = validateAmount(amount, purpose);
    if (!valid) {
        return Result<Transaction>::From(valid);
    }

    if (m_account.spendingFrozen) {
        return Result<Transaction>::Fail(ErrorCode::AccountFrozen,
            "Spending is frozen for " + m_account.accountId + ": " + m_account.frozenReason);
    }
    if (m_account.spendableXp < amount) {
        int64_t shortfall = amount - m_account.spendableXp;
        return Result<Transaction>::Fail(ErrorCode::InsufficientXP,
            "Insufficient XP: need " + std::to_string(amount) + ", have "
            + std::to_string(m_account.spendableXp) + " (short by " + std::to_string(shortfall) + ")",
            shortfall);
    }

    m_account.spendableXp -= amount;
    return append(TransactionType::Spend, -amount, purpose, description, refs, requestKey);
}

void LedgerSession::SetCurrentWpm(int64_t wpm)
{
    m_account.currentWpm = wpm;
    m_dirty = true;
}

void LedgerSession::SetMaxWpm(int64_t wpm)
{
    m_account.maxWpm = wpm;
    m_dirty = true;
}

void LedgerSession::SetStreak(int64_t streakDays, int64_t lastEarnDay)
{
    m_account.streakDays = streakDays;
    m_account.lastEarnDay = lastEarnDay;
    m_dirty = true;
}

Result<Transaction> LedgerSession::append(TransactionType type,
                                          int64_t amount,
                                          const std::string &source,
                                          const std::string &description,
                                          const core::TransactionRefs &refs,
                                          const std::string &requestKey)
{
    Transaction tx;
    tx.accountId    = m_account.accountId;
    tx.type         = type;
    tx.amount       = amount;
    tx.source       = source;
    tx.description  = description;
    tx.balanceAfter = m_account.spendableXp;
    tx.createdAt    = m_now;
    tx.refs         = refs;
    tx.requestKey   = requestKey;
    tx.prevHash     = m_account.lastHash.empty() ? util::hashing::genesisHash() : m_account.lastHash;
    tx.entryHash    = computeEntryHash(tx);

    tx.id = m_store.InsertTransaction(tx);
    m_account.lastHash = tx.entryHash;
    m_dirty = true;

    util::logger::debug(std::string("[TransactionManager] ") + core::transactionTypeName(type) + " "
                        + std::to_string(amount) + " " + source + " for " + m_account.accountId
                        + " (balance " + std::to_string(tx.balanceAfter) + ")");
    return Result<Transaction>::Ok(tx);
}

std::optional<Result<Transaction>> LedgerSession::replay(TransactionType type,
                                                        int64_t signedAmount,
                                                        const std::string &source,
                                                        const core::TransactionRefs &refs,
                                                        const std::string &requestKey)
{
    if (requestKey.empty()) {
        return std::nullopt;
    }
    auto existing = m_store.FindTransactionByRequestKey(requestKey);
    if (!existing) {
        return std::nullopt;
    }
    if (existing->accountId != m_account.accountId || existing->type != type) {
        return Result<Transaction>::Fail(ErrorCode::ValidationError,
            "Request key '" + requestKey + "' was already used for a different operation");
    }
    if (existing->amount != signedAmount || existing->source != source
        || existing->refs.quizAttemptId != refs.quizAttemptId
        || existing->refs.commentId != refs.commentId
        || existing->refs.featureRef != refs.featureRef) {
        util::logger::warn("[TransactionManager] Request key " + requestKey + " reused with different terms for "
                           + m_account.accountId);
        return Result<Transaction>::Fail(ErrorCode::ValidationError,
            "Request key '" + requestKey + "' was already used for " + std::to_string(existing->amount) + " XP ("
            + existing->source + ")");
    }
    existing->replayed = true;
    util::logger::info("[TransactionManager] Replaying request " + requestKey + " for " + m_account.accountId);
    return Result<Transaction>::Ok(*existing);
}

Status LedgerSession::validateAmount(int64_t amount, const std::string &source) const
{
    if (amount <= 0) {
        return Status::Fail(ErrorCode::ValidationError,
            "Amount must be positive, got " + std::to_string(amount));
    }
    if (amount > m_params.maxTransactionAmount) {
        return Status::Fail(ErrorCode::ValidationError,
            "Amount " + std::to_string(amount) + " exceeds the per-transaction limit of "
            + std::to_string(m_params.maxTransactionAmount));
    }
    if (source.empty()) {
        return Status::Fail(ErrorCode::ValidationError, "Transaction source must not be empty");
    }
    return core::OkStatus();
}

// -----------------------------------------------------------------------------
// TransactionManager
// -----------------------------------------------------------------------------
TransactionManager::TransactionManager(storage::LedgerStore &store, const config::EconomyParams &params)
    : m_store(store), m_params(params)
{
}

Result<core::Account> TransactionManager::CreateAccount(const std::string &accountId)
{
    if (accountId.empty()) {
        return Result<core::Account>::Fail(ErrorCode::ValidationError, "Account id must not be empty");
    }

    core::Account account;
    account.accountId  = accountId;
    account.currentWpm = m_params.initialCurrentWpm;
    account.maxWpm     = m_params.initialMaxWpm;
    account.lastHash   = util::hashing::genesisHash();
    account.createdAt  = m_store.NowMillis();

    bool inserted = false;
    try {
        m_store.RunInTransaction([&]() {
            inserted = m_store.InsertAccount(account);
            return inserted;
        });
    }
    catch (const core::StoreError &ex) {
        util::logger::error(std::string("[TransactionManager] CreateAccount failed: ") + ex.what());
        return Result<core::Account>::Fail(ex.busy() ? ErrorCode::TransientConflict : ErrorCode::StorageError,
                                           ex.what());
    }

    if (!inserted) {
        return Result<core::Account>::Fail(ErrorCode::ValidationError,
                                           "Account '" + accountId + "' already exists");
    }
    util::logger::info("[TransactionManager] Created account " + accountId);
    return Result<core::Account>::Ok(account);
}

Result<Transaction> TransactionManager::Earn(const std::string &accountId,
                                             int64_t amount,
                                             const std::string &source,
                                             const std::string &description,
                                             const core::TransactionRefs &refs,
                                             const std::string &requestKey,
                                             Deadline deadline)
{
    return Execute<Transaction>(accountId, [&](LedgerSession &session) {
        return session.Earn(amount, source, description, refs, requestKey);
    }, deadline);
}

Result<Transaction> TransactionManager::Spend(const std::string &accountId,
                                              int64_t amount,
                                              const std::string &purpose,
                                              const std::string &description,
                                              const core::TransactionRefs &refs,
                                              const std::string &requestKey,
                                              Deadline deadline)
{
    auto result = Execute<Transaction>(accountId, [&](LedgerSession &session) {
        return session.Spend(amount, purpose, description, refs, requestKey);
    }, deadline);
    if (!result && result.code() == ErrorCode::InsufficientXP) {
        util::logger::info("[TransactionManager] Spend rejected for " + accountId + ": " + result.message());
    }
    return result;
}

Status TransactionManager::Freeze(const std::string &accountId, const std::string &reason)
{
    Status status = runUnit(accountId, [&](LedgerSession &session) -> Status {
        session.Store().SetSpendingFrozen(accountId, true, reason);
        return core::OkStatus();
    }, NoDeadline());
    if (status) {
        util::logger::warn("[TransactionManager] Spending frozen for " + accountId + ": " + reason);
    }
    return status;
}

Status TransactionManager::Unfreeze(const std::string &accountId)
{
    Status status = runUnit(accountId, [&](LedgerSession &session) -> Status {
        if (!session.Account().spendingFrozen) {
            return Status::Fail(ErrorCode::ValidationError, "Account " + accountId + " is not frozen");
        }
        session.Store().SetSpendingFrozen(accountId, false, "");
        return core::OkStatus();
    }, NoDeadline());
    if (status) {
        util::logger::info("[TransactionManager] Spending unfrozen for " + accountId);
    }
    return status;
}

Result<core::Balance> TransactionManager::GetBalance(const std::string &accountId)
{
    try {
        auto account = m_store.LoadAccount(accountId);
        if (!account) {
            return Result<core::Balance>::Fail(ErrorCode::NotFound, "Unknown account '" + accountId + "'");
        }
        core::Balance balance;
        balance.accumulatedXp = account->accumulatedXp;
        balance.spendableXp = account->spendableXp;
        return Result<core::Balance>::Ok(balance);
    }
    catch (const core::StoreError &ex) {
        util::logger::error(std::string("[TransactionManager] GetBalance failed: ") + ex.what());
        return Result<core::Balance>::Fail(ErrorCode::StorageError, ex.what());
    }
}

Result<core::Account> TransactionManager::GetAccount(const std::string &accountId)
{
    try {
        auto account = m_store.LoadAccount(accountId);
        if (!account) {
            return Result<core::Account>::Fail(ErrorCode::NotFound, "Unknown account '" + accountId + "'");
        }
        account->ownedFeatures = m_store.OwnedFeatures(accountId);
        return Result<core::Account>::Ok(*account);
    }
    catch (const core::StoreError &ex) {
        util::logger::error(std::string("[TransactionManager] GetAccount failed: ") + ex.what());
        return Result<core::Account>::Fail(ErrorCode::StorageError, ex.what());
    }
}

Result<std::vector<Transaction>> TransactionManager::GetHistory(const std::string &accountId,
                                                                std::optional<TransactionType> type,
                                                                size_t limit)
{
    try {
        if (!m_store.LoadAccount(accountId)) {
            return Result<std::vector<Transaction>>::Fail(ErrorCode::NotFound,
                                                          "Unknown account '" + accountId + "'");
        }
        return Result<std::vector<Transaction>>::Ok(m_store.LoadTransactions(accountId, type, limit, true));
    }
    catch (const core::StoreError &ex) {
        util::logger::error(std::string("[TransactionManager] GetHistory failed: ") + ex.what());
        return Result<std::vector<Transaction>>::Fail(ErrorCode::StorageError, ex.what());
    }
}

Result<core::BalanceSummary> TransactionManager::GetBalanceSummary(const std::string &accountId, size_t recentLimit)
{
    try {
        auto account = m_store.LoadAccount(accountId);
        if (!account) {
            return Result<core::BalanceSummary>::Fail(ErrorCode::NotFound, "Unknown account '" + accountId + "'");
        }
        storage::TransactionTotals totals = m_store.SumTransactions(accountId);

        core::BalanceSummary summary;
        summary.accountId      = accountId;
        summary.accumulatedXp  = account->accumulatedXp;
        summary.spendableXp    = account->spendableXp;
        summary.lifetimeEarned = totals.sumEarned;
        summary.lifetimeSpent  = totals.sumSpent;
        summary.currentWpm     = account->currentWpm;
        summary.maxWpm         = account->maxWpm;
        summary.spendingFrozen = account->spendingFrozen;
        summary.recent         = m_store.LoadTransactions(accountId, std::nullopt, recentLimit, true);
        return Result<core::BalanceSummary>::Ok(summary);
    }
    catch (const core::StoreError &ex) {
        util::logger::error(std::string("[TransactionManager] GetBalanceSummary failed: ") + ex.what());
        return Result<core::BalanceSummary>::Fail(ErrorCode::StorageError, ex.what());
    }
}

// -----------------------------------------------------------------------------
// Unit of work
// -----------------------------------------------------------------------------
std::shared_ptr<std::timed_mutex> TransactionManager::accountMutex(const std::string &accountId)
{
    std::lock_guard<std::mutex> lock(m_registryMutex);
    auto &slot = m_accountLocks[accountId];
    if (!slot) {
        slot = std::make_shared<std::timed_mutex>();
    }
    return slot;
}

void TransactionManager::backoff(uint32_t attempt, bool busy) const
{
    // A busy ledger means another unit is between its first write and its commit.
    const uint32_t kMinBusyBackoffMs = 5;
    uint32_t stepMs = busy ? std::max(m_params.retryBackoffMs, kMinBusyBackoffMs) : m_params.retryBackoffMs;
    if (stepMs == 0) {
        return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(stepMs * (attempt + 1)));
}

Status TransactionManager::runUnit(const std::string &accountId,
                                   const std::function<Status(LedgerSession&)> &body,
                                   Deadline deadline)
{
    if (accountId.empty()) {
        return Status::Fail(ErrorCode::ValidationError, "Account id must not be empty");
    }

    auto mutex = accountMutex(accountId);
    std::unique_lock<std::timed_mutex> accountLock(*mutex, std::defer_lock);
    if (deadline == NoDeadline()) {
        accountLock.lock();
    }
    else if (!accountLock.try_lock_until(deadline)) {
        return Status::Fail(ErrorCode::Timeout, "Deadline expired waiting for account " + accountId);
    }

    for (uint32_t attempt = 0; attempt <= m_params.lockRetryLimit; ++attempt) {
        if (std::chrono::steady_clock::now() > deadline) {
            return Status::Fail(ErrorCode::Timeout, "Deadline expired before commit for account " + accountId);
        }

        Status outcome = core::OkStatus();
        bool versionConflict = false;
        try {
            m_store.RunInTransaction([&]() {
                auto account = m_store.LoadAccount(accountId);
                if (!account) {
                    outcome = Status::Fail(ErrorCode::NotFound, "Unknown account '" + accountId + "'");
                    return false;
                }

                int64_t expectedVersion = account->version;
                LedgerSession session(m_store, m_params, *account);
                outcome = body(session);
                if (!outcome.ok()) {
                    return false;
                }
                if (session.Dirty() && !m_store.UpdateAccount(session.Account(), expectedVersion)) {
                    versionConflict = true;
                    return false;
                }
                if (std::chrono::steady_clock::now() > deadline) {
                    outcome = Status::Fail(ErrorCode::Timeout,
                                           "Deadline expired before commit for account " + accountId);
                    return false;
                }
                return true;
            });
        }
        catch (const core::StoreError &ex) {
            if (ex.busy()) {
                util::logger::warn("[TransactionManager] Ledger busy for " + accountId + " (attempt "
                                   + std::to_string(attempt + 1) + "): " + ex.what());
                backoff(attempt, true);
                continue;
            }
            util::logger::error(std::string("[TransactionManager] Storage failure for ") + accountId + ": "
                                + ex.what());
            return Status::Fail(ErrorCode::StorageError, ex.what());
        }

        if (versionConflict) {
            util::logger::warn("[TransactionManager] Version conflict on " + accountId + " (attempt "
                               + std::to_string(attempt + 1) + ")");
            backoff(attempt, false);
            continue;
        }
        return outcome;
    }

    util::logger::warn("[TransactionManager] Giving up on " + accountId + " after "
                       + std::to_string(m_params.lockRetryLimit) + " retries");
    return Status::Fail(ErrorCode::TransientConflict,
                        "Account " + accountId + " is busy, retry later");
}

} // namespace ledger
} // namespace xpeconomy
