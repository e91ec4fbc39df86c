#include "monitor/ledger_monitor.hpp"
#include "ledger/audit_chain.hpp"
#include "util/logger.hpp"

#include <cstdlib>
#include <future>
#include <set>
#include <sstream>

namespace xpeconomy {
namespace monitor {

using core::ErrorCode;
using core::Result;

namespace {

constexpr int64_t kMinuteMillis = 60 * 1000;

std::string flagKey(const std::string &kind, const std::string &detail)
{
    return kind + "|" + detail;
}

// Plain-text dump of the account row and its full history, one row per line.
std::string serializeHistory(const core::Account &account, const std::vector<core::Transaction> &history)
{
    std::ostringstream oss;
    oss << "account=" << account.accountId
        << " accumulated=" << account.accumulatedXp
        << " spendable=" << account.spendableXp
        << " version=" << account.version
        << " head=" << account.lastHash << "\n";
    for (const auto &tx : history) {
        oss << tx.id << "|" << core::transactionTypeName(tx.type) << "|" << tx.amount << "|" << tx.source
            << "|" << tx.description << "|" << tx.balanceAfter << "|" << tx.createdAt << "|" << tx.requestKey
            << "|" << tx.prevHash << "|" << tx.entryHash << "\n";
    }
    return oss.str();
}

} // namespace

LedgerMonitor::LedgerMonitor(ledger::TransactionManager &transactions, const config::EconomyParams &params,
                             size_t threadCount)
    : m_transactions(transactions), m_params(params), m_pool(threadCount)
{
}

Result<AccountAudit> LedgerMonitor::AuditAccount(const std::string &accountId)
{
    using R = Result<AccountAudit>;

    R result = R::Fail(ErrorCode::StorageError, "audit did not run");
    try {
        result = m_transactions.Execute<AccountAudit>(accountId, [&](ledger::LedgerSession &session) {
            storage::LedgerStore &store = session.Store();
            const core::Account &account = session.Account();

            AccountAudit audit;
            audit.accountId = accountId;

            std::set<std::string> known;
            for (const auto &flag : store.LoadReviewFlags(accountId)) {
                known.insert(flagKey(flag.kind, flag.detail));
            }

            std::vector<core::ReviewFlag> found;
            auto note = [&](const std::string &kind, const std::string &detail, bool violation) {
                if (known.count(flagKey(kind, detail))) {
                    return;
                }
                core::ReviewFlag flag;
                flag.accountId = accountId;
                flag.kind = kind;
                flag.detail = detail;
                flag.violation = violation;
                flag.createdAt = session.Now();
                found.push_back(flag);
            };

            // ---- hard invariants ------------------------------------------
            if (account.spendableXp < 0 || account.accumulatedXp < 0) {
                note("negative_balance", "spendable=" + std::to_string(account.spendableXp)
                     + " accumulated=" + std::to_string(account.accumulatedXp), true);
            }

            storage::TransactionTotals totals = store.SumTransactions(accountId);
            if (totals.sumAmount != account.spendableXp) {
                note("reconciliation_spendable", "ledger sum " + std::to_string(totals.sumAmount)
                     + " != stored spendable " + std::to_string(account.spendableXp), true);
            }
            if (totals.sumEarned != account.accumulatedXp) {
                note("reconciliation_accumulated", "earned sum " + std::to_string(totals.sumEarned)
                     + " != stored accumulated " + std::to_string(account.accumulatedXp), true);
            }

            std::vector<core::Transaction> history = store.LoadTransactions(accountId);
            long broken = ledger::firstBrokenLink(history, account.lastHash);
            if (broken >= 0) {
                std::string where = static_cast<size_t>(broken) < history.size()
                    ? "transaction " + std::to_string(history[static_cast<size_t>(broken)].id)
                    : std::string("account head");
                note("hash_chain", "chain broken at " + where, true);
            }

            // ---- advisory --------------------------------------------------
            int64_t windowStart = session.Now() - m_params.velocityWindowSeconds * 1000;
            int64_t earnedInWindow = 0;
            for (const auto &tx : history) {
                if (tx.type == core::TransactionType::Earn && tx.createdAt >= windowStart) {
                    earnedInWindow += tx.amount;
                }
                if (std::llabs(tx.amount) > m_params.largeTransactionThreshold) {
                    note("large_transaction", "transaction " + std::to_string(tx.id) + " amount "
                         + std::to_string(tx.amount), false);
                }
            }
            if (earnedInWindow > m_params.velocityThresholdXp) {
                note("velocity", std::to_string(earnedInWindow) + " XP earned within "
                     + std::to_string(m_params.velocityWindowSeconds) + "s", false);
            }

            size_t first = 0;
            for (size_t last = 0; last < history.size(); ++last) {
                while (history[last].createdAt - history[first].createdAt >= kMinuteMillis) {
                    ++first;
                }
                int64_t inMinute = static_cast<int64_t>(last - first + 1);
                if (inMinute > m_params.maxTransactionsPerMinute) {
                    note("burst", std::to_string(inMinute) + "+ transactions within one minute from transaction "
                         + std::to_string(history[first].id), false);
                    break;
                }
            }

            // ---- record ----------------------------------------------------
            bool violation = false;
            for (auto &flag : found) {
                flag.id = store.InsertReviewFlag(flag);
                violation = violation || flag.violation;
            }
            if (violation) {
                audit.archiveId = store.ArchiveSnapshot(accountId, "invariant violation",
                                                        serializeHistory(account, history));
                if (m_params.freezeOnViolation && !account.spendingFrozen) {
                    store.SetSpendingFrozen(accountId, true, "invariant violation under review");
                    audit.frozen = true;
                }
            }

            audit.findings = std::move(found);
            return R::Ok(audit);
        });
    }
    catch (const std::exception &ex) {
        util::logger::error("[LedgerMonitor] Audit of " + accountId + " failed: " + ex.what());
        return R::Fail(ErrorCode::StorageError, ex.what());
    }
    if (!result) {
        return result;
    }

    const AccountAudit &audit = result.value();
    for (const auto &flag : audit.findings) {
        if (flag.violation) {
            util::logger::critical("[LedgerMonitor] InvariantViolation on " + accountId + ": "
                                   + flag.kind + " (" + flag.detail + ")");
        }
        else {
            util::logger::warn("[LedgerMonitor] Review flag on " + accountId + ": " + flag.kind
                               + " (" + flag.detail + ")");
        }
    }
    if (audit.archiveId > 0) {
        util::logger::info("[LedgerMonitor] History of " + accountId + " archived as #"
                           + std::to_string(audit.archiveId));
    }
    if (audit.frozen) {
        util::logger::critical("[LedgerMonitor] Spending frozen for " + accountId + " pending investigation");
    }
    return result;
}

MonitorReport LedgerMonitor::RunCycle()
{
    MonitorReport report;

    std::vector<std::string> accountIds;
    try {
        accountIds = m_transactions.Store().ListAccountIds();
    }
    catch (const core::StoreError &ex) {
        util::logger::error(std::string("[LedgerMonitor] Could not list accounts: ") + ex.what());
        report.failures = 1;
        return report;
    }

    std::vector<std::future<Result<AccountAudit>>> pending;
    pending.reserve(accountIds.size());
    for (const auto &id : accountIds) {
        pending.push_back(m_pool.enqueue([this, id]() { return AuditAccount(id); }));
    }

    for (auto &future : pending) {
        Result<AccountAudit> audit = future.get();
        ++report.accountsChecked;
        if (!audit) {
            ++report.failures;
            continue;
        }
        for (const auto &flag : audit.value().findings) {
            if (flag.violation) {
                ++report.violations;
            }
            else {
                ++report.advisories;
            }
        }
        if (audit.value().frozen) {
            ++report.frozen;
        }
        report.audits.push_back(audit.value());
    }

    util::logger::info("[LedgerMonitor] Cycle checked " + std::to_string(report.accountsChecked)
                       + " accounts: " + std::to_string(report.violations) + " violations, "
                       + std::to_string(report.advisories) + " advisories, "
                       + std::to_string(report.frozen) + " frozen");
    return report;
}

core::Status LedgerMonitor::Unfreeze(const std::string &accountId)
{
    core::Status status = m_transactions.Unfreeze(accountId);
    if (!status) {
        return status;
    }
    try {
        core::ReviewFlag cleared;
        cleared.accountId = accountId;
        cleared.kind = "review_cleared";
        cleared.detail = "spending unfrozen after manual review";
        cleared.createdAt = m_transactions.Store().NowMillis();
        m_transactions.Store().InsertReviewFlag(cleared);
    }
    catch (const core::StoreError &ex) {
        util::logger::error(std::string("[LedgerMonitor] Could not record review for ") + accountId + ": "
                            + ex.what());
        return core::Status::Fail(ErrorCode::StorageError, ex.what());
    }
    return status;
}

Result<core::EconomyMetrics> LedgerMonitor::GetEconomyMetrics(int64_t windowSeconds)
{
    using R = Result<core::EconomyMetrics>;
    if (windowSeconds <= 0) {
        return R::Fail(ErrorCode::ValidationError, "Metrics window must be positive");
    }
    try {
        storage::LedgerStore &store = m_transactions.Store();
        int64_t since = store.NowMillis() - windowSeconds * 1000;
        storage::TransactionTotals totals = store.SumAllTransactionsSince(since);

        core::EconomyMetrics metrics;
        metrics.windowSeconds  = windowSeconds;
        metrics.totalEarned    = totals.sumEarned;
        metrics.totalSpent     = totals.sumSpent;
        metrics.net            = totals.sumEarned - totals.sumSpent;
        metrics.transactions   = totals.count;
        metrics.activeAccounts = store.CountActiveAccountsSince(since);
        metrics.purchases      = store.CountPurchasesSince(since);
        return R::Ok(metrics);
    }
    catch (const core::StoreError &ex) {
        util::logger::error(std::string("[LedgerMonitor] GetEconomyMetrics failed: ") + ex.what());
        return R::Fail(ErrorCode::StorageError, ex.what());
    }
}

Result<std::vector<core::ReviewFlag>> LedgerMonitor::GetReviewFlags(const std::string &accountId)
{
    try {
        return Result<std::vector<core::ReviewFlag>>::Ok(m_transactions.Store().LoadReviewFlags(accountId));
    }
    catch (const core::StoreError &ex) {
        return Result<std::vector<core::ReviewFlag>>::Fail(ErrorCode::StorageError, ex.what());
    }
}

} // namespace monitor
} // namespace xpeconomy
