#ifndef XPECONOMY_MONITOR_LEDGER_MONITOR_HPP
#define XPECONOMY_MONITOR_LEDGER_MONITOR_HPP

#include <string>
#include <vector>
#include <cstdint>
#include "config/economy_params.hpp"
#include "core/errors.hpp"
#include "core/types.hpp"
#include "ledger/transaction_manager.hpp"
#include "util/thread_pool.hpp"

/**
 * @file ledger_monitor.hpp
 * @brief Detective checks over the stored ledger.
 *
 * Hard violations (never corrected automatically):
 *   - negative_balance:            spendable or accumulated XP below zero
 *   - reconciliation_spendable:    sum of all amounts != spendable XP
 *   - reconciliation_accumulated:  sum of EARN amounts != accumulated XP
 *   - hash_chain:                  a stored transaction no longer matches its hash
 *
 * Advisory findings (flagged for review, never freeze):
 *   - velocity:           EARN total inside velocityWindowSeconds above velocityThresholdXp
 *   - burst:              more than maxTransactionsPerMinute rows inside one minute
 *   - large_transaction:  a single amount above largeTransactionThreshold
 *
 * A violation is logged at CRITICAL, stored as a review flag, the account's
 * history is archived (zlib) and, with freezeOnViolation, spending is frozen.
 * A finding already flagged with the same detail is not flagged again.
 */

namespace xpeconomy {
namespace monitor {

struct AccountAudit
{
    std::string accountId;
    std::vector<core::ReviewFlag> findings;   ///< new flags written by this audit
    int64_t archiveId = 0;                    ///< 0 when nothing was archived
    bool frozen = false;                      ///< spending was frozen by this audit

    bool HasViolation() const
    {
        for (const auto &flag : findings) {
            if (flag.violation) {
                return true;
            }
        }
        return false;
    }
};

struct MonitorReport
{
    int64_t accountsChecked = 0;
    int64_t violations = 0;
    int64_t advisories = 0;
    int64_t frozen = 0;
    int64_t failures = 0;    ///< accounts whose audit could not run
    std::vector<AccountAudit> audits;
};

class LedgerMonitor
{
public:
    LedgerMonitor(ledger::TransactionManager &transactions, const config::EconomyParams &params,
                  size_t threadCount = 2);

    /// Checks one account under its lock, so the balance and the log are read consistently.
    core::Result<AccountAudit> AuditAccount(const std::string &accountId);

    /// Audits every account, fanned out over the worker pool.
    MonitorReport RunCycle();

    /// Manual review action: lift a freeze and record that the flags were reviewed.
    core::Status Unfreeze(const std::string &accountId);

    core::Result<core::EconomyMetrics> GetEconomyMetrics(int64_t windowSeconds);

    core::Result<std::vector<core::ReviewFlag>> GetReviewFlags(const std::string &accountId);

private:
    ledger::TransactionManager &m_transactions;
    const config::EconomyParams &m_params;
    util::ThreadPool m_pool;
};

} // namespace monitor
} // namespace xpeconomy

#endif // XPECONOMY_MONITOR_LEDGER_MONITOR_HPP
