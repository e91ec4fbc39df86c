#ifndef XPECONOMY_LEDGER_AUDIT_CHAIN_HPP
#define XPECONOMY_LEDGER_AUDIT_CHAIN_HPP

#include <string>
#include <vector>
#include "core/types.hpp"
#include "util/hashing.hpp"

namespace xpeconomy {
namespace ledger {

/**
 * @brief entry_hash of a transaction row: SHA-256 over tx.prevHash and the
 *        row's canonical fields. The row id is not part of the hash.
 */
inline std::string computeEntryHash(const core::Transaction &tx)
{
    std::vector<std::string> fields = {
        tx.accountId,
        core::transactionTypeName(tx.type),
        std::to_string(tx.amount),
        tx.source,
        tx.description,
        std::to_string(tx.balanceAfter),
        std::to_string(tx.createdAt),
        tx.refs.quizAttemptId ? std::to_string(*tx.refs.quizAttemptId) : std::string(),
        tx.refs.commentId,
        tx.refs.featureRef,
        tx.requestKey
    };
    return util::hashing::chainHash(tx.prevHash, fields);
}

/**
 * @brief Walk an account's transactions in id order.
 * @return index of the first broken link, or -1 when the chain is intact.
 */
inline long firstBrokenLink(const std::vector<core::Transaction> &history, const std::string &accountHead)
{
    std::string expectedPrev = util::hashing::genesisHash();
    for (size_t i = 0; i < history.size(); ++i) {
        const auto &tx = history[i];
        if (tx.prevHash != expectedPrev || computeEntryHash(tx) != tx.entryHash) {
            return static_cast<long>(i);
        }
        expectedPrev = tx.entryHash;
    }
    // The account row must point at the last entry.
    if (expectedPrev != accountHead) {
        return static_cast<long>(history.size());
    }
    return -1;
}

} // namespace ledger
} // namespace xpeconomy

#endif // XPECONOMY_LEDGER_AUDIT_CHAIN_HPP
