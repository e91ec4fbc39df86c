#ifndef XPECONOMY_SOCIAL_SOCIAL_INTERACTION_MANAGER_HPP
#define XPECONOMY_SOCIAL_SOCIAL_INTERACTION_MANAGER_HPP

#include <string>
#include <atomic>
#include <cstdint>
#include "config/economy_params.hpp"
#include "core/errors.hpp"
#include "core/types.hpp"
#include "ledger/transaction_manager.hpp"

/**
 * @file social_interaction_manager.hpp
 * @brief Prices comments and comment interactions and pays comment authors.
 *
 * Posting requires a passed quiz on the content. The first comment after each
 * perfect score is free; otherwise a top-level comment costs commentCost and a
 * reply replyCost.
 *
 * An interaction charges the actor first. Only when that spend has committed is
 * the author paid floor(cost * authorRewardRate), and only for positive tiers.
 * The two steps are keyed interact:<requestId>:spend and :reward, so calling
 * Interact again with the same request id finishes a half-done interaction
 * without charging or paying twice. Without a request id one is generated and
 * returned in the record. The caller's deadline bounds the charge only; once
 * the actor has paid, the author is paid regardless.
 */

namespace xpeconomy {
namespace social {

class SocialInteractionManager
{
public:
    SocialInteractionManager(ledger::TransactionManager &transactions, const config::EconomyParams &params);

    /**
     * @brief Register a comment and charge for it.
     * @param parentId empty for a top-level comment
     * @return CommentLocked without a passed attempt, InsufficientXP when the author
     *         cannot pay, NotFound for an unknown parent, ValidationError for a reused id.
     */
    core::Result<core::CommentRecord> PostComment(const std::string &authorId,
                                                  const std::string &commentId,
                                                  const std::string &contentId,
                                                  const std::string &parentId = "",
                                                  ledger::Deadline deadline = ledger::NoDeadline());

    core::Result<core::InteractionRecord> Interact(const std::string &actorId,
                                                   const std::string &commentId,
                                                   core::InteractionTier tier,
                                                   const std::string &requestId = "",
                                                   ledger::Deadline deadline = ledger::NoDeadline());

    int64_t CommentCost(bool isReply) const;
    int64_t InteractionCost(core::InteractionTier tier) const;
    int64_t AuthorReward(core::InteractionTier tier) const;

    core::Result<bool> CanAffordComment(const std::string &accountId, const std::string &contentId, bool isReply);
    core::Result<bool> CanAffordInteraction(const std::string &accountId, core::InteractionTier tier);

    core::Result<core::InteractionSummary> GetInteractionSummary(const std::string &accountId);

private:
    std::string newRequestId(const std::string &actorId, const std::string &commentId);

    ledger::TransactionManager &m_transactions;
    const config::EconomyParams &m_params;
    std::atomic<uint64_t> m_sequence;
};

} // namespace social
} // namespace xpeconomy

#endif // XPECONOMY_SOCIAL_SOCIAL_INTERACTION_MANAGER_HPP
