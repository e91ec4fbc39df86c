#include "social/social_interaction_manager.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"

#include <cmath>

namespace xpeconomy {
namespace social {

using core::ErrorCode;
using core::Result;

namespace {
constexpr const char *kCommentScope = "comment";
constexpr const char *kInteractScope = "interact";
} // namespace

SocialInteractionManager::SocialInteractionManager(ledger::TransactionManager &transactions,
                                                   const config::EconomyParams &params)
    : m_transactions(transactions), m_params(params), m_sequence(0)
{
}

std::string SocialInteractionManager::newRequestId(const std::string &actorId, const std::string &commentId)
{
    std::string seed = actorId + "|" + commentId + "|" + std::to_string(m_transactions.Store().NowMillis()) + "|"
                       + std::to_string(++m_sequence);
    return "ix-" + util::hashing::sha256(seed).substr(0, 24);
}

int64_t SocialInteractionManager::CommentCost(bool isReply) const
{
    return isReply ? m_params.replyCost : m_params.commentCost;
}

int64_t SocialInteractionManager::InteractionCost(core::InteractionTier tier) const
{
    switch (tier) {
    case core::InteractionTier::Bronze:       return m_params.bronzeCost;
    case core::InteractionTier::Silver:       return m_params.silverCost;
    case core::InteractionTier::Gold:         return m_params.goldCost;
    case core::InteractionTier::ReportTroll:  return m_params.reportTrollCost;
    case core::InteractionTier::ReportBad:    return m_params.reportBadCost;
    case core::InteractionTier::ReportSevere: return m_params.reportSevereCost;
    }
    return 0;
}

int64_t SocialInteractionManager::AuthorReward(core::InteractionTier tier) const
{
    if (!core::isPositiveTier(tier)) {
        return 0;
    }
    double reward = static_cast<double>(InteractionCost(tier)) * m_params.authorRewardRate;
    return static_cast<int64_t>(std::floor(reward + 1e-9));
}

Result<core::CommentRecord> SocialInteractionManager::PostComment(const std::string &authorId,
                                                                  const std::string &commentId,
                                                                  const std::string &contentId,
                                                                  const std::string &parentId,
                                                                  ledger::Deadline deadline)
{
    using R = Result<core::CommentRecord>;
    if (commentId.empty() || contentId.empty()) {
        return R::Fail(ErrorCode::ValidationError, "Comment id and content id are required");
    }

    auto result = m_transactions.Execute<core::CommentRecord>(authorId, [&](ledger::LedgerSession &session) {
        storage::LedgerStore &store = session.Store();

        if (store.LoadComment(commentId)) {
            return R::Fail(ErrorCode::ValidationError, "Comment id '" + commentId + "' already exists");
        }
        bool isReply = !parentId.empty();
        if (isReply) {
            auto parent = store.LoadComment(parentId);
            if (!parent) {
                return R::Fail(ErrorCode::NotFound, "Unknown parent comment '" + parentId + "'");
            }
            if (parent->contentId != contentId) {
                return R::Fail(ErrorCode::ValidationError,
                               "Parent comment '" + parentId + "' belongs to different content");
            }
        }
        if (!store.HasPassedAttempt(authorId, contentId)) {
            return R::Fail(ErrorCode::CommentLocked,
                           "Pass the quiz on '" + contentId + "' before commenting");
        }

        core::CommentRecord comment;
        comment.commentId = commentId;
        comment.authorId  = authorId;
        comment.contentId = contentId;
        comment.parentId  = parentId;
        comment.createdAt = session.Now();

        if (store.ConsumeCommentCredit(authorId, contentId)) {
            comment.isFree = true;
        }
        else {
            core::TransactionRefs refs;
            refs.commentId = commentId;
            int64_t cost = CommentCost(isReply);
            auto spent = session.Spend(cost,
                                       isReply ? core::sources::CommentReply : core::sources::CommentPost,
                                       (isReply ? "Reply on " : "Comment on ") + contentId,
                                       refs, ledger::DerivedRequestKey(kCommentScope, commentId));
            if (!spent) {
                return R::From(spent);
            }
            comment.costPaid = cost;
            comment.transactionId = spent.value().id;
        }

        if (!store.InsertComment(comment)) {
            return R::Fail(ErrorCode::ValidationError, "Comment id '" + commentId + "' already exists");
        }
        return R::Ok(comment);
    }, deadline);

    if (result) {
        util::logger::info("[SocialInteraction] " + authorId + " posted " + commentId + " on " + contentId
                           + (result.value().isFree ? " (free)" : " for " + std::to_string(result.value().costPaid)
                              + " XP"));
    }
    else {
        util::logger::info("[SocialInteraction] Comment " + commentId + " by " + authorId + " rejected: "
                           + result.message());
    }
    return result;
}

Result<core::InteractionRecord> SocialInteractionManager::Interact(const std::string &actorId,
                                                                   const std::string &commentId,
                                                                   core::InteractionTier tier,
                                                                   const std::string &requestId,
                                                                   ledger::Deadline deadline)
{
    using R = Result<core::InteractionRecord>;

    // Both legs are keyed by the request id, so a half-finished interaction can always be resumed.
    const std::string requestKey = requestId.empty() ? newRequestId(actorId, commentId) : requestId;

    std::optional<core::CommentRecord> comment;
    try {
        comment = m_transactions.Store().LoadComment(commentId);
    }
    catch (const core::StoreError &ex) {
        util::logger::error(std::string("[SocialInteraction] Interact failed: ") + ex.what());
        return R::Fail(ErrorCode::StorageError, ex.what());
    }
    if (!comment) {
        return R::Fail(ErrorCode::NotFound, "Unknown comment '" + commentId + "'");
    }

    int64_t cost = InteractionCost(tier);
    bool selfInteraction = comment->authorId == actorId;
    int64_t reward = selfInteraction ? 0 : AuthorReward(tier);

    // Step 1: charge the actor and record the interaction.
    auto charged = m_transactions.Execute<core::InteractionRecord>(actorId, [&](ledger::LedgerSession &session) {
        storage::LedgerStore &store = session.Store();
        if (auto previous = store.FindInteractionByRequestKey(requestKey)) {
            if (previous->actorId != actorId || previous->commentId != commentId || previous->tier != tier) {
                return R::Fail(ErrorCode::ValidationError,
                               "Request id '" + requestKey + "' was already used for a different interaction");
            }
            previous->replayed = true;
            return R::Ok(*previous);
        }

        core::TransactionRefs refs;
        refs.commentId = commentId;
        auto spent = session.Spend(cost,
                                   core::isPositiveTier(tier) ? core::sources::InteractionGiven
                                                              : core::sources::ReportFiled,
                                   std::string(core::interactionTierName(tier)) + " on comment " + commentId,
                                   refs, ledger::DerivedRequestKey(kInteractScope, requestKey, "spend"));
        if (!spent) {
            return R::From(spent);
        }

        core::InteractionRecord record;
        record.actorId      = actorId;
        record.commentId    = commentId;
        record.authorId     = comment->authorId;
        record.tier         = tier;
        record.cost         = cost;
        record.authorReward = reward;
        record.requestKey   = requestKey;
        record.createdAt    = session.Now();
        record.id           = store.InsertInteraction(record);
        return R::Ok(record);
    }, deadline);

    if (!charged) {
        util::logger::info("[SocialInteraction] " + std::string(core::interactionTierName(tier)) + " by "
                           + actorId + " on " + commentId + " rejected: " + charged.message());
        return charged;
    }

    // Step 2: pay the author, only after the actor's spend has committed. The
    // deadline no longer applies: the charge is already on the ledger.
    const core::InteractionRecord &record = charged.value();
    if (record.authorReward > 0) {
        core::TransactionRefs refs;
        refs.commentId = commentId;
        auto paid = m_transactions.Earn(record.authorId, record.authorReward, core::sources::InteractionReceived,
                                        std::string(core::interactionTierName(tier)) + " received on comment "
                                        + commentId,
                                        refs, ledger::DerivedRequestKey(kInteractScope, requestKey, "reward"),
                                        ledger::NoDeadline());
        if (!paid) {
            util::logger::error("[SocialInteraction] Actor " + actorId + " was charged for " + commentId
                                + " but the author reward failed: " + paid.message());
            return R::Fail(paid.code(), "Interaction charged but author reward not yet paid (retry with request_id="
                                        + requestKey + "): " + paid.message());
        }
    }

    util::logger::info("[SocialInteraction] " + actorId + " gave " + core::interactionTierName(tier) + " on "
                       + commentId + " (cost " + std::to_string(record.cost) + ", author +"
                       + std::to_string(record.authorReward) + ")");
    return charged;
}

Result<bool> SocialInteractionManager::CanAffordComment(const std::string &accountId,
                                                        const std::string &contentId,
                                                        bool isReply)
{
    auto account = m_transactions.GetAccount(accountId);
    if (!account) {
        return Result<bool>::From(account);
    }
    try {
        if (m_transactions.Store().GetCommentCredits(accountId, contentId) > 0) {
            return Result<bool>::Ok(true);
        }
    }
    catch (const core::StoreError &ex) {
        return Result<bool>::Fail(ErrorCode::StorageError, ex.what());
    }
    const core::Account &a = account.value();
    return Result<bool>::Ok(!a.spendingFrozen && a.spendableXp >= CommentCost(isReply));
}

Result<bool> SocialInteractionManager::CanAffordInteraction(const std::string &accountId, core::InteractionTier tier)
{
    auto balance = m_transactions.GetAccount(accountId);
    if (!balance) {
        return Result<bool>::From(balance);
    }
    const core::Account &a = balance.value();
    return Result<bool>::Ok(!a.spendingFrozen && a.spendableXp >= InteractionCost(tier));
}

Result<core::InteractionSummary> SocialInteractionManager::GetInteractionSummary(const std::string &accountId)
{
    using R = Result<core::InteractionSummary>;
    try {
        storage::LedgerStore &store = m_transactions.Store();
        if (!store.LoadAccount(accountId)) {
            return R::Fail(ErrorCode::NotFound, "Unknown account '" + accountId + "'");
        }
        core::InteractionSummary summary;
        summary.accountId            = accountId;
        summary.commentsPosted       = store.CountCommentsByAuthor(accountId);
        summary.interactionsGiven    = store.CountPositiveInteractionsGiven(accountId);
        summary.interactionsReceived = store.CountPositiveInteractionsReceived(accountId);
        summary.xpSpentSocial        = store.SumAmountBySources(accountId, {
            core::sources::CommentPost, core::sources::CommentReply,
            core::sources::InteractionGiven, core::sources::ReportFiled});
        summary.xpEarnedSocial       = store.SumAmountBySources(accountId, {core::sources::InteractionReceived});
        summary.net                  = summary.xpEarnedSocial - summary.xpSpentSocial;
        return R::Ok(summary);
    }
    catch (const core::StoreError &ex) {
        util::logger::error(std::string("[SocialInteraction] GetInteractionSummary failed: ") + ex.what());
        return R::Fail(ErrorCode::StorageError, ex.what());
    }
}

} // namespace social
} // namespace xpeconomy
