#ifndef XPECONOMY_CORE_TYPES_HPP
#define XPECONOMY_CORE_TYPES_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

/**
 * @file types.hpp
 * @brief Plain records persisted by the ledger store and returned by the managers.
 *
 * Timestamps are unix milliseconds. XP amounts are signed 64-bit integers;
 * a SPEND transaction stores a negative amount.
 */

namespace xpeconomy {
namespace core {

enum class TransactionType {
    Earn,
    Spend
};

inline const char* transactionTypeName(TransactionType type)
{
    return type == TransactionType::Earn ? "EARN" : "SPEND";
}

/// Transaction source / purpose categories.
namespace sources {
    constexpr const char* QuizCompletion      = "quiz_completion";
    constexpr const char* SpeedProgression    = "speed_progression";
    constexpr const char* ReadingStreak       = "reading_streak";
    constexpr const char* InteractionReceived = "interaction_received";
    constexpr const char* CommentPost         = "comment_post";
    constexpr const char* CommentReply        = "comment_reply";
    constexpr const char* InteractionGiven    = "interaction_given";
    constexpr const char* ReportFiled         = "report_filed";
    constexpr const char* FeaturePurchase     = "feature_purchase";
    constexpr const char* BundlePurchase      = "bundle_purchase";
    constexpr const char* AdminGrant          = "admin_grant";
    constexpr const char* Manual              = "manual";
} // namespace sources

struct Account
{
    std::string accountId;
    int64_t accumulatedXp = 0;
    int64_t spendableXp = 0;
    int64_t currentWpm = 0;
    int64_t maxWpm = 0;
    int64_t streakDays = 0;
    int64_t lastEarnDay = -1;   ///< days since epoch of the last XP-earning quiz, -1 if none
    bool spendingFrozen = false;
    std::string frozenReason;
    std::string lastHash;       ///< head of the account's audit hash chain
    int64_t version = 0;
    int64_t createdAt = 0;
    std::vector<std::string> ownedFeatures;   ///< filled by TransactionManager::GetAccount
};

/// Optional references a transaction can carry.
struct TransactionRefs
{
    std::optional<int64_t> quizAttemptId;
    std::string commentId;
    std::string featureRef;     ///< feature or bundle id
};

struct Transaction
{
    int64_t id = 0;
    std::string accountId;
    TransactionType type = TransactionType::Earn;
    int64_t amount = 0;
    std::string source;
    std::string description;
    int64_t balanceAfter = 0;
    int64_t createdAt = 0;
    TransactionRefs refs;
    std::string requestKey;
    std::string prevHash;
    std::string entryHash;
    bool replayed = false;      ///< true when returned for a repeated request key
};

struct QuizAttempt
{
    int64_t id = 0;
    std::string accountId;
    std::string contentId;
    int64_t attemptNumber = 0;
    int64_t scorePct = 0;
    int64_t wpmUsed = 0;
    int64_t xpAwarded = 0;
    bool isPerfect = false;
    bool passed = false;
    std::string requestKey;
    int64_t createdAt = 0;

    // Filled by the quiz processor, not persisted on the attempt row.
    std::optional<int64_t> rewardTransactionId;
    bool progressionTriggered = false;
    int64_t newMaxWpm = 0;
    int64_t streakBonusXp = 0;
    bool commentCreditGranted = false;
    bool replayed = false;
};

struct FeatureCatalogEntry
{
    std::string featureId;
    std::string name;
    int64_t price = 0;
    std::string category;
    std::vector<std::string> prerequisites;
    std::string bundleId;       ///< empty when not part of a bundle
};

struct FeatureBundle
{
    std::string bundleId;
    std::string name;
    int64_t price = 0;
    std::vector<std::string> members;
};

struct FeaturePurchase
{
    int64_t id = 0;
    std::string accountId;
    std::string featureId;
    int64_t costPaid = 0;
    int64_t transactionId = 0;
    std::string bundleId;
    int64_t createdAt = 0;
};

/// Outcome of a bundle purchase: one shared transaction, one row per granted member.
struct BundlePurchaseResult
{
    std::string bundleId;
    int64_t charged = 0;
    Transaction transaction;
    std::vector<FeaturePurchase> granted;
};

struct Balance
{
    int64_t accumulatedXp = 0;
    int64_t spendableXp = 0;
};

struct BalanceSummary
{
    std::string accountId;
    int64_t accumulatedXp = 0;
    int64_t spendableXp = 0;
    int64_t lifetimeEarned = 0;
    int64_t lifetimeSpent = 0;
    int64_t currentWpm = 0;
    int64_t maxWpm = 0;
    bool spendingFrozen = false;
    std::vector<Transaction> recent;
};

struct CommentRecord
{
    std::string commentId;
    std::string authorId;
    std::string contentId;
    std::string parentId;       ///< empty for a top-level comment
    bool isFree = false;
    int64_t costPaid = 0;
    std::optional<int64_t> transactionId;
    int64_t createdAt = 0;
};

enum class InteractionTier {
    Bronze,
    Silver,
    Gold,
    ReportTroll,
    ReportBad,
    ReportSevere
};

inline const char* interactionTierName(InteractionTier tier)
{
    switch (tier) {
    case InteractionTier::Bronze:       return "bronze";
    case InteractionTier::Silver:       return "silver";
    case InteractionTier::Gold:         return "gold";
    case InteractionTier::ReportTroll:  return "report_troll";
    case InteractionTier::ReportBad:    return "report_bad";
    case InteractionTier::ReportSevere: return "report_severe";
    }
    return "unknown";
}

inline std::optional<InteractionTier> parseInteractionTier(const std::string &name)
{
    if (name == "bronze")        return InteractionTier::Bronze;
    if (name == "silver")        return InteractionTier::Silver;
    if (name == "gold")          return InteractionTier::Gold;
    if (name == "report_troll")  return InteractionTier::ReportTroll;
    if (name == "report_bad")    return InteractionTier::ReportBad;
    if (name == "report_severe") return InteractionTier::ReportSevere;
    return std::nullopt;
}

inline bool isPositiveTier(InteractionTier tier)
{
    return tier == InteractionTier::Bronze || tier == InteractionTier::Silver
        || tier == InteractionTier::Gold;
}

struct InteractionRecord
{
    int64_t id = 0;
    std::string actorId;
    std::string commentId;
    std::string authorId;
    InteractionTier tier = InteractionTier::Bronze;
    int64_t cost = 0;
    int64_t authorReward = 0;
    std::string requestKey;
    int64_t createdAt = 0;
    bool replayed = false;
};

struct InteractionSummary
{
    std::string accountId;
    int64_t commentsPosted = 0;
    int64_t interactionsGiven = 0;
    int64_t interactionsReceived = 0;
    int64_t xpSpentSocial = 0;
    int64_t xpEarnedSocial = 0;
    int64_t net = 0;
};

struct ReviewFlag
{
    int64_t id = 0;
    std::string accountId;
    std::string kind;
    std::string detail;
    bool violation = false;     ///< hard invariant violation (as opposed to advisory)
    int64_t createdAt = 0;
};

struct EconomyMetrics
{
    int64_t windowSeconds = 0;
    int64_t totalEarned = 0;
    int64_t totalSpent = 0;
    int64_t net = 0;
    int64_t activeAccounts = 0;
    int64_t purchases = 0;
    int64_t transactions = 0;
};

} // namespace core
} // namespace xpeconomy

#endif // XPECONOMY_CORE_TYPES_HPP
