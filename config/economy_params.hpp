#ifndef XPECONOMY_CONFIG_ECONOMY_PARAMS_HPP
#define XPECONOMY_CONFIG_ECONOMY_PARAMS_HPP

#include <string>
#include <cstdint>
#include <vector>
#include <utility>

/**
 * @file economy_params.hpp
 * @brief Defines the tunable parameters of the XP economy (rates, costs, thresholds).
 *
 * Every constant the reward formula, the social costs, the speed ratchet and the
 * monitoring layer depend on lives here, so a deployment can re-price the economy
 * through the config file without touching code.
 *
 * Example usage:
 *  @code
 *    auto params = xpeconomy::config::getDefaultParams();
 *    std::cout << "New comment costs " << params.commentCost << " XP\n";
 *  @endcode
 */

namespace xpeconomy {
namespace config {

/**
 * @brief Which content length metric feeds the reward formula.
 *        A deployment picks exactly one; the two are never mixed.
 */
enum class LengthMetric {
    Words,
    Letters
};

inline std::string lengthMetricName(LengthMetric metric)
{
    return metric == LengthMetric::Letters ? "letters" : "words";
}

/**
 * @struct EconomyParams
 * @brief Encapsulates the XP economy parameters.
 */
struct EconomyParams
{
    // Identifies the preset: "default", "test", ...
    std::string profileID;

    // Reading speed progression
    int64_t initialCurrentWpm;
    int64_t initialMaxWpm;
    int64_t minWpm;
    int64_t wpmStep;
    int64_t progressionBonusXp;

    // Reward formula
    LengthMetric lengthMetric;
    int64_t passThresholdPct;
    double speedBaseWpm;
    double perfectBonusRate;
    double diminishingBase;

    // Social costs
    int64_t commentCost;
    int64_t replyCost;
    int64_t bronzeCost;
    int64_t silverCost;
    int64_t goldCost;
    int64_t reportTrollCost;
    int64_t reportBadCost;
    int64_t reportSevereCost;
    double authorRewardRate;

    // Transaction manager
    int64_t maxTransactionAmount;
    uint32_t lockRetryLimit;
    uint32_t retryBackoffMs;

    // Monitoring thresholds
    int64_t velocityWindowSeconds;
    int64_t velocityThresholdXp;
    int64_t maxTransactionsPerMinute;
    int64_t largeTransactionThreshold;
    bool freezeOnViolation;

    // Reading streak tiers: (minimum streak days, bonus XP), ascending by days.
    std::vector<std::pair<int64_t, int64_t>> streakTiers;
};

/**
 * @brief Provides the production economy.
 */
inline EconomyParams getDefaultParams()
{
    EconomyParams ep;
    ep.profileID                 = "default";

    ep.initialCurrentWpm         = 200;
    ep.initialMaxWpm             = 225;
    ep.minWpm                    = 50;
    ep.wpmStep                   = 25;
    ep.progressionBonusXp        = 50;

    ep.lengthMetric              = LengthMetric::Words;
    ep.passThresholdPct          = 60;
    ep.speedBaseWpm              = 250.0;
    ep.perfectBonusRate          = 0.25;
    ep.diminishingBase           = 0.5;

    ep.commentCost               = 100;
    ep.replyCost                 = 50;
    ep.bronzeCost                = 5;
    ep.silverCost                = 15;
    ep.goldCost                  = 30;
    ep.reportTrollCost           = 5;
    ep.reportBadCost             = 15;
    ep.reportSevereCost          = 30;
    ep.authorRewardRate          = 0.5;

    ep.maxTransactionAmount      = 100000;
    ep.lockRetryLimit            = 3;
    ep.retryBackoffMs            = 10;

    ep.velocityWindowSeconds     = 3600;  // one hour
    ep.velocityThresholdXp       = 5000;
    ep.maxTransactionsPerMinute  = 10;
    ep.largeTransactionThreshold = 5000;
    ep.freezeOnViolation         = true;

    ep.streakTiers = {{3, 5}, {7, 10}, {14, 25}, {30, 50}};
    return ep;
}

/**
 * @brief Parameters for local testing: same prices, no backoff sleeps.
 */
inline EconomyParams getTestParams()
{
    EconomyParams ep = getDefaultParams();
    ep.profileID      = "test";
    ep.retryBackoffMs = 0;
    return ep;
}

} // namespace config
} // namespace xpeconomy

#endif // XPECONOMY_CONFIG_ECONOMY_PARAMS_HPP
