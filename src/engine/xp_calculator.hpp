#ifndef XPECONOMY_ENGINE_XP_CALCULATOR_HPP
#define XPECONOMY_ENGINE_XP_CALCULATOR_HPP

#include <string>
#include <cmath>
#include <cctype>
#include <cstdint>
#include "config/economy_params.hpp"
#include "core/errors.hpp"

/**
 * @file xp_calculator.hpp
 * @brief Pure reward function for a completed reading quiz.
 *
 *   complexity  = reading_level / 10
 *   speed       = (wpm_used / speedBaseWpm) * complexity
 *   raw         = length * speed * (score_pct / 100)
 *   perfect     = raw * perfectBonusRate        (score_pct == 100 only)
 *   diminishing = diminishingBase ^ (attempt_number - 1)
 *   total       = floor((raw + perfect) * diminishing)
 *
 * Scores below passThresholdPct earn nothing and stop there. A total above
 * maxTransactionAmount is a ValidationError; it could never be credited.
 */

namespace xpeconomy {
namespace engine {

struct RewardInput
{
    int64_t contentLength = 0;   ///< words or letters, per the deployment's LengthMetric
    double readingLevel = 0.0;
    int64_t scorePct = 0;
    int64_t wpmUsed = 0;
    int64_t attemptNumber = 1;
};

struct RewardResult
{
    int64_t xpAwarded = 0;
    bool passed = false;
    bool perfect = false;

    // Breakdown (all zero when the attempt did not pass)
    double complexityFactor = 0.0;
    double speedMultiplier = 0.0;
    double raw = 0.0;
    double perfectBonus = 0.0;
    double diminishingFactor = 0.0;
};

/**
 * @brief Count content length with the configured metric.
 *        Words are whitespace separated tokens; letters are non-whitespace characters.
 */
inline int64_t MeasureContent(const std::string &text, config::LengthMetric metric)
{
    int64_t count = 0;
    bool inWord = false;
    for (unsigned char c : text) {
        bool space = std::isspace(c) != 0;
        if (metric == config::LengthMetric::Letters) {
            if (!space) {
                ++count;
            }
            continue;
        }
        if (!space && !inWord) {
            ++count;
        }
        inWord = !space;
    }
    return count;
}

inline core::Result<RewardResult> CalculateReward(const RewardInput &in, const config::EconomyParams &params)
{
    using core::ErrorCode;
    using R = core::Result<RewardResult>;

    if (in.contentLength < 0) {
        return R::Fail(ErrorCode::ValidationError, "Content length must not be negative");
    }
    if (in.readingLevel < 0.0 || !std::isfinite(in.readingLevel)) {
        return R::Fail(ErrorCode::ValidationError, "Reading level must be a non-negative number");
    }
    if (in.scorePct < 0 || in.scorePct > 100) {
        return R::Fail(ErrorCode::ValidationError,
                       "Score must be between 0 and 100, got " + std::to_string(in.scorePct));
    }
    if (in.wpmUsed <= 0) {
        return R::Fail(ErrorCode::ValidationError, "Reading speed must be positive");
    }
    if (in.attemptNumber < 1) {
        return R::Fail(ErrorCode::ValidationError, "Attempt number starts at 1");
    }

    RewardResult out;
    out.passed = in.scorePct >= params.passThresholdPct;
    out.perfect = in.scorePct == 100;
    if (!out.passed) {
        out.perfect = false;
        return R::Ok(out);
    }

    out.complexityFactor = in.readingLevel / 10.0;
    out.speedMultiplier = (static_cast<double>(in.wpmUsed) / params.speedBaseWpm) * out.complexityFactor;
    double accuracy = static_cast<double>(in.scorePct) / 100.0;
    out.raw = static_cast<double>(in.contentLength) * out.speedMultiplier * accuracy;
    out.perfectBonus = out.perfect ? out.raw * params.perfectBonusRate : 0.0;
    out.diminishingFactor = std::pow(params.diminishingBase, static_cast<double>(in.attemptNumber - 1));

    // 1e-9 keeps exact products such as 1000.0 computed as 999.999... from flooring down
    double total = (out.raw + out.perfectBonus) * out.diminishingFactor;
    if (!std::isfinite(total) || total >= static_cast<double>(params.maxTransactionAmount) + 1.0) {
        return R::Fail(ErrorCode::ValidationError,
                       "Reward exceeds the per-transaction limit of " + std::to_string(params.maxTransactionAmount));
    }
    out.xpAwarded = static_cast<int64_t>(std::floor(total + 1e-9));
    return R::Ok(out);
}

} // namespace engine
} // namespace xpeconomy

#endif // XPECONOMY_ENGINE_XP_CALCULATOR_HPP
