#include "engine/speed_progression.hpp"
#include "util/logger.hpp"

#include <algorithm>

namespace xpeconomy {
namespace engine {

using core::ErrorCode;

namespace {
constexpr int64_t kDefaultLastSuccessfulWpm = 200;
constexpr int64_t kRecommendationStep = 25;
constexpr int64_t kMaxRecommendationDrop = 100;
constexpr int64_t kRecommendationFloor = 100;
} // namespace

SpeedProgressionController::SpeedProgressionController(ledger::TransactionManager &transactions,
                                                       const config::EconomyParams &params)
    : m_transactions(transactions), m_params(params)
{
}

core::Result<core::Account> SpeedProgressionController::SetCurrentWpm(const std::string &accountId, int64_t wpm)
{
    return m_transactions.Execute<core::Account>(accountId, [&](ledger::LedgerSession &session) {
        const core::Account &account = session.Account();
        if (wpm < m_params.minWpm || wpm > account.maxWpm) {
            return core::Result<core::Account>::Fail(ErrorCode::ValidationError,
                "Reading speed must be between " + std::to_string(m_params.minWpm) + " and "
                + std::to_string(account.maxWpm) + " WPM, got " + std::to_string(wpm));
        }
        session.SetCurrentWpm(wpm);
        util::logger::info("[SpeedProgression] " + accountId + " now reads at " + std::to_string(wpm) + " WPM");
        return core::Result<core::Account>::Ok(session.Account());
    });
}

core::Status SpeedProgressionController::ValidateQuizSpeed(const core::Account &account, int64_t wpmUsed) const
{
    if (wpmUsed <= 0) {
        return core::Status::Fail(ErrorCode::ValidationError, "Reading speed must be positive");
    }
    if (wpmUsed > account.maxWpm) {
        return core::Status::Fail(ErrorCode::ValidationError,
            "Speed " + std::to_string(wpmUsed) + " WPM is above the unlocked maximum of "
            + std::to_string(account.maxWpm) + " WPM");
    }
    return core::OkStatus();
}

bool SpeedProgressionController::ShouldRatchet(const core::Account &account,
                                               int64_t attemptNumber,
                                               int64_t wpmUsed,
                                               int64_t scorePct) const
{
    return attemptNumber == 1 && wpmUsed == account.maxWpm && scorePct == 100;
}

core::Result<ProgressionOutcome> SpeedProgressionController::ApplyRatchet(ledger::LedgerSession &session,
                                                                          int64_t attemptNumber,
                                                                          int64_t wpmUsed,
                                                                          int64_t scorePct,
                                                                          std::optional<int64_t> quizAttemptId,
                                                                          const std::string &requestKey)
{
    ProgressionOutcome outcome;
    outcome.newMaxWpm = session.Account().maxWpm;
    if (!ShouldRatchet(session.Account(), attemptNumber, wpmUsed, scorePct)) {
        return core::Result<ProgressionOutcome>::Ok(outcome);
    }

    int64_t newMax = session.Account().maxWpm + m_params.wpmStep;
    session.SetMaxWpm(newMax);
    outcome.triggered = true;
    outcome.newMaxWpm = newMax;

    if (m_params.progressionBonusXp > 0) {
        core::TransactionRefs refs;
        refs.quizAttemptId = quizAttemptId;
        auto bonus = session.Earn(m_params.progressionBonusXp, core::sources::SpeedProgression,
                                  "Max reading speed raised to " + std::to_string(newMax) + " WPM",
                                  refs, requestKey.empty() ? std::string() : requestKey + ":progression");
        if (!bonus) {
            return core::Result<ProgressionOutcome>::From(bonus);
        }
        outcome.bonus = bonus.value();
    }

    util::logger::info("[SpeedProgression] " + session.Account().accountId + " unlocked "
                       + std::to_string(newMax) + " WPM");
    return core::Result<ProgressionOutcome>::Ok(outcome);
}

int64_t SpeedProgressionController::RecommendedWpm(int64_t lastSuccessfulWpm, int64_t failedAttempts) const
{
    if (lastSuccessfulWpm <= 0) {
        lastSuccessfulWpm = kDefaultLastSuccessfulWpm;
    }
    int64_t reduction = std::min(std::max<int64_t>(failedAttempts, 0) * kRecommendationStep,
                                 kMaxRecommendationDrop);
    return std::max(lastSuccessfulWpm - reduction, kRecommendationFloor);
}

core::Result<int64_t> SpeedProgressionController::RecommendedWpmFor(const std::string &accountId,
                                                                    int64_t failedAttempts)
{
    auto account = m_transactions.GetAccount(accountId);
    if (!account) {
        return core::Result<int64_t>::From(account);
    }
    try {
        auto last = m_transactions.Store().LastPassedWpm(accountId);
        return core::Result<int64_t>::Ok(RecommendedWpm(last.value_or(kDefaultLastSuccessfulWpm), failedAttempts));
    }
    catch (const core::StoreError &ex) {
        util::logger::error(std::string("[SpeedProgression] RecommendedWpmFor failed: ") + ex.what());
        return core::Result<int64_t>::Fail(ErrorCode::StorageError, ex.what());
    }
}

} // namespace engine
} // namespace xpeconomy
