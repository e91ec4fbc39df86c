#ifndef XPECONOMY_ENGINE_SPEED_PROGRESSION_HPP
#define XPECONOMY_ENGINE_SPEED_PROGRESSION_HPP

#include <string>
#include <optional>
#include <cstdint>
#include "config/economy_params.hpp"
#include "core/errors.hpp"
#include "core/types.hpp"
#include "ledger/transaction_manager.hpp"

/**
 * @file speed_progression.hpp
 * @brief Reading speed selection and the max-speed ratchet.
 *
 * A reader picks any current speed between minWpm and the unlocked max_wpm for free.
 * The max only moves up, by wpmStep, when a first attempt at exactly max_wpm scores
 * 100%; that also pays a fixed speed_progression bonus.
 */

namespace xpeconomy {
namespace engine {

struct ProgressionOutcome
{
    bool triggered = false;
    int64_t newMaxWpm = 0;
    std::optional<core::Transaction> bonus;
};

class SpeedProgressionController
{
public:
    SpeedProgressionController(ledger::TransactionManager &transactions, const config::EconomyParams &params);

    /**
     * @brief Manual speed change, free of charge.
     * @return the updated account, or ValidationError when wpm is outside [minWpm, max_wpm].
     */
    core::Result<core::Account> SetCurrentWpm(const std::string &accountId, int64_t wpm);

    /// Quiz speeds above the unlocked maximum (or not positive) are rejected.
    core::Status ValidateQuizSpeed(const core::Account &account, int64_t wpmUsed) const;

    bool ShouldRatchet(const core::Account &account, int64_t attemptNumber, int64_t wpmUsed, int64_t scorePct) const;

    /**
     * @brief Apply the ratchet inside an open unit of work on the account.
     * The bonus transaction is keyed requestKey + ":progression" when a key is given.
     */
    core::Result<ProgressionOutcome> ApplyRatchet(ledger::LedgerSession &session,
                                                  int64_t attemptNumber,
                                                  int64_t wpmUsed,
                                                  int64_t scorePct,
                                                  std::optional<int64_t> quizAttemptId,
                                                  const std::string &requestKey);

    /**
     * @brief Suggested speed after failed attempts: 25 WPM slower per failure,
     *        at most 100 WPM slower, never below 100 WPM.
     */
    int64_t RecommendedWpm(int64_t lastSuccessfulWpm, int64_t failedAttempts) const;

    /// Same, starting from the account's most recent passed speed (200 when none).
    core::Result<int64_t> RecommendedWpmFor(const std::string &accountId, int64_t failedAttempts);

private:
    ledger::TransactionManager &m_transactions;
    const config::EconomyParams &m_params;
};

} // namespace engine
} // namespace xpeconomy

#endif // XPECONOMY_ENGINE_SPEED_PROGRESSION_HPP
