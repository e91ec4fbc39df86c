#ifndef XPECONOMY_ENGINE_QUIZ_PROCESSOR_HPP
#define XPECONOMY_ENGINE_QUIZ_PROCESSOR_HPP

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include "config/economy_params.hpp"
#include "core/errors.hpp"
#include "core/types.hpp"
#include "engine/content_source.hpp"
#include "engine/quiz_grader.hpp"
#include "engine/speed_progression.hpp"
#include "ledger/transaction_manager.hpp"

/**
 * @file quiz_processor.hpp
 * @brief Turns a completed quiz into ledger effects.
 *
 * One attempt is one unit of work on the reader's account:
 *   - the attempt row (attempt number = prior attempts on the content + 1),
 *   - the quiz_completion reward,
 *   - a free comment credit for a perfect score,
 *   - the speed ratchet and its bonus,
 *   - the reading streak and its bonus.
 * Either all of them are written or none.
 */

namespace xpeconomy {
namespace engine {

class QuizProcessor
{
public:
    QuizProcessor(ledger::TransactionManager &transactions,
                  SpeedProgressionController &progression,
                  IContentSource &content,
                  const config::EconomyParams &params);

    /**
     * @brief Record a graded attempt and apply its rewards.
     *
     * A repeated requestKey returns the stored attempt with replayed set and
     * writes nothing. Derived transactions use requestKey + ":reward",
     * ":progression" and ":streak".
     */
    core::Result<core::QuizAttempt> RecordQuizAttempt(const std::string &accountId,
                                                      const std::string &contentId,
                                                      int64_t scorePct,
                                                      int64_t wpmUsed,
                                                      const std::string &requestKey = "",
                                                      ledger::Deadline deadline = ledger::NoDeadline());

    /**
     * @brief Send answers to the grader, wait at most timeout, then record the attempt.
     * On timeout nothing is written and Timeout is returned.
     */
    core::Result<core::QuizAttempt> SubmitForGrading(IQuizGrader &grader,
                                                     const QuizSubmission &submission,
                                                     std::chrono::milliseconds timeout);

    core::Result<std::vector<core::QuizAttempt>> GetAttempts(const std::string &accountId,
                                                             const std::string &contentId);

    /// Commenting unlocks with any passed attempt, even one whose reward was diminished to zero.
    core::Result<bool> HasPassed(const std::string &accountId, const std::string &contentId);

private:
    core::Result<int64_t> applyStreak(ledger::LedgerSession &session, int64_t quizAttemptId,
                                      const std::string &requestKey);
    int64_t streakBonusFor(int64_t streakDays) const;

    ledger::TransactionManager &m_transactions;
    SpeedProgressionController &m_progression;
    IContentSource &m_content;
    const config::EconomyParams &m_params;
};

} // namespace engine
} // namespace xpeconomy

#endif // XPECONOMY_ENGINE_QUIZ_PROCESSOR_HPP
