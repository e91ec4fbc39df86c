#include "engine/quiz_processor.hpp"
#include "engine/xp_calculator.hpp"
#include "util/logger.hpp"

namespace xpeconomy {
namespace engine {

using core::ErrorCode;
using core::QuizAttempt;
using core::Result;

namespace {
constexpr int64_t kMillisPerDay = 86400000;
constexpr const char *kKeyScope = "quiz";
} // namespace

QuizProcessor::QuizProcessor(ledger::TransactionManager &transactions,
                             SpeedProgressionController &progression,
                             IContentSource &content,
                             const config::EconomyParams &params)
    : m_transactions(transactions), m_progression(progression), m_content(content), m_params(params)
{
}

Result<QuizAttempt> QuizProcessor::RecordQuizAttempt(const std::string &accountId,
                                                     const std::string &contentId,
                                                     int64_t scorePct,
                                                     int64_t wpmUsed,
                                                     const std::string &requestKey,
                                                     ledger::Deadline deadline)
{
    auto content = m_content.Lookup(contentId);
    if (!content) {
        return Result<QuizAttempt>::Fail(ErrorCode::NotFound, "Unknown content '" + contentId + "'");
    }

    auto result = m_transactions.Execute<QuizAttempt>(accountId, [&](ledger::LedgerSession &session) {
        storage::LedgerStore &store = session.Store();

        if (auto previous = store.FindQuizAttemptByRequestKey(requestKey)) {
            if (previous->accountId != accountId || previous->contentId != contentId) {
                return Result<QuizAttempt>::Fail(ErrorCode::ValidationError,
                    "Request key '" + requestKey + "' was already used for a different attempt");
            }
            previous->replayed = true;
            return Result<QuizAttempt>::Ok(*previous);
        }

        core::Status speedOk = m_progression.ValidateQuizSpeed(session.Account(), wpmUsed);
        if (!speedOk) {
            return Result<QuizAttempt>::From(speedOk);
        }

        RewardInput input;
        input.contentLength = content->length;
        input.readingLevel  = content->readingLevel;
        input.scorePct      = scorePct;
        input.wpmUsed       = wpmUsed;
        input.attemptNumber = store.CountAttempts(accountId, contentId) + 1;

        auto reward = CalculateReward(input, m_params);
        if (!reward) {
            return Result<QuizAttempt>::From(reward);
        }

        QuizAttempt attempt;
        attempt.accountId     = accountId;
        attempt.contentId     = contentId;
        attempt.attemptNumber = input.attemptNumber;
        attempt.scorePct      = scorePct;
        attempt.wpmUsed       = wpmUsed;
        attempt.xpAwarded     = reward.value().xpAwarded;
        attempt.isPerfect     = reward.value().perfect;
        attempt.passed        = reward.value().passed;
        attempt.requestKey    = requestKey;
        attempt.createdAt     = session.Now();
        attempt.id            = store.InsertQuizAttempt(attempt);

        core::TransactionRefs refs;
        refs.quizAttemptId = attempt.id;

        if (attempt.xpAwarded > 0) {
            auto earned = session.Earn(attempt.xpAwarded, core::sources::QuizCompletion,
                                       "Quiz on " + contentId + " (attempt "
                                       + std::to_string(attempt.attemptNumber) + ", score "
                                       + std::to_string(scorePct) + "%)",
                                       refs, ledger::DerivedRequestKey(kKeyScope, requestKey, "reward"));
            if (!earned) {
                return Result<QuizAttempt>::From(earned);
            }
            attempt.rewardTransactionId = earned.value().id;
        }

        if (attempt.isPerfect) {
            store.AddCommentCredit(accountId, contentId);
            attempt.commentCreditGranted = true;
        }

        auto progression = m_progression.ApplyRatchet(session, attempt.attemptNumber, wpmUsed, scorePct,
                                                      attempt.id,
                                                      ledger::DerivedRequestKey(kKeyScope, requestKey));
        if (!progression) {
            return Result<QuizAttempt>::From(progression);
        }
        attempt.progressionTriggered = progression.value().triggered;
        attempt.newMaxWpm = progression.value().newMaxWpm;

        if (attempt.xpAwarded > 0) {
            auto streak = applyStreak(session, attempt.id, requestKey);
            if (!streak) {
                return Result<QuizAttempt>::From(streak);
            }
            attempt.streakBonusXp = streak.value();
        }

        return Result<QuizAttempt>::Ok(attempt);
    }, deadline);

    if (result && !result.value().replayed) {
        const QuizAttempt &a = result.value();
        util::logger::info("[QuizProcessor] " + accountId + " attempt " + std::to_string(a.attemptNumber)
                           + " on " + contentId + ": score " + std::to_string(a.scorePct) + "%, "
                           + std::to_string(a.xpAwarded) + " XP"
                           + (a.progressionTriggered ? ", max speed " + std::to_string(a.newMaxWpm) : ""));
    }
    else if (!result) {
        util::logger::info("[QuizProcessor] Attempt rejected for " + accountId + " on " + contentId + ": "
                           + result.message());
    }
    return result;
}

Result<QuizAttempt> QuizProcessor::SubmitForGrading(IQuizGrader &grader,
                                                    const QuizSubmission &submission,
                                                    std::chrono::milliseconds timeout)
{
    std::future<QuizGrade> pending = grader.Grade(submission);
    if (!pending.valid()) {
        return Result<QuizAttempt>::Fail(ErrorCode::TransientConflict, "Grader returned no result");
    }
    if (pending.wait_for(timeout) != std::future_status::ready) {
        util::logger::warn("[QuizProcessor] Grading timed out after " + std::to_string(timeout.count())
                           + " ms for " + submission.accountId + " on " + submission.contentId);
        return Result<QuizAttempt>::Fail(ErrorCode::Timeout,
            "Quiz grading did not finish within " + std::to_string(timeout.count()) + " ms");
    }

    QuizGrade grade;
    try {
        grade = pending.get();
    }
    catch (const std::exception &ex) {
        util::logger::warn(std::string("[QuizProcessor] Grader failed: ") + ex.what());
        return Result<QuizAttempt>::Fail(ErrorCode::TransientConflict,
                                         std::string("Quiz grading failed: ") + ex.what());
    }

    int64_t wpm = grade.wpmUsed > 0 ? grade.wpmUsed : submission.wpmUsed;
    return RecordQuizAttempt(submission.accountId, submission.contentId, grade.scorePct, wpm,
                             submission.requestKey);
}

Result<std::vector<QuizAttempt>> QuizProcessor::GetAttempts(const std::string &accountId,
                                                            const std::string &contentId)
{
    try {
        return Result<std::vector<QuizAttempt>>::Ok(
            m_transactions.Store().LoadQuizAttempts(accountId, contentId));
    }
    catch (const core::StoreError &ex) {
        util::logger::error(std::string("[QuizProcessor] GetAttempts failed: ") + ex.what());
        return Result<std::vector<QuizAttempt>>::Fail(ErrorCode::StorageError, ex.what());
    }
}

Result<bool> QuizProcessor::HasPassed(const std::string &accountId, const std::string &contentId)
{
    try {
        return Result<bool>::Ok(m_transactions.Store().HasPassedAttempt(accountId, contentId));
    }
    catch (const core::StoreError &ex) {
        util::logger::error(std::string("[QuizProcessor] HasPassed failed: ") + ex.what());
        return Result<bool>::Fail(ErrorCode::StorageError, ex.what());
    }
}

Result<int64_t> QuizProcessor::applyStreak(ledger::LedgerSession &session, int64_t quizAttemptId,
                                           const std::string &requestKey)
{
    const core::Account &account = session.Account();
    int64_t today = session.Now() / kMillisPerDay;
    if (account.lastEarnDay == today) {
        return Result<int64_t>::Ok(0);
    }

    int64_t streak = (account.lastEarnDay == today - 1) ? account.streakDays + 1 : 1;
    session.SetStreak(streak, today);

    int64_t bonus = streakBonusFor(streak);
    if (bonus <= 0) {
        return Result<int64_t>::Ok(0);
    }

    core::TransactionRefs refs;
    refs.quizAttemptId = quizAttemptId;
    auto earned = session.Earn(bonus, core::sources::ReadingStreak,
                               std::to_string(streak) + "-day reading streak", refs,
                               ledger::DerivedRequestKey(kKeyScope, requestKey, "streak"));
    if (!earned) {
        return Result<int64_t>::From(earned);
    }
    return Result<int64_t>::Ok(bonus);
}

int64_t QuizProcessor::streakBonusFor(int64_t streakDays) const
{
    int64_t bonus = 0;
    for (const auto &tier : m_params.streakTiers) {
        if (streakDays >= tier.first) {
            bonus = tier.second;
        }
    }
    return bonus;
}

} // namespace engine
} // namespace xpeconomy
