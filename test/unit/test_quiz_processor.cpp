// test/unit/test_quiz_processor.cpp
// -----------------------------------------------------------
// Quiz attempts: rewards, retries, the speed ratchet, comment credits,
// reading streaks, replay and asynchronous grading.

#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <vector>

#include "economy_fixture.hpp"
#include "engine/content_source.hpp"
#include "engine/quiz_grader.hpp"
#include "engine/quiz_processor.hpp"
#include "engine/speed_progression.hpp"

namespace xpeconomy {
namespace test {
namespace {

using core::ErrorCode;

// Grader whose answers are decided by the test.
class ScriptedGrader : public engine::IQuizGrader {
  public:
    enum class Mode { Answer, Fail, Hang };

    explicit ScriptedGrader(Mode mode, int64_t score = 0) : m_mode(mode), m_score(score) {}

    std::future<engine::QuizGrade> Grade(const engine::QuizSubmission& submission) override {
        auto promise = std::make_shared<std::promise<engine::QuizGrade>>();
        std::future<engine::QuizGrade> future = promise->get_future();
        if (m_mode == Mode::Answer) {
            promise->set_value(engine::QuizGrade{m_score, submission.wpmUsed});
        } else if (m_mode == Mode::Fail) {
            promise->set_exception(std::make_exception_ptr(std::runtime_error("grader unavailable")));
        }
        // Hang: keep the promise alive and never fulfil it.
        m_pending.push_back(promise);
        return future;
    }

  private:
    Mode m_mode;
    int64_t m_score;
    std::vector<std::shared_ptr<std::promise<engine::QuizGrade>>> m_pending;
};

class QuizProcessorTest : public EconomyTest {
  protected:
    QuizProcessorTest()
        : content(params.lengthMetric),
          progression(*tm, params),
          quizzes(*tm, progression, content, params) {}

    void SetUp() override {
        EconomyTest::SetUp();
        // 400 words at level 10: 200 WPM gives a 0.8 speed multiplier.
        content.Register("article-1", 400, 10.0);
        content.Register("article-2", 400, 10.0);
        content.Register("article-3", 400, 10.0);
        content.Register("article-4", 400, 10.0);
        content.Register("tiny", 1, 1.0);
        createFunded("alice", 0);
    }

    engine::InMemoryContentSource content;
    engine::SpeedProgressionController progression;
    engine::QuizProcessor quizzes;
};

TEST_F(QuizProcessorTest, PerfectFirstAttemptPaysAndGrantsCommentCredit) {
    auto attempt = quizzes.RecordQuizAttempt("alice", "article-1", 100, 200);
    ASSERT_TRUE(attempt.ok());
    const auto& a = attempt.value();
    EXPECT_EQ(a.attemptNumber, 1);
    EXPECT_EQ(a.xpAwarded, 400);
    EXPECT_TRUE(a.passed);
    EXPECT_TRUE(a.isPerfect);
    EXPECT_TRUE(a.commentCreditGranted);
    EXPECT_FALSE(a.progressionTriggered);
    EXPECT_EQ(a.streakBonusXp, 0);
    ASSERT_TRUE(a.rewardTransactionId.has_value());

    auto tx = store->LoadTransaction(*a.rewardTransactionId);
    ASSERT_TRUE(tx.has_value());
    EXPECT_EQ(tx->source, core::sources::QuizCompletion);
    EXPECT_EQ(tx->refs.quizAttemptId, a.id);

    EXPECT_EQ(spendable("alice"), 400);
    EXPECT_EQ(accumulated("alice"), 400);
    EXPECT_EQ(store->GetCommentCredits("alice", "article-1"), 1);
}

TEST_F(QuizProcessorTest, RetriesAreDiminished) {
    ASSERT_TRUE(quizzes.RecordQuizAttempt("alice", "article-1", 100, 200).ok());
    auto second = quizzes.RecordQuizAttempt("alice", "article-1", 100, 200);
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(second.value().attemptNumber, 2);
    EXPECT_EQ(second.value().xpAwarded, 200);

    auto third = quizzes.RecordQuizAttempt("alice", "article-1", 60, 200);
    ASSERT_TRUE(third.ok());
    EXPECT_EQ(third.value().attemptNumber, 3);
    // 400 * 0.8 * 0.6 = 192, quartered
    EXPECT_EQ(third.value().xpAwarded, 48);
    EXPECT_EQ(spendable("alice"), 648);
}

TEST_F(QuizProcessorTest, FailedAttemptIsRecordedWithoutReward) {
    auto attempt = quizzes.RecordQuizAttempt("alice", "article-1", 50, 200);
    ASSERT_TRUE(attempt.ok());
    EXPECT_FALSE(attempt.value().passed);
    EXPECT_EQ(attempt.value().xpAwarded, 0);
    EXPECT_FALSE(attempt.value().rewardTransactionId.has_value());

    EXPECT_TRUE(store->LoadTransactions("alice").empty());
    EXPECT_FALSE(quizzes.HasPassed("alice", "article-1").value());
    EXPECT_EQ(quizzes.GetAttempts("alice", "article-1").value().size(), (size_t)1);

    // The failed attempt still counts towards the retry penalty.
    auto retry = quizzes.RecordQuizAttempt("alice", "article-1", 100, 200);
    EXPECT_EQ(retry.value().attemptNumber, 2);
    EXPECT_EQ(retry.value().xpAwarded, 200);
}

TEST_F(QuizProcessorTest, ZeroRewardPassStillUnlocksComments) {
    auto attempt = quizzes.RecordQuizAttempt("alice", "tiny", 80, 100);
    ASSERT_TRUE(attempt.ok());
    EXPECT_TRUE(attempt.value().passed);
    EXPECT_EQ(attempt.value().xpAwarded, 0);
    EXPECT_TRUE(quizzes.HasPassed("alice", "tiny").value());
    EXPECT_TRUE(store->LoadTransactions("alice").empty());
}

TEST_F(QuizProcessorTest, PerfectAttemptAtMaxSpeedRaisesTheCeiling) {
    auto attempt = quizzes.RecordQuizAttempt("alice", "article-1", 100, 225);
    ASSERT_TRUE(attempt.ok());
    EXPECT_TRUE(attempt.value().progressionTriggered);
    EXPECT_EQ(attempt.value().newMaxWpm, 250);
    // 400 * 0.9 * 1.25 = 450, plus the 50 XP progression bonus
    EXPECT_EQ(attempt.value().xpAwarded, 450);
    EXPECT_EQ(spendable("alice"), 500);
    EXPECT_EQ(tm->GetAccount("alice").value().maxWpm, 250);

    auto history = store->LoadTransactions("alice");
    ASSERT_EQ(history.size(), (size_t)2);
    EXPECT_EQ(history[0].source, core::sources::QuizCompletion);
    EXPECT_EQ(history[1].source, core::sources::SpeedProgression);
    EXPECT_EQ(history[1].amount, 50);
}

TEST_F(QuizProcessorTest, RetryAtMaxSpeedDoesNotRatchet) {
    ASSERT_TRUE(quizzes.RecordQuizAttempt("alice", "article-1", 90, 225).ok());
    auto retry = quizzes.RecordQuizAttempt("alice", "article-1", 100, 225);
    ASSERT_TRUE(retry.ok());
    EXPECT_FALSE(retry.value().progressionTriggered);
    EXPECT_EQ(tm->GetAccount("alice").value().maxWpm, 225);
}

TEST_F(QuizProcessorTest, SpeedAboveMaxIsRejectedBeforeAnyWrite) {
    auto attempt = quizzes.RecordQuizAttempt("alice", "article-1", 100, 250);
    EXPECT_EQ(attempt.code(), ErrorCode::ValidationError);
    EXPECT_TRUE(quizzes.GetAttempts("alice", "article-1").value().empty());

    EXPECT_EQ(quizzes.RecordQuizAttempt("alice", "article-1", 100, -5).code(), ErrorCode::ValidationError);
    EXPECT_EQ(quizzes.RecordQuizAttempt("alice", "article-1", 140, 200).code(), ErrorCode::ValidationError);
    EXPECT_TRUE(store->LoadTransactions("alice").empty());
}

TEST_F(QuizProcessorTest, UnknownContentAndAccount) {
    EXPECT_EQ(quizzes.RecordQuizAttempt("alice", "missing", 100, 200).code(), ErrorCode::NotFound);
    EXPECT_EQ(quizzes.RecordQuizAttempt("ghost", "article-1", 100, 200).code(), ErrorCode::NotFound);
}

TEST_F(QuizProcessorTest, RepeatedRequestKeyReplaysTheAttempt) {
    auto first = quizzes.RecordQuizAttempt("alice", "article-1", 100, 225, "quiz-7");
    ASSERT_TRUE(first.ok());
    auto again = quizzes.RecordQuizAttempt("alice", "article-1", 100, 225, "quiz-7");
    ASSERT_TRUE(again.ok());
    EXPECT_TRUE(again.value().replayed);
    EXPECT_EQ(again.value().id, first.value().id);

    EXPECT_EQ(spendable("alice"), 500);
    EXPECT_EQ(tm->GetAccount("alice").value().maxWpm, 250);
    EXPECT_EQ(quizzes.GetAttempts("alice", "article-1").value().size(), (size_t)1);
    EXPECT_TRUE(store->FindTransactionByRequestKey("quiz:quiz-7:reward").has_value());
    EXPECT_TRUE(store->FindTransactionByRequestKey("quiz:quiz-7:progression").has_value());

    EXPECT_EQ(quizzes.RecordQuizAttempt("alice", "article-2", 100, 200, "quiz-7").code(),
              ErrorCode::ValidationError);
}

TEST_F(QuizProcessorTest, StreakBonusOnThirdConsecutiveDay) {
    auto day1 = quizzes.RecordQuizAttempt("alice", "article-1", 80, 200);
    EXPECT_EQ(day1.value().streakBonusXp, 0);

    nowMs += kDayMillis;
    auto day2 = quizzes.RecordQuizAttempt("alice", "article-2", 80, 200);
    EXPECT_EQ(day2.value().streakBonusXp, 0);

    nowMs += kDayMillis;
    auto day3 = quizzes.RecordQuizAttempt("alice", "article-3", 80, 200);
    EXPECT_EQ(day3.value().streakBonusXp, 5);
    EXPECT_EQ(tm->GetAccount("alice").value().streakDays, 3);

    // A second quiz on the same day pays no second bonus.
    auto sameDay = quizzes.RecordQuizAttempt("alice", "article-4", 80, 200);
    EXPECT_EQ(sameDay.value().streakBonusXp, 0);

    // 256 XP per quiz plus one 5 XP bonus
    EXPECT_EQ(spendable("alice"), 4 * 256 + 5);
    auto streakRows = store->SumAmountBySources("alice", {core::sources::ReadingStreak});
    EXPECT_EQ(streakRows, 5);
}

TEST_F(QuizProcessorTest, StreakBonusIsPaidEachDayAtATier) {
    const char* articles[] = {"article-1", "article-2", "article-3", "article-4"};
    int64_t bonuses[4] = {0, 0, 0, 0};
    for (int day = 0; day < 4; ++day) {
        auto attempt = quizzes.RecordQuizAttempt("alice", articles[day], 80, 200);
        ASSERT_TRUE(attempt.ok());
        bonuses[day] = attempt.value().streakBonusXp;
        nowMs += kDayMillis;
    }
    EXPECT_EQ(bonuses[2], 5);
    EXPECT_EQ(bonuses[3], 5);
    EXPECT_EQ(tm->GetAccount("alice").value().streakDays, 4);
    EXPECT_EQ(store->SumAmountBySources("alice", {core::sources::ReadingStreak}), 10);
}

TEST_F(QuizProcessorTest, MissedDayResetsTheStreak) {
    ASSERT_TRUE(quizzes.RecordQuizAttempt("alice", "article-1", 80, 200).ok());
    nowMs += kDayMillis;
    ASSERT_TRUE(quizzes.RecordQuizAttempt("alice", "article-2", 80, 200).ok());
    EXPECT_EQ(tm->GetAccount("alice").value().streakDays, 2);

    nowMs += 2 * kDayMillis;
    ASSERT_TRUE(quizzes.RecordQuizAttempt("alice", "article-3", 80, 200).ok());
    EXPECT_EQ(tm->GetAccount("alice").value().streakDays, 1);
}

TEST_F(QuizProcessorTest, FailedQuizDoesNotExtendTheStreak) {
    ASSERT_TRUE(quizzes.RecordQuizAttempt("alice", "article-1", 80, 200).ok());
    nowMs += kDayMillis;
    ASSERT_TRUE(quizzes.RecordQuizAttempt("alice", "article-2", 30, 200).ok());
    EXPECT_EQ(tm->GetAccount("alice").value().streakDays, 1);
}

TEST_F(QuizProcessorTest, GradedSubmissionIsRecorded) {
    ScriptedGrader grader(ScriptedGrader::Mode::Answer, 100);
    engine::QuizSubmission submission;
    submission.accountId = "alice";
    submission.contentId = "article-1";
    submission.answers = {"b", "d", "a"};
    submission.wpmUsed = 200;

    auto attempt = quizzes.SubmitForGrading(grader, submission, std::chrono::milliseconds(500));
    ASSERT_TRUE(attempt.ok());
    EXPECT_EQ(attempt.value().scorePct, 100);
    EXPECT_EQ(attempt.value().xpAwarded, 400);
}

TEST_F(QuizProcessorTest, GraderTimeoutWritesNothing) {
    ScriptedGrader grader(ScriptedGrader::Mode::Hang);
    engine::QuizSubmission submission;
    submission.accountId = "alice";
    submission.contentId = "article-1";
    submission.wpmUsed = 200;

    auto attempt = quizzes.SubmitForGrading(grader, submission, std::chrono::milliseconds(20));
    EXPECT_EQ(attempt.code(), ErrorCode::Timeout);
    EXPECT_TRUE(quizzes.GetAttempts("alice", "article-1").value().empty());
    EXPECT_EQ(spendable("alice"), 0);
}

TEST_F(QuizProcessorTest, GraderFailureIsTransient) {
    ScriptedGrader grader(ScriptedGrader::Mode::Fail);
    engine::QuizSubmission submission;
    submission.accountId = "alice";
    submission.contentId = "article-1";
    submission.wpmUsed = 200;

    auto attempt = quizzes.SubmitForGrading(grader, submission, std::chrono::milliseconds(500));
    EXPECT_EQ(attempt.code(), ErrorCode::TransientConflict);
    EXPECT_TRUE(quizzes.GetAttempts("alice", "article-1").value().empty());
}

} // namespace
} // namespace test
} // namespace xpeconomy
