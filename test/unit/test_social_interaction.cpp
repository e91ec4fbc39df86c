// test/unit/test_social_interaction.cpp
// -----------------------------------------------------------
// Comment pricing, free comment credits, interaction tiers and author rewards.

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <thread>

#include "economy_fixture.hpp"
#include "engine/content_source.hpp"
#include "engine/quiz_processor.hpp"
#include "engine/speed_progression.hpp"
#include "social/social_interaction_manager.hpp"

namespace xpeconomy {
namespace test {
namespace {

using core::ErrorCode;
using core::InteractionTier;

class SocialInteractionTest : public EconomyTest {
  protected:
    SocialInteractionTest()
        : content(params.lengthMetric),
          progression(*tm, params),
          quizzes(*tm, progression, content, params),
          socialManager(*tm, params) {}

    void SetUp() override {
        EconomyTest::SetUp();
        // Too short to earn anything: passing it only unlocks comments.
        content.Register("article-1", 1, 1.0);
        content.Register("article-2", 1, 1.0);
    }

    /// Pass the quiz; a perfect score also leaves one free comment credit.
    void pass(const std::string& accountId, const std::string& contentId, bool perfect) {
        auto attempt = quizzes.RecordQuizAttempt(accountId, contentId, perfect ? 100 : 80, 100);
        ASSERT_TRUE(attempt.ok());
        ASSERT_TRUE(attempt.value().passed);
    }

    /// bob owns comment "c-bob" on article-1, posted with his free credit.
    void seedAuthorComment() {
        createFunded("bob", 0);
        pass("bob", "article-1", true);
        ASSERT_TRUE(socialManager.PostComment("bob", "c-bob", "article-1").ok());
    }

    engine::InMemoryContentSource content;
    engine::SpeedProgressionController progression;
    engine::QuizProcessor quizzes;
    social::SocialInteractionManager socialManager;
};

TEST_F(SocialInteractionTest, CommentWithoutEnoughXpIsRejected) {
    createFunded("alice", 80);
    pass("alice", "article-1", false);

    auto comment = socialManager.PostComment("alice", "c1", "article-1");
    ASSERT_FALSE(comment.ok());
    EXPECT_EQ(comment.code(), ErrorCode::InsufficientXP);
    EXPECT_EQ(comment.shortfall(), 20);

    EXPECT_EQ(spendable("alice"), 80);
    EXPECT_EQ(store->LoadTransactions("alice").size(), (size_t)1);
    EXPECT_FALSE(store->LoadComment("c1").has_value());
}

TEST_F(SocialInteractionTest, CommentingNeedsAPassedQuiz) {
    createFunded("alice", 500);
    EXPECT_EQ(socialManager.PostComment("alice", "c1", "article-1").code(), ErrorCode::CommentLocked);

    ASSERT_TRUE(quizzes.RecordQuizAttempt("alice", "article-1", 40, 100).ok());
    EXPECT_EQ(socialManager.PostComment("alice", "c1", "article-1").code(), ErrorCode::CommentLocked);

    pass("alice", "article-1", false);
    auto comment = socialManager.PostComment("alice", "c1", "article-1");
    ASSERT_TRUE(comment.ok());
    EXPECT_FALSE(comment.value().isFree);
    EXPECT_EQ(comment.value().costPaid, 100);
    EXPECT_EQ(spendable("alice"), 400);
}

TEST_F(SocialInteractionTest, PerfectScoreMakesNextCommentFree) {
    createFunded("alice", 150);
    pass("alice", "article-1", true);

    auto first = socialManager.PostComment("alice", "c1", "article-1");
    ASSERT_TRUE(first.ok());
    EXPECT_TRUE(first.value().isFree);
    EXPECT_EQ(first.value().costPaid, 0);
    EXPECT_FALSE(first.value().transactionId.has_value());
    EXPECT_EQ(spendable("alice"), 150);

    auto second = socialManager.PostComment("alice", "c2", "article-1");
    ASSERT_TRUE(second.ok());
    EXPECT_FALSE(second.value().isFree);
    EXPECT_EQ(spendable("alice"), 50);

    // The credit is per content.
    pass("alice", "article-2", false);
    EXPECT_EQ(socialManager.PostComment("alice", "c3", "article-2").code(), ErrorCode::InsufficientXP);
}

TEST_F(SocialInteractionTest, RepliesCostLessAndMustMatchTheParent) {
    seedAuthorComment();
    createFunded("alice", 120);
    pass("alice", "article-1", false);

    auto reply = socialManager.PostComment("alice", "r1", "article-1", "c-bob");
    ASSERT_TRUE(reply.ok());
    EXPECT_EQ(reply.value().costPaid, 50);
    EXPECT_EQ(reply.value().parentId, "c-bob");
    EXPECT_EQ(spendable("alice"), 70);

    EXPECT_EQ(socialManager.PostComment("alice", "r2", "article-1", "nope").code(), ErrorCode::NotFound);
    EXPECT_EQ(socialManager.PostComment("alice", "r2", "article-2", "c-bob").code(), ErrorCode::ValidationError);
    EXPECT_EQ(socialManager.PostComment("alice", "r1", "article-1", "c-bob").code(), ErrorCode::ValidationError);
    EXPECT_EQ(spendable("alice"), 70);
}

TEST_F(SocialInteractionTest, FreeCreditCoversAReply) {
    seedAuthorComment();
    createFunded("alice", 0);
    pass("alice", "article-1", true);

    auto reply = socialManager.PostComment("alice", "r1", "article-1", "c-bob");
    ASSERT_TRUE(reply.ok());
    EXPECT_TRUE(reply.value().isFree);
}

TEST_F(SocialInteractionTest, GoldInteractionPaysHalfToTheAuthor) {
    seedAuthorComment();
    createFunded("carol", 40);

    auto gold = socialManager.Interact("carol", "c-bob", InteractionTier::Gold);
    ASSERT_TRUE(gold.ok());
    EXPECT_EQ(gold.value().cost, 30);
    EXPECT_EQ(gold.value().authorReward, 15);
    EXPECT_EQ(gold.value().authorId, "bob");

    EXPECT_EQ(spendable("carol"), 10);
    EXPECT_EQ(spendable("bob"), 15);
    EXPECT_EQ(accumulated("bob"), 15);

    auto rewards = tm->GetHistory("bob", core::TransactionType::Earn).value();
    ASSERT_EQ(rewards.size(), (size_t)1);
    EXPECT_EQ(rewards[0].source, core::sources::InteractionReceived);
    EXPECT_EQ(rewards[0].refs.commentId, "c-bob");
}

TEST_F(SocialInteractionTest, TierPrices) {
    EXPECT_EQ(socialManager.InteractionCost(InteractionTier::Bronze), 5);
    EXPECT_EQ(socialManager.InteractionCost(InteractionTier::Silver), 15);
    EXPECT_EQ(socialManager.InteractionCost(InteractionTier::Gold), 30);
    EXPECT_EQ(socialManager.InteractionCost(InteractionTier::ReportTroll), 5);
    EXPECT_EQ(socialManager.InteractionCost(InteractionTier::ReportBad), 15);
    EXPECT_EQ(socialManager.InteractionCost(InteractionTier::ReportSevere), 30);

    EXPECT_EQ(socialManager.AuthorReward(InteractionTier::Bronze), 2);
    EXPECT_EQ(socialManager.AuthorReward(InteractionTier::Silver), 7);
    EXPECT_EQ(socialManager.AuthorReward(InteractionTier::Gold), 15);
    EXPECT_EQ(socialManager.AuthorReward(InteractionTier::ReportSevere), 0);

    EXPECT_EQ(socialManager.CommentCost(false), 100);
    EXPECT_EQ(socialManager.CommentCost(true), 50);
}

TEST_F(SocialInteractionTest, ReportsChargeTheReporterOnly) {
    seedAuthorComment();
    createFunded("carol", 40);

    auto report = socialManager.Interact("carol", "c-bob", InteractionTier::ReportSevere);
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report.value().authorReward, 0);
    EXPECT_EQ(spendable("carol"), 10);
    EXPECT_EQ(spendable("bob"), 0);

    auto spends = tm->GetHistory("carol", core::TransactionType::Spend).value();
    ASSERT_EQ(spends.size(), (size_t)1);
    EXPECT_EQ(spends[0].source, core::sources::ReportFiled);
}

TEST_F(SocialInteractionTest, InteractingWithOwnCommentPaysNoReward) {
    seedAuthorComment();
    ASSERT_TRUE(tm->Earn("bob", 20, core::sources::AdminGrant, "grant").ok());

    auto self = socialManager.Interact("bob", "c-bob", InteractionTier::Silver);
    ASSERT_TRUE(self.ok());
    EXPECT_EQ(self.value().authorReward, 0);
    EXPECT_EQ(spendable("bob"), 5);
}

TEST_F(SocialInteractionTest, InteractionWithoutFundsChangesNothing) {
    seedAuthorComment();
    createFunded("carol", 3);

    auto bronze = socialManager.Interact("carol", "c-bob", InteractionTier::Bronze);
    EXPECT_EQ(bronze.code(), ErrorCode::InsufficientXP);
    EXPECT_EQ(bronze.shortfall(), 2);
    EXPECT_EQ(spendable("carol"), 3);
    EXPECT_EQ(spendable("bob"), 0);

    EXPECT_EQ(socialManager.Interact("carol", "missing", InteractionTier::Bronze).code(), ErrorCode::NotFound);
}

TEST_F(SocialInteractionTest, RepeatedRequestIdNeverChargesTwice) {
    seedAuthorComment();
    createFunded("carol", 100);

    auto first = socialManager.Interact("carol", "c-bob", InteractionTier::Gold, "ix-1");
    ASSERT_TRUE(first.ok());
    auto again = socialManager.Interact("carol", "c-bob", InteractionTier::Gold, "ix-1");
    ASSERT_TRUE(again.ok());
    EXPECT_TRUE(again.value().replayed);
    EXPECT_EQ(again.value().id, first.value().id);

    EXPECT_EQ(spendable("carol"), 70);
    EXPECT_EQ(spendable("bob"), 15);

    EXPECT_EQ(socialManager.Interact("carol", "c-bob", InteractionTier::Bronze, "ix-1").code(),
              ErrorCode::ValidationError);
}

TEST_F(SocialInteractionTest, RetryAfterInterruptedInteractionCompletesIt) {
    seedAuthorComment();
    createFunded("carol", 100);

    // The actor's charge went through under this request id but nothing else did.
    core::TransactionRefs refs;
    refs.commentId = "c-bob";
    ASSERT_TRUE(tm->Spend("carol", 30, core::sources::InteractionGiven, "gold on comment c-bob", refs,
                          ledger::DerivedRequestKey("interact", "ix-9", "spend"))
                    .ok());

    auto resumed = socialManager.Interact("carol", "c-bob", InteractionTier::Gold, "ix-9");
    ASSERT_TRUE(resumed.ok());
    EXPECT_EQ(spendable("carol"), 70);
    EXPECT_EQ(spendable("bob"), 15);
}

TEST_F(SocialInteractionTest, CommentChargeKeyCannotBePrepaidCheaply) {
    createFunded("alice", 500);
    pass("alice", "article-1", false);

    ASSERT_TRUE(tm->Spend("alice", 1, core::sources::Manual, "", {}, "comment:c1").ok());
    auto comment = socialManager.PostComment("alice", "c1", "article-1");
    EXPECT_EQ(comment.code(), ErrorCode::ValidationError);

    EXPECT_EQ(spendable("alice"), 499);
    EXPECT_FALSE(store->LoadComment("c1").has_value());
}

TEST_F(SocialInteractionTest, InteractionWithoutRequestIdGetsOne) {
    seedAuthorComment();
    createFunded("carol", 100);

    auto first = socialManager.Interact("carol", "c-bob", InteractionTier::Bronze);
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first.value().requestKey.rfind("ix-", 0), (size_t)0);

    auto second = socialManager.Interact("carol", "c-bob", InteractionTier::Bronze);
    ASSERT_TRUE(second.ok());
    EXPECT_NE(second.value().requestKey, first.value().requestKey);
    EXPECT_FALSE(second.value().replayed);

    // The generated id resumes the interaction like a caller-supplied one.
    auto again = socialManager.Interact("carol", "c-bob", InteractionTier::Bronze, first.value().requestKey);
    ASSERT_TRUE(again.ok());
    EXPECT_TRUE(again.value().replayed);
    EXPECT_EQ(spendable("carol"), 90);
    EXPECT_EQ(spendable("bob"), 4);
}

TEST_F(SocialInteractionTest, AffordabilityAndSummary) {
    seedAuthorComment();
    createFunded("carol", 80);
    pass("carol", "article-1", false);

    EXPECT_FALSE(socialManager.CanAffordComment("carol", "article-1", false).value());
    EXPECT_TRUE(socialManager.CanAffordComment("carol", "article-1", true).value());
    EXPECT_FALSE(socialManager.CanAffordComment("bob", "article-1", false).value());
    EXPECT_TRUE(socialManager.CanAffordInteraction("carol", InteractionTier::Gold).value());
    EXPECT_EQ(socialManager.CanAffordInteraction("ghost", InteractionTier::Gold).code(), ErrorCode::NotFound);

    ASSERT_TRUE(socialManager.Interact("carol", "c-bob", InteractionTier::Silver).ok());
    ASSERT_TRUE(socialManager.PostComment("carol", "r1", "article-1", "c-bob").ok());

    auto carol = socialManager.GetInteractionSummary("carol").value();
    EXPECT_EQ(carol.commentsPosted, 1);
    EXPECT_EQ(carol.interactionsGiven, 1);
    EXPECT_EQ(carol.xpSpentSocial, 65);
    EXPECT_EQ(carol.net, -65);

    auto bob = socialManager.GetInteractionSummary("bob").value();
    EXPECT_EQ(bob.commentsPosted, 1);
    EXPECT_EQ(bob.interactionsReceived, 1);
    EXPECT_EQ(bob.xpEarnedSocial, 7);
}

class SocialInteractionFileTest : public EconomyTest {
  protected:
    void SetUp() override {
        EconomyTest::SetUp();
        useFileDatabase("test_social_side_by_side.sqlite");
        content = std::make_unique<engine::InMemoryContentSource>(params.lengthMetric);
        progression = std::make_unique<engine::SpeedProgressionController>(*tm, params);
        quizzes = std::make_unique<engine::QuizProcessor>(*tm, *progression, *content, params);
        socialManager = std::make_unique<social::SocialInteractionManager>(*tm, params);
        content->Register("article-1", 1, 1.0);
    }

    void TearDown() override {
        socialManager.reset();
        quizzes.reset();
        progression.reset();
        EconomyTest::TearDown();
    }

    std::unique_ptr<engine::InMemoryContentSource> content;
    std::unique_ptr<engine::SpeedProgressionController> progression;
    std::unique_ptr<engine::QuizProcessor> quizzes;
    std::unique_ptr<social::SocialInteractionManager> socialManager;
};

TEST_F(SocialInteractionFileTest, AuthorIsPaidEvenWhenBusyPastTheDeadline) {
    createFunded("bob", 0);
    ASSERT_TRUE(quizzes->RecordQuizAttempt("bob", "article-1", 100, 100).ok());
    ASSERT_TRUE(socialManager->PostComment("bob", "c-bob", "article-1").ok());
    createFunded("carol", 100);

    // bob's account stays busy well past carol's deadline.
    std::promise<void> entered;
    std::atomic<bool> signalled(false);
    std::thread busy([&]() {
        auto held = tm->Execute<int>("bob", [&](ledger::LedgerSession&) {
            if (!signalled.exchange(true)) {
                entered.set_value();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            return core::Result<int>::Ok(0);
        });
        EXPECT_TRUE(held.ok());
    });
    entered.get_future().wait();

    auto gold = socialManager->Interact("carol", "c-bob", InteractionTier::Gold, "",
                                        ledger::DeadlineIn(std::chrono::milliseconds(100)));
    busy.join();

    ASSERT_TRUE(gold.ok()) << gold.message();
    EXPECT_FALSE(gold.value().requestKey.empty());
    EXPECT_EQ(spendable("carol"), 70);
    EXPECT_EQ(spendable("bob"), 15);
}

} // namespace
} // namespace test
} // namespace xpeconomy
