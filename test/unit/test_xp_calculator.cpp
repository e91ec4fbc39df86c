// test/unit/test_xp_calculator.cpp
// -----------------------------------------------------------
// Reward formula and content measurement.

#include <gtest/gtest.h>

#include "config/economy_params.hpp"
#include "engine/xp_calculator.hpp"

namespace {

using xpeconomy::config::LengthMetric;
using xpeconomy::core::ErrorCode;
using xpeconomy::engine::CalculateReward;
using xpeconomy::engine::MeasureContent;
using xpeconomy::engine::RewardInput;

RewardInput makeInput(int64_t length, double level, int64_t score, int64_t wpm, int64_t attempt = 1) {
    RewardInput in;
    in.contentLength = length;
    in.readingLevel = level;
    in.scorePct = score;
    in.wpmUsed = wpm;
    in.attemptNumber = attempt;
    return in;
}

TEST(XpCalculatorTest, PerfectFirstAttemptAtBaseSpeed) {
    auto params = xpeconomy::config::getDefaultParams();
    auto result = CalculateReward(makeInput(1000, 8.0, 100, 250), params);
    ASSERT_TRUE(result.ok());

    const auto& r = result.value();
    EXPECT_NEAR(r.speedMultiplier, 0.8, 1e-9);
    EXPECT_NEAR(r.raw, 800.0, 1e-9);
    EXPECT_NEAR(r.perfectBonus, 200.0, 1e-9);
    EXPECT_EQ(r.xpAwarded, 1000);
    EXPECT_TRUE(r.passed);
    EXPECT_TRUE(r.perfect);
}

TEST(XpCalculatorTest, FailingScoreEarnsNothing) {
    auto params = xpeconomy::config::getDefaultParams();
    auto result = CalculateReward(makeInput(1000, 8.0, 50, 250), params);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().xpAwarded, 0);
    EXPECT_FALSE(result.value().passed);
    EXPECT_FALSE(result.value().perfect);
}

TEST(XpCalculatorTest, PassThresholdIsInclusive) {
    auto params = xpeconomy::config::getDefaultParams();

    auto atThreshold = CalculateReward(makeInput(1000, 10.0, 60, 250), params);
    ASSERT_TRUE(atThreshold.ok());
    EXPECT_TRUE(atThreshold.value().passed);
    EXPECT_EQ(atThreshold.value().xpAwarded, 600);

    auto below = CalculateReward(makeInput(1000, 10.0, 59, 250), params);
    ASSERT_TRUE(below.ok());
    EXPECT_FALSE(below.value().passed);
    EXPECT_EQ(below.value().xpAwarded, 0);
}

TEST(XpCalculatorTest, RetriesHalveTheReward) {
    auto params = xpeconomy::config::getDefaultParams();
    // 400 words, level 10, 200 wpm, 80%: raw = 400 * 0.8 * 0.8 = 256
    EXPECT_EQ(CalculateReward(makeInput(400, 10.0, 80, 200, 1), params).value().xpAwarded, 256);
    EXPECT_EQ(CalculateReward(makeInput(400, 10.0, 80, 200, 2), params).value().xpAwarded, 128);
    EXPECT_EQ(CalculateReward(makeInput(400, 10.0, 80, 200, 3), params).value().xpAwarded, 64);
    EXPECT_EQ(CalculateReward(makeInput(400, 10.0, 80, 200, 4), params).value().xpAwarded, 32);
}

TEST(XpCalculatorTest, LateRetryFloorsToZeroButStillPasses) {
    auto params = xpeconomy::config::getDefaultParams();
    auto result = CalculateReward(makeInput(10, 1.0, 70, 100, 12), params);
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.value().passed);
    EXPECT_EQ(result.value().xpAwarded, 0);
}

TEST(XpCalculatorTest, ResultIsFloored) {
    auto params = xpeconomy::config::getDefaultParams();
    // 333 * (200/250 * 0.7) * 0.75 = 139.86
    auto result = CalculateReward(makeInput(333, 7.0, 75, 200), params);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().xpAwarded, 139);
}

TEST(XpCalculatorTest, RejectsMalformedInput) {
    auto params = xpeconomy::config::getDefaultParams();
    EXPECT_EQ(CalculateReward(makeInput(-1, 8.0, 100, 250), params).code(), ErrorCode::ValidationError);
    EXPECT_EQ(CalculateReward(makeInput(100, -2.0, 100, 250), params).code(), ErrorCode::ValidationError);
    EXPECT_EQ(CalculateReward(makeInput(100, 8.0, 101, 250), params).code(), ErrorCode::ValidationError);
    EXPECT_EQ(CalculateReward(makeInput(100, 8.0, -5, 250), params).code(), ErrorCode::ValidationError);
    EXPECT_EQ(CalculateReward(makeInput(100, 8.0, 90, -250), params).code(), ErrorCode::ValidationError);
    EXPECT_EQ(CalculateReward(makeInput(100, 8.0, 90, 0), params).code(), ErrorCode::ValidationError);
    EXPECT_EQ(CalculateReward(makeInput(100, 8.0, 90, 250, 0), params).code(), ErrorCode::ValidationError);
}

TEST(XpCalculatorTest, RewardAboveTransactionLimitIsRejected) {
    auto params = xpeconomy::config::getDefaultParams();
    auto atLimit = CalculateReward(makeInput(100000, 8.0, 100, 250), params);
    ASSERT_TRUE(atLimit.ok());
    EXPECT_NEAR(static_cast<double>(atLimit.value().xpAwarded), 100000.0, 1.0);

    auto over = CalculateReward(makeInput(100010, 8.0, 100, 250), params);
    EXPECT_EQ(over.code(), ErrorCode::ValidationError);
    EXPECT_EQ(over.message(), "Reward exceeds the per-transaction limit of 100000");

    EXPECT_EQ(CalculateReward(makeInput(1000000, 1e300, 100, 250), params).code(), ErrorCode::ValidationError);
}

TEST(XpCalculatorTest, EmptyContentEarnsZero) {
    auto params = xpeconomy::config::getDefaultParams();
    auto result = CalculateReward(makeInput(0, 8.0, 100, 250), params);
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.value().passed);
    EXPECT_EQ(result.value().xpAwarded, 0);
}

TEST(MeasureContentTest, WordsAndLetters) {
    const std::string text = "  The quick\tbrown fox\n jumps ";
    EXPECT_EQ(MeasureContent(text, LengthMetric::Words), 5);
    EXPECT_EQ(MeasureContent(text, LengthMetric::Letters), 21);
    EXPECT_EQ(MeasureContent("", LengthMetric::Words), 0);
    EXPECT_EQ(MeasureContent("   ", LengthMetric::Letters), 0);
}

} // namespace
