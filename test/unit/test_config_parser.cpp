// test/unit/test_config_parser.cpp
// -----------------------------------------------------------
// key=value configuration: process settings, economy tuning and bad input.

#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <stdexcept>

#include "config/economy_params.hpp"
#include "config/service_config.hpp"
#include "util/config_parser.hpp"

namespace xpeconomy {
namespace {

class ConfigParserTest : public ::testing::Test {
  protected:
    ConfigParserTest() : economy(config::getDefaultParams()), parser(serviceConfig, economy) {}

    config::ServiceConfig serviceConfig;
    config::EconomyParams economy;
    util::ConfigParser parser;
};

TEST_F(ConfigParserTest, DefaultsMatchTheShippedEconomy) {
    EXPECT_EQ(serviceConfig.databasePath(), "./xpeconomy_data/ledger.sqlite");
    EXPECT_EQ(serviceConfig.monitorIntervalSeconds, (uint64_t)300);
    EXPECT_EQ(economy.lengthMetric, config::LengthMetric::Words);
    EXPECT_EQ(economy.commentCost, 100);
    EXPECT_EQ(economy.replyCost, 50);
    EXPECT_EQ(economy.initialCurrentWpm, 200);
    EXPECT_EQ(economy.initialMaxWpm, 225);
    EXPECT_TRUE(economy.freezeOnViolation);
}

TEST_F(ConfigParserTest, ParsesProcessAndEconomyKeys) {
    parser.loadFromString(
        "# comment line\n"
        "\n"
        "dataDirectory = /var/lib/xpeconomy\n"
        "databaseFile=:memory:\n"
        "logLevel=DEBUG\n"
        "monitorIntervalSeconds=60\n"
        "monitorThreads=4\n"
        "graderTimeoutMs=750\n"
        "lengthMetric=letters\n"
        "commentCost=120\n"
        "authorRewardRate=0.25\n"
        "diminishingBase=0.75\n"
        "freezeOnViolation=no\n"
        "lockRetryLimit=5\n");

    EXPECT_EQ(serviceConfig.dataDirectory, "/var/lib/xpeconomy");
    EXPECT_EQ(serviceConfig.databasePath(), ":memory:");
    EXPECT_EQ(serviceConfig.logLevel, "DEBUG");
    EXPECT_EQ(serviceConfig.monitorIntervalSeconds, (uint64_t)60);
    EXPECT_EQ(serviceConfig.monitorThreads, (uint32_t)4);
    EXPECT_EQ(serviceConfig.graderTimeoutMs, (uint64_t)750);

    EXPECT_EQ(economy.lengthMetric, config::LengthMetric::Letters);
    EXPECT_EQ(economy.commentCost, 120);
    EXPECT_DOUBLE_EQ(economy.authorRewardRate, 0.25);
    EXPECT_DOUBLE_EQ(economy.diminishingBase, 0.75);
    EXPECT_FALSE(economy.freezeOnViolation);
    EXPECT_EQ(economy.lockRetryLimit, (uint32_t)5);

    // untouched
    EXPECT_EQ(economy.replyCost, 50);
}

TEST_F(ConfigParserTest, UnknownKeyIsIgnored) {
    EXPECT_NO_THROW(parser.loadFromString("shardCount=12\ncommentCost=90\n"));
    EXPECT_EQ(economy.commentCost, 90);
}

TEST_F(ConfigParserTest, MalformedLinesThrow) {
    EXPECT_THROW(parser.loadFromString("commentCost 100\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("commentCost=cheap\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("commentCost=100xp\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("monitorThreads=-1\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("perfectBonusRate=a lot\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("freezeOnViolation=maybe\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("lengthMetric=pages\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("logLevel=LOUD\n"), std::runtime_error);
    EXPECT_EQ(economy.commentCost, 100);
}

TEST_F(ConfigParserTest, MissingFileKeepsDefaults) {
    EXPECT_FALSE(parser.loadFromFile("does_not_exist_xpeconomy.conf"));
    EXPECT_EQ(economy.commentCost, 100);
}

TEST_F(ConfigParserTest, LoadsFromFile) {
    const std::string path = "test_config_parser.conf";
    {
        std::ofstream out(path);
        out << "goldCost=45\n"
            << "velocityThresholdXp=9000\n";
    }
    EXPECT_TRUE(parser.loadFromFile(path));
    EXPECT_EQ(economy.goldCost, 45);
    EXPECT_EQ(economy.velocityThresholdXp, 9000);
    std::remove(path.c_str());
}

} // namespace
} // namespace xpeconomy
