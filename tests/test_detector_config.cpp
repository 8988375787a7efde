#include "detection/DetectorConfig.hpp"
#include "utils/ConfigLoader.hpp"
#include "utils/Logger.hpp"

#include <gtest/gtest.h>
#include <iostream>
#include <sstream>
#include <stdexcept>

using namespace Sentinel;
using Detection::DetectorConfig;

class DetectorConfigTest : public ::testing::Test {
protected:
  void SetUp() override { Utils::getLogger().setConsole(nullptr); }
  void TearDown() override { Utils::getLogger().setConsole(&std::cerr); }

  static DetectorConfig load(const std::string &text) {
    Utils::ConfigLoader loader;
    std::istringstream in(text);
    loader.loadFromStream(in);
    return DetectorConfig::fromConfig(loader);
  }
};

TEST_F(DetectorConfigTest, DefaultsAreValid) {
  DetectorConfig cfg;
  EXPECT_FALSE(cfg.validate());
  EXPECT_EQ(cfg.windowCapacity, 100u);
  EXPECT_EQ(cfg.minPoints, 10u);
  EXPECT_DOUBLE_EQ(cfg.zScoreThreshold, 3.0);
  EXPECT_DOUBLE_EQ(cfg.ewmaAlpha, 0.1);
  EXPECT_DOUBLE_EQ(cfg.severity.sev1, 6.0);
  EXPECT_DOUBLE_EQ(cfg.severity.sev2, 4.5);
  ASSERT_EQ(cfg.patternRules.size(), 5u);
  EXPECT_EQ(cfg.patternRules.front().id, "high_token_latency_spike");
  EXPECT_EQ(cfg.patternRules.back().id, "context_exhaustion");
}

TEST_F(DetectorConfigTest, ReadsScalarKeys) {
  const auto cfg = load("window_capacity = 50\n"
                        "min_points = 5\n"
                        "zscore_threshold = 2.5\n"
                        "ewma_alpha = 0.3\n"
                        "sev1_zscore = 8\n"
                        "sev2_zscore = 5\n"
                        "recent_anomaly_capacity = 20\n"
                        "correlation_window_ms = 250\n");
  EXPECT_EQ(cfg.windowCapacity, 50u);
  EXPECT_EQ(cfg.minPoints, 5u);
  EXPECT_DOUBLE_EQ(cfg.zScoreThreshold, 2.5);
  EXPECT_DOUBLE_EQ(cfg.ewmaAlpha, 0.3);
  EXPECT_DOUBLE_EQ(cfg.severity.sev1, 8.0);
  EXPECT_DOUBLE_EQ(cfg.severity.sev2, 5.0);
  EXPECT_EQ(cfg.recentAnomalyCapacity, 20u);
  EXPECT_EQ(cfg.correlationWindow.count(), 250);
  EXPECT_FALSE(cfg.validate());
}

TEST_F(DetectorConfigTest, UnparsableNumberKeepsDefault) {
  const auto cfg = load("window_capacity = lots\nzscore_threshold = high\n");
  EXPECT_EQ(cfg.windowCapacity, 100u);
  EXPECT_DOUBLE_EQ(cfg.zScoreThreshold, 3.0);
}

TEST_F(DetectorConfigTest, ConfiguredRulesReplaceDefaultsInIndexOrder) {
  const auto cfg = load("pattern_rule.10 = second: x, y\n"
                        "pattern_rule.2 = first: a, b, c\n"
                        "pattern_rule.2.min_matches = 2\n"
                        "pattern_rule.2.description = Two of a, b, c\n");
  ASSERT_EQ(cfg.patternRules.size(), 2u);
  EXPECT_EQ(cfg.patternRules[0].id, "first");
  EXPECT_EQ(cfg.patternRules[0].metrics, (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_EQ(cfg.patternRules[0].minMatches, 2u);
  EXPECT_EQ(cfg.patternRules[0].requiredMatches(), 2u);
  EXPECT_EQ(cfg.patternRules[0].description, "Two of a, b, c");
  EXPECT_EQ(cfg.patternRules[1].id, "second");
  EXPECT_EQ(cfg.patternRules[1].requiredMatches(), 2u);
  EXPECT_FALSE(cfg.validate());
}

TEST_F(DetectorConfigTest, MalformedRulesThrow) {
  EXPECT_THROW(load("pattern_rule.1 = no colon here\n"), std::invalid_argument);
  EXPECT_THROW(load("pattern_rule.1 = : a, b\n"), std::invalid_argument);
  EXPECT_THROW(load("pattern_rule.x = id: a, b\n"), std::invalid_argument);
  EXPECT_THROW(load("pattern_rule.1 = id: a, b\npattern_rule.1.min_matches = -1\n"),
               std::invalid_argument);
  EXPECT_THROW(load("pattern_rule.3.description = orphan\n"), std::invalid_argument);
}

TEST_F(DetectorConfigTest, ValidateReportsRangeProblems) {
  DetectorConfig cfg;
  cfg.windowCapacity = 0;
  EXPECT_TRUE(cfg.validate());

  cfg = DetectorConfig{};
  cfg.minPoints = 0;
  EXPECT_TRUE(cfg.validate());

  cfg = DetectorConfig{};
  cfg.zScoreThreshold = 0.0;
  EXPECT_TRUE(cfg.validate());

  cfg = DetectorConfig{};
  cfg.ewmaAlpha = 1.5;
  EXPECT_TRUE(cfg.validate());

  cfg = DetectorConfig{};
  cfg.ewmaAlpha = 1.0;
  EXPECT_FALSE(cfg.validate());

  cfg = DetectorConfig{};
  cfg.severity = {4.0, 5.0};
  EXPECT_TRUE(cfg.validate());

  cfg = DetectorConfig{};
  cfg.recentAnomalyCapacity = 0;
  EXPECT_TRUE(cfg.validate());

  cfg = DetectorConfig{};
  cfg.correlationWindow = Utils::milliseconds(-1);
  EXPECT_TRUE(cfg.validate());
}

TEST_F(DetectorConfigTest, ValidateReportsRuleProblems) {
  DetectorConfig cfg;
  cfg.patternRules.push_back(cfg.patternRules.front());
  const auto duplicate = cfg.validate();
  ASSERT_TRUE(duplicate);
  EXPECT_NE(duplicate->find("duplicate"), std::string::npos);

  cfg = DetectorConfig{};
  cfg.patternRules = {{"unclassified", {"a", "b"}, 0, ""}};
  EXPECT_TRUE(cfg.validate());

  cfg = DetectorConfig{};
  cfg.patternRules = {{"empty", {}, 0, ""}};
  EXPECT_TRUE(cfg.validate());

  cfg = DetectorConfig{};
  cfg.patternRules = {{"greedy", {"a", "b"}, 3, ""}};
  EXPECT_TRUE(cfg.validate());
}

TEST_F(DetectorConfigTest, NegativeSizeIsCaughtByValidate) {
  const auto cfg = load("window_capacity = -5\n");
  EXPECT_EQ(cfg.windowCapacity, 0u);
  EXPECT_TRUE(cfg.validate());
}
