#include "analysis/insight_engine.hpp"
#include "core/metrics_registry.hpp"
#include "io/sample_data_generator.hpp"
#include "utils/json_formatter.hpp"

#include <gtest/gtest.h>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace insights;

namespace {

Insight make_insight(const std::string &narrative, Priority priority,
                     double confidence) {
  Insight insight;
  insight.type = "test";
  insight.narrative = narrative;
  insight.confidence = confidence;
  insight.action = "";
  insight.priority = priority;
  return insight;
}

std::set<std::string> types_of(const std::vector<Insight> &insights) {
  std::set<std::string> types;
  for (const auto &insight : insights)
    types.insert(insight.type);
  return types;
}

} // namespace

class InsightEngineTest : public ::testing::Test {
protected:
  void SetUp() override { input = SampleDataGenerator().generate(); }

  AnalysisInput input;
};

TEST(RankInsightsTest, PriorityThenConfidenceThenInputOrder) {
  std::vector<Insight> insights = {
      make_insight("low", Priority::LOW, 99.0),
      make_insight("medium-a", Priority::MEDIUM, 80.0),
      make_insight("high-low-confidence", Priority::HIGH, 60.0),
      make_insight("medium-b", Priority::MEDIUM, 80.0),
      make_insight("high", Priority::HIGH, 90.0),
      make_insight("medium-top", Priority::MEDIUM, 85.0)};

  rank_insights(insights);

  std::vector<std::string> order;
  for (const auto &insight : insights)
    order.push_back(insight.narrative);
  EXPECT_EQ(order, (std::vector<std::string>{"high", "high-low-confidence",
                                             "medium-top", "medium-a",
                                             "medium-b", "low"}));
}

TEST_F(InsightEngineTest, EmptyInputProducesNothing) {
  InsightEngine engine;
  EXPECT_TRUE(engine.analyze(AnalysisInput{}).empty());
}

TEST_F(InsightEngineTest, SampleDataCoversEveryAnalyzer) {
  InsightEngine engine;
  auto ranked = engine.analyze(input);

  auto types = types_of(ranked);
  EXPECT_EQ(types.count(InsightType::SEASONALITY), 1u);
  EXPECT_EQ(types.count(InsightType::TREND), 1u);
  EXPECT_EQ(types.count(InsightType::ANOMALY), 1u);
  EXPECT_EQ(types.count(InsightType::CUSTOMER_SEGMENT), 1u);
  EXPECT_EQ(types.count(InsightType::CORRELATION), 1u);
}

TEST_F(InsightEngineTest, OutputIsRanked) {
  InsightEngine engine;
  auto ranked = engine.analyze(input);
  ASSERT_FALSE(ranked.empty());

  for (size_t i = 1; i < ranked.size(); ++i) {
    const int prev = priority_weight(ranked[i - 1].priority);
    const int cur = priority_weight(ranked[i].priority);
    EXPECT_GE(prev, cur);
    if (prev == cur)
      EXPECT_GE(ranked[i - 1].confidence, ranked[i].confidence);
  }
}

TEST_F(InsightEngineTest, RepeatedAnalysesAreIdentical) {
  InsightEngine engine;
  const auto first = JsonFormatter::format_insights_to_json(engine.analyze(input));
  const auto second = JsonFormatter::format_insights_to_json(engine.analyze(input));
  EXPECT_EQ(first, second);
}

TEST_F(InsightEngineTest, OnlyPresentInputsAreAnalyzed) {
  AnalysisInput customers_only;
  customers_only.customers = input.customers;

  InsightEngine engine;
  auto ranked = engine.analyze(customers_only);
  ASSERT_FALSE(ranked.empty());
  EXPECT_EQ(types_of(ranked),
            std::set<std::string>{InsightType::CUSTOMER_SEGMENT});
}

TEST_F(InsightEngineTest, DisabledAnalyzersAreSkipped) {
  Config::AnalysisConfig config;
  config.trend_enabled = false;
  config.anomaly_enabled = false;
  config.correlation_enabled = false;

  InsightEngine engine(config);
  auto types = types_of(engine.analyze(input));
  EXPECT_EQ(types.count(InsightType::TREND), 0u);
  EXPECT_EQ(types.count(InsightType::ANOMALY), 0u);
  EXPECT_EQ(types.count(InsightType::CORRELATION), 0u);
  EXPECT_EQ(types.count(InsightType::SEASONALITY), 1u);
  EXPECT_EQ(types.count(InsightType::CUSTOMER_SEGMENT), 1u);
}

TEST_F(InsightEngineTest, ThresholdReachesAnomalyDetector) {
  Config::AnalysisConfig config;
  config.anomaly_z_score_threshold = 10.0;

  InsightEngine engine(config);
  EXPECT_EQ(types_of(engine.analyze(input)).count(InsightType::ANOMALY), 0u);
}

TEST_F(InsightEngineTest, InvalidThresholdIsRejected) {
  Config::AnalysisConfig config;
  config.anomaly_z_score_threshold = -1.0;
  EXPECT_THROW(InsightEngine engine(config), std::invalid_argument);
}

TEST_F(InsightEngineTest, RecordsMetricsWhenEnabled) {
  InsightEngine engine(Config::AnalysisConfig{}, true);
  auto ranked = engine.analyze(input);
  ASSERT_FALSE(ranked.empty());

  const std::string exposition = MetricsRegistry::instance().serialize();
  EXPECT_NE(exposition.find("insight_engine_runs_total"), std::string::npos);
  EXPECT_NE(exposition.find("insight_analyzer_runs_total{analyzer=\"trend\"}"),
            std::string::npos);
  EXPECT_NE(exposition.find("insight_insights_generated_total"),
            std::string::npos);
}
