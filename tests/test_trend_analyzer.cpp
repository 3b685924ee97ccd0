#include "analysis/trend_analyzer.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <string>
#include <variant>
#include <vector>

using namespace insights;

namespace {

const int64_t BASE_MS = Utils::utc_date_to_ms(2023, 1, 1);

// Ten evenly spaced daily points from `first` to `last`.
std::vector<TimeSeriesPoint> linear_series(double first, double last,
                                           size_t n = 10) {
  std::vector<TimeSeriesPoint> series;
  const double step = (last - first) / static_cast<double>(n - 1);
  for (size_t i = 0; i < n; ++i)
    series.push_back({BASE_MS + static_cast<int64_t>(i) * Utils::MS_PER_DAY,
                      first + step * i});
  return series;
}

const TrendDetails &details_of(const Insight &insight) {
  return std::get<TrendDetails>(insight.details);
}

} // namespace

TEST(TrendAnalyzerTest, StrongGrowthIsHighPriority) {
  TrendAnalyzer analyzer;
  auto results = analyzer.analyze(linear_series(100.0, 125.0));

  ASSERT_EQ(results.size(), 1u);
  const auto &insight = results[0];
  EXPECT_EQ(insight.type, InsightType::TREND);
  EXPECT_DOUBLE_EQ(insight.confidence, 82.0);
  EXPECT_EQ(insight.priority, Priority::HIGH);

  const auto &details = details_of(insight);
  EXPECT_NEAR(details.slope, 25.0 / 9.0, 1e-9);
  EXPECT_NEAR(details.intercept, 100.0, 1e-9);
  ASSERT_TRUE(details.growth_rate.has_value());
  EXPECT_NEAR(*details.growth_rate, 25.0, 1e-9);
  EXPECT_NE(insight.narrative.find("growth trend"), std::string::npos);
  EXPECT_NE(insight.narrative.find("25.0%"), std::string::npos);
}

TEST(TrendAnalyzerTest, GrowthPriorityBands) {
  TrendAnalyzer analyzer;

  auto medium = analyzer.analyze(linear_series(100.0, 115.0));
  ASSERT_EQ(medium.size(), 1u);
  EXPECT_EQ(medium[0].priority, Priority::MEDIUM);

  auto low = analyzer.analyze(linear_series(100.0, 105.0));
  ASSERT_EQ(low.size(), 1u);
  EXPECT_EQ(low[0].priority, Priority::LOW);
}

TEST(TrendAnalyzerTest, DeclineUsesMagnitudeForPriority) {
  TrendAnalyzer analyzer;
  auto results = analyzer.analyze(linear_series(200.0, 100.0));

  ASSERT_EQ(results.size(), 1u);
  EXPECT_LT(details_of(results[0]).slope, 0.0);
  EXPECT_NEAR(*details_of(results[0]).growth_rate, -50.0, 1e-9);
  EXPECT_EQ(results[0].priority, Priority::HIGH);
  EXPECT_NE(results[0].narrative.find("decline trend"), std::string::npos);
  EXPECT_NE(results[0].action.find("corrective"), std::string::npos);
}

TEST(TrendAnalyzerTest, SortsByTimestampBeforeFitting) {
  auto series = linear_series(100.0, 125.0);
  std::reverse(series.begin(), series.end());

  TrendAnalyzer analyzer;
  auto results = analyzer.analyze(series);

  ASSERT_EQ(results.size(), 1u);
  EXPECT_GT(details_of(results[0]).slope, 0.0);
  EXPECT_NEAR(*details_of(results[0]).growth_rate, 25.0, 1e-9);
  // The caller's order is untouched.
  EXPECT_NEAR(series.front().value, 125.0, 1e-9);
}

TEST(TrendAnalyzerTest, ZeroFirstValueLeavesGrowthUndefined) {
  TrendAnalyzer analyzer;
  auto results = analyzer.analyze(linear_series(0.0, 90.0));

  ASSERT_EQ(results.size(), 1u);
  EXPECT_FALSE(details_of(results[0]).growth_rate.has_value());
  EXPECT_EQ(results[0].priority, Priority::LOW);
  EXPECT_NE(results[0].narrative.find("undefined"), std::string::npos);
}

TEST(TrendAnalyzerTest, TooFewPointsProducesNothing) {
  TrendAnalyzer analyzer;
  EXPECT_TRUE(analyzer.analyze(linear_series(100.0, 200.0, 9)).empty());
  EXPECT_TRUE(analyzer.analyze({}).empty());
  EXPECT_EQ(analyzer.analyze(linear_series(100.0, 200.0, 10)).size(), 1u);
}
