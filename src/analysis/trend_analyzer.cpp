#include "trend_analyzer.hpp"
#include "analysis/statistics.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace insights {

namespace {

Priority priority_for_growth(const std::optional<double> &growth_rate) {
  if (!growth_rate)
    return Priority::LOW;

  const double magnitude = std::abs(*growth_rate);
  if (magnitude > TrendAnalyzer::HIGH_GROWTH_PERCENT)
    return Priority::HIGH;
  if (magnitude > TrendAnalyzer::MEDIUM_GROWTH_PERCENT)
    return Priority::MEDIUM;
  return Priority::LOW;
}

} // namespace

std::vector<Insight>
TrendAnalyzer::analyze(const std::vector<TimeSeriesPoint> &series) const {
  std::vector<Insight> results;
  if (series.size() < MIN_POINTS) {
    LOG(LogLevel::DEBUG, LogComponent::ANALYSIS_TREND,
        "Only " << series.size() << " points (need " << MIN_POINTS
                << "), skipping trend analysis");
    return results;
  }

  // Sort a copy; the caller's series order is left untouched.
  std::vector<TimeSeriesPoint> sorted = series;
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const TimeSeriesPoint &a, const TimeSeriesPoint &b) {
                     return a.timestamp_ms < b.timestamp_ms;
                   });

  std::vector<double> values;
  values.reserve(sorted.size());
  for (const auto &point : sorted)
    values.push_back(point.value);

  const auto fit = stats::fit_against_index(values);
  if (!fit)
    return results;

  const double first_value = values.front();
  const double last_value = values.back();
  std::optional<double> growth_rate;
  if (first_value != 0.0)
    growth_rate = (last_value - first_value) / first_value * 100.0;
  else
    LOG(LogLevel::WARN, LogComponent::ANALYSIS_TREND,
        "First value of the series is zero, growth rate is undefined");

  const bool growing = fit->slope > 0.0;

  LOG(LogLevel::DEBUG, LogComponent::ANALYSIS_TREND,
      "slope=" << fit->slope << ", intercept=" << fit->intercept
               << ", growth_rate="
               << (growth_rate ? std::to_string(*growth_rate) : "undefined"));

  Insight insight;
  insight.type = InsightType::TREND;
  insight.narrative = std::string("Data shows a ") +
                      (growing ? "growth" : "decline") +
                      " trend (slope: " + Utils::format_fixed(fit->slope, 2) +
                      " per period). Overall growth rate: " +
                      (growth_rate ? Utils::format_fixed(*growth_rate, 1) + "%"
                                   : std::string("undefined (first value is 0)"));
  insight.confidence = CONFIDENCE;
  insight.action = growing
                       ? "Continue the current strategy to sustain growth"
                       : "Review the strategy and plan corrective measures";
  insight.priority = priority_for_growth(growth_rate);
  insight.details = TrendDetails{fit->slope, fit->intercept, growth_rate};

  results.push_back(std::move(insight));
  return results;
}

} // namespace insights
