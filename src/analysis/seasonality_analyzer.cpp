#include "seasonality_analyzer.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <array>
#include <string>
#include <utility>
#include <vector>

namespace insights {

std::vector<Insight>
SeasonalityAnalyzer::analyze(const std::vector<TimeSeriesPoint> &series) const {
  std::vector<Insight> results;
  if (series.empty()) {
    LOG(LogLevel::DEBUG, LogComponent::ANALYSIS_SEASONALITY,
        "Empty series, skipping seasonality analysis");
    return results;
  }

  std::array<double, 13> month_sums{};
  std::array<size_t, 13> month_counts{};
  // Months in the order they first appear; ties resolve to the earliest.
  std::vector<int> month_order;

  for (const auto &point : series) {
    const int month = Utils::month_of_year_utc(point.timestamp_ms);
    if (month_counts[month] == 0)
      month_order.push_back(month);
    month_sums[month] += point.value;
    month_counts[month]++;
  }

  int peak_month = month_order.front();
  int trough_month = month_order.front();
  double peak_mean = month_sums[peak_month] / month_counts[peak_month];
  double trough_mean = peak_mean;
  double sum_of_means = 0.0;

  for (int month : month_order) {
    const double month_mean = month_sums[month] / month_counts[month];
    sum_of_means += month_mean;
    if (month_mean > peak_mean) {
      peak_mean = month_mean;
      peak_month = month;
    }
    if (month_mean < trough_mean) {
      trough_mean = month_mean;
      trough_month = month;
    }
  }

  const double overall_mean =
      sum_of_means / static_cast<double>(month_order.size());

  // A zero mean of means leaves the relative spread undefined; report none.
  double variation = 0.0;
  if (overall_mean != 0.0)
    variation = (peak_mean - trough_mean) / overall_mean * 100.0;
  else
    LOG(LogLevel::WARN, LogComponent::ANALYSIS_SEASONALITY,
        "Mean of monthly averages is zero, reporting 0% variation");

  LOG(LogLevel::DEBUG, LogComponent::ANALYSIS_SEASONALITY,
      "Months observed: " << month_order.size() << ", peak=" << peak_month
                          << ", trough=" << trough_month
                          << ", variation=" << variation);

  Insight insight;
  insight.type = InsightType::SEASONALITY;
  insight.narrative =
      "Values peak in month " + std::to_string(peak_month) + " (average " +
      Utils::format_fixed(peak_mean, 0) + ") and bottom out in month " +
      std::to_string(trough_month) + " (average " +
      Utils::format_fixed(trough_mean, 0) + "). Seasonal variation is " +
      Utils::format_fixed(variation, 1) + "%";
  insight.confidence = CONFIDENCE;
  insight.action = "Build up inventory ahead of month " +
                   std::to_string(peak_month) +
                   " and strengthen promotions in month " +
                   std::to_string(trough_month);
  insight.priority =
      variation > HIGH_VARIATION_PERCENT ? Priority::HIGH : Priority::MEDIUM;
  insight.details = SeasonalityDetails{peak_month, trough_month, peak_mean,
                                       trough_mean, variation};

  results.push_back(std::move(insight));
  return results;
}

} // namespace insights
