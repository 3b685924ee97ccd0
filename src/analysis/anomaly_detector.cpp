#include "anomaly_detector.hpp"
#include "analysis/statistics.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace insights {

AnomalyDetector::AnomalyDetector(double z_score_threshold)
    : z_score_threshold_(z_score_threshold) {
  if (!(z_score_threshold > 0.0) || std::isinf(z_score_threshold)) {
    throw std::invalid_argument(
        "Z-score threshold must be a positive finite number");
  }
}

std::vector<AnomalyPoint> AnomalyDetector::find_anomalies(
    const std::vector<TimeSeriesPoint> &series) const {
  std::vector<AnomalyPoint> anomalies;
  if (series.empty())
    return anomalies;

  std::vector<double> values;
  values.reserve(series.size());
  for (const auto &point : series)
    values.push_back(point.value);

  const double mean = stats::mean(values);
  const double std_dev = stats::population_std_dev(values, mean);

  if (std_dev == 0.0) {
    LOG(LogLevel::DEBUG, LogComponent::ANALYSIS_ANOMALY,
        "Zero standard deviation, no anomalies possible");
    return anomalies;
  }

  for (size_t i = 0; i < series.size(); ++i) {
    const double z_score = std::abs(series[i].value - mean) / std_dev;
    if (z_score > z_score_threshold_)
      anomalies.push_back(
          AnomalyPoint{i, series[i].value, series[i].timestamp_ms, z_score});
  }

  LOG(LogLevel::DEBUG, LogComponent::ANALYSIS_ANOMALY,
      "mean=" << mean << ", std_dev=" << std_dev << ", flagged "
              << anomalies.size() << " of " << series.size() << " points");
  return anomalies;
}

std::vector<Insight>
AnomalyDetector::analyze(const std::vector<TimeSeriesPoint> &series) const {
  std::vector<Insight> results;

  const auto anomalies = find_anomalies(series);
  if (anomalies.empty())
    return results;

  // Strict comparison keeps the earliest point on ties.
  const AnomalyPoint *most_extreme = &anomalies.front();
  for (const auto &anomaly : anomalies) {
    if (anomaly.z_score > most_extreme->z_score)
      most_extreme = &anomaly;
  }

  const bool widespread = static_cast<double>(anomalies.size()) >
                          static_cast<double>(series.size()) *
                              HIGH_PRIORITY_FRACTION;

  Insight insight;
  insight.type = InsightType::ANOMALY;
  insight.narrative =
      "Detected " + std::to_string(anomalies.size()) +
      " anomalous value(s). Largest deviation: " +
      Utils::format_fixed(most_extreme->z_score, 1) + " sigma (" +
      Utils::format_date_utc(most_extreme->timestamp_ms) + ": " +
      Utils::format_fixed(most_extreme->value, 0) + ")";
  insight.confidence = CONFIDENCE;
  insight.action = "Investigate the root cause of the anomalies (campaign "
                   "effects, system failures, external factors)";
  insight.priority = widespread ? Priority::HIGH : Priority::MEDIUM;
  insight.details = AnomalyDetails{anomalies.size(), *most_extreme};

  results.push_back(std::move(insight));
  return results;
}

} // namespace insights
