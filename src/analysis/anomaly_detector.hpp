#ifndef ANOMALY_DETECTOR_HPP
#define ANOMALY_DETECTOR_HPP

#include "core/insight.hpp"

#include <vector>

namespace insights {

/**
 * Flags series points whose population z-score exceeds a threshold and
 * summarizes them as a single insight built around the most extreme point.
 */
class AnomalyDetector {
public:
  static constexpr double DEFAULT_Z_SCORE_THRESHOLD = 2.5;
  static constexpr double CONFIDENCE = 88.0;
  // Share of the series above which the anomalies become high priority.
  static constexpr double HIGH_PRIORITY_FRACTION = 0.05;

  /**
   * @param z_score_threshold Standard deviations beyond which a point is
   * anomalous. Must be positive and finite.
   * @throws std::invalid_argument on an invalid threshold
   */
  explicit AnomalyDetector(double z_score_threshold = DEFAULT_Z_SCORE_THRESHOLD);

  // Every point with z > threshold, in series order.
  std::vector<AnomalyPoint>
  find_anomalies(const std::vector<TimeSeriesPoint> &series) const;

  std::vector<Insight> analyze(const std::vector<TimeSeriesPoint> &series) const;

private:
  double z_score_threshold_;
};

} // namespace insights

#endif // ANOMALY_DETECTOR_HPP
