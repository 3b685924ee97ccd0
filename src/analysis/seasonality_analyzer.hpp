#ifndef SEASONALITY_ANALYZER_HPP
#define SEASONALITY_ANALYZER_HPP

#include "core/insight.hpp"

#include <vector>

namespace insights {

/**
 * Monthly seasonality: groups values by calendar month (ignoring the year),
 * finds the peak and trough month averages and reports their spread relative
 * to the mean of the monthly averages.
 */
class SeasonalityAnalyzer {
public:
  static constexpr double CONFIDENCE = 85.0;
  static constexpr double HIGH_VARIATION_PERCENT = 30.0;

  std::vector<Insight> analyze(const std::vector<TimeSeriesPoint> &series) const;
};

} // namespace insights

#endif // SEASONALITY_ANALYZER_HPP
