#ifndef TREND_ANALYZER_HPP
#define TREND_ANALYZER_HPP

#include "core/insight.hpp"

#include <cstddef>
#include <vector>

namespace insights {

// Linear trend over the chronologically sorted series plus first-to-last
// growth rate.
class TrendAnalyzer {
public:
  static constexpr size_t MIN_POINTS = 10;
  static constexpr double CONFIDENCE = 82.0;
  static constexpr double HIGH_GROWTH_PERCENT = 20.0;
  static constexpr double MEDIUM_GROWTH_PERCENT = 10.0;

  std::vector<Insight> analyze(const std::vector<TimeSeriesPoint> &series) const;
};

} // namespace insights

#endif // TREND_ANALYZER_HPP
