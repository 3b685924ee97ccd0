#ifndef CORRELATION_ANALYZER_HPP
#define CORRELATION_ANALYZER_HPP

#include "core/insight.hpp"

#include <string>
#include <vector>

namespace insights {

// Pairwise Pearson correlation across the numeric fields of a tabular sample.
class CorrelationAnalyzer {
public:
  static constexpr double MIN_ABS_CORRELATION = 0.5;
  static constexpr double STRONG_CORRELATION = 0.6;
  static constexpr double VERY_STRONG_CORRELATION = 0.8;
  static constexpr double HIGH_PRIORITY_CORRELATION = 0.7;
  static constexpr double MAX_CONFIDENCE = 95.0;

  /**
   * Fields of the first record whose value is a non-NaN number in every
   * record of the sample, in the first record's field order.
   */
  static std::vector<std::string>
  numeric_fields(const std::vector<DataPoint> &sample);

  std::vector<Insight> analyze(const std::vector<DataPoint> &sample) const;
};

} // namespace insights

#endif // CORRELATION_ANALYZER_HPP
