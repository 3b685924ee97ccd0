#ifndef SEGMENTATION_ANALYZER_HPP
#define SEGMENTATION_ANALYZER_HPP

#include "core/insight.hpp"

#include <array>
#include <vector>

namespace insights {

enum class CustomerSegment {
  CHAMPIONS,
  LOYAL_CUSTOMERS,
  POTENTIAL_LOYALISTS,
  AT_RISK,
  CANNOT_LOSE_THEM,
  HIBERNATING
};

struct SegmentInfo {
  CustomerSegment segment;
  const char *key;  // payload identifier, e.g. "atRisk"
  const char *name; // display name
  const char *action;
  bool always_high_priority;
};

// Fixed segment table in evaluation order.
const std::array<SegmentInfo, 6> &segment_table();

const SegmentInfo &segment_info(CustomerSegment segment);

/**
 * RFM segmentation against population averages of recency, frequency and
 * monetary value.
 *
 * Segments are NOT mutually exclusive: a customer is counted in every segment
 * whose rule it satisfies, so segment percentages can sum past 100%.
 */
class SegmentationAnalyzer {
public:
  static constexpr double CONFIDENCE = 78.0;
  static constexpr double MEDIUM_SHARE_PERCENT = 20.0;

  struct Averages {
    double recency;
    double frequency;
    double monetary;
  };

  static Averages population_averages(const std::vector<CustomerRecord> &customers);

  // True when the customer satisfies the segment's rule.
  static bool matches(CustomerSegment segment, const CustomerRecord &customer,
                      const Averages &avg);

  std::vector<Insight>
  analyze(const std::vector<CustomerRecord> &customers) const;
};

} // namespace insights

#endif // SEGMENTATION_ANALYZER_HPP
