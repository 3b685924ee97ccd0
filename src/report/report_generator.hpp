#ifndef REPORT_GENERATOR_HPP
#define REPORT_GENERATOR_HPP

#include "core/insight.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace report {

struct PriorityCounts {
  size_t high = 0;
  size_t medium = 0;
  size_t low = 0;
};

struct SeriesStats {
  double mean;
  double std_dev; // population
  double max;
  double min;
};

struct CustomerStats {
  double avg_monetary;
  double avg_frequency;
};

// Condensed view of a ranked insight list for hand-off to other tools.
struct InsightSummary {
  size_t total_insights = 0;
  size_t high_priority_count = 0;
  std::vector<std::string> key_findings; // narratives of the top insights
  std::vector<std::string> next_actions; // actions of high-priority insights
};

PriorityCounts count_by_priority(const std::vector<insights::Insight> &ranked);

std::optional<SeriesStats>
compute_series_stats(const std::vector<insights::TimeSeriesPoint> &series);

std::optional<CustomerStats>
compute_customer_stats(const std::vector<insights::CustomerRecord> &customers);

/**
 * Mean effort weight over all insights: trend 1, seasonality 2,
 * customer-segment 3, correlation 2, anomaly 1, anything else 2.
 * Returns 0 for an empty list.
 */
double implementation_complexity(const std::vector<insights::Insight> &ranked);

// Actions of the first `max_actions` high-priority insights, in rank order.
std::vector<std::string>
recommended_actions(const std::vector<insights::Insight> &ranked,
                    size_t max_actions);

InsightSummary build_summary(const std::vector<insights::Insight> &ranked,
                             size_t max_key_findings);

// Header, per-priority counts and one entry per insight in the given order.
std::string generate_report(const std::vector<insights::Insight> &ranked);

// Input statistics, implementation order and complexity for a finished run.
std::string
generate_detailed_analysis(const std::vector<insights::Insight> &ranked,
                           const insights::AnalysisInput &input,
                           size_t max_actions);

} // namespace report

#endif // REPORT_GENERATOR_HPP
