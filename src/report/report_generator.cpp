#include "report_generator.hpp"
#include "analysis/statistics.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace report {

using insights::Insight;
using insights::Priority;

namespace {

const std::map<std::string, double> &complexity_weights() {
  static const std::map<std::string, double> weights = {
      {insights::InsightType::TREND, 1.0},
      {insights::InsightType::SEASONALITY, 2.0},
      {insights::InsightType::CUSTOMER_SEGMENT, 3.0},
      {insights::InsightType::CORRELATION, 2.0},
      {insights::InsightType::ANOMALY, 1.0}};
  return weights;
}

constexpr double DEFAULT_COMPLEXITY_WEIGHT = 2.0;

const char *priority_marker(Priority priority) {
  switch (priority) {
  case Priority::HIGH:
    return "[HIGH]";
  case Priority::MEDIUM:
    return "[MEDIUM]";
  case Priority::LOW:
    return "[LOW]";
  }
  return "[LOW]";
}

std::string format_confidence(double confidence) {
  if (confidence == std::floor(confidence))
    return Utils::format_fixed(confidence, 0);
  return Utils::format_fixed(confidence, 1);
}

} // namespace

PriorityCounts count_by_priority(const std::vector<Insight> &ranked) {
  PriorityCounts counts;
  for (const auto &insight : ranked) {
    switch (insight.priority) {
    case Priority::HIGH:
      counts.high++;
      break;
    case Priority::MEDIUM:
      counts.medium++;
      break;
    case Priority::LOW:
      counts.low++;
      break;
    }
  }
  return counts;
}

std::optional<SeriesStats>
compute_series_stats(const std::vector<insights::TimeSeriesPoint> &series) {
  if (series.empty())
    return std::nullopt;

  std::vector<double> values;
  values.reserve(series.size());
  for (const auto &point : series)
    values.push_back(point.value);

  SeriesStats result;
  result.mean = insights::stats::mean(values);
  result.std_dev = insights::stats::population_std_dev(values, result.mean);
  result.max = *std::max_element(values.begin(), values.end());
  result.min = *std::min_element(values.begin(), values.end());
  return result;
}

std::optional<CustomerStats>
compute_customer_stats(const std::vector<insights::CustomerRecord> &customers) {
  if (customers.empty())
    return std::nullopt;

  double monetary_sum = 0.0;
  double frequency_sum = 0.0;
  for (const auto &customer : customers) {
    monetary_sum += customer.monetary;
    frequency_sum += customer.frequency;
  }
  const double n = static_cast<double>(customers.size());
  return CustomerStats{monetary_sum / n, frequency_sum / n};
}

double implementation_complexity(const std::vector<Insight> &ranked) {
  if (ranked.empty())
    return 0.0;

  double total = 0.0;
  for (const auto &insight : ranked) {
    auto it = complexity_weights().find(insight.type);
    total += it != complexity_weights().end() ? it->second
                                              : DEFAULT_COMPLEXITY_WEIGHT;
  }
  return total / static_cast<double>(ranked.size());
}

std::vector<std::string> recommended_actions(const std::vector<Insight> &ranked,
                                             size_t max_actions) {
  std::vector<std::string> actions;
  for (const auto &insight : ranked) {
    if (actions.size() >= max_actions)
      break;
    if (insight.priority == Priority::HIGH)
      actions.push_back(insight.action);
  }
  return actions;
}

InsightSummary build_summary(const std::vector<Insight> &ranked,
                             size_t max_key_findings) {
  InsightSummary summary;
  summary.total_insights = ranked.size();
  for (const auto &insight : ranked) {
    if (summary.key_findings.size() < max_key_findings)
      summary.key_findings.push_back(insight.narrative);
    if (insight.priority == Priority::HIGH) {
      summary.high_priority_count++;
      summary.next_actions.push_back(insight.action);
    }
  }
  return summary;
}

std::string generate_report(const std::vector<Insight> &ranked) {
  const PriorityCounts counts = count_by_priority(ranked);
  const std::string heavy_rule(60, '=');
  const std::string light_rule(50, '-');

  std::ostringstream out;
  out << heavy_rule << '\n'
      << "Insight Analysis Report\n"
      << heavy_rule << "\n\n"
      << "Total insights:  " << ranked.size() << '\n'
      << "High priority:   " << counts.high << '\n'
      << "Medium priority: " << counts.medium << '\n'
      << "Low priority:    " << counts.low << "\n\n"
      << light_rule << '\n'
      << "Insights (ranked by priority)\n"
      << light_rule << '\n';

  for (size_t i = 0; i < ranked.size(); ++i) {
    const auto &insight = ranked[i];
    out << '\n'
        << '[' << (i + 1) << "] " << insight.type << ' '
        << priority_marker(insight.priority) << '\n'
        << "  Finding:    " << insight.narrative << '\n'
        << "  Confidence: " << format_confidence(insight.confidence) << "%\n"
        << "  Action:     " << insight.action << '\n';
  }

  LOG(LogLevel::DEBUG, LogComponent::REPORT,
      "Rendered report for " << ranked.size() << " insight(s)");
  return out.str();
}

std::string generate_detailed_analysis(const std::vector<Insight> &ranked,
                                       const insights::AnalysisInput &input,
                                       size_t max_actions) {
  const std::string heavy_rule(60, '=');

  std::ostringstream out;
  out << heavy_rule << '\n'
      << "Detailed Analysis\n"
      << heavy_rule << "\n\n"
      << "Data statistics:\n";

  bool any_stats = false;
  if (input.time_series) {
    if (auto stats = compute_series_stats(*input.time_series)) {
      any_stats = true;
      out << "  Series mean:               "
          << Utils::format_fixed(stats->mean, 0) << '\n'
          << "  Series standard deviation: "
          << Utils::format_fixed(stats->std_dev, 0) << '\n'
          << "  Series maximum:            "
          << Utils::format_fixed(stats->max, 0) << '\n'
          << "  Series minimum:            "
          << Utils::format_fixed(stats->min, 0) << '\n';
    }
  }
  if (input.customers) {
    if (auto stats = compute_customer_stats(*input.customers)) {
      any_stats = true;
      out << "  Average customer value:    "
          << Utils::format_fixed(stats->avg_monetary, 0) << '\n'
          << "  Average frequency:         "
          << Utils::format_fixed(stats->avg_frequency, 1) << '\n';
    }
  }
  if (!any_stats)
    out << "  (no time series or customer data)\n";

  out << "\nRecommended implementation order:\n";
  const auto actions = recommended_actions(ranked, max_actions);
  if (actions.empty())
    out << "  (no high-priority insights)\n";
  for (size_t i = 0; i < actions.size(); ++i)
    out << "  " << (i + 1) << ". " << actions[i] << '\n';

  out << "\nImplementation complexity: "
      << Utils::format_fixed(implementation_complexity(ranked), 2)
      << " (1 = simple, 3 = involved)\n";

  return out.str();
}

} // namespace report
