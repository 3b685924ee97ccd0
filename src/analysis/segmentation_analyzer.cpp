#include "segmentation_analyzer.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <array>
#include <string>
#include <utility>
#include <vector>

namespace insights {

const std::array<SegmentInfo, 6> &segment_table() {
  static const std::array<SegmentInfo, 6> table = {{
      {CustomerSegment::CHAMPIONS, "champions", "Champions",
       "Offer exclusive experiences and a rewards program", true},
      {CustomerSegment::LOYAL_CUSTOMERS, "loyalCustomers", "Loyal Customers",
       "Present upsell and cross-sell opportunities", false},
      {CustomerSegment::POTENTIAL_LOYALISTS, "potentialLoyalists",
       "Potential Loyalists", "Guide them into the loyalty program", false},
      {CustomerSegment::AT_RISK, "atRisk", "At Risk",
       "Win them back with rewards and personalized outreach", true},
      {CustomerSegment::CANNOT_LOSE_THEM, "cannotLoseThem",
       "Cannot Lose Them", "Provide personal attention and dedicated support",
       true},
      {CustomerSegment::HIBERNATING, "hibernating", "Hibernating",
       "Run a reactivation campaign", false},
  }};
  return table;
}

const SegmentInfo &segment_info(CustomerSegment segment) {
  return segment_table()[static_cast<size_t>(segment)];
}

SegmentationAnalyzer::Averages SegmentationAnalyzer::population_averages(
    const std::vector<CustomerRecord> &customers) {
  Averages avg{0.0, 0.0, 0.0};
  if (customers.empty())
    return avg;

  for (const auto &c : customers) {
    avg.recency += c.recency;
    avg.frequency += c.frequency;
    avg.monetary += c.monetary;
  }
  const double n = static_cast<double>(customers.size());
  avg.recency /= n;
  avg.frequency /= n;
  avg.monetary /= n;
  return avg;
}

bool SegmentationAnalyzer::matches(CustomerSegment segment,
                                   const CustomerRecord &c,
                                   const Averages &avg) {
  switch (segment) {
  case CustomerSegment::CHAMPIONS:
    return c.recency < avg.recency && c.frequency > avg.frequency &&
           c.monetary > avg.monetary;
  case CustomerSegment::LOYAL_CUSTOMERS:
    return c.recency < avg.recency * 1.5 && c.frequency > avg.frequency;
  case CustomerSegment::POTENTIAL_LOYALISTS:
    return c.recency < avg.recency && c.frequency <= avg.frequency;
  case CustomerSegment::AT_RISK:
    return c.recency > avg.recency * 1.5 && c.frequency <= avg.frequency;
  case CustomerSegment::CANNOT_LOSE_THEM:
    return c.recency > avg.recency && c.monetary > avg.monetary * 1.5;
  case CustomerSegment::HIBERNATING:
    return c.recency > avg.recency * 2 && c.frequency <= avg.frequency * 0.5;
  }
  return false;
}

std::vector<Insight> SegmentationAnalyzer::analyze(
    const std::vector<CustomerRecord> &customers) const {
  std::vector<Insight> results;
  if (customers.empty()) {
    LOG(LogLevel::DEBUG, LogComponent::ANALYSIS_SEGMENTATION,
        "No customers supplied, skipping segmentation");
    return results;
  }

  const Averages avg = population_averages(customers);
  const double population = static_cast<double>(customers.size());

  LOG(LogLevel::DEBUG, LogComponent::ANALYSIS_SEGMENTATION,
      "Averages: recency=" << avg.recency << ", frequency=" << avg.frequency
                           << ", monetary=" << avg.monetary);

  for (const auto &info : segment_table()) {
    size_t count = 0;
    double frequency_sum = 0.0;
    double monetary_sum = 0.0;
    for (const auto &customer : customers) {
      if (!matches(info.segment, customer, avg))
        continue;
      ++count;
      frequency_sum += customer.frequency;
      monetary_sum += customer.monetary;
    }

    if (count == 0)
      continue;

    const double percentage = static_cast<double>(count) / population * 100.0;
    const double avg_frequency = frequency_sum / static_cast<double>(count);
    const double avg_monetary = monetary_sum / static_cast<double>(count);

    Priority priority = Priority::LOW;
    if (info.always_high_priority)
      priority = Priority::HIGH;
    else if (percentage > MEDIUM_SHARE_PERCENT)
      priority = Priority::MEDIUM;

    LOG(LogLevel::DEBUG, LogComponent::ANALYSIS_SEGMENTATION,
        info.key << ": " << count << " customers (" << percentage << "%)");

    Insight insight;
    insight.type = InsightType::CUSTOMER_SEGMENT;
    insight.narrative = std::string(info.name) + ": " + std::to_string(count) +
                        " customers (" + Utils::format_fixed(percentage, 1) +
                        "%) - average frequency " +
                        Utils::format_fixed(avg_frequency, 1) +
                        ", average monetary value " +
                        Utils::format_fixed(avg_monetary, 0);
    insight.confidence = CONFIDENCE;
    insight.action = info.action;
    insight.priority = priority;
    insight.details = SegmentDetails{info.key, count, percentage,
                                     avg_frequency, avg_monetary};
    results.push_back(std::move(insight));
  }

  return results;
}

} // namespace insights
