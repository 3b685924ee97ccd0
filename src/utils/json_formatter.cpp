#include "json_formatter.hpp"
#include "utils/utils.hpp"

#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace JsonFormatter {

nlohmann::json details_to_json(const insights::InsightDetails &details) {
  return std::visit(
      [](const auto &d) -> nlohmann::json {
        using T = std::decay_t<decltype(d)>;
        nlohmann::json j;

        if constexpr (std::is_same_v<T, insights::SeasonalityDetails>) {
          j["peakMonth"] = d.peak_month;
          j["troughMonth"] = d.trough_month;
          j["peakMean"] = d.peak_mean;
          j["troughMean"] = d.trough_mean;
          j["variation"] = d.variation;
        } else if constexpr (std::is_same_v<T, insights::TrendDetails>) {
          j["slope"] = d.slope;
          j["intercept"] = d.intercept;
          if (d.growth_rate)
            j["growthRate"] = *d.growth_rate;
          else
            j["growthRate"] = nullptr;
        } else if constexpr (std::is_same_v<T, insights::SegmentDetails>) {
          j["segment"] = d.segment;
          j["count"] = d.count;
          j["percentage"] = d.percentage;
          j["avgFrequency"] = d.avg_frequency;
          j["avgMonetary"] = d.avg_monetary;
        } else if constexpr (std::is_same_v<T, insights::CorrelationDetails>) {
          j["field1"] = d.field1;
          j["field2"] = d.field2;
          j["correlation"] = d.correlation;
        } else if constexpr (std::is_same_v<T, insights::AnomalyDetails>) {
          j["anomalyCount"] = d.anomaly_count;
          j["mostExtreme"] = {
              {"index", d.most_extreme.index},
              {"value", d.most_extreme.value},
              {"date", Utils::format_date_utc(d.most_extreme.timestamp_ms)},
              {"zScore", d.most_extreme.z_score}};
        }
        return j;
      },
      details);
}

nlohmann::json insight_to_json_object(const insights::Insight &insight) {
  nlohmann::json j;
  j["type"] = insight.type;
  j["insight"] = insight.narrative;
  j["confidence"] = insight.confidence;
  j["actionable"] = insight.action;
  j["priority"] = insights::priority_to_string(insight.priority);

  nlohmann::json data = details_to_json(insight.details);
  if (!data.is_null())
    j["data"] = std::move(data);
  return j;
}

nlohmann::json
insights_to_json_array(const std::vector<insights::Insight> &ranked) {
  nlohmann::json array = nlohmann::json::array();
  for (const auto &insight : ranked)
    array.push_back(insight_to_json_object(insight));
  return array;
}

nlohmann::json summary_to_json(const std::vector<insights::Insight> &ranked,
                               const report::InsightSummary &summary) {
  nlohmann::json j;
  j["totalInsights"] = summary.total_insights;
  j["highPriorityCount"] = summary.high_priority_count;

  nlohmann::json entries = nlohmann::json::array();
  for (const auto &insight : ranked) {
    entries.push_back(
        {{"type", insight.type},
         {"insight", insight.narrative},
         {"confidence", insight.confidence},
         {"priority", insights::priority_to_string(insight.priority)},
         {"actionable", insight.action}});
  }
  j["insights"] = std::move(entries);
  j["summary"] = {{"keyFindings", summary.key_findings},
                  {"nextActions", summary.next_actions}};
  return j;
}

std::string format_insights_to_json(const std::vector<insights::Insight> &ranked,
                                    int indent) {
  return insights_to_json_array(ranked).dump(indent);
}

} // namespace JsonFormatter
