#ifndef JSON_FORMATTER_HPP
#define JSON_FORMATTER_HPP

#include "core/insight.hpp"
#include "nlohmann/json.hpp"
#include "report/report_generator.hpp"

#include <string>
#include <vector>

namespace JsonFormatter {

// Payload object for the insight's details; null when there are none.
nlohmann::json details_to_json(const insights::InsightDetails &details);

// {type, insight, confidence, actionable, priority, data}
nlohmann::json insight_to_json_object(const insights::Insight &insight);

nlohmann::json
insights_to_json_array(const std::vector<insights::Insight> &ranked);

/**
 * {totalInsights, highPriorityCount, insights[], summary{keyFindings,
 * nextActions}}. Entries in insights[] carry no payload.
 */
nlohmann::json summary_to_json(const std::vector<insights::Insight> &ranked,
                               const report::InsightSummary &summary);

std::string format_insights_to_json(const std::vector<insights::Insight> &ranked,
                                    int indent = 2);

} // namespace JsonFormatter

#endif // JSON_FORMATTER_HPP
