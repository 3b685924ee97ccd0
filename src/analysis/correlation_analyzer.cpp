#include "correlation_analyzer.hpp"
#include "analysis/statistics.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace insights {

namespace {

std::optional<double> numeric_value(const DataPoint &record,
                                    const std::string &name) {
  const FieldValue *value = find_field(record, name);
  if (value == nullptr)
    return std::nullopt;

  const double *number = std::get_if<double>(value);
  if (number == nullptr || std::isnan(*number))
    return std::nullopt;
  return *number;
}

std::vector<double> extract_column(const std::vector<DataPoint> &sample,
                                   const std::string &name) {
  std::vector<double> column;
  column.reserve(sample.size());
  for (const auto &record : sample) {
    if (auto number = numeric_value(record, name))
      column.push_back(*number);
  }
  return column;
}

const char *strength_label(double abs_r) {
  if (abs_r > CorrelationAnalyzer::VERY_STRONG_CORRELATION)
    return "very strong";
  if (abs_r > CorrelationAnalyzer::STRONG_CORRELATION)
    return "strong";
  return "moderate";
}

} // namespace

std::vector<std::string>
CorrelationAnalyzer::numeric_fields(const std::vector<DataPoint> &sample) {
  std::vector<std::string> fields;
  if (sample.empty())
    return fields;

  for (const auto &field : sample.front()) {
    bool numeric_everywhere = true;
    for (const auto &record : sample) {
      if (!numeric_value(record, field.name)) {
        numeric_everywhere = false;
        break;
      }
    }
    if (numeric_everywhere)
      fields.push_back(field.name);
  }
  return fields;
}

std::vector<Insight>
CorrelationAnalyzer::analyze(const std::vector<DataPoint> &sample) const {
  std::vector<Insight> results;

  const auto fields = numeric_fields(sample);
  if (fields.size() < 2) {
    LOG(LogLevel::DEBUG, LogComponent::ANALYSIS_CORRELATION,
        "Only " << fields.size()
                << " numeric field(s), skipping correlation analysis");
    return results;
  }

  for (size_t i = 0; i < fields.size(); ++i) {
    for (size_t j = i + 1; j < fields.size(); ++j) {
      const auto x = extract_column(sample, fields[i]);
      const auto y = extract_column(sample, fields[j]);
      if (x.size() != y.size()) {
        LOG(LogLevel::DEBUG, LogComponent::ANALYSIS_CORRELATION,
            "Length mismatch for " << fields[i] << "/" << fields[j]
                                   << ", skipping pair");
        continue;
      }

      const double r = stats::pearson_correlation(x, y);
      const double abs_r = std::abs(r);

      LOG(LogLevel::TRACE, LogComponent::ANALYSIS_CORRELATION,
          fields[i] << " vs " << fields[j] << ": r=" << r);

      if (!(abs_r > MIN_ABS_CORRELATION))
        continue;

      Insight insight;
      insight.type = InsightType::CORRELATION;
      insight.narrative = fields[i] + " and " + fields[j] + " show a " +
                          strength_label(abs_r) + " " +
                          (r > 0.0 ? "positive" : "negative") +
                          " correlation (r=" + Utils::format_fixed(r, 3) + ")";
      insight.confidence = std::min(MAX_CONFIDENCE, abs_r * 100.0);
      insight.action = "Optimizing " + fields[i] + " is expected to " +
                       (r > 0.0 ? "raise " : "adjust ") + fields[j];
      insight.priority = abs_r > HIGH_PRIORITY_CORRELATION ? Priority::HIGH
                                                           : Priority::MEDIUM;
      insight.details = CorrelationDetails{fields[i], fields[j], r};
      results.push_back(std::move(insight));
    }
  }

  return results;
}

} // namespace insights
