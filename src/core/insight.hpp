#ifndef INSIGHT_HPP
#define INSIGHT_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace insights {

// --- Input records ---

struct TimeSeriesPoint {
  int64_t timestamp_ms; // UTC, milliseconds since epoch (negative before 1970)
  double value;
};

struct CustomerRecord {
  std::string customer_id;
  double recency;   // days since last activity
  double frequency; // purchase count
  double monetary;  // total value
};

// Kept distinct from double so that timestamp fields never count as numeric.
struct Timestamp {
  int64_t ms;
};

using FieldValue = std::variant<double, std::string, Timestamp>;

struct Field {
  std::string name;
  FieldValue value;
};

// One row of a tabular sample. Fields keep the caller's column order.
using DataPoint = std::vector<Field>;

const FieldValue *find_field(const DataPoint &record, std::string_view name);

// Every member is optional; an analyzer only runs when its input is present.
struct AnalysisInput {
  std::optional<std::vector<TimeSeriesPoint>> time_series;
  std::optional<std::vector<CustomerRecord>> customers;
  std::optional<std::vector<DataPoint>> tabular_sample;
};

// --- Output records ---

enum class Priority { HIGH, MEDIUM, LOW };

std::string priority_to_string(Priority priority);
int priority_weight(Priority priority);

namespace InsightType {
constexpr const char *SEASONALITY = "seasonality";
constexpr const char *TREND = "trend";
constexpr const char *CUSTOMER_SEGMENT = "customer-segment";
constexpr const char *CORRELATION = "correlation";
constexpr const char *ANOMALY = "anomaly";
} // namespace InsightType

struct SeasonalityDetails {
  int peak_month;
  int trough_month;
  double peak_mean;
  double trough_mean;
  double variation; // percent of the mean of monthly means
};

struct TrendDetails {
  double slope;
  double intercept;
  // Absent when the first value of the series is zero.
  std::optional<double> growth_rate;
};

struct SegmentDetails {
  std::string segment;
  size_t count;
  double percentage;
  double avg_frequency;
  double avg_monetary;
};

struct CorrelationDetails {
  std::string field1;
  std::string field2;
  double correlation;
};

struct AnomalyPoint {
  size_t index; // position in the caller's series
  double value;
  int64_t timestamp_ms;
  double z_score;
};

struct AnomalyDetails {
  size_t anomaly_count;
  AnomalyPoint most_extreme;
};

using InsightDetails =
    std::variant<std::monostate, SeasonalityDetails, TrendDetails,
                 SegmentDetails, CorrelationDetails, AnomalyDetails>;

struct Insight {
  std::string type;
  std::string narrative;
  double confidence; // [0, 100]
  std::string action;
  Priority priority;
  InsightDetails details;
};

} // namespace insights

#endif // INSIGHT_HPP
