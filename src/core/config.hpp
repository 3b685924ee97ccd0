#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// Analysis Settings
constexpr const char *AN_ANOMALY_Z_SCORE_THRESHOLD = "anomaly_z_score_threshold";
constexpr const char *AN_SEASONALITY_ENABLED = "seasonality_enabled";
constexpr const char *AN_TREND_ENABLED = "trend_enabled";
constexpr const char *AN_SEGMENTATION_ENABLED = "segmentation_enabled";
constexpr const char *AN_CORRELATION_ENABLED = "correlation_enabled";
constexpr const char *AN_ANOMALY_ENABLED = "anomaly_enabled";

// Report Settings
constexpr const char *RE_OUTPUT_FORMAT = "output_format";
constexpr const char *RE_INCLUDE_DETAILED_ANALYSIS = "include_detailed_analysis";
constexpr const char *RE_MAX_RECOMMENDED_ACTIONS = "max_recommended_actions";
constexpr const char *RE_MAX_KEY_FINDINGS = "max_key_findings";

// Sample Data Settings
constexpr const char *SD_RANDOM_SEED = "random_seed";
constexpr const char *SD_TIME_SERIES_DAYS = "time_series_days";
constexpr const char *SD_CORRELATION_ROWS = "correlation_rows";
constexpr const char *SD_CUSTOMER_SCALE = "customer_scale";

// Metrics Settings
constexpr const char *ME_ENABLED = "enabled";
constexpr const char *ME_PRINT_ON_EXIT = "print_on_exit";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";

} // namespace Keys

struct AnalysisConfig {
  double anomaly_z_score_threshold = 2.5;
  bool seasonality_enabled = true;
  bool trend_enabled = true;
  bool segmentation_enabled = true;
  bool correlation_enabled = true;
  bool anomaly_enabled = true;
};

struct ReportConfig {
  // "text" or "json"
  std::string output_format = "text";
  bool include_detailed_analysis = true;
  size_t max_recommended_actions = 5;
  size_t max_key_findings = 3;
};

struct SampleDataConfig {
  uint32_t random_seed = 42;
  size_t time_series_days = 365;
  size_t correlation_rows = 100;
  size_t customer_scale = 1;
};

struct MetricsConfig {
  bool enabled = true;
  bool print_on_exit = false;
};

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct AppConfig {
  AnalysisConfig analysis;
  ReportConfig report;
  SampleDataConfig sample_data;
  MetricsConfig metrics;
  LoggingConfig logging;

  AppConfig() = default;
};

LogLevel string_to_log_level(const std::string &level_str_raw);

// WARN for every component, INFO for CORE.
void apply_default_log_levels(LoggingConfig &config);
std::shared_ptr<AppConfig> make_default_config();

// Validation functions for configuration parameters
bool validate_analysis_config(const AnalysisConfig &config,
                              std::vector<std::string> &errors);
bool validate_report_config(const ReportConfig &config,
                            std::vector<std::string> &errors);
bool validate_sample_data_config(const SampleDataConfig &config,
                                 std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

// Fills `config` from an INI file. Returns false if the file cannot be opened.
bool parse_config_into(const std::string &filepath, AppConfig &config);

class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::shared_ptr<const AppConfig> current_config_ = make_default_config();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
