#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Config {

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"analysis.engine", LogComponent::ANALYSIS_ENGINE},
    {"analysis.seasonality", LogComponent::ANALYSIS_SEASONALITY},
    {"analysis.trend", LogComponent::ANALYSIS_TREND},
    {"analysis.segmentation", LogComponent::ANALYSIS_SEGMENTATION},
    {"analysis.correlation", LogComponent::ANALYSIS_CORRELATION},
    {"analysis.anomaly", LogComponent::ANALYSIS_ANOMALY},
    {"report", LogComponent::REPORT},
    {"sample_data", LogComponent::SAMPLE_DATA}};

void apply_default_log_levels(LoggingConfig &config) {
  for (const auto &pair : key_to_component_map) {
    config.log_levels[pair.second] = LogLevel::WARN;
  }
  config.log_levels[LogComponent::CORE] = LogLevel::INFO;
}

std::shared_ptr<AppConfig> make_default_config() {
  auto config = std::make_shared<AppConfig>();
  apply_default_log_levels(config->logging);
  return config;
}

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::to_lower_copy(Utils::trim_copy(val_str_raw));
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

bool validate_analysis_config(const AnalysisConfig &config,
                              std::vector<std::string> &errors) {
  bool valid = true;

  if (!(config.anomaly_z_score_threshold > 0.0) ||
      config.anomaly_z_score_threshold > 10.0) {
    errors.push_back(
        "Analysis anomaly z-score threshold must be in (0.0, 10.0]");
    valid = false;
  }

  return valid;
}

bool validate_report_config(const ReportConfig &config,
                            std::vector<std::string> &errors) {
  bool valid = true;

  if (config.output_format != "text" && config.output_format != "json") {
    errors.push_back("Report output format must be one of: text, json");
    valid = false;
  }

  if (config.max_recommended_actions < 1 ||
      config.max_recommended_actions > 50) {
    errors.push_back(
        "Report max recommended actions must be between 1 and 50");
    valid = false;
  }

  if (config.max_key_findings < 1 || config.max_key_findings > 20) {
    errors.push_back("Report max key findings must be between 1 and 20");
    valid = false;
  }

  return valid;
}

bool validate_sample_data_config(const SampleDataConfig &config,
                                 std::vector<std::string> &errors) {
  bool valid = true;

  if (config.time_series_days < 12 || config.time_series_days > 3650) {
    errors.push_back(
        "Sample data time series days must be between 12 and 3650");
    valid = false;
  }

  if (config.correlation_rows < 2 || config.correlation_rows > 100000) {
    errors.push_back(
        "Sample data correlation rows must be between 2 and 100000");
    valid = false;
  }

  if (config.customer_scale < 1 || config.customer_scale > 100) {
    errors.push_back("Sample data customer scale must be between 1 and 100");
    valid = false;
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (!validate_analysis_config(config.analysis, errors))
    valid = false;

  if (!validate_report_config(config.report, errors))
    valid = false;

  if (!validate_sample_data_config(config.sample_data, errors))
    valid = false;

  return valid;
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  apply_default_log_levels(config.logging);

  std::ifstream config_file(filepath);
  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    // Numeric keys keep their default when the value does not parse
    auto warn_invalid = [&]() {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid value for key '" << key << "': '" << value
                << "'" << std::endl;
    };
    auto read_double = [&](double &target) {
      if (auto parsed = Utils::string_to_number<double>(value))
        target = *parsed;
      else
        warn_invalid();
    };
    auto read_size = [&](size_t &target) {
      if (auto parsed = Utils::string_to_number<size_t>(value))
        target = *parsed;
      else
        warn_invalid();
    };

    if (current_section == "Analysis") {
      if (key == Keys::AN_ANOMALY_Z_SCORE_THRESHOLD)
        read_double(config.analysis.anomaly_z_score_threshold);
      else if (key == Keys::AN_SEASONALITY_ENABLED)
        config.analysis.seasonality_enabled = string_to_bool(value);
      else if (key == Keys::AN_TREND_ENABLED)
        config.analysis.trend_enabled = string_to_bool(value);
      else if (key == Keys::AN_SEGMENTATION_ENABLED)
        config.analysis.segmentation_enabled = string_to_bool(value);
      else if (key == Keys::AN_CORRELATION_ENABLED)
        config.analysis.correlation_enabled = string_to_bool(value);
      else if (key == Keys::AN_ANOMALY_ENABLED)
        config.analysis.anomaly_enabled = string_to_bool(value);

    } else if (current_section == "Report") {
      if (key == Keys::RE_OUTPUT_FORMAT)
        config.report.output_format = Utils::to_lower_copy(value);
      else if (key == Keys::RE_INCLUDE_DETAILED_ANALYSIS)
        config.report.include_detailed_analysis = string_to_bool(value);
      else if (key == Keys::RE_MAX_RECOMMENDED_ACTIONS)
        read_size(config.report.max_recommended_actions);
      else if (key == Keys::RE_MAX_KEY_FINDINGS)
        read_size(config.report.max_key_findings);

    } else if (current_section == "SampleData") {
      if (key == Keys::SD_RANDOM_SEED) {
        if (auto parsed = Utils::string_to_number<uint32_t>(value))
          config.sample_data.random_seed = *parsed;
        else
          warn_invalid();
      } else if (key == Keys::SD_TIME_SERIES_DAYS)
        read_size(config.sample_data.time_series_days);
      else if (key == Keys::SD_CORRELATION_ROWS)
        read_size(config.sample_data.correlation_rows);
      else if (key == Keys::SD_CUSTOMER_SCALE)
        read_size(config.sample_data.customer_scale);

    } else if (current_section == "Metrics") {
      if (key == Keys::ME_ENABLED)
        config.metrics.enabled = string_to_bool(value);
      else if (key == Keys::ME_PRINT_ON_EXIT)
        config.metrics.print_on_exit = string_to_bool(value);

    } else if (current_section == "Logging") {
      if (key == Keys::LOGGING_DEFAULT_LEVEL) {
        LogLevel default_level = string_to_log_level(value);
        for (auto &pair : config.logging.log_levels)
          pair.second = default_level;
      } else {
        auto comp_it = key_to_component_map.find(key);
        if (comp_it != key_to_component_map.end())
          config.logging.log_levels[comp_it->second] =
              string_to_log_level(value);
        else if (key.length() > 2 && key.substr(key.length() - 2) == ".*") {
          // Wildcard match, e.g., "analysis.* = DEBUG"
          std::string prefix = key.substr(0, key.length() - 1);
          for (const auto &pair : key_to_component_map) {
            if (pair.first.rfind(prefix, 0) == 0)
              config.logging.log_levels[pair.second] =
                  string_to_log_level(value);
          }
        }
      }
    }
  }

  return true;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  auto new_config = std::make_shared<AppConfig>();

  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
