#ifndef LOGGER_HPP
#define LOGGER_HPP

#include "config.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>

// Enum for standard log severity levels
enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

// Enum for all granular application components
enum class LogComponent {
  // Top-level components
  CORE,
  CONFIG,

  // Analysis sub-components
  ANALYSIS_ENGINE,
  ANALYSIS_SEASONALITY,
  ANALYSIS_TREND,
  ANALYSIS_SEGMENTATION,
  ANALYSIS_CORRELATION,
  ANALYSIS_ANOMALY,

  // Output and demo input
  REPORT,
  SAMPLE_DATA
};

class LogManager {
public:
  static LogManager &instance() {
    static LogManager instance;
    return instance;
  }

  inline void configure(const Config::LoggingConfig &config) {
    log_levels_ = config.log_levels;
  }

  // Destination of LOG lines; stdout unless redirected.
  void set_output(std::ostream &out) { output_ = &out; }
  std::ostream &output() const { return *output_; }

  bool should_log(LogLevel level, LogComponent component) const {
    auto it = log_levels_.find(component);
    if (it == log_levels_.end())
      return false;

    return level >= it->second;
  }

private:
  LogManager() = default; // Private constructor for singleton
  std::map<LogComponent, LogLevel> log_levels_;
  std::ostream *output_ = &std::cout;
};

// --- The Core Logging Macro ---
// The message expression is only evaluated when should_log() passes.
#define LOG(level, component, message)                                         \
  do {                                                                         \
    if (LogManager::instance().should_log(level, component)) {                 \
      auto now = std::chrono::system_clock::now();                             \
      auto time_t_now = std::chrono::system_clock::to_time_t(now);             \
      auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(         \
                    now.time_since_epoch()) %                                  \
                1000;                                                          \
      std::ostringstream oss;                                                  \
      oss << std::put_time(std::gmtime(&time_t_now), "%Y-%m-%dT%H:%M:%S")      \
          << '.' << std::setw(3) << std::setfill('0') << ms.count() << "Z ";   \
      oss << "[" << level_to_string(level) << "] ";                            \
      oss << "[" << component_to_string(component) << "] ";                    \
      oss << "[" << __FILE__ << ":" << __LINE__ << "] ";                       \
      oss << message;                                                          \
      LogManager::instance().output() << oss.str() << std::endl;               \
    }                                                                          \
  } while (0)

// --- Helper Functions to Convert Enums to Strings for Printing ---

inline const char *level_to_string(LogLevel level) {
  switch (level) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::FATAL:
    return "FATAL";
  }
  return "UNKNOWN";
}

inline const char *component_to_string(LogComponent component) {
  switch (component) {
  case LogComponent::CORE:
    return "CORE";
  case LogComponent::CONFIG:
    return "CONFIG";
  case LogComponent::ANALYSIS_ENGINE:
    return "ANALYSIS.ENGINE";
  case LogComponent::ANALYSIS_SEASONALITY:
    return "ANALYSIS.SEASONALITY";
  case LogComponent::ANALYSIS_TREND:
    return "ANALYSIS.TREND";
  case LogComponent::ANALYSIS_SEGMENTATION:
    return "ANALYSIS.SEGMENTATION";
  case LogComponent::ANALYSIS_CORRELATION:
    return "ANALYSIS.CORRELATION";
  case LogComponent::ANALYSIS_ANOMALY:
    return "ANALYSIS.ANOMALY";
  case LogComponent::REPORT:
    return "REPORT";
  case LogComponent::SAMPLE_DATA:
    return "SAMPLE_DATA";
  }
  return "GENERAL";
}

#endif // LOGGER_HPP
