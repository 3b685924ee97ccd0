#ifndef SAMPLE_DATA_GENERATOR_HPP
#define SAMPLE_DATA_GENERATOR_HPP

#include "core/config.hpp"
#include "core/insight.hpp"

#include <cstdint>
#include <random>
#include <vector>

/**
 * Deterministic demo input: a year of daily sales with seasonality, growth,
 * noise and two injected events; four customer archetype groups; and a
 * marketing table where sales depend on ad spend, temperature and events.
 * The same seed always yields the same bundle.
 */
class SampleDataGenerator {
public:
  static constexpr int64_t SERIES_START_MS = 1672531200000LL; // 2023-01-01
  static constexpr size_t CAMPAIGN_DAY = 180;
  static constexpr double CAMPAIGN_BOOST = 1200.0;
  static constexpr size_t OUTAGE_DAY = 300;
  static constexpr double OUTAGE_DROP = -500.0;

  explicit SampleDataGenerator(const Config::SampleDataConfig &config = {});

  insights::AnalysisInput generate();

  std::vector<insights::TimeSeriesPoint> generate_time_series();
  std::vector<insights::CustomerRecord> generate_customers();
  std::vector<insights::DataPoint> generate_tabular_sample();

private:
  int uniform_int(int low, int high);
  double uniform_real(double low, double high);

  Config::SampleDataConfig config_;
  std::mt19937 rng_;
};

#endif // SAMPLE_DATA_GENERATOR_HPP
