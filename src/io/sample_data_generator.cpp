#include "sample_data_generator.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace {

struct CustomerArchetype {
  const char *id_prefix;
  size_t base_count;
  int recency_min, recency_max;
  int frequency_min, frequency_max;
  int monetary_min, monetary_max;
};

// Ranges are inclusive.
constexpr CustomerArchetype ARCHETYPES[] = {
    {"champion", 50, 1, 15, 10, 14, 100000, 149999},
    {"loyal", 80, 5, 34, 6, 9, 50000, 89999},
    {"atrisk", 60, 60, 119, 2, 4, 20000, 49999},
    {"potential", 120, 1, 20, 1, 3, 10000, 34999},
};

} // namespace

SampleDataGenerator::SampleDataGenerator(const Config::SampleDataConfig &config)
    : config_(config), rng_(config.random_seed) {}

int SampleDataGenerator::uniform_int(int low, int high) {
  std::uniform_int_distribution<int> dist(low, high);
  return dist(rng_);
}

double SampleDataGenerator::uniform_real(double low, double high) {
  std::uniform_real_distribution<double> dist(low, high);
  return dist(rng_);
}

insights::AnalysisInput SampleDataGenerator::generate() {
  insights::AnalysisInput input;
  input.time_series = generate_time_series();
  input.customers = generate_customers();
  input.tabular_sample = generate_tabular_sample();

  LOG(LogLevel::INFO, LogComponent::SAMPLE_DATA,
      "Generated " << input.time_series->size() << " series points, "
                   << input.customers->size() << " customers, "
                   << input.tabular_sample->size() << " tabular rows (seed "
                   << config_.random_seed << ")");
  return input;
}

std::vector<insights::TimeSeriesPoint>
SampleDataGenerator::generate_time_series() {
  std::vector<insights::TimeSeriesPoint> series;
  series.reserve(config_.time_series_days);

  for (size_t day = 0; day < config_.time_series_days; ++day) {
    const double i = static_cast<double>(day);
    const double seasonal = 1000.0 + 300.0 * std::sin(2.0 * M_PI * i / 365.0) +
                            150.0 * std::sin(4.0 * M_PI * i / 365.0);
    const double trend = i * 0.8;
    const double noise = uniform_real(-100.0, 100.0);

    double event = 0.0;
    if (day == CAMPAIGN_DAY)
      event = CAMPAIGN_BOOST;
    else if (day == OUTAGE_DAY)
      event = OUTAGE_DROP;

    series.push_back(
        {SERIES_START_MS + static_cast<int64_t>(day) * Utils::MS_PER_DAY,
         std::max(0.0, seasonal + trend + noise + event)});
  }
  return series;
}

std::vector<insights::CustomerRecord> SampleDataGenerator::generate_customers() {
  std::vector<insights::CustomerRecord> customers;

  for (const auto &archetype : ARCHETYPES) {
    const size_t count = archetype.base_count * config_.customer_scale;
    for (size_t i = 0; i < count; ++i) {
      insights::CustomerRecord customer;
      customer.customer_id =
          std::string(archetype.id_prefix) + "_" + std::to_string(i);
      customer.recency =
          uniform_int(archetype.recency_min, archetype.recency_max);
      customer.frequency =
          uniform_int(archetype.frequency_min, archetype.frequency_max);
      customer.monetary =
          uniform_int(archetype.monetary_min, archetype.monetary_max);
      customers.push_back(std::move(customer));
    }
  }
  return customers;
}

std::vector<insights::DataPoint> SampleDataGenerator::generate_tabular_sample() {
  std::vector<insights::DataPoint> sample;
  sample.reserve(config_.correlation_rows);

  for (size_t row = 0; row < config_.correlation_rows; ++row) {
    const double ad_spend = uniform_real(50.0, 150.0);
    const double temperature = uniform_real(10.0, 35.0);
    const int event_count = uniform_int(0, 5);

    const double sales = ad_spend * 3.2 +
                         std::max(0.0, temperature - 15.0) * 15.0 +
                         event_count * 120.0 + uniform_real(0.0, 500.0);

    insights::DataPoint record;
    record.push_back({"id", static_cast<double>(row + 1)});
    record.push_back({"ad_spend", std::round(ad_spend)});
    record.push_back({"temperature", std::round(temperature * 10.0) / 10.0});
    record.push_back({"event_count", static_cast<double>(event_count)});
    record.push_back({"sales", std::round(sales)});
    sample.push_back(std::move(record));
  }
  return sample;
}
