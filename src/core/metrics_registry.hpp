#ifndef METRICS_REGISTRY_HPP
#define METRICS_REGISTRY_HPP

#include <map>
#include <memory>
#include <mutex>
#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/registry.h>
#include <string>

// Process-wide prometheus-cpp registry. Families are registered once by name
// and reused on later lookups.
class MetricsRegistry {
public:
  static MetricsRegistry &instance();

  MetricsRegistry(const MetricsRegistry &) = delete;
  MetricsRegistry &operator=(const MetricsRegistry &) = delete;

  prometheus::Counter &create_counter(const std::string &name,
                                      const std::string &help);

  prometheus::Family<prometheus::Counter> &
  create_counter_family(const std::string &name, const std::string &help);

  // Prometheus text exposition format of everything registered so far.
  std::string serialize() const;

private:
  MetricsRegistry();
  ~MetricsRegistry() = default;

  std::shared_ptr<prometheus::Registry> registry_;
  std::map<std::string, prometheus::Family<prometheus::Counter> *>
      counter_families_;
  std::mutex families_mutex_;
};

#endif // METRICS_REGISTRY_HPP
