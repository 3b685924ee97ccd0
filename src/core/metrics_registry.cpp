#include "metrics_registry.hpp"

#include <prometheus/text_serializer.h>

MetricsRegistry &MetricsRegistry::instance() {
  static MetricsRegistry instance;
  return instance;
}

MetricsRegistry::MetricsRegistry()
    : registry_(std::make_shared<prometheus::Registry>()) {}

prometheus::Counter &MetricsRegistry::create_counter(const std::string &name,
                                                     const std::string &help) {
  return create_counter_family(name, help).Add({});
}

prometheus::Family<prometheus::Counter> &
MetricsRegistry::create_counter_family(const std::string &name,
                                       const std::string &help) {
  std::lock_guard<std::mutex> lock(families_mutex_);

  auto it = counter_families_.find(name);
  if (it != counter_families_.end())
    return *it->second;

  auto &family =
      prometheus::BuildCounter().Name(name).Help(help).Register(*registry_);
  counter_families_.emplace(name, &family);
  return family;
}

std::string MetricsRegistry::serialize() const {
  prometheus::TextSerializer serializer;
  return serializer.Serialize(registry_->Collect());
}
