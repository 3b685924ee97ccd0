#include "insight_engine.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace insights {

void rank_insights(std::vector<Insight> &insights) {
  std::stable_sort(insights.begin(), insights.end(),
                   [](const Insight &a, const Insight &b) {
                     const int wa = priority_weight(a.priority);
                     const int wb = priority_weight(b.priority);
                     if (wa != wb)
                       return wa > wb;
                     return a.confidence > b.confidence;
                   });
}

InsightEngine::InsightEngine(const Config::AnalysisConfig &config,
                             bool record_metrics)
    : config_(config), record_metrics_(record_metrics),
      anomaly_(config.anomaly_z_score_threshold) {}

std::vector<Insight> InsightEngine::analyze(const AnalysisInput &input) const {
  std::vector<Insight> all;

  auto append = [&all](std::vector<Insight> produced) {
    all.insert(all.end(), std::make_move_iterator(produced.begin()),
               std::make_move_iterator(produced.end()));
  };
  auto run = [&](bool enabled, const char *name, auto &&analyzer_call) {
    if (!enabled) {
      LOG(LogLevel::DEBUG, LogComponent::ANALYSIS_ENGINE,
          name << " analyzer disabled by configuration");
      return;
    }
    auto produced = analyzer_call();
    record_run(name, produced.size());
    append(std::move(produced));
  };

  if (input.time_series) {
    const auto &series = *input.time_series;
    run(config_.seasonality_enabled, "seasonality",
        [&] { return seasonality_.analyze(series); });
    run(config_.trend_enabled, "trend", [&] { return trend_.analyze(series); });
    run(config_.anomaly_enabled, "anomaly",
        [&] { return anomaly_.analyze(series); });
  }

  if (input.customers) {
    run(config_.segmentation_enabled, "segmentation",
        [&] { return segmentation_.analyze(*input.customers); });
  }

  if (input.tabular_sample) {
    run(config_.correlation_enabled, "correlation",
        [&] { return correlation_.analyze(*input.tabular_sample); });
  }

  rank_insights(all);
  record_results(all);

  LOG(LogLevel::INFO, LogComponent::ANALYSIS_ENGINE,
      "Analysis produced " << all.size() << " insight(s)");
  return all;
}

void InsightEngine::record_run(const char *analyzer, size_t produced) const {
  LOG(LogLevel::DEBUG, LogComponent::ANALYSIS_ENGINE,
      analyzer << " analyzer produced " << produced << " insight(s)");
  if (!record_metrics_)
    return;

  MetricsRegistry::instance()
      .create_counter_family("insight_analyzer_runs_total",
                             "Analyzer invocations by analyzer name.")
      .Add({{"analyzer", analyzer}})
      .Increment();
}

void InsightEngine::record_results(const std::vector<Insight> &ranked) const {
  if (!record_metrics_)
    return;

  auto &registry = MetricsRegistry::instance();
  registry
      .create_counter("insight_engine_runs_total",
                      "Completed insight engine analyses.")
      .Increment();

  auto &generated = registry.create_counter_family(
      "insight_insights_generated_total",
      "Insights produced, by type and priority.");
  for (const auto &insight : ranked) {
    generated
        .Add({{"type", insight.type},
              {"priority", priority_to_string(insight.priority)}})
        .Increment();
  }
}

} // namespace insights
