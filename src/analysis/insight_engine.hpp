#ifndef INSIGHT_ENGINE_HPP
#define INSIGHT_ENGINE_HPP

#include "analysis/anomaly_detector.hpp"
#include "analysis/correlation_analyzer.hpp"
#include "analysis/seasonality_analyzer.hpp"
#include "analysis/segmentation_analyzer.hpp"
#include "analysis/trend_analyzer.hpp"
#include "core/config.hpp"
#include "core/insight.hpp"

#include <vector>

namespace insights {

/**
 * Stable sort by priority weight (high first), then by confidence
 * (descending). Insights that tie on both keep their relative order.
 */
void rank_insights(std::vector<Insight> &insights);

/**
 * Runs every enabled analyzer whose input is present in the bundle and
 * returns the merged, ranked insights.
 *
 * Invocation order: seasonality, trend, anomaly (time series), segmentation
 * (customers), correlation (tabular sample). The engine keeps no state
 * between calls, so one instance may serve any number of analyses.
 */
class InsightEngine {
public:
  /**
   * @param config Analyzer toggles and the anomaly threshold.
   * @param record_metrics Count runs and produced insights in the
   * process-wide MetricsRegistry.
   * @throws std::invalid_argument if the anomaly threshold is invalid
   */
  explicit InsightEngine(const Config::AnalysisConfig &config = {},
                         bool record_metrics = false);

  std::vector<Insight> analyze(const AnalysisInput &input) const;

private:
  void record_run(const char *analyzer, size_t produced) const;
  void record_results(const std::vector<Insight> &ranked) const;

  Config::AnalysisConfig config_;
  bool record_metrics_;

  SeasonalityAnalyzer seasonality_;
  TrendAnalyzer trend_;
  AnomalyDetector anomaly_;
  SegmentationAnalyzer segmentation_;
  CorrelationAnalyzer correlation_;
};

} // namespace insights

#endif // INSIGHT_ENGINE_HPP
