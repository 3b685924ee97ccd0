#include "application.hpp"
#include "analysis/insight_engine.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "io/sample_data_generator.hpp"
#include "report/report_generator.hpp"
#include "utils/json_formatter.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>

int run_application(const Config::AppConfig &config, std::ostream &out) {
  const auto &report_config = config.report;
  const bool json_output = report_config.output_format == "json";

  // --- Initialize Logging ---
  LogManager::instance().set_output(json_output ? std::cerr : std::cout);
  LogManager::instance().configure(config.logging);

  LOG(LogLevel::INFO, LogComponent::CORE, "Insight engine starting up...");

  std::unique_ptr<insights::InsightEngine> engine;
  try {
    engine = std::make_unique<insights::InsightEngine>(config.analysis,
                                                       config.metrics.enabled);
  } catch (const std::invalid_argument &e) {
    LOG(LogLevel::FATAL, LogComponent::CORE,
        "Failed to initialize insight engine: " << e.what());
    return 1;
  }

  // --- Build Input and Analyze ---
  SampleDataGenerator generator(config.sample_data);
  const insights::AnalysisInput input = generator.generate();

  const std::vector<insights::Insight> ranked = engine->analyze(input);

  // --- Output ---
  if (json_output) {
    const auto summary =
        report::build_summary(ranked, report_config.max_key_findings);
    nlohmann::json document = JsonFormatter::summary_to_json(ranked, summary);
    document["details"] = JsonFormatter::insights_to_json_array(ranked);
    out << document.dump(2) << std::endl;
  } else {
    out << report::generate_report(ranked);
    if (report_config.include_detailed_analysis) {
      out << '\n'
          << report::generate_detailed_analysis(
                 ranked, input, report_config.max_recommended_actions);
    }
    out << std::flush;
  }

  if (config.metrics.enabled && config.metrics.print_on_exit) {
    std::ostream &metrics_out = json_output ? std::cerr : out;
    metrics_out << '\n' << MetricsRegistry::instance().serialize() << std::flush;
  }

  LOG(LogLevel::INFO, LogComponent::CORE,
      "Insight engine finished with " << ranked.size() << " insight(s)");
  return 0;
}
