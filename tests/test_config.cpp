#include <gtest/gtest.h>
#include <fstream>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "../src/core/config.hpp"
#include "../src/core/logger.hpp"

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create a temporary directory for test files
        test_dir = std::filesystem::temp_directory_path() / "insight_engine_config_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        // Clean up test files
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    std::string createTestConfigFile(const std::string& content) {
        auto config_path = test_dir / "test_config.ini";
        std::ofstream file(config_path);
        file << content;
        file.close();
        return config_path.string();
    }

    std::filesystem::path test_dir;
};

// Test defaults before any file is loaded
TEST_F(ConfigTest, DefaultsWithoutFile) {
    Config::ConfigManager manager;
    auto config = manager.get_config();
    ASSERT_TRUE(config);

    EXPECT_DOUBLE_EQ(config->analysis.anomaly_z_score_threshold, 2.5);
    EXPECT_TRUE(config->analysis.seasonality_enabled);
    EXPECT_TRUE(config->analysis.correlation_enabled);
    EXPECT_EQ(config->report.output_format, "text");
    EXPECT_EQ(config->report.max_recommended_actions, 5u);
    EXPECT_EQ(config->report.max_key_findings, 3u);
    EXPECT_EQ(config->sample_data.random_seed, 42u);
    EXPECT_EQ(config->sample_data.time_series_days, 365u);
    EXPECT_TRUE(config->metrics.enabled);
    EXPECT_EQ(config->logging.log_levels.at(LogComponent::CORE), LogLevel::INFO);
    EXPECT_EQ(config->logging.log_levels.at(LogComponent::REPORT), LogLevel::WARN);
}

// Test Analysis configuration parsing
TEST_F(ConfigTest, AnalysisConfigParsing) {
    std::string config_content = R"(
# analyzer switches
[Analysis]
anomaly_z_score_threshold = 3.0
seasonality_enabled = false
trend_enabled = yes
segmentation_enabled = 0
correlation_enabled = on
anomaly_enabled = true
)";

    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    auto config = manager.get_config();
    EXPECT_DOUBLE_EQ(config->analysis.anomaly_z_score_threshold, 3.0);
    EXPECT_FALSE(config->analysis.seasonality_enabled);
    EXPECT_TRUE(config->analysis.trend_enabled);
    EXPECT_FALSE(config->analysis.segmentation_enabled);
    EXPECT_TRUE(config->analysis.correlation_enabled);
    EXPECT_TRUE(config->analysis.anomaly_enabled);
}

// Test Report, SampleData and Metrics configuration parsing
TEST_F(ConfigTest, ReportSampleDataAndMetricsParsing) {
    std::string config_content = R"(
[Report]
output_format = JSON
include_detailed_analysis = false
max_recommended_actions = 8
max_key_findings = 4

[SampleData]
random_seed = 7
time_series_days = 730
correlation_rows = 250
customer_scale = 2

[Metrics]
enabled = false
print_on_exit = true
)";

    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    auto config = manager.get_config();
    EXPECT_EQ(config->report.output_format, "json");
    EXPECT_FALSE(config->report.include_detailed_analysis);
    EXPECT_EQ(config->report.max_recommended_actions, 8u);
    EXPECT_EQ(config->report.max_key_findings, 4u);
    EXPECT_EQ(config->sample_data.random_seed, 7u);
    EXPECT_EQ(config->sample_data.time_series_days, 730u);
    EXPECT_EQ(config->sample_data.correlation_rows, 250u);
    EXPECT_EQ(config->sample_data.customer_scale, 2u);
    EXPECT_FALSE(config->metrics.enabled);
    EXPECT_TRUE(config->metrics.print_on_exit);
}

// Test logging levels including the wildcard form
TEST_F(ConfigTest, LoggingLevelsAndWildcard) {
    std::string config_content = R"(
[Logging]
default_level = ERROR
analysis.* = DEBUG
report = trace
)";

    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    const auto &levels = manager.get_config()->logging.log_levels;
    EXPECT_EQ(levels.at(LogComponent::CORE), LogLevel::ERROR);
    EXPECT_EQ(levels.at(LogComponent::SAMPLE_DATA), LogLevel::ERROR);
    EXPECT_EQ(levels.at(LogComponent::ANALYSIS_ENGINE), LogLevel::DEBUG);
    EXPECT_EQ(levels.at(LogComponent::ANALYSIS_ANOMALY), LogLevel::DEBUG);
    EXPECT_EQ(levels.at(LogComponent::REPORT), LogLevel::TRACE);
}

// Unparseable numbers keep their defaults
TEST_F(ConfigTest, InvalidNumbersKeepDefaults) {
    std::string config_content = R"(
[Analysis]
anomaly_z_score_threshold = lots

[SampleData]
time_series_days = -5
missing_delimiter_line
)";

    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    auto config = manager.get_config();
    EXPECT_DOUBLE_EQ(config->analysis.anomaly_z_score_threshold, 2.5);
    EXPECT_EQ(config->sample_data.time_series_days, 365u);
}

// Failed validation keeps the previously loaded configuration
TEST_F(ConfigTest, ValidationFailureKeepsExistingConfig) {
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(createTestConfigFile(R"(
[Report]
max_key_findings = 6
)")));

    EXPECT_FALSE(manager.load_configuration(createTestConfigFile(R"(
[Report]
output_format = xml
max_key_findings = 2
)")));

    auto config = manager.get_config();
    EXPECT_EQ(config->report.output_format, "text");
    EXPECT_EQ(config->report.max_key_findings, 6u);
}

TEST_F(ConfigTest, MissingFileIsReported) {
    Config::ConfigManager manager;
    EXPECT_FALSE(manager.load_configuration((test_dir / "absent.ini").string()));
    EXPECT_DOUBLE_EQ(manager.get_config()->analysis.anomaly_z_score_threshold, 2.5);
}

TEST(ConfigValidationTest, RangeChecks) {
    Config::AppConfig config;
    std::vector<std::string> errors;
    EXPECT_TRUE(Config::validate_app_config(config, errors));
    EXPECT_TRUE(errors.empty());

    config.analysis.anomaly_z_score_threshold = 0.0;
    config.report.max_recommended_actions = 0;
    config.sample_data.time_series_days = 11;
    config.sample_data.customer_scale = 101;
    EXPECT_FALSE(Config::validate_app_config(config, errors));
    EXPECT_EQ(errors.size(), 4u);

    errors.clear();
    Config::AnalysisConfig analysis;
    analysis.anomaly_z_score_threshold = 10.0;
    EXPECT_TRUE(Config::validate_analysis_config(analysis, errors));
    analysis.anomaly_z_score_threshold = 10.5;
    EXPECT_FALSE(Config::validate_analysis_config(analysis, errors));
}

TEST(ConfigValidationTest, LogLevelStrings) {
    EXPECT_EQ(Config::string_to_log_level(" warn "), LogLevel::WARN);
    EXPECT_EQ(Config::string_to_log_level("Fatal"), LogLevel::FATAL);
    EXPECT_EQ(Config::string_to_log_level("verbose"), LogLevel::INFO);
}
