// File: tests/config/detector_config_test.cpp
//
// Tests for YAML detector configuration

#include "config/detector_config.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace dedupe;

class DetectorConfigTest : public ::testing::Test {
protected:
    std::string temp_config_path = "/tmp/dedupe_test_config.yaml";

    void TearDown() override {
        std::filesystem::remove(temp_config_path);
    }
};

TEST_F(DetectorConfigTest, DefaultConfig) {
    auto config = DetectorConfig::Default();

    EXPECT_DOUBLE_EQ(0.95, config.thresholds.auto_merge);
    EXPECT_DOUBLE_EQ(0.85, config.thresholds.high_confidence);
    EXPECT_DOUBLE_EQ(0.70, config.thresholds.medium_confidence);
    EXPECT_DOUBLE_EQ(0.50, config.thresholds.low_confidence);
    EXPECT_DOUBLE_EQ(0.85, config.thresholds.minimum_match);

    EXPECT_DOUBLE_EQ(95.0, config.fuzzy.exact);
    EXPECT_DOUBLE_EQ(85.0, config.fuzzy.high);
    EXPECT_DOUBLE_EQ(70.0, config.fuzzy.medium);
    EXPECT_DOUBLE_EQ(50.0, config.fuzzy.low);

    EXPECT_DOUBLE_EQ(10.0, config.tolerance.value_percent);
    EXPECT_DOUBLE_EQ(7.0, config.tolerance.date_days);

    EXPECT_EQ(FieldWeights::Default(), config.weights);
    EXPECT_EQ(100u, config.batch.batch_size);
    EXPECT_EQ(1u, config.batch.worker_threads);
    EXPECT_FALSE(config.logging.debug_logging);
    EXPECT_EQ(200u, config.storage.candidate_limit);

    EXPECT_TRUE(config.Validate());
}

TEST_F(DetectorConfigTest, LoadFromString) {
    std::string yaml = R"(
thresholds:
  auto_merge: 0.97
  minimum_match: 0.80

fuzzy:
  medium: 65

tolerance:
  value_percent: 5
  date_days: 14

weights:
  description: 0.1
  contacts: 0.0

batch:
  batch_size: 25
  worker_threads: 4

logging:
  debug_logging: true

storage:
  db_path: "/tmp/deals.db"
  candidate_limit: 50
  enable_wal: false
)";

    auto config_opt = DetectorConfig::LoadFromString(yaml);
    ASSERT_TRUE(config_opt.has_value());

    auto config = config_opt.value();
    EXPECT_DOUBLE_EQ(0.97, config.thresholds.auto_merge);
    EXPECT_DOUBLE_EQ(0.80, config.thresholds.minimum_match);
    EXPECT_DOUBLE_EQ(0.85, config.thresholds.high_confidence);  // Unchanged
    EXPECT_DOUBLE_EQ(65.0, config.fuzzy.medium);
    EXPECT_DOUBLE_EQ(5.0, config.tolerance.value_percent);
    EXPECT_DOUBLE_EQ(14.0, config.tolerance.date_days);

    EXPECT_DOUBLE_EQ(0.1, config.weights.Get(SimilarityFactor::DESCRIPTION));
    EXPECT_DOUBLE_EQ(0.0, config.weights.Get(SimilarityFactor::CONTACTS));
    EXPECT_DOUBLE_EQ(0.25, config.weights.Get(SimilarityFactor::DEAL_NAME));

    EXPECT_EQ(25u, config.batch.batch_size);
    EXPECT_EQ(4u, config.batch.worker_threads);
    EXPECT_TRUE(config.logging.debug_logging);
    EXPECT_EQ("/tmp/deals.db", config.storage.db_path);
    EXPECT_EQ(50u, config.storage.candidate_limit);
    EXPECT_FALSE(config.storage.enable_wal);
}

TEST_F(DetectorConfigTest, SaveAndLoad) {
    auto config = DetectorConfig::Default();
    config.thresholds.auto_merge = 0.99;
    config.weights.Set(SimilarityFactor::DESCRIPTION, 0.2);
    config.batch.worker_threads = 3;
    config.storage.db_path = "custom.db";

    ASSERT_TRUE(config.SaveToFile(temp_config_path));

    auto loaded_opt = DetectorConfig::LoadFromFile(temp_config_path);
    ASSERT_TRUE(loaded_opt.has_value());

    auto loaded = loaded_opt.value();
    EXPECT_DOUBLE_EQ(0.99, loaded.thresholds.auto_merge);
    EXPECT_DOUBLE_EQ(0.2, loaded.weights.Get(SimilarityFactor::DESCRIPTION));
    EXPECT_EQ(3u, loaded.batch.worker_threads);
    EXPECT_EQ("custom.db", loaded.storage.db_path);
}

TEST_F(DetectorConfigTest, SaveAndLoadKeepsFullPrecision) {
    auto config = DetectorConfig::Default();
    config.tolerance.value_percent = 100.0 / 3.0;
    config.tolerance.date_days = 0.1 + 0.2;
    config.weights.Set(SimilarityFactor::DEAL_NAME, 2.0 / 7.0);

    auto loaded = DetectorConfig::LoadFromString(config.ToYamlString());

    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(config.tolerance.value_percent, loaded->tolerance.value_percent);
    EXPECT_EQ(config.tolerance.date_days, loaded->tolerance.date_days);
    EXPECT_EQ(config.weights, loaded->weights);
    EXPECT_NE(std::string::npos, config.ToYamlString().find("auto_merge: 0.95\n"));
}

TEST_F(DetectorConfigTest, SaveAndLoadEscapesDbPath) {
    auto config = DetectorConfig::Default();
    config.storage.db_path = "C:\\data\\deals \"q1\".db";

    ASSERT_TRUE(config.SaveToFile(temp_config_path));
    auto loaded = DetectorConfig::LoadFromFile(temp_config_path);

    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(config.storage.db_path, loaded->storage.db_path);
}

TEST_F(DetectorConfigTest, NegativeCountFails) {
    EXPECT_FALSE(DetectorConfig::LoadFromString("batch:\n  batch_size: -1\n").has_value());
    EXPECT_FALSE(DetectorConfig::LoadFromString("batch:\n  worker_threads: +2\n").has_value());
    EXPECT_FALSE(DetectorConfig::LoadFromString("storage:\n  candidate_limit: 10k\n").has_value());

    auto config = DetectorConfig::LoadFromString("batch:\n  batch_size: 250\n");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(250u, config->batch.batch_size);
}

TEST_F(DetectorConfigTest, ToYamlStringContainsSections) {
    std::string yaml = DetectorConfig::Default().ToYamlString();

    EXPECT_NE(std::string::npos, yaml.find("thresholds:"));
    EXPECT_NE(std::string::npos, yaml.find("fuzzy:"));
    EXPECT_NE(std::string::npos, yaml.find("tolerance:"));
    EXPECT_NE(std::string::npos, yaml.find("weights:"));
    EXPECT_NE(std::string::npos, yaml.find("deal_name: 0.25"));
    EXPECT_NE(std::string::npos, yaml.find("batch:"));
    EXPECT_NE(std::string::npos, yaml.find("storage:"));
}

TEST_F(DetectorConfigTest, LoadFromMissingFileFails) {
    EXPECT_FALSE(DetectorConfig::LoadFromFile("/nonexistent/dedupe.yaml").has_value());
}

TEST_F(DetectorConfigTest, MalformedYamlFails) {
    EXPECT_FALSE(DetectorConfig::LoadFromString("thresholds: [unclosed").has_value());
}

TEST_F(DetectorConfigTest, NonNumericValueFails) {
    std::string yaml = R"(
thresholds:
  auto_merge: very_high
)";
    EXPECT_FALSE(DetectorConfig::LoadFromString(yaml).has_value());
}

TEST_F(DetectorConfigTest, UnknownWeightFactorFails) {
    std::string yaml = R"(
weights:
  color: 0.5
)";
    EXPECT_FALSE(DetectorConfig::LoadFromString(yaml).has_value());
}

TEST_F(DetectorConfigTest, OutOfRangeThresholdFailsValidation) {
    std::string yaml = R"(
thresholds:
  minimum_match: 1.5
)";
    EXPECT_FALSE(DetectorConfig::LoadFromString(yaml).has_value());
}

TEST_F(DetectorConfigTest, ValidationErrors) {
    auto config = DetectorConfig::Default();
    config.thresholds.auto_merge = 0.80;      // Below high_confidence
    config.fuzzy.high = 120.0;
    config.tolerance.date_days = 0.0;
    config.batch.batch_size = 0;

    auto errors = config.GetValidationErrors();
    EXPECT_FALSE(config.Validate());
    EXPECT_EQ(4u, errors.size());
}

TEST_F(DetectorConfigTest, NegativeWeightInvalid) {
    auto config = DetectorConfig::Default();
    config.weights.Set(SimilarityFactor::PRODUCTS, -0.1);
    EXPECT_FALSE(config.Validate());
}

TEST_F(DetectorConfigTest, AllZeroWeightsInvalid) {
    auto config = DetectorConfig::Default();
    config.weights = FieldWeights{{SimilarityFactor::DEAL_NAME, 0.0}};
    EXPECT_FALSE(config.Validate());
}

TEST_F(DetectorConfigTest, EmptyYamlGivesDefaults) {
    auto config = DetectorConfig::LoadFromString("");
    ASSERT_TRUE(config.has_value());
    EXPECT_DOUBLE_EQ(0.95, config->thresholds.auto_merge);
}
