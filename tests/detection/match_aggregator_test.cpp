// File: tests/detection/match_aggregator_test.cpp
#include "detection/match_aggregator.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

namespace dedupe {
namespace {

MatchCandidate MakeMatch(const std::string& id, double confidence, Strategy strategy) {
    MatchCandidate match;
    match.matched_entity_id = id;
    match.matched_entity.id = id;
    match.confidence = confidence;
    match.similarity_score = confidence;
    match.strategy = strategy;
    return match;
}

class MatchAggregatorTest : public ::testing::Test {
protected:
    MatchAggregator aggregator_;
};

TEST_F(MatchAggregatorTest, KeepsHighestConfidencePerEntity) {
    std::vector<MatchCandidate> matches = {
        MakeMatch("X", 0.80, Strategy::FUZZY_NAME),
        MakeMatch("X", 0.92, Strategy::MULTI_FACTOR),
    };

    DetectionResult result = aggregator_.Aggregate(matches, 0.0);

    ASSERT_EQ(1u, result.matches.size());
    EXPECT_DOUBLE_EQ(0.92, result.matches[0].confidence);
    EXPECT_EQ(Strategy::MULTI_FACTOR, result.matches[0].strategy);
}

TEST_F(MatchAggregatorTest, TieKeepsFirstSeen) {
    std::vector<MatchCandidate> matches = {
        MakeMatch("X", 0.90, Strategy::CUSTOMER_VALUE),
        MakeMatch("X", 0.90, Strategy::MULTI_FACTOR),
    };

    auto merged = MatchAggregator::MergeByEntity(matches);

    ASSERT_EQ(1u, merged.size());
    EXPECT_EQ(Strategy::CUSTOMER_VALUE, merged[0].strategy);
}

TEST_F(MatchAggregatorTest, FiltersAndSortsDescending) {
    std::vector<MatchCandidate> matches = {
        MakeMatch("A", 0.86, Strategy::MULTI_FACTOR),
        MakeMatch("B", 0.99, Strategy::EXACT_MATCH),
        MakeMatch("C", 0.40, Strategy::MULTI_FACTOR),
        MakeMatch("D", 0.90, Strategy::FUZZY_NAME),
    };

    DetectionResult result = aggregator_.Aggregate(matches, 0.85);

    ASSERT_EQ(3u, result.matches.size());
    EXPECT_EQ("B", result.matches[0].matched_entity_id);
    EXPECT_EQ("D", result.matches[1].matched_entity_id);
    EXPECT_EQ("A", result.matches[2].matched_entity_id);
    EXPECT_TRUE(result.is_duplicate);
    EXPECT_DOUBLE_EQ(0.99, result.confidence);
}

TEST_F(MatchAggregatorTest, ThresholdIsInclusive) {
    DetectionResult result = aggregator_.Aggregate({MakeMatch("A", 0.85, Strategy::MULTI_FACTOR)}, 0.85);
    EXPECT_EQ(1u, result.matches.size());
}

TEST_F(MatchAggregatorTest, NothingAboveThreshold) {
    DetectionResult result = aggregator_.Aggregate({MakeMatch("A", 0.60, Strategy::MULTI_FACTOR)}, 0.85);

    EXPECT_FALSE(result.is_duplicate);
    EXPECT_TRUE(result.matches.empty());
    EXPECT_DOUBLE_EQ(0.0, result.confidence);
    EXPECT_EQ(SuggestedAction::NO_ACTION, result.suggested_action);
}

TEST_F(MatchAggregatorTest, DecisionThresholds) {
    EXPECT_EQ(SuggestedAction::AUTO_MERGE, aggregator_.DecideAction(0.96));
    EXPECT_EQ(SuggestedAction::AUTO_MERGE, aggregator_.DecideAction(0.95));
    EXPECT_EQ(SuggestedAction::MANUAL_REVIEW, aggregator_.DecideAction(0.88));
    EXPECT_EQ(SuggestedAction::MANUAL_REVIEW, aggregator_.DecideAction(0.85));
    EXPECT_EQ(SuggestedAction::NO_ACTION, aggregator_.DecideAction(0.60));
}

TEST_F(MatchAggregatorTest, LowThresholdReportsNoActionMatches) {
    DetectionResult result = aggregator_.Aggregate({MakeMatch("A", 0.60, Strategy::MULTI_FACTOR)}, 0.5);

    EXPECT_TRUE(result.is_duplicate);
    EXPECT_EQ(SuggestedAction::NO_ACTION, result.suggested_action);
}

TEST(MatchAggregatorConfigTest, FromDetectorConfig) {
    DetectorConfig config = DetectorConfig::Default();
    config.thresholds.auto_merge = 0.99;
    config.thresholds.high_confidence = 0.90;

    MatchAggregator aggregator = MatchAggregator::FromDetectorConfig(config);

    EXPECT_EQ(SuggestedAction::MANUAL_REVIEW, aggregator.DecideAction(0.96));
    EXPECT_EQ(SuggestedAction::NO_ACTION, aggregator.DecideAction(0.88));
}

TEST(MatchAggregatorConfigTest, InvertedThresholdsThrow) {
    MatchAggregator::Config config;
    config.auto_merge_threshold = 0.80;
    config.high_confidence_threshold = 0.90;
    EXPECT_THROW(MatchAggregator aggregator(config), std::invalid_argument);
}

} // namespace
} // namespace dedupe
