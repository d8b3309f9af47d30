// File: tests/similarity/multi_factor_scorer_test.cpp
#include "similarity/multi_factor_scorer.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

namespace dedupe {
namespace {

class MultiFactorScorerTest : public ::testing::Test {
protected:
    void SetUp() override {
        full_.id = "deal-1";
        full_.deal_name = "Cloud Migration";
        full_.customer_name = "Acme Corp";
        full_.deal_value = 100000.0;
        full_.close_date = Date::FromCivil(2024, 6, 30);
        full_.vendor_id = "vendor-1";
        full_.products = {"Firewall", "VPN"};
        full_.contacts = {{"Jane", std::string("jane@acme.com")}};
        full_.description = "Move on-prem workloads to the cloud";
    }

    DealRecord full_;
    MultiFactorScorer scorer_;
};

TEST_F(MultiFactorScorerTest, IdenticalDealsScoreOne) {
    SimilarityScore score = scorer_.Score(full_, full_);

    EXPECT_NEAR(1.0, score.overall, 1e-9);
    EXPECT_NEAR(1.0, score.weight, 1e-9);
    for (const auto& [factor, value] : score.factors.Data()) {
        EXPECT_DOUBLE_EQ(1.0, value) << ToString(factor);
    }
}

TEST_F(MultiFactorScorerTest, DescriptionSkippedAtZeroWeight) {
    SimilarityScore score = scorer_.Score(full_, full_);

    EXPECT_FALSE(score.factors.Has(SimilarityFactor::DESCRIPTION));
    EXPECT_EQ(7u, score.factors.Size());
}

TEST_F(MultiFactorScorerTest, DescriptionIncludedWithPositiveWeight) {
    FieldWeights weights = FieldWeights::Default();
    weights.Set(SimilarityFactor::DESCRIPTION, 0.10);

    DealRecord other = full_;
    other.description = "Completely different text about printers";

    SimilarityScore with_description = scorer_.Score(full_, other, weights);
    SimilarityScore without = scorer_.Score(full_, other);

    EXPECT_TRUE(with_description.factors.Has(SimilarityFactor::DESCRIPTION));
    EXPECT_NEAR(1.10, with_description.weight, 1e-9);
    EXPECT_LT(with_description.overall, without.overall);
}

TEST_F(MultiFactorScorerTest, MissingWeightsContributeNothing) {
    FieldWeights only_name{{SimilarityFactor::DEAL_NAME, 1.0}};

    DealRecord other = full_;
    other.customer_name = "Totally Different Customer";
    other.deal_value = 5.0;

    SimilarityScore score = scorer_.Score(full_, other, only_name);

    EXPECT_NEAR(1.0, score.overall, 1e-9);
    EXPECT_NEAR(1.0, score.weight, 1e-9);
    // Factors are still reported
    EXPECT_TRUE(score.factors.Has(SimilarityFactor::CUSTOMER_NAME));
}

TEST_F(MultiFactorScorerTest, ZeroTotalWeightScoresZero) {
    FieldWeights none{{SimilarityFactor::DEAL_NAME, 0.0}};
    SimilarityScore score = scorer_.Score(full_, full_, none);

    EXPECT_DOUBLE_EQ(0.0, score.overall);
    EXPECT_DOUBLE_EQ(0.0, score.weight);
}

TEST_F(MultiFactorScorerTest, WeightedAverageOfFactors) {
    DealRecord other = full_;
    other.vendor_id = "vendor-2";   // vendor factor 0
    other.products.clear();          // products factor 0
    other.contacts.clear();          // contacts factor 0

    SimilarityScore score = scorer_.Score(full_, other);

    // name .25 + customer .25 + value .15 + date .10 over total 1.0
    EXPECT_NEAR(0.75, score.overall, 1e-9);
    EXPECT_DOUBLE_EQ(0.0, score.factors.Get(SimilarityFactor::VENDOR_MATCH));
}

TEST_F(MultiFactorScorerTest, EmptyVendorIdsDoNotMatch) {
    DealRecord a = full_;
    DealRecord b = full_;
    a.vendor_id = "";
    b.vendor_id = "";

    EXPECT_DOUBLE_EQ(0.0, scorer_.Score(a, b).factors.Get(SimilarityFactor::VENDOR_MATCH));
}

TEST_F(MultiFactorScorerTest, EmptyDealsScoreZero) {
    DealRecord empty;
    SimilarityScore score = scorer_.Score(empty, empty);

    EXPECT_DOUBLE_EQ(0.0, score.overall);
}

TEST_F(MultiFactorScorerTest, IsSymmetric) {
    DealRecord other = full_;
    other.deal_name = "Cloud Migration Phase 2";
    other.customer_name = "ACME Corporation";
    other.deal_value = 108000.0;
    other.close_date = Date::FromCivil(2024, 7, 4);
    other.products = {"Firewall"};

    EXPECT_DOUBLE_EQ(scorer_.Score(full_, other).overall, scorer_.Score(other, full_).overall);
}

TEST_F(MultiFactorScorerTest, ToleranceFromConfig) {
    MultiFactorScorer::Config strict;
    strict.value_tolerance_percent = 1.0;
    MultiFactorScorer strict_scorer(strict);

    DealRecord other = full_;
    other.deal_value = 105000.0;

    double loose = scorer_.Score(full_, other).factors.Get(SimilarityFactor::DEAL_VALUE);
    double tight = strict_scorer.Score(full_, other).factors.Get(SimilarityFactor::DEAL_VALUE);
    EXPECT_GT(loose, tight);
}

TEST(MultiFactorScorerConfigTest, NegativeToleranceThrows) {
    MultiFactorScorer::Config config;
    config.date_tolerance_days = -1.0;
    EXPECT_THROW(MultiFactorScorer scorer(config), std::invalid_argument);
}

} // namespace
} // namespace dedupe
