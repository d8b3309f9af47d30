// File: tests/similarity/field_similarity_test.cpp
#include "similarity/field_similarity.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <utility>
#include <vector>

namespace dedupe {
namespace {

// ============================================================================
// Fuzzy String Similarity Tests
// ============================================================================

TEST(FuzzyStringSimilarityTest, EmptyInputsScoreZero) {
    EXPECT_DOUBLE_EQ(0.0, FuzzyStringSimilarity("", "anything"));
    EXPECT_DOUBLE_EQ(0.0, FuzzyStringSimilarity("anything", ""));
    EXPECT_DOUBLE_EQ(0.0, FuzzyStringSimilarity("", ""));
}

TEST(FuzzyStringSimilarityTest, PunctuationOnlyScoresZero) {
    EXPECT_DOUBLE_EQ(0.0, FuzzyStringSimilarity("!!!", "???"));
}

TEST(FuzzyStringSimilarityTest, EqualAfterNormalizationScoresHundred) {
    EXPECT_DOUBLE_EQ(100.0, FuzzyStringSimilarity("Cloud Migration", "cloud migration!"));
}

TEST(FuzzyStringSimilarityTest, WordOrderDoesNotMatter) {
    EXPECT_DOUBLE_EQ(100.0, FuzzyStringSimilarity("migration cloud", "cloud migration"));
}

TEST(FuzzyStringSimilarityTest, SubstringScoresHigh) {
    EXPECT_GE(FuzzyStringSimilarity("Cloud Migration", "Cloud Migration Phase 2"), 90.0);
}

TEST(FuzzyStringSimilarityTest, UnrelatedScoresLow) {
    EXPECT_LT(FuzzyStringSimilarity("Cloud Migration", "Zzyzx"), 50.0);
}

TEST(FuzzyStringSimilarityTest, IsSymmetricAndBounded) {
    const std::vector<std::pair<std::string, std::string>> pairs = {
        {"Acme Corp", "ACME Corporation"},
        {"Data Center Refresh", "Datacenter refresh 2024"},
        {"a", "ab"},
        {"Network Upgrade", "Upgrade of the network"},
    };

    for (const auto& [a, b] : pairs) {
        double ab = FuzzyStringSimilarity(a, b);
        double ba = FuzzyStringSimilarity(b, a);
        EXPECT_DOUBLE_EQ(ab, ba) << a << " / " << b;
        EXPECT_GE(ab, 0.0);
        EXPECT_LE(ab, 100.0);
    }
}

// ============================================================================
// Dice Coefficient Tests
// ============================================================================

TEST(DiceCoefficientTest, IdenticalIsOne) {
    EXPECT_DOUBLE_EQ(1.0, DiceCoefficient("night", "night"));
}

TEST(DiceCoefficientTest, KnownValue) {
    // night: ni ig gh ht / nacht: na ac ch ht -> one shared bigram
    EXPECT_DOUBLE_EQ(0.25, DiceCoefficient("night", "nacht"));
}

TEST(DiceCoefficientTest, IgnoresWhitespace) {
    EXPECT_DOUBLE_EQ(1.0, DiceCoefficient("data center", "datacenter"));
}

TEST(DiceCoefficientTest, ShortStringsScoreZero) {
    EXPECT_DOUBLE_EQ(0.0, DiceCoefficient("a", "b"));
}

// ============================================================================
// Name Similarity Tests
// ============================================================================

TEST(CustomerNameSimilarityTest, LegalSuffixesIgnored) {
    EXPECT_DOUBLE_EQ(1.0, CustomerNameSimilarity("Acme Corp", "ACME Corporation"));
    EXPECT_DOUBLE_EQ(1.0, CustomerNameSimilarity("Acme, Inc.", "acme llc"));
}

TEST(CustomerNameSimilarityTest, EmptyIsZero) {
    EXPECT_DOUBLE_EQ(0.0, CustomerNameSimilarity("", "Acme"));
}

TEST(DealNameSimilarityTest, ScaledToUnitRange) {
    EXPECT_DOUBLE_EQ(1.0, DealNameSimilarity("Cloud Migration", "cloud migration"));
    EXPECT_DOUBLE_EQ(0.0, DealNameSimilarity("", "cloud migration"));
}

// ============================================================================
// Value Similarity Tests
// ============================================================================

TEST(ValueSimilarityTest, EqualValuesScoreOne) {
    EXPECT_DOUBLE_EQ(1.0, ValueSimilarity(100000.0, 100000.0, 10.0));
}

TEST(ValueSimilarityTest, MissingOrZeroScoresZero) {
    EXPECT_DOUBLE_EQ(0.0, ValueSimilarity(std::nullopt, 100.0, 10.0));
    EXPECT_DOUBLE_EQ(0.0, ValueSimilarity(100.0, std::nullopt, 10.0));
    EXPECT_DOUBLE_EQ(0.0, ValueSimilarity(0.0, 100.0, 10.0));
}

TEST(ValueSimilarityTest, NonFiniteScoresZero) {
    EXPECT_DOUBLE_EQ(0.0, ValueSimilarity(std::numeric_limits<double>::infinity(), 100.0, 10.0));
    EXPECT_DOUBLE_EQ(0.0, ValueSimilarity(std::nan(""), 100.0, 10.0));
}

TEST(ValueSimilarityTest, WithinToleranceScoresHigh) {
    // 5 / 102.5 = 4.88% -> 1 - 0.488 * 0.3
    double score = ValueSimilarity(100.0, 105.0, 10.0);
    EXPECT_GT(score, 0.7);
    EXPECT_NEAR(1.0 - (5.0 / 102.5 * 100.0 / 10.0) * 0.3, score, 1e-9);
}

TEST(ValueSimilarityTest, BeyondThreeTolerancesScoresZero) {
    // 150 / 175 = 85.7%
    EXPECT_DOUBLE_EQ(0.0, ValueSimilarity(100.0, 250.0, 10.0));
}

TEST(ValueSimilarityTest, BetweenToleranceBandsDecaysLinearly) {
    // 20 / 110 = 18.18%
    double score = ValueSimilarity(100.0, 120.0, 10.0);
    double diff = 20.0 / 110.0 * 100.0;
    EXPECT_NEAR(0.7 - ((diff - 10.0) / 20.0) * 0.7, score, 1e-9);
    EXPECT_LT(score, 0.7);
    EXPECT_GT(score, 0.0);
}

TEST(ValueSimilarityTest, IsSymmetric) {
    EXPECT_DOUBLE_EQ(ValueSimilarity(100.0, 117.0, 10.0), ValueSimilarity(117.0, 100.0, 10.0));
}

// ============================================================================
// Date Similarity Tests
// ============================================================================

TEST(DateSimilarityTest, SameDateScoresOne) {
    Date date = Date::FromCivil(2024, 6, 30);
    EXPECT_DOUBLE_EQ(1.0, DateSimilarity(date, date, 7.0));
}

TEST(DateSimilarityTest, MissingScoresZero) {
    EXPECT_DOUBLE_EQ(0.0, DateSimilarity(std::nullopt, Date::FromCivil(2024, 6, 30), 7.0));
}

TEST(DateSimilarityTest, ToleranceBands) {
    Date base = Date::FromCivil(2024, 6, 1);

    // 7 days: edge of the inner band
    EXPECT_NEAR(0.7, DateSimilarity(base, Date::FromCivil(2024, 6, 8), 7.0), 1e-9);

    // 14 days: a third of the way through 7..28
    EXPECT_NEAR(0.7 - (7.0 / 21.0) * 0.7,
                DateSimilarity(base, Date::FromCivil(2024, 6, 15), 7.0), 1e-9);

    // 30 days: beyond four tolerances
    EXPECT_DOUBLE_EQ(0.0, DateSimilarity(base, Date::FromCivil(2024, 7, 1), 7.0));
}

// ============================================================================
// Set Similarity Tests
// ============================================================================

TEST(SetSimilarityTest, Jaccard) {
    EXPECT_NEAR(2.0 / 3.0, SetSimilarity({"a", "b", "c"}, {"a", "b"}), 1e-9);
}

TEST(SetSimilarityTest, EmptyScoresZero) {
    EXPECT_DOUBLE_EQ(0.0, SetSimilarity({}, {"a"}));
    EXPECT_DOUBLE_EQ(0.0, SetSimilarity({}, {}));
}

TEST(SetSimilarityTest, DuplicatesCollapse) {
    EXPECT_DOUBLE_EQ(1.0, SetSimilarity({"a", "a"}, {"a"}));
}

TEST(ProductSimilarityTest, NormalizesNames) {
    EXPECT_DOUBLE_EQ(1.0, ProductSimilarity({"Firewall Pro!", "VPN"}, {"vpn", "firewall pro"}));
}

TEST(ContactSimilarityTest, ComparesEmailsCaseInsensitively) {
    std::vector<ContactRecord> a = {
        {"Jane", std::string("jane@acme.com")},
        {"Bob", std::string("bob@acme.com")},
    };
    std::vector<ContactRecord> b = {
        {"J. Doe", std::string("JANE@ACME.COM")},
        {"Amy", std::string("amy@acme.com")},
        {"No Mail", std::nullopt},
    };

    // {jane, bob} vs {jane, amy}
    EXPECT_NEAR(1.0 / 3.0, ContactSimilarity(a, b), 1e-9);
}

TEST(ContactSimilarityTest, NoEmailsScoresZero) {
    std::vector<ContactRecord> a = {{"Jane", std::nullopt}};
    EXPECT_DOUBLE_EQ(0.0, ContactSimilarity(a, a));
}

} // namespace
} // namespace dedupe
