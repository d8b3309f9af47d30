// File: tests/normalize/normalizer_test.cpp
#include "normalize/normalizer.hpp"
#include <gtest/gtest.h>

namespace dedupe {
namespace {

// ============================================================================
// NormalizeString Tests
// ============================================================================

TEST(NormalizeStringTest, EmptyStaysEmpty) {
    EXPECT_EQ("", NormalizeString(""));
}

TEST(NormalizeStringTest, LowercasesAndTrims) {
    EXPECT_EQ("cloud migration", NormalizeString("  Cloud Migration  "));
}

TEST(NormalizeStringTest, DropsPunctuation) {
    EXPECT_EQ("acme corp", NormalizeString("Acme Corp."));
    EXPECT_EQ("ab testing", NormalizeString("A/B Testing!"));
    EXPECT_EQ("snake_case", NormalizeString("snake_case"));
}

TEST(NormalizeStringTest, CollapsesWhitespaceRuns) {
    EXPECT_EQ("a b c", NormalizeString("a \t b\n\nc"));
    EXPECT_EQ("acme inc", NormalizeString("Acme , Inc"));
}

TEST(NormalizeStringTest, PunctuationOnlyBecomesEmpty) {
    EXPECT_EQ("", NormalizeString("...!?"));
}

TEST(NormalizeStringTest, IsIdempotent) {
    for (const char* input : {"Hello, World", "  X-Ray  Systems ", "ABC123"}) {
        std::string once = NormalizeString(input);
        EXPECT_EQ(once, NormalizeString(once)) << input;
    }
}

// ============================================================================
// NormalizeCompanyName Tests
// ============================================================================

TEST(NormalizeCompanyNameTest, StripsLegalSuffixes) {
    EXPECT_EQ("acme", NormalizeCompanyName("Acme Inc"));
    EXPECT_EQ("acme", NormalizeCompanyName("Acme Inc."));
    EXPECT_EQ("acme", NormalizeCompanyName("ACME Corporation"));
    EXPECT_EQ("acme", NormalizeCompanyName("Acme, LLC"));
    EXPECT_EQ("globex", NormalizeCompanyName("Globex Limited"));
}

TEST(NormalizeCompanyNameTest, StripsRepeatedSuffixes) {
    EXPECT_EQ("acme", NormalizeCompanyName("Acme Co Ltd"));
    EXPECT_EQ("initech", NormalizeCompanyName("Initech Company Inc"));
}

TEST(NormalizeCompanyNameTest, RequiresWordBoundary) {
    // "co" inside a word is not a suffix
    EXPECT_EQ("cisco", NormalizeCompanyName("Cisco"));
    EXPECT_EQ("frisco", NormalizeCompanyName("Frisco"));
}

TEST(NormalizeCompanyNameTest, SuffixOnlyBecomesEmpty) {
    EXPECT_EQ("", NormalizeCompanyName("Inc"));
}

TEST(NormalizeCompanyNameTest, EquivalentSpellingsAgree) {
    EXPECT_EQ(NormalizeCompanyName("Acme Corp"), NormalizeCompanyName("ACME corporation"));
}

} // namespace
} // namespace dedupe
