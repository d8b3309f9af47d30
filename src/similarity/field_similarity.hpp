// File: src/similarity/field_similarity.hpp
#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace dedupe {

/// Default tolerance for deal value comparison (percent of the mean)
constexpr double kDefaultValueTolerancePercent = 10.0;

/// Default tolerance for date comparison (days)
constexpr double kDefaultDateToleranceDays = 7.0;

/// Fuzzy similarity of two free-text strings on a [0, 100] scale
///
/// Both inputs are normalized first. Equal normalized strings score 100;
/// an empty input (raw or normalized) scores 0. Otherwise the result is the
/// maximum of several scorers, each robust to a different kind of noise:
/// - Indel ratio (typos)
/// - Partial ratio (one string embedded in the other)
/// - Token-sort ratio (word reordering)
/// - Token-set ratio (extra words)
/// - Bigram Dice coefficient x 100
///
/// Taking the maximum favours recall over precision.
/// Symmetric: FuzzyStringSimilarity(a, b) == FuzzyStringSimilarity(b, a)
double FuzzyStringSimilarity(const std::string& a, const std::string& b);

/// Bigram Dice coefficient in [0, 1] (whitespace ignored, bigrams counted
/// with multiplicity)
double DiceCoefficient(const std::string& a, const std::string& b);

/// Deal name similarity in [0, 1]
double DealNameSimilarity(const std::string& a, const std::string& b);

/// Customer name similarity in [0, 1]; legal suffixes are stripped first
double CustomerNameSimilarity(const std::string& a, const std::string& b);

/// Free-text description similarity in [0, 1]
double DescriptionSimilarity(const std::string& a, const std::string& b);

/// Numeric value similarity in [0, 1]
///
/// Missing or zero values score 0; equal values score 1. The percentage
/// difference relative to the mean scales 1.0 -> 0.7 inside the tolerance
/// and 0.7 -> 0.0 up to three times the tolerance.
double ValueSimilarity(std::optional<double> a, std::optional<double> b,
                       double tolerance_percent = kDefaultValueTolerancePercent);

/// Date similarity in [0, 1]
///
/// Same shape as ValueSimilarity, measured in fractional days, with the
/// outer band extending to four times the tolerance.
double DateSimilarity(const std::optional<Date>& a, const std::optional<Date>& b,
                      double tolerance_days = kDefaultDateToleranceDays);

/// Jaccard similarity of two string sets; 0 if either side is empty
double SetSimilarity(const std::vector<std::string>& a, const std::vector<std::string>& b);

/// Jaccard similarity of normalized product names
double ProductSimilarity(const std::vector<std::string>& a, const std::vector<std::string>& b);

/// Jaccard similarity of lowercased contact emails (contacts without an
/// email are ignored)
double ContactSimilarity(const std::vector<ContactRecord>& a, const std::vector<ContactRecord>& b);

} // namespace dedupe
