// File: src/detection/match_strategy.cpp
#include "detection/match_strategy.hpp"
#include "normalize/normalizer.hpp"
#include "similarity/field_similarity.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace dedupe {

namespace {

// Customer + value/date strategies require both similarities at this level
constexpr double kCustomerPairThreshold = 0.85;

// Vendor + customer strategy
constexpr double kVendorCustomerThreshold = 0.80;
constexpr double kVendorBonus = 0.3;

MatchCandidate MakeMatch(const DealRecord& existing,
                         double confidence,
                         Strategy strategy,
                         SimilarityFactors factors,
                         std::string reasoning) {
    MatchCandidate match;
    match.matched_entity_id = *existing.id;
    match.matched_entity = existing;
    match.similarity_score = confidence;
    match.confidence = confidence;
    match.strategy = strategy;
    match.factors = std::move(factors);
    match.reasoning = std::move(reasoning);
    return match;
}

std::string Percent(double fraction) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << fraction * 100.0;
    return oss.str();
}

// $1,234,567.5
std::string FormatMoney(double value) {
    std::ostringstream raw;
    raw << std::fixed << std::setprecision(2) << std::abs(value);
    std::string digits = raw.str();

    std::string fraction;
    size_t dot = digits.find('.');
    if (dot != std::string::npos) {
        fraction = digits.substr(dot + 1);
        digits = digits.substr(0, dot);
        while (!fraction.empty() && fraction.back() == '0') {
            fraction.pop_back();
        }
    }

    std::string grouped;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) {
            grouped.insert(grouped.begin(), ',');
        }
        grouped.insert(grouped.begin(), *it);
        ++count;
    }

    std::string result = value < 0 ? "-$" : "$";
    result += grouped;
    if (!fraction.empty()) {
        result += "." + fraction;
    }
    return result;
}

} // namespace

// ============================================================================
// ExactMatchStrategy
// ============================================================================

std::vector<MatchCandidate> ExactMatchStrategy::FindMatches(
        const DealRecord& entity,
        const std::vector<DealRecord>& candidates) const {
    std::vector<MatchCandidate> matches;

    const std::string norm_deal_name = NormalizeString(entity.deal_name);
    const std::string norm_customer = NormalizeCompanyName(entity.customer_name);

    for (const auto& existing : candidates) {
        if (!existing.HasId()) {
            continue;
        }

        if (NormalizeString(existing.deal_name) != norm_deal_name ||
            NormalizeCompanyName(existing.customer_name) != norm_customer) {
            continue;
        }

        // Allow a one-unit rounding difference; a missing value does not block
        if (entity.HasValue() && existing.HasValue() &&
            std::abs(*entity.deal_value - *existing.deal_value) >= 1.0) {
            continue;
        }

        matches.push_back(MakeMatch(
            existing, 1.0, GetStrategy(),
            SimilarityFactors{
                {SimilarityFactor::DEAL_NAME, 1.0},
                {SimilarityFactor::CUSTOMER_NAME, 1.0},
                {SimilarityFactor::DEAL_VALUE, 1.0},
            },
            "Exact match on deal name and customer name"));
    }

    return matches;
}

// ============================================================================
// FuzzyNameStrategy
// ============================================================================

FuzzyNameStrategy::FuzzyNameStrategy(double medium_threshold, double high_threshold)
    : medium_threshold_(medium_threshold), high_threshold_(high_threshold) {
    if (medium_threshold_ < 0.0 || high_threshold_ > 100.0) {
        throw std::invalid_argument("fuzzy thresholds must be in range [0, 100]");
    }
}

std::vector<MatchCandidate> FuzzyNameStrategy::FindMatches(
        const DealRecord& entity,
        const std::vector<DealRecord>& candidates) const {
    std::vector<MatchCandidate> matches;

    for (const auto& existing : candidates) {
        if (!existing.HasId()) {
            continue;
        }

        double deal_name_score = FuzzyStringSimilarity(entity.deal_name, existing.deal_name);
        double customer_score = FuzzyStringSimilarity(entity.customer_name, existing.customer_name);
        double average = (deal_name_score + customer_score) / 2.0;

        // Both names at least "medium", and high on average
        if (deal_name_score < medium_threshold_ ||
            customer_score < medium_threshold_ ||
            average < high_threshold_) {
            continue;
        }

        std::ostringstream reason;
        reason << std::fixed << std::setprecision(1)
               << "Fuzzy match: deal name " << deal_name_score
               << "%, customer " << customer_score << "%";

        matches.push_back(MakeMatch(
            existing,
            average / 100.0,
            GetStrategy(),
            SimilarityFactors{
                {SimilarityFactor::DEAL_NAME, deal_name_score / 100.0},
                {SimilarityFactor::CUSTOMER_NAME, customer_score / 100.0},
            },
            reason.str()));
    }

    return matches;
}

// ============================================================================
// CustomerValueStrategy
// ============================================================================

CustomerValueStrategy::CustomerValueStrategy(double value_tolerance_percent)
    : value_tolerance_percent_(value_tolerance_percent) {
}

std::vector<MatchCandidate> CustomerValueStrategy::FindMatches(
        const DealRecord& entity,
        const std::vector<DealRecord>& candidates) const {
    std::vector<MatchCandidate> matches;

    if (!entity.HasValue()) {
        return matches;
    }

    for (const auto& existing : candidates) {
        if (!existing.HasId() || !existing.HasValue()) {
            continue;
        }

        double customer_sim = CustomerNameSimilarity(entity.customer_name, existing.customer_name);
        double value_sim = ValueSimilarity(entity.deal_value, existing.deal_value,
                                           value_tolerance_percent_);

        if (customer_sim < kCustomerPairThreshold || value_sim < kCustomerPairThreshold) {
            continue;
        }

        std::string reason = "Same customer (" + Percent(customer_sim) +
            "%) with similar deal value (" + FormatMoney(*entity.deal_value) +
            " vs " + FormatMoney(*existing.deal_value) + ")";

        matches.push_back(MakeMatch(
            existing,
            customer_sim * 0.6 + value_sim * 0.4,
            GetStrategy(),
            SimilarityFactors{
                {SimilarityFactor::CUSTOMER_NAME, customer_sim},
                {SimilarityFactor::DEAL_VALUE, value_sim},
            },
            reason));
    }

    return matches;
}

// ============================================================================
// CustomerDateStrategy
// ============================================================================

CustomerDateStrategy::CustomerDateStrategy(double date_tolerance_days)
    : date_tolerance_days_(date_tolerance_days) {
}

std::vector<MatchCandidate> CustomerDateStrategy::FindMatches(
        const DealRecord& entity,
        const std::vector<DealRecord>& candidates) const {
    std::vector<MatchCandidate> matches;

    if (!entity.close_date) {
        return matches;
    }

    for (const auto& existing : candidates) {
        if (!existing.HasId() || !existing.close_date) {
            continue;
        }

        double customer_sim = CustomerNameSimilarity(entity.customer_name, existing.customer_name);
        double date_sim = DateSimilarity(entity.close_date, existing.close_date,
                                         date_tolerance_days_);

        if (customer_sim < kCustomerPairThreshold || date_sim < kCustomerPairThreshold) {
            continue;
        }

        std::string reason = "Same customer (" + Percent(customer_sim) +
            "%) with similar close date (" + entity.close_date->ToString() +
            " vs " + existing.close_date->ToString() + ")";

        matches.push_back(MakeMatch(
            existing,
            customer_sim * 0.6 + date_sim * 0.4,
            GetStrategy(),
            SimilarityFactors{
                {SimilarityFactor::CUSTOMER_NAME, customer_sim},
                {SimilarityFactor::CLOSE_DATE, date_sim},
            },
            reason));
    }

    return matches;
}

// ============================================================================
// VendorCustomerStrategy
// ============================================================================

std::vector<MatchCandidate> VendorCustomerStrategy::FindMatches(
        const DealRecord& entity,
        const std::vector<DealRecord>& candidates) const {
    std::vector<MatchCandidate> matches;

    if (!entity.HasVendor()) {
        return matches;
    }

    for (const auto& existing : candidates) {
        if (!existing.HasId() || !existing.HasVendor() || *existing.vendor_id != *entity.vendor_id) {
            continue;
        }

        double customer_sim = CustomerNameSimilarity(entity.customer_name, existing.customer_name);
        if (customer_sim < kVendorCustomerThreshold) {
            continue;
        }

        double deal_name_sim = DealNameSimilarity(entity.deal_name, existing.deal_name);
        double confidence = std::min(1.0, kVendorBonus + customer_sim * 0.5 + deal_name_sim * 0.2);

        matches.push_back(MakeMatch(
            existing,
            confidence,
            GetStrategy(),
            SimilarityFactors{
                {SimilarityFactor::VENDOR_MATCH, 1.0},
                {SimilarityFactor::CUSTOMER_NAME, customer_sim},
                {SimilarityFactor::DEAL_NAME, deal_name_sim},
            },
            "Same vendor with similar customer (" + Percent(customer_sim) + "%)"));
    }

    return matches;
}

// ============================================================================
// MultiFactorStrategy
// ============================================================================

MultiFactorStrategy::MultiFactorStrategy(MultiFactorScorer scorer, double min_overall)
    : scorer_(std::move(scorer)), min_overall_(min_overall) {
    if (min_overall_ < 0.0 || min_overall_ > 1.0) {
        throw std::invalid_argument("min_overall must be in range [0.0, 1.0]");
    }
}

std::vector<MatchCandidate> MultiFactorStrategy::FindMatches(
        const DealRecord& entity,
        const std::vector<DealRecord>& candidates) const {
    std::vector<MatchCandidate> matches;

    for (const auto& existing : candidates) {
        if (!existing.HasId()) {
            continue;
        }

        SimilarityScore score = scorer_.Score(entity, existing);
        if (score.overall < min_overall_) {
            continue;
        }

        matches.push_back(MakeMatch(
            existing,
            score.overall,
            GetStrategy(),
            score.factors,
            "Multi-factor match with " + Percent(score.overall) + "% overall similarity"));
    }

    return matches;
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<MatchStrategy> CreateStrategy(Strategy strategy, const DetectorConfig& config) {
    switch (strategy) {
        case Strategy::EXACT_MATCH:
            return std::make_unique<ExactMatchStrategy>();
        case Strategy::FUZZY_NAME:
            return std::make_unique<FuzzyNameStrategy>(config.fuzzy.medium, config.fuzzy.high);
        case Strategy::CUSTOMER_VALUE:
            return std::make_unique<CustomerValueStrategy>(config.tolerance.value_percent);
        case Strategy::CUSTOMER_DATE:
            return std::make_unique<CustomerDateStrategy>(config.tolerance.date_days);
        case Strategy::VENDOR_CUSTOMER:
            return std::make_unique<VendorCustomerStrategy>();
        case Strategy::MULTI_FACTOR: {
            MultiFactorScorer::Config scorer_config;
            scorer_config.weights = config.weights;
            scorer_config.value_tolerance_percent = config.tolerance.value_percent;
            scorer_config.date_tolerance_days = config.tolerance.date_days;
            return std::make_unique<MultiFactorStrategy>(
                MultiFactorScorer(scorer_config), config.thresholds.medium_confidence);
        }
    }
    throw std::invalid_argument("Unknown strategy");
}

} // namespace dedupe
