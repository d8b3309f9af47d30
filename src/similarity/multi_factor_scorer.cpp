// File: src/similarity/multi_factor_scorer.cpp
#include "similarity/multi_factor_scorer.hpp"
#include <algorithm>
#include <stdexcept>

namespace dedupe {

MultiFactorScorer::MultiFactorScorer()
    : MultiFactorScorer(Config{}) {
}

MultiFactorScorer::MultiFactorScorer(const Config& config)
    : config_(config) {
    if (config_.value_tolerance_percent < 0.0) {
        throw std::invalid_argument("value_tolerance_percent must be non-negative");
    }
    if (config_.date_tolerance_days < 0.0) {
        throw std::invalid_argument("date_tolerance_days must be non-negative");
    }
}

SimilarityFactors MultiFactorScorer::ComputeFactors(
        const DealRecord& a,
        const DealRecord& b,
        bool include_description) const {
    SimilarityFactors factors;

    factors.Set(SimilarityFactor::DEAL_NAME, DealNameSimilarity(a.deal_name, b.deal_name));
    factors.Set(SimilarityFactor::CUSTOMER_NAME,
                CustomerNameSimilarity(a.customer_name, b.customer_name));

    bool same_vendor = a.HasVendor() && b.HasVendor() && *a.vendor_id == *b.vendor_id;
    factors.Set(SimilarityFactor::VENDOR_MATCH, same_vendor ? 1.0 : 0.0);

    factors.Set(SimilarityFactor::DEAL_VALUE,
                ValueSimilarity(a.deal_value, b.deal_value, config_.value_tolerance_percent));
    factors.Set(SimilarityFactor::CLOSE_DATE,
                DateSimilarity(a.close_date, b.close_date, config_.date_tolerance_days));
    factors.Set(SimilarityFactor::PRODUCTS, ProductSimilarity(a.products, b.products));
    factors.Set(SimilarityFactor::CONTACTS, ContactSimilarity(a.contacts, b.contacts));

    if (include_description) {
        factors.Set(SimilarityFactor::DESCRIPTION,
                    DescriptionSimilarity(a.description, b.description));
    }

    return factors;
}

SimilarityScore MultiFactorScorer::Score(const DealRecord& a, const DealRecord& b) const {
    return Score(a, b, config_.weights);
}

SimilarityScore MultiFactorScorer::Score(
        const DealRecord& a,
        const DealRecord& b,
        const FieldWeights& weights) const {
    SimilarityScore result;
    result.factors = ComputeFactors(a, b, weights.Get(SimilarityFactor::DESCRIPTION) > 0.0);

    double weighted_sum = 0.0;
    double total_weight = 0.0;

    for (const auto& [factor, value] : result.factors.Data()) {
        double weight = weights.Get(factor);  // 0 when not supplied
        weighted_sum += value * weight;
        total_weight += weight;
    }

    result.weight = total_weight;
    result.overall = total_weight > 0.0
        ? std::clamp(weighted_sum / total_weight, 0.0, 1.0)
        : 0.0;

    return result;
}

} // namespace dedupe
