// File: src/similarity/multi_factor_scorer.hpp
#pragma once

#include "core/types.hpp"
#include "similarity/field_similarity.hpp"

namespace dedupe {

/// Weighted combination of per-field similarities
///
/// Computes a SimilarityFactors map for two deals and reduces it to one
/// overall score:
///
///   overall = sum(factor * weight) / sum(weight)
///
/// taken over the factors that were computed. A factor without a supplied
/// weight contributes nothing to either sum. The description factor is
/// only computed when its weight is positive.
///
/// Example:
///   MultiFactorScorer scorer;
///   SimilarityScore score = scorer.Score(deal_a, deal_b);
///   if (score.overall >= 0.70) { ... }
class MultiFactorScorer {
public:
    /// Configuration for MultiFactorScorer
    struct Config {
        /// Default weights used when Score() is called without weights
        FieldWeights weights = FieldWeights::Default();

        /// Deal value tolerance in percent
        double value_tolerance_percent{kDefaultValueTolerancePercent};

        /// Close date tolerance in days
        double date_tolerance_days{kDefaultDateToleranceDays};
    };

    MultiFactorScorer();
    explicit MultiFactorScorer(const Config& config);

    /// Score two deals with the configured weights
    SimilarityScore Score(const DealRecord& a, const DealRecord& b) const;

    /// Score two deals with explicit weights
    SimilarityScore Score(const DealRecord& a, const DealRecord& b,
                          const FieldWeights& weights) const;

    /// Compute the per-field factors only
    SimilarityFactors ComputeFactors(const DealRecord& a, const DealRecord& b,
                                     bool include_description) const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
};

} // namespace dedupe
