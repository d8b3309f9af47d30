// File: src/detection/match_strategy.hpp
#pragma once

#include "config/detector_config.hpp"
#include "core/types.hpp"
#include "similarity/multi_factor_scorer.hpp"
#include <memory>
#include <string>
#include <vector>

namespace dedupe {

/// Abstract base class for duplicate matching strategies
///
/// A strategy is a pure function from (new deal, candidate pool) to the
/// candidates it believes are duplicates, each with a strategy-specific
/// confidence in [0, 1], the similarity factors it used and a short
/// human-readable reasoning. Candidates without an id are never matched.
///
/// Strategies hold only immutable configuration and may be shared across
/// threads.
class MatchStrategy {
public:
    virtual ~MatchStrategy() = default;

    /// Find candidates that this strategy considers duplicates of entity
    /// @param entity The new deal
    /// @param candidates Pool of existing deals (entity itself excluded)
    /// @return Matches in pool order
    virtual std::vector<MatchCandidate> FindMatches(
        const DealRecord& entity,
        const std::vector<DealRecord>& candidates) const = 0;

    /// Strategy tag carried by every produced match
    virtual Strategy GetStrategy() const = 0;

    /// Human-readable strategy name
    std::string GetName() const { return ToString(GetStrategy()); }
};

/// Normalized deal name and company-normalized customer name are equal;
/// when both deals carry a value they differ by less than one unit.
/// Confidence: 1.0
class ExactMatchStrategy : public MatchStrategy {
public:
    std::vector<MatchCandidate> FindMatches(
        const DealRecord& entity,
        const std::vector<DealRecord>& candidates) const override;

    Strategy GetStrategy() const override { return Strategy::EXACT_MATCH; }
};

/// Fuzzy deal and customer name scores (0-100) both at least the medium
/// fuzzy threshold and averaging at least the high fuzzy threshold.
/// Confidence: average / 100
class FuzzyNameStrategy : public MatchStrategy {
public:
    FuzzyNameStrategy(double medium_threshold, double high_threshold);

    std::vector<MatchCandidate> FindMatches(
        const DealRecord& entity,
        const std::vector<DealRecord>& candidates) const override;

    Strategy GetStrategy() const override { return Strategy::FUZZY_NAME; }

private:
    double medium_threshold_;
    double high_threshold_;
};

/// Both deals carry a value; customer and value similarity both >= 0.85.
/// Confidence: 0.6 * customer + 0.4 * value
class CustomerValueStrategy : public MatchStrategy {
public:
    explicit CustomerValueStrategy(double value_tolerance_percent);

    std::vector<MatchCandidate> FindMatches(
        const DealRecord& entity,
        const std::vector<DealRecord>& candidates) const override;

    Strategy GetStrategy() const override { return Strategy::CUSTOMER_VALUE; }

private:
    double value_tolerance_percent_;
};

/// Both deals carry a close date; customer and date similarity both >= 0.85.
/// Confidence: 0.6 * customer + 0.4 * date
class CustomerDateStrategy : public MatchStrategy {
public:
    explicit CustomerDateStrategy(double date_tolerance_days);

    std::vector<MatchCandidate> FindMatches(
        const DealRecord& entity,
        const std::vector<DealRecord>& candidates) const override;

    Strategy GetStrategy() const override { return Strategy::CUSTOMER_DATE; }

private:
    double date_tolerance_days_;
};

/// Same non-empty vendor id and customer similarity >= 0.80.
/// Confidence: min(1, 0.3 + 0.5 * customer + 0.2 * deal name)
class VendorCustomerStrategy : public MatchStrategy {
public:
    std::vector<MatchCandidate> FindMatches(
        const DealRecord& entity,
        const std::vector<DealRecord>& candidates) const override;

    Strategy GetStrategy() const override { return Strategy::VENDOR_CUSTOMER; }
};

/// Weighted multi-factor score at or above the medium confidence threshold.
/// Confidence: the overall score
class MultiFactorStrategy : public MatchStrategy {
public:
    MultiFactorStrategy(MultiFactorScorer scorer, double min_overall);

    std::vector<MatchCandidate> FindMatches(
        const DealRecord& entity,
        const std::vector<DealRecord>& candidates) const override;

    Strategy GetStrategy() const override { return Strategy::MULTI_FACTOR; }

private:
    MultiFactorScorer scorer_;
    double min_overall_;
};

/// Create the strategy for a tag, parameterized from config
std::unique_ptr<MatchStrategy> CreateStrategy(Strategy strategy, const DetectorConfig& config);

} // namespace dedupe
