// File: src/detection/match_aggregator.hpp
#pragma once

#include "config/detector_config.hpp"
#include "core/types.hpp"
#include <vector>

namespace dedupe {

/// MatchAggregator - Reconciles matches from several strategies into one
/// ranked DetectionResult and maps the top confidence to an action.
class MatchAggregator {
public:
    /// Decision thresholds
    struct Config {
        /// auto_merge at or above this confidence
        double auto_merge_threshold{0.95};

        /// manual_review at or above this confidence
        double high_confidence_threshold{0.85};
    };

    MatchAggregator();
    explicit MatchAggregator(const Config& config);

    /// Build from the engine configuration
    static MatchAggregator FromDetectorConfig(const DetectorConfig& config);

    /// Keep the highest-confidence match per matched id
    ///
    /// Ties keep the match seen first; ids keep first-seen order.
    static std::vector<MatchCandidate> MergeByEntity(const std::vector<MatchCandidate>& matches);

    /// Merge, filter to confidence >= threshold, sort descending (stable)
    /// and decide the suggested action
    DetectionResult Aggregate(const std::vector<MatchCandidate>& matches, double threshold) const;

    /// Map a confidence to an action
    SuggestedAction DecideAction(double max_confidence) const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
};

} // namespace dedupe
