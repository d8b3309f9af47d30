// File: src/detection/duplicate_detector.hpp
#pragma once

#include "config/detector_config.hpp"
#include "core/types.hpp"
#include "detection/match_aggregator.hpp"
#include "detection/match_strategy.hpp"
#include "similarity/multi_factor_scorer.hpp"
#include "storage/entity_repository.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <vector>

namespace dedupe {

/// Per-call options for DuplicateDetector::Detect
struct DetectOptions {
    /// Explicit candidate pool; when absent the repository is queried
    std::optional<std::vector<DealRecord>> candidates;

    /// Minimum confidence for a match to be reported (default: minimum_match)
    std::optional<double> threshold;

    /// Strategies to run (default: all). Always evaluated in canonical order.
    std::optional<std::vector<Strategy>> strategies;
};

/// DuplicateDetector - Decides whether one deal already exists in a pool.
///
/// Runs every enabled MatchStrategy against the pool, merges their opinions
/// (best confidence per matched id), filters by threshold, ranks, and maps
/// the top confidence to a suggested action.
///
/// Collaborators are injected as ports:
/// - EntityRepository supplies a bounded pool when the caller passes none
/// - DetectionLog records the top match (best effort)
/// - DuplicateNotifier emits "duplicate.detected" (best effort)
///
/// Side effects fire only for entities with an id whose pool came from the
/// repository; their failures are reported on std::cerr and never reach the
/// caller. Repository failures propagate.
///
/// The configuration is bound at construction and never changes, so one
/// detector can serve concurrent callers.
class DuplicateDetector {
public:
    /// Constructor with configuration and optional collaborators
    /// @param config Engine configuration (validated)
    /// @param repository Candidate source for Detect() without candidates
    /// @param detection_log Best-effort match log
    /// @param notifier Best-effort notification sink
    /// @throws std::invalid_argument if config is invalid
    explicit DuplicateDetector(
        const DetectorConfig& config,
        std::shared_ptr<EntityRepository> repository = nullptr,
        std::shared_ptr<DetectionLog> detection_log = nullptr,
        std::shared_ptr<DuplicateNotifier> notifier = nullptr);

    /// Detect duplicates of one deal
    /// @throws std::logic_error if no candidates are given and no repository is set
    /// @throws std::runtime_error (or whatever the repository throws) on data-access failure
    DetectionResult Detect(const DealRecord& entity, const DetectOptions& options = {}) const;

    /// Weighted similarity of two deals using the configured weights
    SimilarityScore Score(const DealRecord& a, const DealRecord& b) const;

    /// Weighted similarity of two deals using explicit weights
    SimilarityScore Score(const DealRecord& a, const DealRecord& b,
                          const FieldWeights& weights) const;

    const DetectorConfig& GetConfig() const { return config_; }

    /// Repository used for candidate lookups (may be null)
    std::shared_ptr<EntityRepository> GetRepository() const { return repository_; }

    /// Set stream for debug output (nullptr disables)
    void SetDebugStream(std::ostream* os);

    /// Write a component-prefixed debug line when debug logging is enabled
    void LogDebug(const std::string& component, const std::string& message) const;

private:
    const DetectorConfig config_;
    std::shared_ptr<EntityRepository> repository_;
    std::shared_ptr<DetectionLog> detection_log_;
    std::shared_ptr<DuplicateNotifier> notifier_;

    std::map<Strategy, std::unique_ptr<MatchStrategy>> strategies_;
    MultiFactorScorer scorer_;
    MatchAggregator aggregator_;

    std::ostream* debug_stream_;
    mutable std::mutex debug_mutex_;

    /// Run the enabled strategies and aggregate
    DetectionResult Evaluate(const DealRecord& entity,
                             const std::vector<DealRecord>& pool,
                             double threshold,
                             const std::vector<Strategy>& enabled) const;

    /// Best-effort logging and notification for a persisted entity
    void PublishDetection(const DealRecord& entity, const DetectionResult& result) const;
};

} // namespace dedupe
