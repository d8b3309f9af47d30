// File: src/detection/batch_processor.hpp
#pragma once

#include "core/types.hpp"
#include "detection/duplicate_detector.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace dedupe {

/// Aggregate counts over a batch result
struct BatchSummary {
    size_t total_entities{0};
    size_t entities_with_duplicates{0};
    size_t total_duplicates_found{0};
    size_t auto_merge_candidates{0};
    size_t manual_review_candidates{0};
};

/// Entity whose duplicates come from a different source file
struct CrossSourceDuplicate {
    std::string entity_id;
    std::string entity_name;
    std::string source_file_id;
    std::vector<MatchCandidate> matches;   // Only matches from other sources
};

/// BatchProcessor - Runs detection over many deals against one shared pool
///
/// The full pool is fetched from the detector's repository once and passed
/// explicitly to every detection, so no per-entity query or side effect
/// happens. Entities are processed in chunks of batch_size; within a chunk
/// up to worker_threads entities run concurrently. Results are keyed by
/// entity id; entities without an id are processed but omitted.
class BatchProcessor {
public:
    struct Config {
        /// Entities per chunk
        size_t batch_size = 100;

        /// Concurrent detections within a chunk (1 = sequential)
        size_t worker_threads = 1;
    };

    /// Constructor using the detector's batch settings
    /// @throws std::invalid_argument if detector is null
    explicit BatchProcessor(std::shared_ptr<const DuplicateDetector> detector);

    /// Constructor with explicit settings
    /// @throws std::invalid_argument if detector is null or a setting is 0
    BatchProcessor(std::shared_ptr<const DuplicateDetector> detector, const Config& config);

    /// Detect duplicates for every entity against the repository's full pool
    /// @throws std::logic_error if the detector has no repository
    /// @throws std::runtime_error if fetching the pool fails
    std::map<std::string, DetectionResult> DetectBatch(const std::vector<DealRecord>& entities) const;

    /// Detect duplicates for every entity against an explicit pool
    std::map<std::string, DetectionResult> DetectBatch(
        const std::vector<DealRecord>& entities,
        const std::vector<DealRecord>& pool) const;

    /// Count entities, duplicates and suggested actions
    static BatchSummary Summarize(const std::map<std::string, DetectionResult>& results);

    /// Keep only matches whose matched deal comes from another source file
    ///
    /// Entities are reported in input order; entities without a source file
    /// id, without a result, or with no remaining match are skipped.
    static std::vector<CrossSourceDuplicate> FindCrossSource(
        const std::vector<DealRecord>& entities,
        const std::map<std::string, DetectionResult>& results);

    const Config& GetConfig() const { return config_; }

private:
    std::shared_ptr<const DuplicateDetector> detector_;
    Config config_;
};

} // namespace dedupe
