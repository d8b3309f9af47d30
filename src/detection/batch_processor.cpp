// File: src/detection/batch_processor.cpp
#include "detection/batch_processor.hpp"
#include "core/parallel.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace dedupe {

namespace {

BatchProcessor::Config ConfigFromDetector(const std::shared_ptr<const DuplicateDetector>& detector) {
    if (!detector) {
        throw std::invalid_argument("BatchProcessor requires a detector");
    }
    BatchProcessor::Config config;
    config.batch_size = detector->GetConfig().batch.batch_size;
    config.worker_threads = detector->GetConfig().batch.worker_threads;
    return config;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

BatchProcessor::BatchProcessor(std::shared_ptr<const DuplicateDetector> detector)
    : BatchProcessor(detector, ConfigFromDetector(detector)) {
}

BatchProcessor::BatchProcessor(std::shared_ptr<const DuplicateDetector> detector, const Config& config)
    : detector_(std::move(detector)), config_(config) {
    if (!detector_) {
        throw std::invalid_argument("BatchProcessor requires a detector");
    }
    if (config_.batch_size == 0) {
        throw std::invalid_argument("batch_size must be greater than 0");
    }
    if (config_.worker_threads == 0) {
        throw std::invalid_argument("worker_threads must be greater than 0");
    }
}

// ============================================================================
// Detection
// ============================================================================

std::map<std::string, DetectionResult> BatchProcessor::DetectBatch(
        const std::vector<DealRecord>& entities) const {
    auto repository = detector_->GetRepository();
    if (!repository) {
        throw std::logic_error("BatchProcessor requires a detector with a repository");
    }

    std::vector<DealRecord> pool = repository->FetchAll();

    std::ostringstream msg;
    msg << "Fetched pool of " << pool.size() << " deals for " << entities.size() << " entities";
    detector_->LogDebug("BatchProcessor", msg.str());

    return DetectBatch(entities, pool);
}

std::map<std::string, DetectionResult> BatchProcessor::DetectBatch(
        const std::vector<DealRecord>& entities,
        const std::vector<DealRecord>& pool) const {
    std::map<std::string, DetectionResult> results;

    DetectOptions options;
    options.candidates = pool;

    for (size_t start = 0; start < entities.size(); start += config_.batch_size) {
        size_t end = std::min(start + config_.batch_size, entities.size());
        std::vector<DetectionResult> chunk(end - start);

        ParallelFor(chunk.size(), config_.worker_threads, [&](size_t i) {
            chunk[i] = detector_->Detect(entities[start + i], options);
        });

        for (size_t i = 0; i < chunk.size(); ++i) {
            const DealRecord& entity = entities[start + i];
            if (entity.HasId()) {
                results[*entity.id] = std::move(chunk[i]);
            }
        }

        std::ostringstream msg;
        msg << "Processed " << end << "/" << entities.size() << " entities";
        detector_->LogDebug("BatchProcessor", msg.str());
    }

    return results;
}

// ============================================================================
// Reporting
// ============================================================================

BatchSummary BatchProcessor::Summarize(const std::map<std::string, DetectionResult>& results) {
    BatchSummary summary;
    summary.total_entities = results.size();

    for (const auto& [id, result] : results) {
        if (result.is_duplicate) {
            summary.entities_with_duplicates++;
        }
        summary.total_duplicates_found += result.matches.size();

        if (result.suggested_action == SuggestedAction::AUTO_MERGE) {
            summary.auto_merge_candidates++;
        } else if (result.suggested_action == SuggestedAction::MANUAL_REVIEW) {
            summary.manual_review_candidates++;
        }
    }

    return summary;
}

std::vector<CrossSourceDuplicate> BatchProcessor::FindCrossSource(
        const std::vector<DealRecord>& entities,
        const std::map<std::string, DetectionResult>& results) {
    std::vector<CrossSourceDuplicate> cross_source;

    for (const auto& entity : entities) {
        if (!entity.HasId() || entity.source_file_id.empty()) {
            continue;
        }

        auto it = results.find(*entity.id);
        if (it == results.end() || !it->second.is_duplicate) {
            continue;
        }

        CrossSourceDuplicate entry;
        for (const auto& match : it->second.matches) {
            if (match.matched_entity.source_file_id != entity.source_file_id) {
                entry.matches.push_back(match);
            }
        }

        if (entry.matches.empty()) {
            continue;
        }

        entry.entity_id = *entity.id;
        entry.entity_name = entity.deal_name;
        entry.source_file_id = entity.source_file_id;
        cross_source.push_back(std::move(entry));
    }

    return cross_source;
}

} // namespace dedupe
