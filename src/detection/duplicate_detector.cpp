// File: src/detection/duplicate_detector.cpp
#include "detection/duplicate_detector.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace dedupe {

namespace {

// Number of matches summarized in a notification
constexpr size_t kNotifiedMatches = 3;

MultiFactorScorer::Config ScorerConfigFrom(const DetectorConfig& config) {
    MultiFactorScorer::Config scorer_config;
    scorer_config.weights = config.weights;
    scorer_config.value_tolerance_percent = config.tolerance.value_percent;
    scorer_config.date_tolerance_days = config.tolerance.date_days;
    return scorer_config;
}

const DetectorConfig& Validated(const DetectorConfig& config) {
    auto errors = config.GetValidationErrors();
    if (!errors.empty()) {
        throw std::invalid_argument("Invalid detector configuration: " + errors.front());
    }
    return config;
}

std::string EntityLabel(const DealRecord& entity) {
    return entity.HasId() ? *entity.id : std::string("<new>");
}

} // namespace

// ============================================================================
// DuplicateDetector Implementation
// ============================================================================

DuplicateDetector::DuplicateDetector(
    const DetectorConfig& config,
    std::shared_ptr<EntityRepository> repository,
    std::shared_ptr<DetectionLog> detection_log,
    std::shared_ptr<DuplicateNotifier> notifier)
    : config_(Validated(config)),
      repository_(std::move(repository)),
      detection_log_(std::move(detection_log)),
      notifier_(std::move(notifier)),
      scorer_(ScorerConfigFrom(config_)),
      aggregator_(MatchAggregator::FromDetectorConfig(config_)),
      debug_stream_(&std::clog) {

    for (Strategy strategy : AllStrategies()) {
        strategies_.emplace(strategy, CreateStrategy(strategy, config_));
    }
}

void DuplicateDetector::SetDebugStream(std::ostream* os) {
    std::lock_guard<std::mutex> lock(debug_mutex_);
    debug_stream_ = os;
}

void DuplicateDetector::LogDebug(const std::string& component, const std::string& message) const {
    if (!config_.logging.debug_logging) {
        return;
    }
    std::lock_guard<std::mutex> lock(debug_mutex_);
    if (debug_stream_) {
        *debug_stream_ << "[" << component << "] " << message << std::endl;
    }
}

DetectionResult DuplicateDetector::Detect(const DealRecord& entity, const DetectOptions& options) const {
    const double threshold = options.threshold.value_or(config_.thresholds.minimum_match);
    const bool using_provided = options.candidates.has_value();

    std::vector<DealRecord> pool;
    if (using_provided) {
        pool = *options.candidates;
    } else {
        if (!repository_) {
            throw std::logic_error("DuplicateDetector requires a repository when no candidates are given");
        }
        try {
            pool = repository_->FindCandidates(entity);
        } catch (const std::exception& e) {
            std::cerr << "[Detector] Duplicate detection failed for "
                      << EntityLabel(entity) << " (" << entity.deal_name << "): "
                      << e.what() << std::endl;
            throw;
        }
    }

    // Never compare an entity against itself
    if (entity.HasId()) {
        pool.erase(std::remove_if(pool.begin(), pool.end(),
            [&entity](const DealRecord& candidate) {
                return candidate.id == entity.id;
            }),
            pool.end());
    }

    if (pool.empty()) {
        return DetectionResult::None();
    }

    const std::vector<Strategy>& enabled = options.strategies ? *options.strategies : AllStrategies();
    DetectionResult result = Evaluate(entity, pool, threshold, enabled);

    if (!using_provided && entity.HasId() && result.is_duplicate) {
        PublishDetection(entity, result);
    }

    std::ostringstream msg;
    msg << std::fixed << std::setprecision(3)
        << "Duplicate detection completed: deal=" << EntityLabel(entity)
        << " name=\"" << entity.deal_name << "\""
        << " candidates=" << pool.size()
        << " matches=" << result.matches.size()
        << " top_confidence=" << result.confidence
        << " action=" << ToString(result.suggested_action);
    LogDebug("Detector", msg.str());

    return result;
}

DetectionResult DuplicateDetector::Evaluate(
        const DealRecord& entity,
        const std::vector<DealRecord>& pool,
        double threshold,
        const std::vector<Strategy>& enabled) const {
    std::vector<MatchCandidate> all_matches;

    for (Strategy strategy : AllStrategies()) {
        if (std::find(enabled.begin(), enabled.end(), strategy) == enabled.end()) {
            continue;
        }
        auto matches = strategies_.at(strategy)->FindMatches(entity, pool);
        all_matches.insert(all_matches.end(),
                           std::make_move_iterator(matches.begin()),
                           std::make_move_iterator(matches.end()));
    }

    return aggregator_.Aggregate(all_matches, threshold);
}

void DuplicateDetector::PublishDetection(const DealRecord& entity, const DetectionResult& result) const {
    const MatchCandidate& top = result.matches.front();

    if (detection_log_) {
        try {
            detection_log_->RecordMatch(EntityType::DEAL, *entity.id, top);
        } catch (const std::exception& e) {
            std::cerr << "[Detector] Failed to log duplicate detection for "
                      << *entity.id << ": " << e.what() << std::endl;
        }
    }

    if (notifier_) {
        DuplicateEvent event;
        event.entity_id = *entity.id;
        event.entity_name = entity.deal_name;
        event.matches_count = result.matches.size();
        event.top_confidence = result.confidence;
        event.suggested_action = result.suggested_action;

        size_t count = std::min(kNotifiedMatches, result.matches.size());
        for (size_t i = 0; i < count; ++i) {
            const auto& match = result.matches[i];
            event.matches.push_back({match.matched_entity_id, match.confidence, match.reasoning});
        }

        try {
            notifier_->Notify(event);
        } catch (const std::exception& e) {
            std::cerr << "[Detector] Failed to send duplicate notification for "
                      << *entity.id << ": " << e.what() << std::endl;
        }
    }
}

SimilarityScore DuplicateDetector::Score(const DealRecord& a, const DealRecord& b) const {
    return scorer_.Score(a, b);
}

SimilarityScore DuplicateDetector::Score(
        const DealRecord& a,
        const DealRecord& b,
        const FieldWeights& weights) const {
    return scorer_.Score(a, b, weights);
}

} // namespace dedupe
