// File: src/detection/match_aggregator.cpp
#include "detection/match_aggregator.hpp"
#include <algorithm>
#include <stdexcept>
#include <unordered_map>

namespace dedupe {

MatchAggregator::MatchAggregator()
    : MatchAggregator(Config{}) {
}

MatchAggregator::MatchAggregator(const Config& config)
    : config_(config) {
    if (config_.auto_merge_threshold < config_.high_confidence_threshold) {
        throw std::invalid_argument("auto_merge_threshold must be >= high_confidence_threshold");
    }
}

MatchAggregator MatchAggregator::FromDetectorConfig(const DetectorConfig& config) {
    Config aggregator_config;
    aggregator_config.auto_merge_threshold = config.thresholds.auto_merge;
    aggregator_config.high_confidence_threshold = config.thresholds.high_confidence;
    return MatchAggregator(aggregator_config);
}

std::vector<MatchCandidate> MatchAggregator::MergeByEntity(
        const std::vector<MatchCandidate>& matches) {
    std::vector<MatchCandidate> merged;
    std::unordered_map<std::string, size_t> index_by_id;

    for (const auto& match : matches) {
        auto it = index_by_id.find(match.matched_entity_id);
        if (it == index_by_id.end()) {
            index_by_id.emplace(match.matched_entity_id, merged.size());
            merged.push_back(match);
        } else if (match.confidence > merged[it->second].confidence) {
            merged[it->second] = match;
        }
    }

    return merged;
}

DetectionResult MatchAggregator::Aggregate(
        const std::vector<MatchCandidate>& matches,
        double threshold) const {
    DetectionResult result;

    for (auto& match : MergeByEntity(matches)) {
        if (match.confidence >= threshold) {
            result.matches.push_back(std::move(match));
        }
    }

    std::stable_sort(result.matches.begin(), result.matches.end(),
        [](const MatchCandidate& a, const MatchCandidate& b) {
            return a.confidence > b.confidence;
        });

    result.is_duplicate = !result.matches.empty();
    result.confidence = result.is_duplicate ? result.matches.front().confidence : 0.0;
    result.suggested_action = DecideAction(result.confidence);

    return result;
}

SuggestedAction MatchAggregator::DecideAction(double max_confidence) const {
    if (max_confidence >= config_.auto_merge_threshold) {
        return SuggestedAction::AUTO_MERGE;
    }
    if (max_confidence >= config_.high_confidence_threshold) {
        return SuggestedAction::MANUAL_REVIEW;
    }
    return SuggestedAction::NO_ACTION;
}

} // namespace dedupe
