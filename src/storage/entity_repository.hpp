// File: src/storage/entity_repository.hpp
#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>

namespace dedupe {

/// Abstract interface for the store that supplies candidate pools
///
/// The detector never scans the store itself; it asks the repository for a
/// bounded, pre-filtered pool. Implementations must fail loudly (throw)
/// instead of returning an incomplete pool.
///
/// Thread Safety: All methods must be thread-safe.
class EntityRepository {
public:
    virtual ~EntityRepository() = default;

    /// Bounded candidate pool for one new deal
    ///
    /// Typically: records whose customer name contains the new customer
    /// name, or that share its vendor, excluding rejected records, newest
    /// first, capped at a fixed limit.
    /// @throws std::runtime_error on data-access failure
    virtual std::vector<DealRecord> FindCandidates(const DealRecord& entity) = 0;

    /// Every non-rejected deal, newest first (batch processing)
    /// @throws std::runtime_error on data-access failure
    virtual std::vector<DealRecord> FetchAll() = 0;
};

/// Abstract interface for best-effort logging of pairwise matches
///
/// Implementations upsert one record per (entity type, id pair) with status
/// "pending"; repeated calls for the same pair must be idempotent.
class DetectionLog {
public:
    virtual ~DetectionLog() = default;

    /// Record the match between entity_id and match.matched_entity_id
    /// @throws std::runtime_error on failure (callers treat it as best effort)
    virtual void RecordMatch(EntityType entity_type,
                             const std::string& entity_id,
                             const MatchCandidate& match) = 0;
};

/// Summary of one match carried by a notification
struct MatchSummary {
    std::string matched_entity_id;
    double confidence{0.0};
    std::string reasoning;
};

/// Event emitted when a persisted entity turns out to have duplicates
struct DuplicateEvent {
    std::string event_name = "duplicate.detected";
    std::string entity_id;
    std::string entity_name;
    size_t matches_count{0};
    double top_confidence{0.0};
    SuggestedAction suggested_action{SuggestedAction::NO_ACTION};
    std::vector<MatchSummary> matches;   // At most three
};

/// Abstract interface for best-effort duplicate notifications
class DuplicateNotifier {
public:
    virtual ~DuplicateNotifier() = default;

    /// Deliver one event; may throw, callers never propagate the failure
    virtual void Notify(const DuplicateEvent& event) = 0;
};

} // namespace dedupe
