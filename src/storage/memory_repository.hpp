// File: src/storage/memory_repository.hpp
#pragma once

#include "storage/entity_repository.hpp"
#include <shared_mutex>
#include <string>
#include <vector>

namespace dedupe {

/// In-memory EntityRepository
///
/// Applies the same candidate filter as the SQLite repository (customer
/// name substring or shared vendor, rejected deals excluded, newest first,
/// bounded), so embedding callers and tests see identical pools.
class MemoryRepository : public EntityRepository {
public:
    struct Config {
        /// Maximum size of a candidate pool
        size_t candidate_limit{200};
    };

    MemoryRepository();
    explicit MemoryRepository(const Config& config);

    std::vector<DealRecord> FindCandidates(const DealRecord& entity) override;
    std::vector<DealRecord> FetchAll() override;

    /// Add a deal; later additions count as newer
    void Add(DealRecord deal);

    /// Number of stored deals (rejected included)
    size_t Size() const;

    void Clear();

private:
    Config config_;
    std::vector<DealRecord> entries_;   // Insertion order, oldest first
    mutable std::shared_mutex mutex_;

    /// Non-rejected entries matching pred, newest first
    template<typename Pred>
    std::vector<DealRecord> Select(Pred pred, size_t limit) const;
};

} // namespace dedupe
