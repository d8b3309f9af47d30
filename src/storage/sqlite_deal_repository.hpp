// File: src/storage/sqlite_deal_repository.hpp
#pragma once

#include "config/detector_config.hpp"
#include "storage/entity_repository.hpp"
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <optional>
#include <string>
#include <sqlite3.h>

namespace dedupe {

/// Deal registrations stored in SQLite
///
/// Serves bounded candidate pools for the detector and full pools for
/// batch processing. Products, contacts and metadata are stored as JSON
/// text columns.
///
/// Thread Safety: all methods serialize on one connection mutex.
class SqliteDealRepository : public EntityRepository {
public:
    struct Config {
        /// Path to the SQLite database file
        std::string db_path;

        /// Maximum size of a candidate pool
        size_t candidate_limit{200};

        /// Enable Write-Ahead Logging for better concurrency
        bool enable_wal{true};

        /// Synchronous mode: FULL, NORMAL, or OFF
        std::string synchronous{"NORMAL"};
    };

    /// @throws std::runtime_error if the database cannot be opened or initialized
    explicit SqliteDealRepository(const Config& config);

    /// Build from the storage section of the engine configuration
    static Config ConfigFrom(const DetectorConfig& config);

    ~SqliteDealRepository() override;

    SqliteDealRepository(const SqliteDealRepository&) = delete;
    SqliteDealRepository& operator=(const SqliteDealRepository&) = delete;

    // ========================================================================
    // EntityRepository Interface Implementation
    // ========================================================================

    std::vector<DealRecord> FindCandidates(const DealRecord& entity) override;
    std::vector<DealRecord> FetchAll() override;

    // ========================================================================
    // Record Management
    // ========================================================================

    /// Insert or replace a deal
    /// @param deal Deal with an id
    /// @param created_at_ms Creation time used for newest-first ordering
    /// @throws std::invalid_argument if deal has no id
    /// @throws std::runtime_error on database failure
    void Store(const DealRecord& deal, int64_t created_at_ms);

    /// Insert or replace a deal stamped with the current time
    void Store(const DealRecord& deal);

    /// Load one deal by id
    std::optional<DealRecord> Retrieve(const std::string& id);

    /// Number of stored deals (rejected included)
    size_t Count();

private:
    Config config_;
    sqlite3* db_{nullptr};
    mutable std::mutex mutex_;

    void InitializeDatabase();
    void CreateTables();
    void ExecuteSQL(const std::string& sql);

    /// Prepare a statement or throw with the SQLite error message
    sqlite3_stmt* Prepare(const char* sql);

    /// Step a prepared SELECT to completion; the caller keeps ownership
    std::vector<DealRecord> ReadDeals(sqlite3_stmt* stmt);

    std::runtime_error Error(const std::string& what) const;
};

} // namespace dedupe
