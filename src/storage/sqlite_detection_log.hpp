// File: src/storage/sqlite_detection_log.hpp
#pragma once

#include "storage/entity_repository.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace dedupe {

/// Stored pairwise detection
struct DetectionRecord {
    EntityType entity_type{EntityType::DEAL};
    std::string entity_id_1;         // Lexicographically smaller id
    std::string entity_id_2;
    double similarity_score{0.0};
    double confidence{0.0};
    std::string strategy;
    SimilarityFactors factors;
    std::string status;              // "pending" until reviewed
    int64_t detected_at{0};          // Unix seconds of the last recording

    /// Id of the other side of the pair
    const std::string& OtherId(const std::string& entity_id) const {
        return entity_id == entity_id_1 ? entity_id_2 : entity_id_1;
    }
};

/// Usage of one detection strategy across the log
struct StrategyUsage {
    std::string strategy;
    size_t count{0};
    double average_confidence{0.0};
};

/// Aggregate counts over the detection log
struct DetectionStatistics {
    size_t total{0};
    size_t pending{0};
    size_t confirmed{0};
    size_t rejected{0};
    size_t auto_merged{0};
    double average_confidence{0.0};  // 0 when the log is empty
    size_t very_high_confidence{0};  // confidence >= 0.95
    size_t high_confidence{0};       // 0.85 <= confidence < 0.95
    std::vector<StrategyUsage> strategies;  // Most used first
};

/// DetectionLog backed by the duplicate_detections table
///
/// One row per (entity type, id pair); the pair is ordered so that
/// entity_id_1 < entity_id_2 and re-recording the same pair updates the row
/// in place.
class SqliteDetectionLog : public DetectionLog {
public:
    struct Config {
        /// Path to the SQLite database file
        std::string db_path;

        /// Enable Write-Ahead Logging for better concurrency
        bool enable_wal{true};
    };

    /// @throws std::runtime_error if the database cannot be opened or initialized
    explicit SqliteDetectionLog(const Config& config);

    ~SqliteDetectionLog() override;

    SqliteDetectionLog(const SqliteDetectionLog&) = delete;
    SqliteDetectionLog& operator=(const SqliteDetectionLog&) = delete;

    /// @throws std::invalid_argument if both ids are equal or empty
    /// @throws std::runtime_error on database failure
    void RecordMatch(EntityType entity_type,
                     const std::string& entity_id,
                     const MatchCandidate& match) override;

    /// Look up the row for a pair (order of ids does not matter)
    std::optional<DetectionRecord> Find(EntityType entity_type,
                                        const std::string& id_a,
                                        const std::string& id_b);

    /// Number of stored rows
    size_t Count();

    /// Set the review status of a pair
    ///
    /// @param status One of "pending", "confirmed", "rejected", "auto_merged"
    /// @return false if the pair has no row
    /// @throws std::invalid_argument for an unknown status
    bool UpdateStatus(EntityType entity_type,
                      const std::string& id_a,
                      const std::string& id_b,
                      const std::string& status);

    /// Counts per status, confidence bands and per-strategy usage
    DetectionStatistics Statistics();

    /// Pending pairs with confidence >= threshold, highest confidence first
    std::vector<DetectionRecord> HighConfidence(double threshold = 0.95, size_t limit = 50);

    /// Pending pairs involving one entity with confidence >= threshold,
    /// highest confidence first
    std::vector<DetectionRecord> CandidatesFor(const std::string& entity_id,
                                               double threshold = 0.7,
                                               size_t limit = 10);

    /// Factors as compact JSON, keyed by factor name
    static std::string FactorsToJson(const SimilarityFactors& factors);

    /// Parse factors JSON; unknown keys and malformed text are ignored
    static SimilarityFactors FactorsFromJson(const std::string& json);

private:
    Config config_;
    sqlite3* db_{nullptr};
    std::mutex mutex_;

    void ExecuteSQL(const std::string& sql);
    sqlite3_stmt* Prepare(const char* sql);
    std::vector<DetectionRecord> ReadRecords(sqlite3_stmt* stmt);
};

} // namespace dedupe
