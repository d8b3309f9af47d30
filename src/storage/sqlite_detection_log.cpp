// File: src/storage/sqlite_detection_log.cpp
#include "storage/sqlite_detection_log.hpp"
#include <memory>
#include <stdexcept>
#include <utility>
#include <json/json.h>

namespace dedupe {

namespace {

struct StatementFinalizer {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};

using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

std::string ColumnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* value = sqlite3_column_text(stmt, column);
    return value ? std::string(reinterpret_cast<const char*>(value)) : std::string();
}

bool IsKnownStatus(const std::string& status) {
    return status == "pending" || status == "confirmed" ||
           status == "rejected" || status == "auto_merged";
}

} // namespace

// ============================================================================
// Constructor and Destructor
// ============================================================================

SqliteDetectionLog::SqliteDetectionLog(const Config& config)
    : config_(config) {
    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + error);
    }

    try {
        sqlite3_busy_timeout(db_, 5000);
        if (config_.enable_wal) {
            ExecuteSQL("PRAGMA journal_mode=WAL;");
        }

        ExecuteSQL(R"(
            CREATE TABLE IF NOT EXISTS duplicate_detections (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                entity_type TEXT NOT NULL,
                entity_id_1 TEXT NOT NULL,
                entity_id_2 TEXT NOT NULL,
                similarity_score REAL NOT NULL,
                confidence_level REAL NOT NULL,
                detection_strategy TEXT NOT NULL,
                similarity_factors TEXT NOT NULL DEFAULT '{}',
                status TEXT NOT NULL DEFAULT 'pending',
                detected_at INTEGER NOT NULL DEFAULT (strftime('%s', 'now')),
                UNIQUE (entity_type, entity_id_1, entity_id_2),
                CHECK (entity_id_1 < entity_id_2)
            );
        )");
    } catch (const std::exception&) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteDetectionLog::~SqliteDetectionLog() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

void SqliteDetectionLog::ExecuteSQL(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : sqlite3_errstr(rc);
        sqlite3_free(error_msg);
        throw std::runtime_error("SQL execution failed: " + error);
    }
}

sqlite3_stmt* SqliteDetectionLog::Prepare(const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
    }
    return stmt;
}

// ============================================================================
// Factor Serialization
// ============================================================================

std::string SqliteDetectionLog::FactorsToJson(const SimilarityFactors& factors) {
    Json::Value object(Json::objectValue);
    for (const auto& [factor, value] : factors.Data()) {
        object[ToString(factor)] = value;
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, object);
}

SimilarityFactors SqliteDetectionLog::FactorsFromJson(const std::string& json) {
    SimilarityFactors factors;

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    if (!reader->parse(json.data(), json.data() + json.size(), &root, &errors) || !root.isObject()) {
        return factors;
    }

    // Unknown keys are ignored
    for (SimilarityFactor factor : AllSimilarityFactors()) {
        const char* key = ToString(factor);
        if (root.isMember(key) && root[key].isNumeric()) {
            factors.Set(factor, root[key].asDouble());
        }
    }
    return factors;
}

// ============================================================================
// DetectionLog Interface Implementation
// ============================================================================

void SqliteDetectionLog::RecordMatch(EntityType entity_type,
                                     const std::string& entity_id,
                                     const MatchCandidate& match) {
    if (entity_id.empty() || match.matched_entity_id.empty() ||
        entity_id == match.matched_entity_id) {
        throw std::invalid_argument("Detection requires two distinct entity ids");
    }

    std::string id_1 = entity_id;
    std::string id_2 = match.matched_entity_id;
    if (id_2 < id_1) {
        std::swap(id_1, id_2);
    }

    const std::string factors_json = FactorsToJson(match.factors);

    std::lock_guard<std::mutex> lock(mutex_);

    StatementPtr stmt(Prepare(
        "INSERT INTO duplicate_detections ("
        "entity_type, entity_id_1, entity_id_2, similarity_score, confidence_level, "
        "detection_strategy, similarity_factors, status) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, 'pending') "
        "ON CONFLICT (entity_type, entity_id_1, entity_id_2) DO UPDATE SET "
        "similarity_score = excluded.similarity_score, "
        "confidence_level = excluded.confidence_level, "
        "detection_strategy = excluded.detection_strategy, "
        "similarity_factors = excluded.similarity_factors, "
        "detected_at = strftime('%s', 'now');"));

    sqlite3_bind_text(stmt.get(), 1, ToString(entity_type), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt.get(), 2, id_1.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 3, id_2.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt.get(), 4, match.similarity_score);
    sqlite3_bind_double(stmt.get(), 5, match.confidence);
    sqlite3_bind_text(stmt.get(), 6, ToString(match.strategy), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt.get(), 7, factors_json.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error(std::string("Failed to record detection: ") + sqlite3_errmsg(db_));
    }
}

// ============================================================================
// Queries
// ============================================================================

std::vector<DetectionRecord> SqliteDetectionLog::ReadRecords(sqlite3_stmt* stmt) {
    std::vector<DetectionRecord> records;

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        DetectionRecord record;
        record.entity_type = ParseEntityType(ColumnText(stmt, 0));
        record.entity_id_1 = ColumnText(stmt, 1);
        record.entity_id_2 = ColumnText(stmt, 2);
        record.similarity_score = sqlite3_column_double(stmt, 3);
        record.confidence = sqlite3_column_double(stmt, 4);
        record.strategy = ColumnText(stmt, 5);
        record.factors = FactorsFromJson(ColumnText(stmt, 6));
        record.status = ColumnText(stmt, 7);
        record.detected_at = sqlite3_column_int64(stmt, 8);
        records.push_back(std::move(record));
    }

    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("Failed to read detections: ") + sqlite3_errmsg(db_));
    }
    return records;
}

std::optional<DetectionRecord> SqliteDetectionLog::Find(EntityType entity_type,
                                                        const std::string& id_a,
                                                        const std::string& id_b) {
    std::string id_1 = id_a;
    std::string id_2 = id_b;
    if (id_2 < id_1) {
        std::swap(id_1, id_2);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    StatementPtr stmt(Prepare(
        "SELECT entity_type, entity_id_1, entity_id_2, similarity_score, confidence_level, "
        "detection_strategy, similarity_factors, status, detected_at "
        "FROM duplicate_detections "
        "WHERE entity_type = ? AND entity_id_1 = ? AND entity_id_2 = ?;"));

    sqlite3_bind_text(stmt.get(), 1, ToString(entity_type), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt.get(), 2, id_1.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 3, id_2.c_str(), -1, SQLITE_TRANSIENT);

    auto records = ReadRecords(stmt.get());
    if (records.empty()) {
        return std::nullopt;
    }
    return records.front();
}

size_t SqliteDetectionLog::Count() {
    std::lock_guard<std::mutex> lock(mutex_);

    StatementPtr stmt(Prepare("SELECT COUNT(*) FROM duplicate_detections;"));

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw std::runtime_error(std::string("Failed to count detections: ") + sqlite3_errmsg(db_));
    }
    return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
}

bool SqliteDetectionLog::UpdateStatus(EntityType entity_type,
                                      const std::string& id_a,
                                      const std::string& id_b,
                                      const std::string& status) {
    if (!IsKnownStatus(status)) {
        throw std::invalid_argument("Unknown detection status: " + status);
    }

    std::string id_1 = id_a;
    std::string id_2 = id_b;
    if (id_2 < id_1) {
        std::swap(id_1, id_2);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    StatementPtr stmt(Prepare(
        "UPDATE duplicate_detections SET status = ? "
        "WHERE entity_type = ? AND entity_id_1 = ? AND entity_id_2 = ?;"));

    sqlite3_bind_text(stmt.get(), 1, status.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, ToString(entity_type), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt.get(), 3, id_1.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 4, id_2.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error(std::string("Failed to update detection: ") + sqlite3_errmsg(db_));
    }
    return sqlite3_changes(db_) > 0;
}

DetectionStatistics SqliteDetectionLog::Statistics() {
    std::lock_guard<std::mutex> lock(mutex_);

    DetectionStatistics stats;

    StatementPtr totals(Prepare(
        "SELECT COUNT(*), "
        "COALESCE(SUM(status = 'pending'), 0), "
        "COALESCE(SUM(status = 'confirmed'), 0), "
        "COALESCE(SUM(status = 'rejected'), 0), "
        "COALESCE(SUM(status = 'auto_merged'), 0), "
        "COALESCE(AVG(confidence_level), 0), "
        "COALESCE(SUM(confidence_level >= 0.95), 0), "
        "COALESCE(SUM(confidence_level >= 0.85 AND confidence_level < 0.95), 0) "
        "FROM duplicate_detections;"));

    if (sqlite3_step(totals.get()) != SQLITE_ROW) {
        throw std::runtime_error(std::string("Failed to read statistics: ") + sqlite3_errmsg(db_));
    }
    stats.total = static_cast<size_t>(sqlite3_column_int64(totals.get(), 0));
    stats.pending = static_cast<size_t>(sqlite3_column_int64(totals.get(), 1));
    stats.confirmed = static_cast<size_t>(sqlite3_column_int64(totals.get(), 2));
    stats.rejected = static_cast<size_t>(sqlite3_column_int64(totals.get(), 3));
    stats.auto_merged = static_cast<size_t>(sqlite3_column_int64(totals.get(), 4));
    stats.average_confidence = sqlite3_column_double(totals.get(), 5);
    stats.very_high_confidence = static_cast<size_t>(sqlite3_column_int64(totals.get(), 6));
    stats.high_confidence = static_cast<size_t>(sqlite3_column_int64(totals.get(), 7));

    StatementPtr by_strategy(Prepare(
        "SELECT detection_strategy, COUNT(*) AS usage_count, AVG(confidence_level) "
        "FROM duplicate_detections GROUP BY detection_strategy "
        "ORDER BY usage_count DESC, detection_strategy ASC;"));

    int rc;
    while ((rc = sqlite3_step(by_strategy.get())) == SQLITE_ROW) {
        StrategyUsage usage;
        usage.strategy = ColumnText(by_strategy.get(), 0);
        usage.count = static_cast<size_t>(sqlite3_column_int64(by_strategy.get(), 1));
        usage.average_confidence = sqlite3_column_double(by_strategy.get(), 2);
        stats.strategies.push_back(std::move(usage));
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("Failed to read statistics: ") + sqlite3_errmsg(db_));
    }

    return stats;
}

std::vector<DetectionRecord> SqliteDetectionLog::HighConfidence(double threshold, size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    StatementPtr stmt(Prepare(
        "SELECT entity_type, entity_id_1, entity_id_2, similarity_score, confidence_level, "
        "detection_strategy, similarity_factors, status, detected_at "
        "FROM duplicate_detections "
        "WHERE status = 'pending' AND confidence_level >= ? "
        "ORDER BY confidence_level DESC, detected_at DESC, id ASC LIMIT ?;"));

    sqlite3_bind_double(stmt.get(), 1, threshold);
    sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(limit));

    return ReadRecords(stmt.get());
}

std::vector<DetectionRecord> SqliteDetectionLog::CandidatesFor(const std::string& entity_id,
                                                               double threshold,
                                                               size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    StatementPtr stmt(Prepare(
        "SELECT entity_type, entity_id_1, entity_id_2, similarity_score, confidence_level, "
        "detection_strategy, similarity_factors, status, detected_at "
        "FROM duplicate_detections "
        "WHERE (entity_id_1 = ?1 OR entity_id_2 = ?1) "
        "AND status = 'pending' AND confidence_level >= ?2 "
        "ORDER BY confidence_level DESC, detected_at DESC, id ASC LIMIT ?3;"));

    sqlite3_bind_text(stmt.get(), 1, entity_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt.get(), 2, threshold);
    sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(limit));

    return ReadRecords(stmt.get());
}

} // namespace dedupe
