// File: include/config/detector_config.hpp
//
// YAML Configuration Support for the duplicate detection engine
// Every tunable threshold, tolerance and weight lives here; a config value
// is bound once into each engine object and never mutated afterwards.

#ifndef DEDUPE_CONFIG_DETECTOR_CONFIG_HPP
#define DEDUPE_CONFIG_DETECTOR_CONFIG_HPP

#include "core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace dedupe {

/// Configuration structure for duplicate detection
struct DetectorConfig {
    // === Confidence Thresholds (0.0 - 1.0) ===
    struct Thresholds {
        double auto_merge = 0.95;       // auto_merge at or above
        double high_confidence = 0.85;  // manual_review at or above; cluster edges
        double medium_confidence = 0.70; // multi-factor trigger
        double low_confidence = 0.50;
        double minimum_match = 0.85;    // default filter for Detect()
    } thresholds;

    // === Fuzzy Ratio Thresholds (0 - 100) ===
    struct Fuzzy {
        double exact = 95.0;
        double high = 85.0;
        double medium = 70.0;
        double low = 50.0;
    } fuzzy;

    // === Numeric/Date Tolerances ===
    struct Tolerance {
        double value_percent = 10.0;
        double date_days = 7.0;
    } tolerance;

    // === Multi-factor Field Weights ===
    FieldWeights weights = FieldWeights::Default();

    // === Batch Processing ===
    struct Batch {
        size_t batch_size = 100;
        size_t worker_threads = 1;      // 1 = sequential
    } batch;

    // === Logging ===
    struct Logging {
        bool debug_logging = false;
    } logging;

    // === Storage (SQLite adapters and CLI) ===
    struct Storage {
        std::string db_path = "dedupe.db";
        size_t candidate_limit = 200;
        bool enable_wal = true;
    } storage;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return DetectorConfig if successful, std::nullopt on error
    static std::optional<DetectorConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @param yaml_content YAML content as string
    /// @return DetectorConfig if successful, std::nullopt on error
    static std::optional<DetectorConfig> LoadFromString(const std::string& yaml_content);

    /// Save configuration to YAML file
    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    /// Convert to YAML string
    std::string ToYamlString() const;

    /// Validate configuration values
    bool Validate() const;

    /// Get validation errors (if any)
    std::vector<std::string> GetValidationErrors() const;

    /// Create default configuration
    static DetectorConfig Default();
};

} // namespace dedupe

#endif // DEDUPE_CONFIG_DETECTOR_CONFIG_HPP
