// File: src/core/types.hpp
#pragma once

#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dedupe {

// Date: calendar date/time with second precision (UTC, seconds since epoch)
// Used for close and registration dates on deal records
class Date {
public:
    // Default constructor creates the epoch
    Date() : seconds_(0) {}

    // Create from seconds since Unix epoch
    static Date FromSeconds(int64_t seconds) { return Date(seconds); }

    // Create from a civil date (month 1-12, day 1-31)
    static Date FromCivil(int year, int month, int day,
                          int hour = 0, int minute = 0, int second = 0);

    // Parse "YYYY-MM-DD" or "YYYY-MM-DD[T ]HH:MM[:SS[.fff]][Z|+HH:MM|-HH:MM]"
    // A UTC offset is applied; no offset means UTC.
    // Returns std::nullopt on malformed input
    static std::optional<Date> Parse(const std::string& text);

    // Seconds since Unix epoch
    int64_t ToSeconds() const { return seconds_; }

    // Signed difference in (fractional) days
    double DaysSince(const Date& other) const {
        return static_cast<double>(seconds_ - other.seconds_) / 86400.0;
    }

    bool operator==(const Date& other) const { return seconds_ == other.seconds_; }
    bool operator!=(const Date& other) const { return seconds_ != other.seconds_; }
    bool operator<(const Date& other) const { return seconds_ < other.seconds_; }

    // ISO-8601 representation ("YYYY-MM-DD" when the time part is zero)
    std::string ToString() const;

private:
    explicit Date(int64_t seconds) : seconds_(seconds) {}
    int64_t seconds_;
};

// EntityType: kind of record being deduplicated
enum class EntityType : uint8_t {
    DEAL = 0,
    VENDOR = 1,
    CONTACT = 2,
};

const char* ToString(EntityType type);
EntityType ParseEntityType(const std::string& str);

// Strategy: independent heuristic that proposes duplicate matches
enum class Strategy : uint8_t {
    EXACT_MATCH = 0,      // Normalized names equal
    FUZZY_NAME = 1,       // Fuzzy deal + customer name
    CUSTOMER_VALUE = 2,   // Same customer, similar deal value
    CUSTOMER_DATE = 3,    // Same customer, similar close date
    VENDOR_CUSTOMER = 4,  // Same vendor, similar customer
    MULTI_FACTOR = 5,     // Weighted score over all fields
};

const char* ToString(Strategy strategy);
Strategy ParseStrategy(const std::string& str);

// All strategies in evaluation order
const std::vector<Strategy>& AllStrategies();

// SuggestedAction: what the caller should do with a detection verdict
enum class SuggestedAction : uint8_t {
    NO_ACTION = 0,
    MANUAL_REVIEW = 1,
    AUTO_MERGE = 2,
};

const char* ToString(SuggestedAction action);
SuggestedAction ParseSuggestedAction(const std::string& str);

// ClusterStatus: lifecycle of a duplicate cluster
enum class ClusterStatus : uint8_t {
    ACTIVE = 0,
    MERGED = 1,
    SPLIT = 2,
};

const char* ToString(ClusterStatus status);
ClusterStatus ParseClusterStatus(const std::string& str);

// SimilarityFactor: field compared by the multi-factor scorer
enum class SimilarityFactor : uint8_t {
    DEAL_NAME = 0,
    CUSTOMER_NAME = 1,
    VENDOR_MATCH = 2,
    DEAL_VALUE = 3,
    CLOSE_DATE = 4,
    PRODUCTS = 5,
    CONTACTS = 6,
    DESCRIPTION = 7,
};

const char* ToString(SimilarityFactor factor);
SimilarityFactor ParseSimilarityFactor(const std::string& str);

// Every factor in declaration order
const std::vector<SimilarityFactor>& AllSimilarityFactors();

// SimilarityFactors: sparse map of per-field scores in [0,1]
// Fields that were not compared are absent rather than zero
class SimilarityFactors {
public:
    using StorageType = std::map<SimilarityFactor, double>;

    SimilarityFactors() = default;
    SimilarityFactors(std::initializer_list<StorageType::value_type> init)
        : data_(init) {}

    void Set(SimilarityFactor factor, double value) { data_[factor] = value; }

    // Returns 0.0 if the factor is absent
    double Get(SimilarityFactor factor) const;

    bool Has(SimilarityFactor factor) const { return data_.count(factor) > 0; }

    size_t Size() const { return data_.size(); }
    bool IsEmpty() const { return data_.empty(); }

    const StorageType& Data() const { return data_; }

    bool operator==(const SimilarityFactors& other) const { return data_ == other.data_; }

    // "deal_name=1.00, customer_name=0.95"
    std::string ToString() const;

private:
    StorageType data_;
};

// FieldWeights: per-factor weights for the multi-factor scorer
// A factor with no weight takes no part in the weighted average
class FieldWeights {
public:
    using StorageType = std::map<SimilarityFactor, double>;

    FieldWeights() = default;
    FieldWeights(std::initializer_list<StorageType::value_type> init)
        : data_(init) {}

    // deal_name .25, customer_name .25, vendor_match .15, deal_value .15,
    // close_date .10, products .05, contacts .05, description 0
    static FieldWeights Default();

    void Set(SimilarityFactor factor, double weight) { data_[factor] = weight; }

    // Returns 0.0 if no weight was supplied
    double Get(SimilarityFactor factor) const;

    bool Has(SimilarityFactor factor) const { return data_.count(factor) > 0; }

    // Sum of all supplied weights
    double Total() const;

    const StorageType& Data() const { return data_; }

    bool operator==(const FieldWeights& other) const { return data_ == other.data_; }

private:
    StorageType data_;
};

// ContactRecord: person attached to a deal
struct ContactRecord {
    std::string name;
    std::optional<std::string> email;
};

// DealRecord: comparable deal registration
struct DealRecord {
    std::optional<std::string> id;           // Absent for unpersisted records
    std::string deal_name;
    std::string customer_name;
    std::optional<double> deal_value;
    std::string currency;
    std::optional<Date> close_date;
    std::optional<Date> registration_date;
    std::optional<std::string> vendor_id;
    std::string vendor_name;
    std::vector<std::string> products;
    std::vector<ContactRecord> contacts;
    std::string description;
    std::string status;
    std::string source_file_id;
    std::map<std::string, std::string> metadata;

    bool HasId() const { return id.has_value() && !id->empty(); }

    // Zero counts as "no value"
    bool HasValue() const { return deal_value.has_value() && *deal_value != 0.0; }

    bool HasVendor() const { return vendor_id.has_value() && !vendor_id->empty(); }
};

// SimilarityScore: result of the weighted multi-factor scorer
struct SimilarityScore {
    double overall{0.0};
    SimilarityFactors factors;
    double weight{0.0};      // Sum of weights that took part
};

// MatchCandidate: one proposed duplicate from one strategy
struct MatchCandidate {
    std::string matched_entity_id;
    DealRecord matched_entity;
    double similarity_score{0.0};
    double confidence{0.0};
    Strategy strategy{Strategy::EXACT_MATCH};
    SimilarityFactors factors;
    std::string reasoning;
};

// DetectionResult: ranked verdict for one entity
struct DetectionResult {
    bool is_duplicate{false};
    std::vector<MatchCandidate> matches;   // Descending confidence, unique ids
    SuggestedAction suggested_action{SuggestedAction::NO_ACTION};
    double confidence{0.0};                // Top match confidence, 0 if none

    static DetectionResult None() { return DetectionResult{}; }
};

// DuplicateCluster: connected component of high-confidence duplicates
struct DuplicateCluster {
    std::string cluster_id;
    std::string cluster_key;               // Sorted member ids joined by '|'
    EntityType entity_type{EntityType::DEAL};
    std::vector<std::string> entity_ids;   // Sorted, size >= 2
    double confidence_score{0.0};
    int64_t created_at_ms{0};              // Milliseconds since epoch
    ClusterStatus status{ClusterStatus::ACTIVE};

    size_t Size() const { return entity_ids.size(); }
};

// Separator used by cluster keys
constexpr char kClusterKeySeparator = '|';

// Build the deterministic key for a set of member ids
std::string MakeClusterKey(std::vector<std::string> entity_ids);

// Generate "cluster_<epoch-ms>_<9 base-36 chars>" (thread-safe)
std::string GenerateClusterId();

} // namespace dedupe
