// File: src/core/types.cpp
#include "core/types.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace dedupe {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date
int64_t DaysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void CivilFromDays(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y += m <= 2;
}

bool IsLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int DaysInMonth(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && IsLeapYear(year)) {
        return 29;
    }
    return kDays[month - 1];
}

// Exactly `count` ASCII digits at pos
bool ReadDigits(const std::string& text, size_t& pos, size_t count, int& value) {
    if (pos + count > text.size()) {
        return false;
    }
    int result = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = text[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        result = result * 10 + (c - '0');
    }
    value = result;
    pos += count;
    return true;
}

bool ReadChar(const std::string& text, size_t& pos, char expected) {
    if (pos < text.size() && text[pos] == expected) {
        ++pos;
        return true;
    }
    return false;
}

} // namespace

// ============================================================================
// Date
// ============================================================================

Date Date::FromCivil(int year, int month, int day, int hour, int minute, int second) {
    int64_t days = DaysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    return Date(days * 86400 + hour * 3600 + minute * 60 + second);
}

std::optional<Date> Date::Parse(const std::string& text) {
    if (text.size() < 10) {
        return std::nullopt;
    }

    int year = 0, month = 0, day = 0;
    int hour = 0, minute = 0, second = 0;

    size_t pos = 0;
    if (!ReadDigits(text, pos, 4, year) || !ReadChar(text, pos, '-') ||
        !ReadDigits(text, pos, 2, month) || !ReadChar(text, pos, '-') ||
        !ReadDigits(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > DaysInMonth(year, month)) {
        return std::nullopt;
    }

    if (text.size() == 10) {
        return FromCivil(year, month, day);
    }

    char separator = text[10];
    if (separator != 'T' && separator != ' ') {
        return std::nullopt;
    }

    // HH:MM[:SS[.fff]]
    pos = 11;
    if (!ReadDigits(text, pos, 2, hour) || !ReadChar(text, pos, ':') ||
        !ReadDigits(text, pos, 2, minute)) {
        return std::nullopt;
    }
    if (ReadChar(text, pos, ':')) {
        if (!ReadDigits(text, pos, 2, second)) {
            return std::nullopt;
        }
        if (ReadChar(text, pos, '.')) {
            size_t start = pos;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                ++pos;
            }
            if (pos == start) {
                return std::nullopt;
            }
        }
    }
    if (hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    // Z, +HH:MM, -HH:MM, +HHMM or nothing (UTC)
    int64_t offset = 0;
    if (pos < text.size()) {
        char sign = text[pos++];
        if (sign == 'Z') {
            // UTC
        } else if (sign == '+' || sign == '-') {
            int offset_hours = 0, offset_minutes = 0;
            if (!ReadDigits(text, pos, 2, offset_hours)) {
                return std::nullopt;
            }
            ReadChar(text, pos, ':');  // Optional
            if (!ReadDigits(text, pos, 2, offset_minutes) ||
                offset_hours > 23 || offset_minutes > 59) {
                return std::nullopt;
            }
            offset = offset_hours * 3600 + offset_minutes * 60;
            if (sign == '-') {
                offset = -offset;
            }
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    return Date(FromCivil(year, month, day, hour, minute, second).ToSeconds() - offset);
}

std::string Date::ToString() const {
    int64_t days = seconds_ / 86400;
    int64_t rem = seconds_ % 86400;
    if (rem < 0) {
        rem += 86400;
        --days;
    }

    int64_t y;
    unsigned m, d;
    CivilFromDays(days, y, m, d);

    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << y << "-"
        << std::setw(2) << m << "-" << std::setw(2) << d;
    if (rem != 0) {
        oss << "T" << std::setw(2) << rem / 3600 << ":"
            << std::setw(2) << (rem % 3600) / 60 << ":"
            << std::setw(2) << rem % 60;
    }
    return oss.str();
}

// ============================================================================
// Enum conversions
// ============================================================================

const char* ToString(EntityType type) {
    switch (type) {
        case EntityType::DEAL: return "deal";
        case EntityType::VENDOR: return "vendor";
        case EntityType::CONTACT: return "contact";
        default: return "unknown";
    }
}

EntityType ParseEntityType(const std::string& str) {
    if (str == "deal") return EntityType::DEAL;
    if (str == "vendor") return EntityType::VENDOR;
    if (str == "contact") return EntityType::CONTACT;
    throw std::invalid_argument("Unknown EntityType: " + str);
}

const char* ToString(Strategy strategy) {
    switch (strategy) {
        case Strategy::EXACT_MATCH: return "exact_match";
        case Strategy::FUZZY_NAME: return "fuzzy_name";
        case Strategy::CUSTOMER_VALUE: return "customer_value";
        case Strategy::CUSTOMER_DATE: return "customer_date";
        case Strategy::VENDOR_CUSTOMER: return "vendor_customer";
        case Strategy::MULTI_FACTOR: return "multi_factor";
        default: return "unknown";
    }
}

Strategy ParseStrategy(const std::string& str) {
    if (str == "exact_match") return Strategy::EXACT_MATCH;
    if (str == "fuzzy_name") return Strategy::FUZZY_NAME;
    if (str == "customer_value") return Strategy::CUSTOMER_VALUE;
    if (str == "customer_date") return Strategy::CUSTOMER_DATE;
    if (str == "vendor_customer") return Strategy::VENDOR_CUSTOMER;
    if (str == "multi_factor") return Strategy::MULTI_FACTOR;
    throw std::invalid_argument("Unknown Strategy: " + str);
}

const std::vector<Strategy>& AllStrategies() {
    static const std::vector<Strategy> kAll = {
        Strategy::EXACT_MATCH,
        Strategy::FUZZY_NAME,
        Strategy::CUSTOMER_VALUE,
        Strategy::CUSTOMER_DATE,
        Strategy::VENDOR_CUSTOMER,
        Strategy::MULTI_FACTOR,
    };
    return kAll;
}

const char* ToString(SuggestedAction action) {
    switch (action) {
        case SuggestedAction::NO_ACTION: return "no_action";
        case SuggestedAction::MANUAL_REVIEW: return "manual_review";
        case SuggestedAction::AUTO_MERGE: return "auto_merge";
        default: return "unknown";
    }
}

SuggestedAction ParseSuggestedAction(const std::string& str) {
    if (str == "no_action") return SuggestedAction::NO_ACTION;
    if (str == "manual_review") return SuggestedAction::MANUAL_REVIEW;
    if (str == "auto_merge") return SuggestedAction::AUTO_MERGE;
    throw std::invalid_argument("Unknown SuggestedAction: " + str);
}

const char* ToString(ClusterStatus status) {
    switch (status) {
        case ClusterStatus::ACTIVE: return "active";
        case ClusterStatus::MERGED: return "merged";
        case ClusterStatus::SPLIT: return "split";
        default: return "unknown";
    }
}

ClusterStatus ParseClusterStatus(const std::string& str) {
    if (str == "active") return ClusterStatus::ACTIVE;
    if (str == "merged") return ClusterStatus::MERGED;
    if (str == "split") return ClusterStatus::SPLIT;
    throw std::invalid_argument("Unknown ClusterStatus: " + str);
}

const char* ToString(SimilarityFactor factor) {
    switch (factor) {
        case SimilarityFactor::DEAL_NAME: return "deal_name";
        case SimilarityFactor::CUSTOMER_NAME: return "customer_name";
        case SimilarityFactor::VENDOR_MATCH: return "vendor_match";
        case SimilarityFactor::DEAL_VALUE: return "deal_value";
        case SimilarityFactor::CLOSE_DATE: return "close_date";
        case SimilarityFactor::PRODUCTS: return "products";
        case SimilarityFactor::CONTACTS: return "contacts";
        case SimilarityFactor::DESCRIPTION: return "description";
        default: return "unknown";
    }
}

SimilarityFactor ParseSimilarityFactor(const std::string& str) {
    if (str == "deal_name") return SimilarityFactor::DEAL_NAME;
    if (str == "customer_name") return SimilarityFactor::CUSTOMER_NAME;
    if (str == "vendor_match") return SimilarityFactor::VENDOR_MATCH;
    if (str == "deal_value") return SimilarityFactor::DEAL_VALUE;
    if (str == "close_date") return SimilarityFactor::CLOSE_DATE;
    if (str == "products") return SimilarityFactor::PRODUCTS;
    if (str == "contacts") return SimilarityFactor::CONTACTS;
    if (str == "description") return SimilarityFactor::DESCRIPTION;
    throw std::invalid_argument("Unknown SimilarityFactor: " + str);
}

const std::vector<SimilarityFactor>& AllSimilarityFactors() {
    static const std::vector<SimilarityFactor> kAll = {
        SimilarityFactor::DEAL_NAME,
        SimilarityFactor::CUSTOMER_NAME,
        SimilarityFactor::VENDOR_MATCH,
        SimilarityFactor::DEAL_VALUE,
        SimilarityFactor::CLOSE_DATE,
        SimilarityFactor::PRODUCTS,
        SimilarityFactor::CONTACTS,
        SimilarityFactor::DESCRIPTION,
    };
    return kAll;
}

// ============================================================================
// SimilarityFactors / FieldWeights
// ============================================================================

double SimilarityFactors::Get(SimilarityFactor factor) const {
    auto it = data_.find(factor);
    return it != data_.end() ? it->second : 0.0;
}

std::string SimilarityFactors::ToString() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    bool first = true;
    for (const auto& [factor, value] : data_) {
        if (!first) {
            oss << ", ";
        }
        oss << dedupe::ToString(factor) << "=" << value;
        first = false;
    }
    return oss.str();
}

FieldWeights FieldWeights::Default() {
    return FieldWeights{
        {SimilarityFactor::DEAL_NAME, 0.25},
        {SimilarityFactor::CUSTOMER_NAME, 0.25},
        {SimilarityFactor::VENDOR_MATCH, 0.15},
        {SimilarityFactor::DEAL_VALUE, 0.15},
        {SimilarityFactor::CLOSE_DATE, 0.10},
        {SimilarityFactor::PRODUCTS, 0.05},
        {SimilarityFactor::CONTACTS, 0.05},
        {SimilarityFactor::DESCRIPTION, 0.00},
    };
}

double FieldWeights::Get(SimilarityFactor factor) const {
    auto it = data_.find(factor);
    return it != data_.end() ? it->second : 0.0;
}

double FieldWeights::Total() const {
    double total = 0.0;
    for (const auto& [factor, weight] : data_) {
        total += weight;
    }
    return total;
}

// ============================================================================
// Clusters
// ============================================================================

std::string MakeClusterKey(std::vector<std::string> entity_ids) {
    std::sort(entity_ids.begin(), entity_ids.end());

    std::string key;
    for (size_t i = 0; i < entity_ids.size(); ++i) {
        if (i > 0) {
            key += kClusterKeySeparator;
        }
        key += entity_ids[i];
    }
    return key;
}

std::string GenerateClusterId() {
    static std::atomic<uint64_t> counter{0};
    static const char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";

    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    // Per-call engine seeded from the device and a process-wide counter
    std::random_device rd;
    std::mt19937_64 rng(rd() ^ counter.fetch_add(1, std::memory_order_relaxed));
    std::uniform_int_distribution<int> dist(0, 35);

    std::string suffix;
    suffix.reserve(9);
    for (int i = 0; i < 9; ++i) {
        suffix += kAlphabet[dist(rng)];
    }

    return "cluster_" + std::to_string(now_ms) + "_" + suffix;
}

} // namespace dedupe
