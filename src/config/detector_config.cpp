// File: src/config/detector_config.cpp
//
// YAML Configuration Implementation for the duplicate detection engine

#include "config/detector_config.hpp"
#include <yaml.h>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace dedupe {

// Helper function to read string from YAML scalar
static std::string GetScalarValue(yaml_event_t* event) {
    return std::string(reinterpret_cast<char*>(event->data.scalar.value),
                      event->data.scalar.length);
}

// Helper to convert string to bool
static bool ParseBool(const std::string& value) {
    return (value == "true" || value == "True" || value == "TRUE" ||
            value == "yes" || value == "Yes" || value == "YES" ||
            value == "1" || value == "on" || value == "On" || value == "ON");
}

static const char* BoolString(bool value) {
    return value ? "true" : "false";
}

// Non-negative integer; signs and trailing text are rejected
static size_t ParseCount(const std::string& value) {
    if (value.empty() || value[0] < '0' || value[0] > '9') {
        throw std::invalid_argument("expected a non-negative integer");
    }
    size_t consumed = 0;
    unsigned long long result = std::stoull(value, &consumed);
    if (consumed != value.size() || result > std::numeric_limits<size_t>::max()) {
        throw std::invalid_argument("expected a non-negative integer");
    }
    return static_cast<size_t>(result);
}

// Shortest of 15 or max_digits10 significant digits that reads back exactly
static std::string FormatDouble(double value) {
    std::ostringstream ss;
    ss << std::setprecision(15) << value;
    if (std::stod(ss.str()) != value) {
        ss.str("");
        ss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    }
    return ss.str();
}

// YAML double-quoted scalar
static std::string QuoteString(const std::string& value) {
    std::string quoted = "\"";
    for (char c : value) {
        switch (c) {
            case '"': quoted += "\\\""; break;
            case '\\': quoted += "\\\\"; break;
            case '\n': quoted += "\\n"; break;
            case '\t': quoted += "\\t"; break;
            case '\r': quoted += "\\r"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char escape[5];
                    std::snprintf(escape, sizeof(escape), "\\x%02x", static_cast<unsigned char>(c));
                    quoted += escape;
                } else {
                    quoted += c;
                }
        }
    }
    quoted += '"';
    return quoted;
}

// Apply one "section.key: value" pair; throws std::invalid_argument or
// std::out_of_range on malformed numbers
static void ApplySetting(DetectorConfig& config,
                         const std::string& section,
                         const std::string& key,
                         const std::string& value) {
    if (section == "thresholds") {
        if (key == "auto_merge") config.thresholds.auto_merge = std::stod(value);
        else if (key == "high_confidence") config.thresholds.high_confidence = std::stod(value);
        else if (key == "medium_confidence") config.thresholds.medium_confidence = std::stod(value);
        else if (key == "low_confidence") config.thresholds.low_confidence = std::stod(value);
        else if (key == "minimum_match") config.thresholds.minimum_match = std::stod(value);
    }
    else if (section == "fuzzy") {
        if (key == "exact") config.fuzzy.exact = std::stod(value);
        else if (key == "high") config.fuzzy.high = std::stod(value);
        else if (key == "medium") config.fuzzy.medium = std::stod(value);
        else if (key == "low") config.fuzzy.low = std::stod(value);
    }
    else if (section == "tolerance") {
        if (key == "value_percent") config.tolerance.value_percent = std::stod(value);
        else if (key == "date_days") config.tolerance.date_days = std::stod(value);
    }
    else if (section == "weights") {
        // Unknown factor names are rejected by ParseSimilarityFactor
        config.weights.Set(ParseSimilarityFactor(key), std::stod(value));
    }
    else if (section == "batch") {
        if (key == "batch_size") config.batch.batch_size = ParseCount(value);
        else if (key == "worker_threads") config.batch.worker_threads = ParseCount(value);
    }
    else if (section == "logging") {
        if (key == "debug_logging") config.logging.debug_logging = ParseBool(value);
    }
    else if (section == "storage") {
        if (key == "db_path") config.storage.db_path = value;
        else if (key == "candidate_limit") config.storage.candidate_limit = ParseCount(value);
        else if (key == "enable_wal") config.storage.enable_wal = ParseBool(value);
    }
}

std::optional<DetectorConfig> DetectorConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << filepath << std::endl;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<DetectorConfig> DetectorConfig::LoadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        std::cerr << "Failed to initialize YAML parser" << std::endl;
        return std::nullopt;
    }

    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    DetectorConfig config = Default();
    std::string current_section;
    std::string current_key;
    int depth = 0;

    bool done = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            std::cerr << "YAML parse error";
            if (parser.problem) {
                std::cerr << ": " << parser.problem
                          << " (line " << parser.problem_mark.line + 1 << ")";
            }
            std::cerr << std::endl;
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        switch (event.type) {
            case YAML_STREAM_START_EVENT:
            case YAML_DOCUMENT_START_EVENT:
                break;

            case YAML_MAPPING_START_EVENT:
                depth++;
                break;

            case YAML_MAPPING_END_EVENT:
                depth--;
                if (depth == 1) {
                    current_section.clear();
                }
                break;

            case YAML_SCALAR_EVENT: {
                std::string value = GetScalarValue(&event);

                if (depth == 1) {
                    // Top-level key (section name)
                    current_section = value;
                } else if (depth == 2) {
                    if (current_key.empty()) {
                        current_key = value;
                    } else {
                        try {
                            ApplySetting(config, current_section, current_key, value);
                        } catch (const std::exception& e) {
                            std::cerr << "Invalid value for " << current_section << "."
                                      << current_key << ": '" << value << "' ("
                                      << e.what() << ")" << std::endl;
                            yaml_event_delete(&event);
                            yaml_parser_delete(&parser);
                            return std::nullopt;
                        }
                        current_key.clear();
                    }
                }
                break;
            }

            case YAML_STREAM_END_EVENT:
            case YAML_DOCUMENT_END_EVENT:
                done = true;
                break;

            default:
                break;
        }

        yaml_event_delete(&event);
    }

    yaml_parser_delete(&parser);

    if (!config.Validate()) {
        std::cerr << "Configuration validation failed:" << std::endl;
        for (const auto& error : config.GetValidationErrors()) {
            std::cerr << "  - " << error << std::endl;
        }
        return std::nullopt;
    }

    return config;
}

bool DetectorConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open file for writing: " << filepath << std::endl;
        return false;
    }

    file << ToYamlString();
    return file.good();
}

std::string DetectorConfig::ToYamlString() const {
    std::ostringstream ss;

    ss << "# Duplicate Detection Configuration\n";
    ss << "# Auto-generated configuration file\n\n";

    ss << "thresholds:\n";
    ss << "  auto_merge: " << FormatDouble(thresholds.auto_merge) << "\n";
    ss << "  high_confidence: " << FormatDouble(thresholds.high_confidence) << "\n";
    ss << "  medium_confidence: " << FormatDouble(thresholds.medium_confidence) << "\n";
    ss << "  low_confidence: " << FormatDouble(thresholds.low_confidence) << "\n";
    ss << "  minimum_match: " << FormatDouble(thresholds.minimum_match) << "\n\n";

    ss << "fuzzy:\n";
    ss << "  exact: " << FormatDouble(fuzzy.exact) << "\n";
    ss << "  high: " << FormatDouble(fuzzy.high) << "\n";
    ss << "  medium: " << FormatDouble(fuzzy.medium) << "\n";
    ss << "  low: " << FormatDouble(fuzzy.low) << "\n\n";

    ss << "tolerance:\n";
    ss << "  value_percent: " << FormatDouble(tolerance.value_percent) << "\n";
    ss << "  date_days: " << FormatDouble(tolerance.date_days) << "\n\n";

    ss << "weights:\n";
    for (const auto& [factor, weight] : weights.Data()) {
        ss << "  " << ToString(factor) << ": " << FormatDouble(weight) << "\n";
    }
    ss << "\n";

    ss << "batch:\n";
    ss << "  batch_size: " << batch.batch_size << "\n";
    ss << "  worker_threads: " << batch.worker_threads << "\n\n";

    ss << "logging:\n";
    ss << "  debug_logging: " << BoolString(logging.debug_logging) << "\n\n";

    ss << "storage:\n";
    ss << "  db_path: " << QuoteString(storage.db_path) << "\n";
    ss << "  candidate_limit: " << storage.candidate_limit << "\n";
    ss << "  enable_wal: " << BoolString(storage.enable_wal) << "\n";

    return ss.str();
}

bool DetectorConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> DetectorConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    auto check_unit = [&errors](double value, const char* name) {
        if (value < 0.0 || value > 1.0) {
            errors.push_back(std::string(name) + " must be between 0.0 and 1.0");
        }
    };

    check_unit(thresholds.auto_merge, "auto_merge");
    check_unit(thresholds.high_confidence, "high_confidence");
    check_unit(thresholds.medium_confidence, "medium_confidence");
    check_unit(thresholds.low_confidence, "low_confidence");
    check_unit(thresholds.minimum_match, "minimum_match");

    if (thresholds.auto_merge < thresholds.high_confidence) {
        errors.push_back("auto_merge must be >= high_confidence");
    }
    if (thresholds.high_confidence < thresholds.medium_confidence ||
        thresholds.medium_confidence < thresholds.low_confidence) {
        errors.push_back("confidence thresholds must satisfy high >= medium >= low");
    }

    auto check_percent = [&errors](double value, const char* name) {
        if (value < 0.0 || value > 100.0) {
            errors.push_back(std::string("fuzzy ") + name + " must be between 0 and 100");
        }
    };

    check_percent(fuzzy.exact, "exact");
    check_percent(fuzzy.high, "high");
    check_percent(fuzzy.medium, "medium");
    check_percent(fuzzy.low, "low");

    if (tolerance.value_percent <= 0.0) {
        errors.push_back("value_percent must be greater than 0");
    }
    if (tolerance.date_days <= 0.0) {
        errors.push_back("date_days must be greater than 0");
    }

    for (const auto& [factor, weight] : weights.Data()) {
        if (weight < 0.0) {
            errors.push_back(std::string("weight for ") + ToString(factor) + " must be non-negative");
        }
    }
    if (weights.Total() <= 0.0) {
        errors.push_back("sum of field weights must be greater than 0");
    }

    if (batch.batch_size == 0) {
        errors.push_back("batch_size must be greater than 0");
    }
    if (batch.worker_threads == 0) {
        errors.push_back("worker_threads must be greater than 0");
    }

    if (storage.candidate_limit == 0) {
        errors.push_back("candidate_limit must be greater than 0");
    }

    return errors;
}

DetectorConfig DetectorConfig::Default() {
    return DetectorConfig{};  // Uses default member initializers
}

} // namespace dedupe
