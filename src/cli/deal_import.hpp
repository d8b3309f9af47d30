// File: src/cli/deal_import.hpp
//
// JSON import of deal records for the command-line front end

#ifndef DEDUPE_CLI_DEAL_IMPORT_HPP
#define DEDUPE_CLI_DEAL_IMPORT_HPP

#include "core/types.hpp"
#include <string>
#include <vector>

namespace Json {
class Value;
}

namespace dedupe {

/// Convert one JSON object to a deal
///
/// Recognized keys: id, deal_name, customer_name, deal_value, currency,
/// close_date, registration_date, vendor_id, vendor_name, products,
/// contacts ([{name, email}]), description, status, source_file_id,
/// metadata (object of strings). Unknown keys are kept in metadata.
/// Unparseable dates are dropped.
/// @throws std::invalid_argument if value is not an object
DealRecord DealFromJson(const Json::Value& value);

/// Parse a JSON array of deals (or a single deal object)
/// @throws std::invalid_argument on malformed JSON
std::vector<DealRecord> ParseDealsJson(const std::string& json);

/// Read and parse a JSON deals file
/// @throws std::runtime_error if the file cannot be read
/// @throws std::invalid_argument on malformed JSON
std::vector<DealRecord> LoadDealsFromFile(const std::string& filepath);

} // namespace dedupe

#endif // DEDUPE_CLI_DEAL_IMPORT_HPP
