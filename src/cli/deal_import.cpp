// File: src/cli/deal_import.cpp
#include "cli/deal_import.hpp"
#include <fstream>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>
#include <json/json.h>

namespace dedupe {

namespace {

const std::set<std::string> kKnownKeys = {
    "id", "deal_name", "customer_name", "deal_value", "currency",
    "close_date", "registration_date", "vendor_id", "vendor_name",
    "products", "contacts", "description", "status", "source_file_id",
    "metadata",
};

std::string StringField(const Json::Value& value, const char* key) {
    const Json::Value& field = value[key];
    if (field.isString()) {
        return field.asString();
    }
    if (field.isNumeric()) {
        return field.asString();
    }
    return "";
}

std::optional<std::string> OptionalStringField(const Json::Value& value, const char* key) {
    if (!value.isMember(key) || value[key].isNull()) {
        return std::nullopt;
    }
    return StringField(value, key);
}

std::optional<double> NumberField(const Json::Value& value, const char* key) {
    const Json::Value& field = value[key];
    if (field.isNumeric()) {
        return field.asDouble();
    }
    if (field.isString()) {
        // Values exported as text, e.g. "125000.50"
        std::istringstream iss(field.asString());
        double parsed;
        if (iss >> parsed) {
            return parsed;
        }
    }
    return std::nullopt;
}

std::optional<Date> DateField(const Json::Value& value, const char* key) {
    if (!value[key].isString()) {
        return std::nullopt;
    }
    return Date::Parse(value[key].asString());
}

std::string Compact(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

} // namespace

DealRecord DealFromJson(const Json::Value& value) {
    if (!value.isObject()) {
        throw std::invalid_argument("Deal must be a JSON object");
    }

    DealRecord deal;
    deal.id = OptionalStringField(value, "id");
    deal.deal_name = StringField(value, "deal_name");
    deal.customer_name = StringField(value, "customer_name");
    deal.deal_value = NumberField(value, "deal_value");
    deal.currency = StringField(value, "currency");
    deal.close_date = DateField(value, "close_date");
    deal.registration_date = DateField(value, "registration_date");
    deal.vendor_id = OptionalStringField(value, "vendor_id");
    deal.vendor_name = StringField(value, "vendor_name");
    deal.description = StringField(value, "description");
    deal.status = StringField(value, "status");
    deal.source_file_id = StringField(value, "source_file_id");

    for (const auto& product : value["products"]) {
        if (product.isString()) {
            deal.products.push_back(product.asString());
        }
    }

    for (const auto& item : value["contacts"]) {
        if (!item.isObject()) {
            continue;
        }
        ContactRecord contact;
        contact.name = StringField(item, "name");
        contact.email = OptionalStringField(item, "email");
        deal.contacts.push_back(std::move(contact));
    }

    const Json::Value& metadata = value["metadata"];
    if (metadata.isObject()) {
        for (const auto& key : metadata.getMemberNames()) {
            deal.metadata[key] = metadata[key].isString() ? metadata[key].asString()
                                                          : Compact(metadata[key]);
        }
    }

    for (const auto& key : value.getMemberNames()) {
        if (kKnownKeys.count(key) == 0) {
            deal.metadata[key] = value[key].isString() ? value[key].asString()
                                                       : Compact(value[key]);
        }
    }

    return deal;
}

std::vector<DealRecord> ParseDealsJson(const std::string& json) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    if (!reader->parse(json.data(), json.data() + json.size(), &root, &errors)) {
        throw std::invalid_argument("Malformed deals JSON: " + errors);
    }

    std::vector<DealRecord> deals;
    if (root.isArray()) {
        for (const auto& item : root) {
            deals.push_back(DealFromJson(item));
        }
    } else {
        deals.push_back(DealFromJson(root));
    }
    return deals;
}

std::vector<DealRecord> LoadDealsFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open deals file: " + filepath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return ParseDealsJson(buffer.str());
}

} // namespace dedupe
