// File: src/storage/sqlite_deal_repository.cpp
#include "storage/sqlite_deal_repository.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <json/json.h>

namespace dedupe {

namespace {

struct StatementFinalizer {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};

using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

constexpr const char* kDealColumns =
    "id, deal_name, customer_name, deal_value, currency, close_date, "
    "registration_date, vendor_id, vendor_name, products, contacts, "
    "description, status, source_file_id, metadata";

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string WriteJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

std::optional<Json::Value> ReadJson(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        return std::nullopt;
    }
    return root;
}

std::string EncodeProducts(const std::vector<std::string>& products) {
    Json::Value array(Json::arrayValue);
    for (const auto& product : products) {
        array.append(product);
    }
    return WriteJson(array);
}

std::string EncodeContacts(const std::vector<ContactRecord>& contacts) {
    Json::Value array(Json::arrayValue);
    for (const auto& contact : contacts) {
        Json::Value entry(Json::objectValue);
        entry["name"] = contact.name;
        if (contact.email) {
            entry["email"] = *contact.email;
        }
        array.append(entry);
    }
    return WriteJson(array);
}

std::string EncodeMetadata(const std::map<std::string, std::string>& metadata) {
    Json::Value object(Json::objectValue);
    for (const auto& [key, value] : metadata) {
        object[key] = value;
    }
    return WriteJson(object);
}

// Malformed JSON columns decode as empty
std::vector<std::string> DecodeProducts(const std::string& text) {
    std::vector<std::string> products;
    auto root = ReadJson(text);
    if (!root || !root->isArray()) {
        return products;
    }
    for (const auto& item : *root) {
        if (item.isString()) {
            products.push_back(item.asString());
        }
    }
    return products;
}

std::vector<ContactRecord> DecodeContacts(const std::string& text) {
    std::vector<ContactRecord> contacts;
    auto root = ReadJson(text);
    if (!root || !root->isArray()) {
        return contacts;
    }
    for (const auto& item : *root) {
        if (!item.isObject()) {
            continue;
        }
        ContactRecord contact;
        if (item.isMember("name") && item["name"].isString()) {
            contact.name = item["name"].asString();
        }
        if (item.isMember("email") && item["email"].isString()) {
            contact.email = item["email"].asString();
        }
        contacts.push_back(std::move(contact));
    }
    return contacts;
}

std::map<std::string, std::string> DecodeMetadata(const std::string& text) {
    std::map<std::string, std::string> metadata;
    auto root = ReadJson(text);
    if (!root || !root->isObject()) {
        return metadata;
    }
    for (const auto& key : root->getMemberNames()) {
        const Json::Value& value = (*root)[key];
        metadata[key] = value.isString() ? value.asString() : WriteJson(value);
    }
    return metadata;
}

std::string ColumnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

std::optional<std::string> ColumnOptionalText(sqlite3_stmt* stmt, int column) {
    if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
        return std::nullopt;
    }
    return ColumnText(stmt, column);
}

void BindOptionalText(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value) {
    if (value) {
        sqlite3_bind_text(stmt, index, value->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

void BindText(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void BindDate(sqlite3_stmt* stmt, int index, const std::optional<Date>& date) {
    if (date) {
        BindText(stmt, index, date->ToString());
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

DealRecord ReadDeal(sqlite3_stmt* stmt) {
    DealRecord deal;
    deal.id = ColumnOptionalText(stmt, 0);
    deal.deal_name = ColumnText(stmt, 1);
    deal.customer_name = ColumnText(stmt, 2);
    if (sqlite3_column_type(stmt, 3) != SQLITE_NULL) {
        deal.deal_value = sqlite3_column_double(stmt, 3);
    }
    deal.currency = ColumnText(stmt, 4);
    deal.close_date = Date::Parse(ColumnText(stmt, 5));
    deal.registration_date = Date::Parse(ColumnText(stmt, 6));
    deal.vendor_id = ColumnOptionalText(stmt, 7);
    deal.vendor_name = ColumnText(stmt, 8);
    deal.products = DecodeProducts(ColumnText(stmt, 9));
    deal.contacts = DecodeContacts(ColumnText(stmt, 10));
    deal.description = ColumnText(stmt, 11);
    deal.status = ColumnText(stmt, 12);
    deal.source_file_id = ColumnText(stmt, 13);
    deal.metadata = DecodeMetadata(ColumnText(stmt, 14));
    return deal;
}

int64_t NowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

// ============================================================================
// Constructor and Destructor
// ============================================================================

SqliteDealRepository::SqliteDealRepository(const Config& config)
    : config_(config) {
    if (config_.candidate_limit == 0) {
        throw std::invalid_argument("candidate_limit must be greater than 0");
    }

    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + error);
    }

    try {
        InitializeDatabase();
    } catch (const std::exception&) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteDealRepository::Config SqliteDealRepository::ConfigFrom(const DetectorConfig& config) {
    Config repo_config;
    repo_config.db_path = config.storage.db_path;
    repo_config.candidate_limit = config.storage.candidate_limit;
    repo_config.enable_wal = config.storage.enable_wal;
    return repo_config;
}

SqliteDealRepository::~SqliteDealRepository() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

void SqliteDealRepository::InitializeDatabase() {
    std::lock_guard<std::mutex> lock(mutex_);

    // Avoid waiting forever on a locked database
    sqlite3_busy_timeout(db_, 5000);

    if (config_.enable_wal) {
        ExecuteSQL("PRAGMA journal_mode=WAL;");
    }
    ExecuteSQL("PRAGMA synchronous=" + config_.synchronous + ";");

    CreateTables();
}

void SqliteDealRepository::CreateTables() {
    ExecuteSQL(R"(
        CREATE TABLE IF NOT EXISTS deal_registrations (
            id TEXT PRIMARY KEY,
            deal_name TEXT NOT NULL DEFAULT '',
            customer_name TEXT NOT NULL DEFAULT '',
            deal_value REAL,
            currency TEXT NOT NULL DEFAULT '',
            close_date TEXT,
            registration_date TEXT,
            vendor_id TEXT,
            vendor_name TEXT NOT NULL DEFAULT '',
            products TEXT NOT NULL DEFAULT '[]',
            contacts TEXT NOT NULL DEFAULT '[]',
            description TEXT NOT NULL DEFAULT '',
            status TEXT NOT NULL DEFAULT '',
            source_file_id TEXT NOT NULL DEFAULT '',
            metadata TEXT NOT NULL DEFAULT '{}',
            created_at INTEGER NOT NULL
        );
    )");

    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_deal_created_at ON deal_registrations(created_at);");
    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_deal_vendor ON deal_registrations(vendor_id);");
}

void SqliteDealRepository::ExecuteSQL(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : sqlite3_errstr(rc);
        sqlite3_free(error_msg);
        throw std::runtime_error("SQL execution failed: " + error);
    }
}

sqlite3_stmt* SqliteDealRepository::Prepare(const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw Error("Failed to prepare statement");
    }
    return stmt;
}

std::runtime_error SqliteDealRepository::Error(const std::string& what) const {
    return std::runtime_error(what + ": " + sqlite3_errmsg(db_));
}

std::vector<DealRecord> SqliteDealRepository::ReadDeals(sqlite3_stmt* stmt) {
    std::vector<DealRecord> deals;

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        deals.push_back(ReadDeal(stmt));
    }

    if (rc != SQLITE_DONE) {
        throw Error("Failed to read deals");
    }
    return deals;
}

// ============================================================================
// Queries
// ============================================================================

std::vector<DealRecord> SqliteDealRepository::FindCandidates(const DealRecord& entity) {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string sql = std::string("SELECT ") + kDealColumns +
        " FROM deal_registrations"
        " WHERE status != 'rejected'"
        " AND (LOWER(customer_name) LIKE ? OR vendor_id = ?)"
        " ORDER BY created_at DESC LIMIT ?;";

    StatementPtr stmt(Prepare(sql.c_str()));

    BindText(stmt.get(), 1, "%" + ToLower(entity.customer_name) + "%");
    BindOptionalText(stmt.get(), 2, entity.HasVendor() ? entity.vendor_id : std::nullopt);
    sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(config_.candidate_limit));

    return ReadDeals(stmt.get());
}

std::vector<DealRecord> SqliteDealRepository::FetchAll() {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string sql = std::string("SELECT ") + kDealColumns +
        " FROM deal_registrations"
        " WHERE status != 'rejected'"
        " ORDER BY created_at DESC;";

    StatementPtr stmt(Prepare(sql.c_str()));
    return ReadDeals(stmt.get());
}

std::optional<DealRecord> SqliteDealRepository::Retrieve(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string sql = std::string("SELECT ") + kDealColumns +
        " FROM deal_registrations WHERE id = ?;";

    StatementPtr stmt(Prepare(sql.c_str()));
    BindText(stmt.get(), 1, id);

    auto deals = ReadDeals(stmt.get());
    if (deals.empty()) {
        return std::nullopt;
    }
    return deals.front();
}

size_t SqliteDealRepository::Count() {
    std::lock_guard<std::mutex> lock(mutex_);

    StatementPtr stmt(Prepare("SELECT COUNT(*) FROM deal_registrations;"));

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw Error("Failed to count deals");
    }
    return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
}

// ============================================================================
// Writes
// ============================================================================

void SqliteDealRepository::Store(const DealRecord& deal) {
    Store(deal, NowMillis());
}

void SqliteDealRepository::Store(const DealRecord& deal, int64_t created_at_ms) {
    if (!deal.HasId()) {
        throw std::invalid_argument("Cannot store a deal without an id");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    StatementPtr stmt(Prepare(
        "INSERT OR REPLACE INTO deal_registrations ("
        "id, deal_name, customer_name, deal_value, currency, close_date, "
        "registration_date, vendor_id, vendor_name, products, contacts, "
        "description, status, source_file_id, metadata, created_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);"));

    BindText(stmt.get(), 1, *deal.id);
    BindText(stmt.get(), 2, deal.deal_name);
    BindText(stmt.get(), 3, deal.customer_name);
    if (deal.deal_value) {
        sqlite3_bind_double(stmt.get(), 4, *deal.deal_value);
    } else {
        sqlite3_bind_null(stmt.get(), 4);
    }
    BindText(stmt.get(), 5, deal.currency);
    BindDate(stmt.get(), 6, deal.close_date);
    BindDate(stmt.get(), 7, deal.registration_date);
    BindOptionalText(stmt.get(), 8, deal.vendor_id);
    BindText(stmt.get(), 9, deal.vendor_name);
    BindText(stmt.get(), 10, EncodeProducts(deal.products));
    BindText(stmt.get(), 11, EncodeContacts(deal.contacts));
    BindText(stmt.get(), 12, deal.description);
    BindText(stmt.get(), 13, deal.status);
    BindText(stmt.get(), 14, deal.source_file_id);
    BindText(stmt.get(), 15, EncodeMetadata(deal.metadata));
    sqlite3_bind_int64(stmt.get(), 16, created_at_ms);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw Error("Failed to store deal " + *deal.id);
    }
}

} // namespace dedupe
