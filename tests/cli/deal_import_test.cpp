// File: tests/cli/deal_import_test.cpp
#include "cli/deal_import.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace dedupe;

TEST(DealImportTest, ParsesAllKnownFields) {
    std::string json = R"([
      {
        "id": "d1",
        "deal_name": "Acme Renewal",
        "customer_name": "Acme Inc",
        "deal_value": 100000,
        "currency": "USD",
        "close_date": "2024-06-30",
        "registration_date": "2024-01-15T10:30:00Z",
        "vendor_id": "v1",
        "vendor_name": "Vendor One",
        "products": ["Firewall", "VPN", 7],
        "contacts": [{"name": "Jane", "email": "jane@acme.com"}, {"name": "Bob"}],
        "description": "Renewal of perimeter products",
        "status": "registered",
        "source_file_id": "file-1",
        "metadata": {"region": "EMEA", "seats": 40}
      }
    ])";

    auto deals = ParseDealsJson(json);

    ASSERT_EQ(1u, deals.size());
    const DealRecord& deal = deals[0];
    EXPECT_EQ(std::optional<std::string>("d1"), deal.id);
    EXPECT_EQ("Acme Renewal", deal.deal_name);
    EXPECT_EQ("Acme Inc", deal.customer_name);
    ASSERT_TRUE(deal.deal_value.has_value());
    EXPECT_DOUBLE_EQ(100000.0, *deal.deal_value);
    EXPECT_EQ("USD", deal.currency);
    EXPECT_EQ(Date::FromCivil(2024, 6, 30), *deal.close_date);
    EXPECT_EQ(Date::FromCivil(2024, 1, 15, 10, 30, 0), *deal.registration_date);
    EXPECT_EQ(std::optional<std::string>("v1"), deal.vendor_id);
    EXPECT_EQ((std::vector<std::string>{"Firewall", "VPN"}), deal.products);
    ASSERT_EQ(2u, deal.contacts.size());
    EXPECT_EQ(std::optional<std::string>("jane@acme.com"), deal.contacts[0].email);
    EXPECT_FALSE(deal.contacts[1].email.has_value());
    EXPECT_EQ("registered", deal.status);
    EXPECT_EQ("file-1", deal.source_file_id);
    EXPECT_EQ("EMEA", deal.metadata.at("region"));
    EXPECT_EQ("40", deal.metadata.at("seats"));
}

TEST(DealImportTest, MissingFieldsStayEmpty) {
    auto deals = ParseDealsJson(R"([{"deal_name": "Only a name"}])");

    ASSERT_EQ(1u, deals.size());
    EXPECT_FALSE(deals[0].id.has_value());
    EXPECT_FALSE(deals[0].deal_value.has_value());
    EXPECT_FALSE(deals[0].close_date.has_value());
    EXPECT_FALSE(deals[0].vendor_id.has_value());
    EXPECT_TRUE(deals[0].products.empty());
}

TEST(DealImportTest, ValueAsText) {
    auto deals = ParseDealsJson(R"({"id": "d1", "deal_value": "125000.50"})");

    ASSERT_EQ(1u, deals.size());
    EXPECT_DOUBLE_EQ(125000.5, *deals[0].deal_value);
}

TEST(DealImportTest, UnparseableDateDropped) {
    auto deals = ParseDealsJson(R"([{"id": "d1", "close_date": "end of june"}])");
    EXPECT_FALSE(deals[0].close_date.has_value());
}

TEST(DealImportTest, UnknownKeysKeptAsMetadata) {
    auto deals = ParseDealsJson(R"([{"id": "d1", "partner_tier": "gold", "score": 3}])");

    EXPECT_EQ("gold", deals[0].metadata.at("partner_tier"));
    EXPECT_EQ("3", deals[0].metadata.at("score"));
}

TEST(DealImportTest, MalformedJsonThrows) {
    EXPECT_THROW(ParseDealsJson("[{\"id\": "), std::invalid_argument);
    EXPECT_THROW(ParseDealsJson("[1, 2]"), std::invalid_argument);
}

TEST(DealImportTest, LoadFromFile) {
    std::string path = "/tmp/dedupe_import_test.json";
    {
        std::ofstream file(path);
        file << R"([{"id": "a"}, {"id": "b"}])";
    }

    auto deals = LoadDealsFromFile(path);
    std::filesystem::remove(path);

    ASSERT_EQ(2u, deals.size());
    EXPECT_EQ("b", *deals[1].id);
}

TEST(DealImportTest, MissingFileThrows) {
    EXPECT_THROW(LoadDealsFromFile("/nonexistent/deals.json"), std::runtime_error);
}
