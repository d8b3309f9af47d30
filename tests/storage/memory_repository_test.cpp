// File: tests/storage/memory_repository_test.cpp
#include "storage/memory_repository.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include <vector>

namespace dedupe {
namespace {

DealRecord CreateDeal(const std::string& id, const std::string& customer,
                      const std::string& vendor = "") {
    DealRecord deal;
    deal.id = id;
    deal.deal_name = "Deal " + id;
    deal.customer_name = customer;
    if (!vendor.empty()) {
        deal.vendor_id = vendor;
    }
    return deal;
}

class MemoryRepositoryTest : public ::testing::Test {
protected:
    MemoryRepository repository_;
};

TEST_F(MemoryRepositoryTest, EmptyRepository) {
    EXPECT_EQ(0u, repository_.Size());
    EXPECT_TRUE(repository_.FetchAll().empty());
    EXPECT_TRUE(repository_.FindCandidates(CreateDeal("x", "Acme")).empty());
}

TEST_F(MemoryRepositoryTest, CandidatesByCustomerSubstringOrVendor) {
    repository_.Add(CreateDeal("d1", "ACME Incorporated"));
    repository_.Add(CreateDeal("d2", "Globex", "v1"));
    repository_.Add(CreateDeal("d3", "Initech", "v2"));

    auto candidates = repository_.FindCandidates(CreateDeal("new", "Acme", "v1"));

    ASSERT_EQ(2u, candidates.size());
    EXPECT_EQ("d2", *candidates[0].id);
    EXPECT_EQ("d1", *candidates[1].id);
}

TEST_F(MemoryRepositoryTest, MissingVendorNeverMatchesMissingVendor) {
    repository_.Add(CreateDeal("d1", "Globex"));

    EXPECT_TRUE(repository_.FindCandidates(CreateDeal("new", "Acme")).empty());
}

TEST_F(MemoryRepositoryTest, RejectedExcluded) {
    DealRecord rejected = CreateDeal("d1", "Acme");
    rejected.status = "rejected";
    repository_.Add(rejected);
    repository_.Add(CreateDeal("d2", "Acme"));

    EXPECT_EQ(1u, repository_.FindCandidates(CreateDeal("new", "Acme")).size());
    EXPECT_EQ(1u, repository_.FetchAll().size());
    EXPECT_EQ(2u, repository_.Size());
}

TEST(MemoryRepositoryConfigTest, CandidateLimit) {
    MemoryRepository repository(MemoryRepository::Config{2});
    for (int i = 0; i < 5; ++i) {
        repository.Add(CreateDeal("d" + std::to_string(i), "Acme"));
    }

    auto candidates = repository.FindCandidates(CreateDeal("new", "Acme"));

    ASSERT_EQ(2u, candidates.size());
    EXPECT_EQ("d4", *candidates[0].id);
    EXPECT_EQ("d3", *candidates[1].id);
    EXPECT_EQ(5u, repository.FetchAll().size());
}

TEST(MemoryRepositoryConfigTest, ZeroLimitThrows) {
    EXPECT_THROW(MemoryRepository(MemoryRepository::Config{0}), std::invalid_argument);
}

TEST_F(MemoryRepositoryTest, Clear) {
    repository_.Add(CreateDeal("d1", "Acme"));
    repository_.Clear();
    EXPECT_EQ(0u, repository_.Size());
}

TEST_F(MemoryRepositoryTest, ConcurrentAddAndQuery) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < 50; ++i) {
                repository_.Add(CreateDeal(std::to_string(t) + "_" + std::to_string(i), "Acme"));
                repository_.FindCandidates(CreateDeal("probe", "Acme"));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(200u, repository_.Size());
}

} // namespace
} // namespace dedupe
