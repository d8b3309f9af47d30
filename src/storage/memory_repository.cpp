// File: src/storage/memory_repository.cpp
#include "storage/memory_repository.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <mutex>
#include <stdexcept>

namespace dedupe {

namespace {

constexpr const char* kRejectedStatus = "rejected";

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

MemoryRepository::MemoryRepository()
    : MemoryRepository(Config{}) {
}

MemoryRepository::MemoryRepository(const Config& config)
    : config_(config) {
    if (config_.candidate_limit == 0) {
        throw std::invalid_argument("candidate_limit must be greater than 0");
    }
}

template<typename Pred>
std::vector<DealRecord> MemoryRepository::Select(Pred pred, size_t limit) const {
    std::vector<DealRecord> result;

    for (auto it = entries_.rbegin(); it != entries_.rend() && result.size() < limit; ++it) {
        if (it->status == kRejectedStatus || !pred(*it)) {
            continue;
        }
        result.push_back(*it);
    }

    return result;
}

std::vector<DealRecord> MemoryRepository::FindCandidates(const DealRecord& entity) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    const std::string needle = ToLower(entity.customer_name);

    return Select([&](const DealRecord& deal) {
        if (ToLower(deal.customer_name).find(needle) != std::string::npos) {
            return true;
        }
        return entity.HasVendor() && deal.vendor_id == entity.vendor_id;
    }, config_.candidate_limit);
}

std::vector<DealRecord> MemoryRepository::FetchAll() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return Select([](const DealRecord&) { return true; },
                  std::numeric_limits<size_t>::max());
}

void MemoryRepository::Add(DealRecord deal) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.push_back(std::move(deal));
}

size_t MemoryRepository::Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

void MemoryRepository::Clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.clear();
}

} // namespace dedupe
