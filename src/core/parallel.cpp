// File: src/core/parallel.cpp
#include "core/parallel.hpp"
#include <algorithm>
#include <exception>
#include <utility>
#include <vector>

namespace dedupe {

void ParallelFor(size_t count, size_t max_workers, const std::function<void(size_t)>& task) {
    ParallelFor(count, max_workers, task, [](std::function<void()> body) {
        return std::thread(std::move(body));
    });
}

void ParallelFor(size_t count, size_t max_workers, const std::function<void(size_t)>& task,
                 const ThreadFactory& spawn) {
    if (count == 0) {
        return;
    }

    size_t workers = std::min(max_workers, count);
    if (workers <= 1) {
        for (size_t i = 0; i < count; ++i) {
            task(i);
        }
        return;
    }

    std::vector<std::exception_ptr> errors(workers);
    std::vector<std::thread> threads;
    threads.reserve(workers);

    auto join_all = [&threads]() {
        for (auto& thread : threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    };

    try {
        for (size_t w = 0; w < workers; ++w) {
            threads.push_back(spawn([&, w]() {
                try {
                    for (size_t i = w; i < count; i += workers) {
                        task(i);
                    }
                } catch (...) {
                    // Handed to the calling thread below
                    errors[w] = std::current_exception();
                }
            }));
        }
    } catch (const std::exception&) {
        join_all();
        throw;
    }

    join_all();

    for (const auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }
}

} // namespace dedupe
