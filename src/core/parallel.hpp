// File: src/core/parallel.hpp
#pragma once

#include <cstddef>
#include <functional>
#include <thread>

namespace dedupe {

/// Run task(i) for every i in [0, count) on at most max_workers threads
///
/// Indices are distributed round-robin over the workers. Returns after all
/// workers have joined. With max_workers <= 1 (or count <= 1) everything
/// runs on the calling thread. The first exception thrown by any task is
/// rethrown on the calling thread after the join.
void ParallelFor(size_t count, size_t max_workers, const std::function<void(size_t)>& task);

/// Starts one worker thread running the given body
using ThreadFactory = std::function<std::thread(std::function<void()>)>;

/// ParallelFor with a custom thread factory (for testing)
///
/// If the factory throws, the workers already started are joined before the
/// exception propagates.
void ParallelFor(size_t count, size_t max_workers, const std::function<void(size_t)>& task,
                 const ThreadFactory& spawn);

} // namespace dedupe
