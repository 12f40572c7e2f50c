#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <thread>
#include <vector>

namespace podsync {

/**
 * Run task(i) for i in [0, count) on up to `workers` threads.
 *
 * Items are claimed in index order and each task writes its own result
 * slot, so the caller's output keeps input order whatever the completion
 * order. The cancel flag is checked before each item is claimed; items
 * not yet claimed when it is raised are never started.
 *
 * @return Number of items that were started
 */
template <typename Task>
size_t RunOrdered(size_t count, size_t workers, const std::atomic<bool>* cancel, Task task) {
    std::atomic<size_t> next{0};
    std::atomic<size_t> started{0};

    auto worker = [&]() {
        while (true) {
            if (cancel && cancel->load()) {
                return;
            }
            size_t index = next.fetch_add(1);
            if (index >= count) {
                return;
            }
            started++;
            task(index);
        }
    };

    size_t thread_count = std::max<size_t>(1, std::min(workers, count));
    if (thread_count <= 1) {
        worker();
        return started.load();
    }

    std::vector<std::thread> threads;
    threads.reserve(thread_count);
    for (size_t i = 0; i < thread_count; ++i) {
        threads.emplace_back(worker);
    }
    for (auto& t : threads) {
        t.join();
    }
    return started.load();
}

} // namespace podsync
