/**
 * test_progress_channel.cpp
 *
 * Unit tests for the bounded progress queue, per-stage progress rules and
 * the ordered worker pool
 */

#include "lib/src/pipeline/OrderedWorkers.h"
#include "lib/src/pipeline/ProgressChannel.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

template<typename T>
bool AssertEqual(const T& actual, const T& expected, const std::string& msg) {
    if (actual != expected) {
        std::cerr << "FAIL: " << msg << std::endl;
        std::cerr << "  Expected: " << expected << std::endl;
        std::cerr << "  Got:      " << actual << std::endl;
        return false;
    }
    return true;
}

#define ASSERT_EQ(actual, expected, msg) \
    if (!AssertEqual(actual, expected, msg)) return false;

#define ASSERT_TRUE(condition, msg) \
    if (!(condition)) { \
        std::cerr << "FAIL: " << msg << std::endl; \
        std::cerr << "  Condition evaluated to false" << std::endl; \
        return false; \
    }

#define ASSERT_FALSE(condition, msg) \
    if (condition) { \
        std::cerr << "FAIL: " << msg << std::endl; \
        std::cerr << "  Condition evaluated to true (expected false)" << std::endl; \
        return false; \
    }

static ProgressUpdate MakeUpdate(int percent) {
    ProgressUpdate update;
    update.stage = PipelineStage::Transfer;
    update.percent = percent;
    update.message = "item " + std::to_string(percent);
    return update;
}

bool TestDeliversInOrder() {
    std::cout << "Testing in-order delivery..." << std::endl;

    std::vector<int> seen;
    std::mutex seen_mutex;
    podsync::ProgressChannel channel(16);
    channel.Start([&](const ProgressUpdate& u) {
        std::lock_guard<std::mutex> lock(seen_mutex);
        seen.push_back(u.percent);
    });

    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(channel.TryPublish(MakeUpdate(i)), "No drop below capacity");
    }
    channel.Stop();

    ASSERT_EQ(seen.size(), static_cast<size_t>(10), "Everything delivered on stop");
    for (int i = 0; i < 10; ++i) {
        ASSERT_EQ(seen[i], i, "Delivery order");
    }
    ASSERT_EQ(channel.DroppedCount(), static_cast<uint64_t>(0), "Nothing dropped");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestSlowConsumerNeverBlocksProducer() {
    std::cout << "Testing producer with a stalled consumer..." << std::endl;

    std::mutex gate_mutex;
    std::condition_variable gate_cv;
    bool open = false;
    std::atomic<bool> in_callback{false};
    std::vector<int> seen;

    podsync::ProgressChannel channel(4);
    channel.Start([&](const ProgressUpdate& u) {
        in_callback = true;
        std::unique_lock<std::mutex> lock(gate_mutex);
        gate_cv.wait(lock, [&] { return open; });
        seen.push_back(u.percent);
    });

    channel.TryPublish(MakeUpdate(0));
    while (!in_callback.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    auto start = std::chrono::steady_clock::now();
    int accepted = 0;
    for (int i = 1; i <= 10; ++i) {
        if (channel.TryPublish(MakeUpdate(i))) accepted++;
    }
    auto elapsed = std::chrono::steady_clock::now() - start;
    size_t pending = channel.Pending();
    uint64_t dropped = channel.DroppedCount();

    // Release the consumer before asserting so Stop() can always join
    {
        std::lock_guard<std::mutex> lock(gate_mutex);
        open = true;
    }
    gate_cv.notify_all();
    channel.Stop();

    ASSERT_TRUE(elapsed < std::chrono::milliseconds(500), "Publishing did not wait for the consumer");
    ASSERT_EQ(accepted, 4, "Only the first four fit");
    ASSERT_EQ(pending, static_cast<size_t>(4), "Queue stays bounded");
    ASSERT_EQ(dropped, static_cast<uint64_t>(6), "Oldest updates dropped");
    ASSERT_EQ(seen.size(), static_cast<size_t>(5), "In-flight update plus queued ones");
    ASSERT_EQ(seen[1], 7, "Oldest surviving update");
    ASSERT_EQ(seen.back(), 10, "Latest update survives");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestStageProgressMonotonic() {
    std::cout << "Testing monotonic stage percentage..." << std::endl;

    std::vector<ProgressUpdate> seen;
    podsync::StageProgress progress(PipelineStage::Acquisition,
        [&](const ProgressUpdate& u) { seen.push_back(u); });

    progress.Report(30, "a");
    progress.Report(20, "b");
    progress.Report(150, "c");
    progress.Report(-5, "d");

    ASSERT_EQ(seen.size(), static_cast<size_t>(4), "Every report delivered");
    ASSERT_EQ(seen[0].percent, 30, "First");
    ASSERT_EQ(seen[1].percent, 30, "Lower value held");
    ASSERT_EQ(seen[2].percent, 100, "Clamped to 100");
    ASSERT_EQ(seen[3].percent, 100, "Negative ignored");
    ASSERT_EQ(seen[1].message, std::string("b"), "Message still updated");
    ASSERT_EQ(progress.Percent(), 100, "Current percent");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestPulseCycles() {
    std::cout << "Testing indeterminate pulses..." << std::endl;

    std::vector<ProgressUpdate> seen;
    podsync::StageProgress progress(PipelineStage::Acquisition,
        [&](const ProgressUpdate& u) { seen.push_back(u); });

    progress.Report(40, "known");
    for (uint32_t i = 0; i < podsync::StageProgress::kPulseCycle + 1; ++i) {
        progress.Pulse("busy");
    }

    const ProgressUpdate& first = seen[1];
    ASSERT_TRUE(first.indeterminate, "Pulse flagged indeterminate");
    ASSERT_EQ(first.percent, 40, "Pulse keeps the percentage");
    ASSERT_EQ(first.pulse, 1u, "Counter advances");
    ASSERT_EQ(seen.back().pulse, 1u, "Counter wraps after a full cycle");
    ASSERT_TRUE(seen.back().stage == PipelineStage::Acquisition, "Stage tagged");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestRunOrderedKeepsInputOrder() {
    std::cout << "Testing ordered worker pool..." << std::endl;

    const size_t count = 20;
    std::vector<size_t> results(count, 0);
    std::atomic<int> active{0};
    std::atomic<int> peak{0};

    size_t started = podsync::RunOrdered(count, 4, nullptr, [&](size_t index) {
        int now = ++active;
        int seen_peak = peak.load();
        while (now > seen_peak && !peak.compare_exchange_weak(seen_peak, now)) {}
        // Later items finish first
        std::this_thread::sleep_for(std::chrono::milliseconds(count - index));
        results[index] = index * 10;
        --active;
    });

    ASSERT_EQ(started, count, "All items started");
    for (size_t i = 0; i < count; ++i) {
        ASSERT_EQ(results[i], i * 10, "Result in its own slot");
    }
    ASSERT_TRUE(peak.load() <= 4, "Worker limit respected");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestRunOrderedCancellation() {
    std::cout << "Testing ordered worker pool cancellation..." << std::endl;

    std::atomic<bool> cancel{false};
    std::vector<int> ran(10, 0);
    size_t started = podsync::RunOrdered(10, 1, &cancel, [&](size_t index) {
        ran[index] = 1;
        if (index == 2) cancel = true;
    });

    ASSERT_EQ(started, static_cast<size_t>(3), "Items after cancellation never start");
    ASSERT_EQ(ran[3], 0, "Item 4 skipped");

    std::cout << "  PASS" << std::endl;
    return true;
}

int main() {
    std::cout << "======================================" << std::endl;
    std::cout << " Progress Channel Unit Tests" << std::endl;
    std::cout << "======================================" << std::endl << std::endl;

    int passed = 0;
    int total = 0;

    auto run_test = [&](bool (*test_func)(), const std::string& name) {
        total++;
        if (test_func()) {
            passed++;
        } else {
            std::cout << "  TEST FAILED: " << name << std::endl;
        }
        std::cout << std::endl;
    };

    run_test(TestDeliversInOrder, "In-Order Delivery");
    run_test(TestSlowConsumerNeverBlocksProducer, "Stalled Consumer");
    run_test(TestStageProgressMonotonic, "Monotonic Percentage");
    run_test(TestPulseCycles, "Pulse Cycles");
    run_test(TestRunOrderedKeepsInputOrder, "Ordered Worker Pool");
    run_test(TestRunOrderedCancellation, "Worker Pool Cancellation");

    std::cout << "======================================" << std::endl;
    std::cout << " Test Results: " << passed << "/" << total << " passed" << std::endl;
    std::cout << "======================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
