#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "../PodSyncTypes.h"

namespace podsync {

/**
 * ProgressChannel
 *
 * Bounded queue between pipeline workers and the caller's progress callback.
 * Producers call TryPublish() from any thread; it never waits on the consumer
 * and drops the oldest queued update when the queue is full. A dispatcher
 * thread owned by the channel delivers updates in order.
 */
class ProgressChannel {
public:
    using Callback = std::function<void(const ProgressUpdate& update)>;

    explicit ProgressChannel(size_t capacity = 64);
    ~ProgressChannel();

    ProgressChannel(const ProgressChannel&) = delete;
    ProgressChannel& operator=(const ProgressChannel&) = delete;

    // Start the dispatcher thread. A null callback discards updates.
    void Start(Callback callback);

    // Deliver what is still queued, then join the dispatcher
    void Stop();

    // Enqueue without blocking. Returns false if an older update was dropped.
    bool TryPublish(const ProgressUpdate& update);

    size_t Capacity() const { return capacity_; }
    size_t Pending() const;
    uint64_t DroppedCount() const { return dropped_.load(); }

private:
    void DispatchThread();

    const size_t capacity_;
    std::deque<ProgressUpdate> queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;

    Callback callback_;
    std::unique_ptr<std::thread> dispatch_thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> dropped_{0};
};

/**
 * Per-stage progress reporter.
 *
 * Keeps the published percentage monotonic within the stage and clamps it
 * to [0,100]. Pulse() reports activity without a measurable total: the pulse
 * counter cycles and the percentage stays where it was.
 */
class StageProgress {
public:
    using Sink = std::function<void(const ProgressUpdate& update)>;

    static constexpr uint32_t kPulseCycle = 100;

    StageProgress(PipelineStage stage, Sink sink);

    void Report(int percent, const std::string& message);
    void Pulse(const std::string& message);

    int Percent() const;

private:
    PipelineStage stage_;
    Sink sink_;
    mutable std::mutex mutex_;
    int percent_ = 0;
    uint32_t pulse_ = 0;
};

} // namespace podsync
