#include "ProgressChannel.h"
#include <algorithm>

namespace podsync {

ProgressChannel::ProgressChannel(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {
}

ProgressChannel::~ProgressChannel() {
    Stop();
}

void ProgressChannel::Start(Callback callback) {
    if (running_.load()) {
        return;
    }
    callback_ = std::move(callback);
    running_.store(true);
    dispatch_thread_ = std::make_unique<std::thread>(&ProgressChannel::DispatchThread, this);
}

void ProgressChannel::Stop() {
    if (!running_.load()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_.store(false);
    }
    queue_cv_.notify_one();

    if (dispatch_thread_ && dispatch_thread_->joinable()) {
        dispatch_thread_->join();
    }
    dispatch_thread_.reset();
}

bool ProgressChannel::TryPublish(const ProgressUpdate& update) {
    bool dropped = false;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            dropped = true;
        }
        queue_.push_back(update);
    }
    if (dropped) {
        dropped_++;
    }
    queue_cv_.notify_one();
    return !dropped;
}

size_t ProgressChannel::Pending() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

void ProgressChannel::DispatchThread() {
    while (true) {
        ProgressUpdate update;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] {
                return !queue_.empty() || !running_.load();
            });

            if (queue_.empty()) {
                break;  // stopped and drained
            }
            update = queue_.front();
            queue_.pop_front();
        }

        // Callback runs outside the lock so producers never wait on it
        if (callback_) {
            callback_(update);
        }
    }
}

StageProgress::StageProgress(PipelineStage stage, Sink sink)
    : stage_(stage), sink_(std::move(sink)) {
}

// The sink runs under the lock so concurrent reporters deliver in order;
// sinks must not block (TryPublish never does)
void StageProgress::Report(int percent, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    percent_ = std::max(percent_, std::min(100, std::max(0, percent)));

    ProgressUpdate update;
    update.stage = stage_;
    update.percent = percent_;
    update.message = message;
    if (sink_) {
        sink_(update);
    }
}

void StageProgress::Pulse(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    pulse_ = (pulse_ + 1) % kPulseCycle;

    ProgressUpdate update;
    update.stage = stage_;
    update.percent = percent_;
    update.message = message;
    update.indeterminate = true;
    update.pulse = pulse_;
    if (sink_) {
        sink_(update);
    }
}

int StageProgress::Percent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return percent_;
}

} // namespace podsync
