#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "PodSyncTypes.h"
#include "device/DeviceBackend.h"

namespace podsync {
class FetchEngine;
class Transcoder;
class TagWriter;
}

class DeviceManager;

/// Settings for one orchestrator. Defaults match the command-line tool.
struct PipelineConfig {
    std::string temp_dir = "temp";
    std::string output_dir = "converted";
    size_t workers = 2;
    bool overwrite = false;

    bool skip_transfer = false;           // stop after Converting
    bool clean_temp = false;              // delete fetched raw files when the run ends
    bool unmount_after_transfer = false;

    std::string video_resolution = "640x480";
    int video_bitrate_kbps = 1500;

    std::string fetch_executable = "yt-dlp";
    std::string transcode_executable = "ffmpeg";
    int artwork_timeout_ms = 30000;

    size_t progress_queue_capacity = 64;
    podsync::DeviceConfig device;
};

/// Which device a run transfers to. Both empty: first discovered device.
struct DeviceSelector {
    std::string mount_point;   // use this mounted path directly
    std::string device_id;     // pick the discovered handle with this id
};

/**
 * PipelineOrchestrator
 *
 * Runs Acquiring -> Converting -> Transferring for one source reference and
 * reports the outcome in a RunSummary. Per-item failures are recorded and
 * the batch continues; an empty stage result ends the run in Failed.
 *
 * Each Run() gets its own progress channel and its own run-scoped logger;
 * nothing is shared between runs except the collaborators passed in.
 */
class PipelineOrchestrator {
public:
    using LogCallback = std::function<void(const std::string& message)>;
    using ProgressCallback = std::function<void(const ProgressUpdate& update)>;

    /// External boundaries; null members are replaced with the default implementations
    struct Collaborators {
        std::shared_ptr<podsync::FetchEngine> fetch_engine;
        std::shared_ptr<podsync::Transcoder> transcoder;
        std::shared_ptr<podsync::TagWriter> tag_writer;
        std::shared_ptr<podsync::DeviceBackend> device_backend;
    };

    PipelineOrchestrator(const PipelineConfig& config, LogCallback log_callback);
    PipelineOrchestrator(const PipelineConfig& config, Collaborators collaborators,
                         LogCallback log_callback);
    ~PipelineOrchestrator();

    PipelineOrchestrator(const PipelineOrchestrator&) = delete;
    PipelineOrchestrator& operator=(const PipelineOrchestrator&) = delete;

    // Called from the run's dispatcher thread, never from a worker
    void SetProgressCallback(ProgressCallback callback);

    /**
     * Execute one run.
     * @param format_name "m4a", "mp3" or "mp4" (video)
     * @param quality_kbps Audio bitrate
     * @param summary Receives counts, failures and the final state
     * @return Ok when the run reached Done (cancelled runs included),
     *         otherwise the error that moved it to Failed
     */
    Status Run(const std::string& reference,
               const std::string& format_name,
               int quality_kbps,
               const DeviceSelector& selector,
               RunSummary* summary);

    /// Request cooperative cancellation of the current run
    void Cancel();
    bool IsCancelled() const { return cancel_requested_.load(); }

    PipelineState GetState() const { return state_.load(); }

    // --- Device queries (outside any run) ---
    std::vector<DeviceHandle> DiscoverDevices();
    Status QueryCapacity(DeviceHandle& handle, DeviceCapacity* out);

    const PipelineConfig& GetConfig() const { return config_; }

private:
    struct RunContext;

    Status Acquire(RunContext& ctx, const std::string& reference, MediaFormat format, int quality);
    Status Convert(RunContext& ctx, MediaFormat format, int quality);
    Status Transfer(RunContext& ctx, const DeviceSelector& selector);
    Status SelectDevice(RunContext& ctx, DeviceManager& devices, const DeviceSelector& selector,
                        DeviceHandle* out);
    void CleanTemp(RunContext& ctx);

    void SetState(RunContext& ctx, PipelineState state);
    Status Fail(RunContext& ctx, ErrorKind kind, const std::string& reason);

    void Log(const std::string& message);

    PipelineConfig config_;
    Collaborators collaborators_;
    LogCallback log_callback_;

    std::mutex callback_mutex_;
    ProgressCallback progress_callback_;

    std::mutex run_mutex_;   // one run at a time per orchestrator
    std::atomic<bool> cancel_requested_{false};
    std::atomic<PipelineState> state_{PipelineState::Idle};
};
