#include "PipelineOrchestrator.h"
#include "AcquisitionManager.h"
#include "DeviceManager.h"
#include "ProcessRunner.h"
#include "TranscodeManager.h"
#include "acquisition/YtDlpFetchEngine.h"
#include "device/DeviceBackendFactory.h"
#include "pipeline/ProgressChannel.h"
#include "protocols/http/HttpClient.h"
#include "transcode/FfmpegTranscoder.h"
#include "transcode/TagWriter.h"
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

struct PipelineOrchestrator::RunContext {
    int run_id = 0;
    LogCallback log;
    podsync::StageProgress::Sink progress;
    RunSummary summary;
    std::vector<ContentDescriptor> fetched;
    std::vector<TranscodedItem> converted;
};

static FailureRecord MakeFailure(PipelineStage stage, const ContentDescriptor& descriptor,
                                 const Status& status) {
    FailureRecord failure;
    failure.stage = stage;
    failure.item_id = descriptor.source_id();
    failure.title = descriptor.title;
    failure.error = status.kind;
    failure.message = status.message;
    return failure;
}

PipelineOrchestrator::PipelineOrchestrator(const PipelineConfig& config, LogCallback log_callback)
    : PipelineOrchestrator(config, Collaborators(), std::move(log_callback)) {
}

PipelineOrchestrator::PipelineOrchestrator(const PipelineConfig& config,
                                           Collaborators collaborators,
                                           LogCallback log_callback)
    : config_(config),
      collaborators_(std::move(collaborators)),
      log_callback_(std::move(log_callback)) {

    auto runner = ProcessRunner::CreateDefault();

    if (!collaborators_.fetch_engine) {
        podsync::YtDlpFetchEngine::Config fetch_config;
        fetch_config.executable = config_.fetch_executable;
        collaborators_.fetch_engine =
            std::make_shared<podsync::YtDlpFetchEngine>(fetch_config, runner, log_callback_);
    }

    if (!collaborators_.transcoder) {
        podsync::FfmpegTranscoder::Config transcode_config;
        transcode_config.executable = config_.transcode_executable;
        collaborators_.transcoder =
            std::make_shared<podsync::FfmpegTranscoder>(transcode_config, runner, log_callback_);
    }

    if (!collaborators_.tag_writer) {
        std::shared_ptr<HttpClient> http;
        try {
            HttpClient::Config http_config;
            http_config.timeout_ms = config_.artwork_timeout_ms;
            http = std::make_shared<HttpClient>(http_config, log_callback_);
        } catch (const std::runtime_error& e) {
            Log(std::string("Artwork download disabled: ") + e.what());
        }
        collaborators_.tag_writer = std::make_shared<podsync::TagWriter>(http, log_callback_);
    }

    if (!collaborators_.device_backend) {
        collaborators_.device_backend =
            podsync::DeviceBackendFactory::CreateForHost(config_.device, runner, log_callback_);
    }
}

PipelineOrchestrator::~PipelineOrchestrator() = default;

void PipelineOrchestrator::SetProgressCallback(ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    progress_callback_ = std::move(callback);
}

void PipelineOrchestrator::Cancel() {
    if (!cancel_requested_.exchange(true)) {
        Log("Cancellation requested");
    }
}

void PipelineOrchestrator::SetState(RunContext& ctx, PipelineState state) {
    state_.store(state);
    ctx.summary.final_state = state;
    ctx.log(std::string("State: ") + PipelineStateToString(state));
}

Status PipelineOrchestrator::Fail(RunContext& ctx, ErrorKind kind, const std::string& reason) {
    ctx.summary.run_error = kind;
    ctx.summary.failure_reason = reason;
    SetState(ctx, PipelineState::Failed);
    ctx.log("Run failed: " + reason);
    return Status::Error(kind, reason);
}

Status PipelineOrchestrator::Run(const std::string& reference,
                                 const std::string& format_name,
                                 int quality_kbps,
                                 const DeviceSelector& selector,
                                 RunSummary* summary) {
    std::lock_guard<std::mutex> run_lock(run_mutex_);
    static std::atomic<int> run_counter{0};

    RunContext ctx;
    ctx.run_id = ++run_counter;
    const std::string prefix = "[run " + std::to_string(ctx.run_id) + "] ";
    ctx.log = [this, prefix](const std::string& message) { Log(prefix + message); };

    cancel_requested_.store(false);

    ProgressCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = progress_callback_;
    }
    podsync::ProgressChannel channel(config_.progress_queue_capacity);
    channel.Start(callback);
    ctx.progress = [&channel](const ProgressUpdate& update) { channel.TryPublish(update); };

    ctx.log("Starting run for " + reference + " (" + format_name + ", " +
            std::to_string(quality_kbps) + " kbps)");

    Status status = [&]() -> Status {
        MediaFormat format;
        if (!ParseMediaFormat(format_name, &format)) {
            SetState(ctx, PipelineState::Acquiring);
            return Fail(ctx, ErrorKind::UnsupportedFormat, "unknown format: " + format_name);
        }

        Status stage = Acquire(ctx, reference, format, quality_kbps);
        if (!stage.ok() || ctx.summary.final_state == PipelineState::Done) return stage;

        stage = Convert(ctx, format, quality_kbps);
        if (!stage.ok() || ctx.summary.final_state == PipelineState::Done) return stage;

        if (config_.skip_transfer) {
            ctx.log("Transfer skipped by configuration");
            SetState(ctx, PipelineState::Done);
            return Status::Ok();
        }

        return Transfer(ctx, selector);
    }();

    CleanTemp(ctx);
    channel.Stop();

    ctx.log("Run finished: " + std::string(PipelineStateToString(ctx.summary.final_state)) +
            (ctx.summary.cancelled ? " (cancelled)" : "") +
            ", transferred " + std::to_string(ctx.summary.transfer.succeeded) + " file(s), " +
            std::to_string(ctx.summary.failures.size()) + " failure(s)");

    if (summary) {
        *summary = ctx.summary;
    }
    return status;
}

// Marks the run as a clean partial stop; callers return right after
static Status FinishCancelled(RunSummary& summary, std::atomic<PipelineState>& state,
                              const PipelineOrchestrator::LogCallback& log) {
    summary.cancelled = true;
    summary.final_state = PipelineState::Done;
    state.store(PipelineState::Done);
    log("Run cancelled, reporting partial results");
    return Status::Ok();
}

Status PipelineOrchestrator::Acquire(RunContext& ctx, const std::string& reference,
                                     MediaFormat format, int quality) {
    SetState(ctx, PipelineState::Acquiring);

    AcquisitionManager::Config acq_config;
    acq_config.temp_dir = config_.temp_dir;
    acq_config.workers = config_.workers;
    AcquisitionManager acquisition(acq_config, collaborators_.fetch_engine, ctx.log, ctx.progress);

    std::vector<ContentDescriptor> resolved;
    AcquisitionManager::ResolveReport report;
    Status resolve_status = acquisition.Resolve(reference, &resolved, &report, &cancel_requested_);

    ctx.summary.acquisition.attempted = report.entries;
    ctx.summary.acquisition.failed = static_cast<uint32_t>(report.skipped.size());
    ctx.summary.failures.insert(ctx.summary.failures.end(),
                                report.skipped.begin(), report.skipped.end());

    if (cancel_requested_.load()) {
        return FinishCancelled(ctx.summary, state_, ctx.log);
    }
    if (resolved.empty()) {
        return Fail(ctx, ErrorKind::SourceUnavailable,
                    "no items could be resolved from " + reference +
                    (resolve_status.message.empty() ? "" : ": " + resolve_status.message));
    }

    auto outcomes = acquisition.FetchAll(resolved, format, quality, &cancel_requested_);
    for (size_t i = 0; i < outcomes.size(); ++i) {
        const auto& outcome = outcomes[i];
        if (!outcome.attempted) continue;
        if (outcome.status.ok()) {
            ctx.summary.acquisition.succeeded++;
            ctx.fetched.push_back(outcome.descriptor);
        } else {
            ctx.summary.acquisition.failed++;
            ctx.summary.failures.push_back(
                MakeFailure(PipelineStage::Acquisition, resolved[i], outcome.status));
        }
    }

    if (cancel_requested_.load()) {
        return FinishCancelled(ctx.summary, state_, ctx.log);
    }
    if (ctx.fetched.empty()) {
        return Fail(ctx, ErrorKind::FetchIncomplete, "no item was fetched successfully");
    }
    return Status::Ok();
}

Status PipelineOrchestrator::Convert(RunContext& ctx, MediaFormat format, int quality) {
    SetState(ctx, PipelineState::Converting);

    TranscodeManager::Config tc_config;
    tc_config.output_dir = config_.output_dir;
    tc_config.overwrite = config_.overwrite;
    tc_config.workers = config_.workers;
    tc_config.video_resolution = config_.video_resolution;
    tc_config.video_bitrate_kbps = config_.video_bitrate_kbps;
    TranscodeManager transcoding(tc_config, collaborators_.transcoder, collaborators_.tag_writer,
                                 ctx.log, ctx.progress);

    auto outcomes = transcoding.ConvertAll(ctx.fetched, format, quality, &cancel_requested_);
    for (size_t i = 0; i < outcomes.size(); ++i) {
        const auto& outcome = outcomes[i];
        if (!outcome.attempted) continue;
        ctx.summary.transcode.attempted++;
        if (outcome.status.ok()) {
            ctx.summary.transcode.succeeded++;
            ctx.converted.push_back(outcome.item);
        } else {
            ctx.summary.transcode.failed++;
            ctx.summary.failures.push_back(
                MakeFailure(PipelineStage::Transcode, ctx.fetched[i], outcome.status));
        }
    }

    if (cancel_requested_.load()) {
        return FinishCancelled(ctx.summary, state_, ctx.log);
    }
    if (ctx.converted.empty()) {
        return Fail(ctx, ErrorKind::UnsupportedFormat, "no item was converted successfully");
    }
    return Status::Ok();
}

Status PipelineOrchestrator::SelectDevice(RunContext& ctx, DeviceManager& devices,
                                          const DeviceSelector& selector, DeviceHandle* out) {
    if (!selector.mount_point.empty()) {
        DeviceHandle handle;
        handle.id = selector.mount_point;
        handle.name = fs::path(selector.mount_point).filename().string();
        handle.model = "Unknown";
        handle.strategy = DiscoveryStrategy::Manual;
        handle.mount_point = selector.mount_point;
        if (!handle.IsMounted()) {
            return Status::Error(ErrorKind::DeviceUnavailable,
                                 "mount point does not exist: " + selector.mount_point);
        }
        *out = handle;
        return Status::Ok();
    }

    auto found = devices.Discover();
    for (const auto& handle : found) {
        if (selector.device_id.empty() || handle.id == selector.device_id) {
            ctx.log("Selected device: " + handle.name + " (" + handle.id + ", " +
                    DiscoveryStrategyToString(handle.strategy) + ")");
            *out = handle;
            return Status::Ok();
        }
    }

    return Status::Error(ErrorKind::DeviceUnavailable,
                         selector.device_id.empty() ? "no device found"
                                                    : "device not found: " + selector.device_id);
}

Status PipelineOrchestrator::Transfer(RunContext& ctx, const DeviceSelector& selector) {
    SetState(ctx, PipelineState::Transferring);

    DeviceManager devices(collaborators_.device_backend, ctx.log);
    podsync::StageProgress progress(PipelineStage::Transfer, ctx.progress);

    DeviceHandle handle;
    Status status = SelectDevice(ctx, devices, selector, &handle);
    if (!status.ok()) {
        return Fail(ctx, ErrorKind::DeviceUnavailable, status.message);
    }

    // Held for the whole phase so concurrent runs on this device cannot interleave
    auto device_lock = devices.AcquireExclusive(handle);

    status = devices.Mount(handle);
    if (!status.ok()) {
        return Fail(ctx, ErrorKind::DeviceUnavailable, "mount failed: " + status.message);
    }
    // Now keyed by mount point as well, shared with any other handle on this volume
    auto volume_lock = devices.AcquireExclusive(handle);

    auto release_device = [&]() {
        if (!config_.unmount_after_transfer) {
            return;
        }
        Status unmounted = devices.Unmount(handle);
        if (!unmounted.ok()) {
            ctx.log("Unmount after transfer failed: " + unmounted.message);
        }
    };

    DeviceCapacity capacity;
    status = devices.Capacity(handle, &capacity);
    if (!status.ok()) {
        release_device();
        return Fail(ctx, ErrorKind::DeviceUnavailable, "capacity query failed: " + status.message);
    }

    uint64_t required = 0;
    for (const auto& item : ctx.converted) {
        std::error_code ec;
        auto size = fs::file_size(item.output_path, ec);
        if (!ec) required += size;
    }

    ctx.log("Transfer needs " + std::to_string(required) + " bytes, device has " +
            std::to_string(capacity.free) + " free");
    if (required > capacity.free) {
        release_device();
        return Fail(ctx, ErrorKind::InsufficientSpace,
                    "need " + std::to_string(required) + " bytes but only " +
                    std::to_string(capacity.free) + " are free on " + handle.name);
    }

    bool cancelled = false;
    const size_t total = ctx.converted.size();
    for (size_t i = 0; i < total; ++i) {
        if (cancel_requested_.load()) {
            cancelled = true;
            break;
        }

        const TranscodedItem& item = ctx.converted[i];
        ctx.summary.transfer.attempted++;

        std::string destination;
        Status placed = devices.PlaceFile(handle, item.output_path, "", &destination);
        if (placed.ok()) {
            ctx.summary.transfer.succeeded++;
            ctx.summary.transferred_paths.push_back(destination);
        } else {
            ctx.summary.transfer.failed++;
            ctx.summary.failures.push_back(
                MakeFailure(PipelineStage::Transfer, item.descriptor, placed));
        }

        progress.Report(static_cast<int>((i + 1) * 100 / total),
                        "Transferred " + std::to_string(i + 1) + "/" + std::to_string(total));
    }

    release_device();

    if (cancelled) {
        return FinishCancelled(ctx.summary, state_, ctx.log);
    }
    SetState(ctx, PipelineState::Done);
    return Status::Ok();
}

void PipelineOrchestrator::CleanTemp(RunContext& ctx) {
    if (!config_.clean_temp) {
        return;
    }
    size_t removed = 0;
    for (const auto& descriptor : ctx.fetched) {
        std::error_code ec;
        if (fs::remove(descriptor.local_path(), ec)) {
            removed++;
        } else if (ec) {
            ctx.log("Could not remove " + descriptor.local_path() + ": " + ec.message());
        }
    }
    ctx.log("Removed " + std::to_string(removed) + " temporary file(s)");
}

std::vector<DeviceHandle> PipelineOrchestrator::DiscoverDevices() {
    DeviceManager devices(collaborators_.device_backend, log_callback_);
    return devices.Discover();
}

Status PipelineOrchestrator::QueryCapacity(DeviceHandle& handle, DeviceCapacity* out) {
    DeviceManager devices(collaborators_.device_backend, log_callback_);
    auto lock = devices.AcquireExclusive(handle);
    Status status = devices.Mount(handle);
    if (!status.ok()) {
        return status;
    }
    auto volume_lock = devices.AcquireExclusive(handle);
    return devices.Capacity(handle, out);
}

void PipelineOrchestrator::Log(const std::string& message) {
    if (log_callback_) {
        log_callback_(message);
    }
}
