#include "podsync/podsync_api.h"
#include "PipelineOrchestrator.h"
#include <atomic>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>

namespace {

struct PipelineWrapper {
    std::atomic<podsync_log_callback_t> log_callback{nullptr};
    std::unique_ptr<PipelineOrchestrator> orchestrator;
};

int ToErrorCode(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:              return PODSYNC_OK;
        case ErrorKind::SourceUnavailable: return PODSYNC_E_SOURCE_UNAVAILABLE;
        case ErrorKind::FetchIncomplete:   return PODSYNC_E_FETCH_INCOMPLETE;
        case ErrorKind::UnsupportedFormat: return PODSYNC_E_UNSUPPORTED_FORMAT;
        case ErrorKind::DeviceUnavailable: return PODSYNC_E_DEVICE_UNAVAILABLE;
        case ErrorKind::InsufficientSpace: return PODSYNC_E_INSUFFICIENT_SPACE;
        case ErrorKind::CopyFailed:        return PODSYNC_E_COPY_FAILED;
        case ErrorKind::ProcessTimeout:    return PODSYNC_E_PROCESS_TIMEOUT;
        case ErrorKind::ToolMissing:       return PODSYNC_E_TOOL_MISSING;
        default:                           return PODSYNC_E_INVALID_ARGUMENT;
    }
}

PipelineWrapper* Unwrap(podsync_pipeline_t pipeline) {
    return static_cast<PipelineWrapper*>(pipeline);
}

// Exceptions stop at the C boundary; report them through the log callback
void ReportException(PipelineWrapper* wrapper, const char* where, const std::exception& e) {
    if (!wrapper) {
        return;
    }
    podsync_log_callback_t callback = wrapper->log_callback.load();
    if (callback) {
        std::string message = std::string(where) + " failed: " + e.what();
        callback(message.c_str());
    }
}

void FillSummary(const RunSummary& in, PodSyncRunSummary* out) {
    out->final_state = static_cast<int>(in.final_state);
    out->cancelled = in.cancelled;
    out->error_code = ToErrorCode(in.run_error);
    out->failure_reason = strdup(in.failure_reason.c_str());
    out->acquisition = {in.acquisition.attempted, in.acquisition.succeeded, in.acquisition.failed};
    out->transcode = {in.transcode.attempted, in.transcode.succeeded, in.transcode.failed};
    out->transfer = {in.transfer.attempted, in.transfer.succeeded, in.transfer.failed};

    out->failures = nullptr;
    out->failure_count = 0;
    if (!in.failures.empty()) {
        // Zeroed so a partly filled array can still be released
        out->failures = new PodSyncFailure[in.failures.size()]();
        out->failure_count = static_cast<uint32_t>(in.failures.size());
        for (size_t i = 0; i < in.failures.size(); ++i) {
            const FailureRecord& f = in.failures[i];
            out->failures[i].stage = static_cast<int>(f.stage);
            out->failures[i].item_id = strdup(f.item_id.c_str());
            out->failures[i].title = strdup(f.title.c_str());
            out->failures[i].error_code = ToErrorCode(f.error);
            out->failures[i].message = strdup(f.message.c_str());
        }
    }
}

} // namespace

extern "C" {

PODSYNC_API podsync_pipeline_t podsync_pipeline_create(const PodSyncConfig* config) {
    PipelineConfig pipeline_config;
    if (config) {
        if (config->temp_dir) pipeline_config.temp_dir = config->temp_dir;
        if (config->output_dir) pipeline_config.output_dir = config->output_dir;
        if (config->manual_mount_point) pipeline_config.device.manual_mount_point = config->manual_mount_point;
        if (config->workers > 0) pipeline_config.workers = config->workers;
        pipeline_config.overwrite = config->overwrite;
        pipeline_config.skip_transfer = config->skip_transfer;
        pipeline_config.clean_temp = config->clean_temp;
        pipeline_config.unmount_after_transfer = config->unmount_after_transfer;
    }

    try {
        auto wrapper = std::make_unique<PipelineWrapper>();
        PipelineWrapper* raw = wrapper.get();
        wrapper->orchestrator = std::make_unique<PipelineOrchestrator>(
            pipeline_config,
            [raw](const std::string& message) {
                podsync_log_callback_t callback = raw->log_callback.load();
                if (callback) {
                    callback(message.c_str());
                }
            });
        return wrapper.release();
    } catch (const std::exception&) {
        return nullptr;
    }
}

PODSYNC_API void podsync_pipeline_destroy(podsync_pipeline_t pipeline) {
    delete Unwrap(pipeline);
}

PODSYNC_API void podsync_set_log_callback(podsync_pipeline_t pipeline, podsync_log_callback_t callback) {
    if (pipeline) {
        Unwrap(pipeline)->log_callback.store(callback);
    }
}

PODSYNC_API void podsync_set_progress_callback(podsync_pipeline_t pipeline, podsync_progress_callback_t callback) {
    if (!pipeline) {
        return;
    }
    if (!callback) {
        Unwrap(pipeline)->orchestrator->SetProgressCallback(nullptr);
        return;
    }
    try {
        Unwrap(pipeline)->orchestrator->SetProgressCallback([callback](const ProgressUpdate& update) {
            callback(static_cast<int>(update.stage), update.percent, update.message.c_str(),
                     update.indeterminate, update.pulse);
        });
    } catch (const std::exception& e) {
        ReportException(Unwrap(pipeline), "podsync_set_progress_callback", e);
    }
}

PODSYNC_API int podsync_pipeline_run(podsync_pipeline_t pipeline,
                                     const char* reference,
                                     const char* format,
                                     int quality_kbps,
                                     const char* mount_point,
                                     const char* device_id,
                                     PodSyncRunSummary* summary) {
    if (summary) {
        // Safe to pass to podsync_free_run_summary whatever happens below
        *summary = PodSyncRunSummary();
    }
    if (!pipeline || !reference || !format || quality_kbps <= 0) {
        return PODSYNC_E_INVALID_ARGUMENT;
    }

    try {
        DeviceSelector selector;
        if (mount_point) selector.mount_point = mount_point;
        if (device_id) selector.device_id = device_id;

        RunSummary run_summary;
        Status status = Unwrap(pipeline)->orchestrator->Run(reference, format, quality_kbps,
                                                            selector, &run_summary);
        if (summary) {
            FillSummary(run_summary, summary);
        }
        return ToErrorCode(status.kind);
    } catch (const std::exception& e) {
        if (summary) {
            podsync_free_run_summary(summary);
            *summary = PodSyncRunSummary();
            summary->final_state = PODSYNC_STATE_FAILED;
            summary->error_code = PODSYNC_E_INTERNAL;
        }
        ReportException(Unwrap(pipeline), "podsync_pipeline_run", e);
        return PODSYNC_E_INTERNAL;
    }
}

PODSYNC_API void podsync_free_run_summary(PodSyncRunSummary* summary) {
    if (!summary) {
        return;
    }
    free(const_cast<char*>(summary->failure_reason));
    summary->failure_reason = nullptr;
    for (uint32_t i = 0; i < summary->failure_count; ++i) {
        free(const_cast<char*>(summary->failures[i].item_id));
        free(const_cast<char*>(summary->failures[i].title));
        free(const_cast<char*>(summary->failures[i].message));
    }
    delete[] summary->failures;
    summary->failures = nullptr;
    summary->failure_count = 0;
}

PODSYNC_API void podsync_pipeline_cancel(podsync_pipeline_t pipeline) {
    if (pipeline) {
        Unwrap(pipeline)->orchestrator->Cancel();
    }
}

PODSYNC_API PodSyncDeviceInfo* podsync_discover_devices(podsync_pipeline_t pipeline, uint32_t* count) {
    if (count) *count = 0;
    if (!pipeline || !count) {
        return nullptr;
    }

    try {
        auto devices = Unwrap(pipeline)->orchestrator->DiscoverDevices();
        if (devices.empty()) {
            return nullptr;
        }

        auto* c_devices = new PodSyncDeviceInfo[devices.size()];
        for (size_t i = 0; i < devices.size(); ++i) {
            c_devices[i].id = strdup(devices[i].id.c_str());
            c_devices[i].name = strdup(devices[i].name.c_str());
            c_devices[i].model = strdup(devices[i].model.c_str());
            c_devices[i].strategy = DiscoveryStrategyToString(devices[i].strategy);
            c_devices[i].mount_point = devices[i].mount_point
                ? strdup(devices[i].mount_point->c_str()) : nullptr;
        }
        *count = static_cast<uint32_t>(devices.size());
        return c_devices;
    } catch (const std::exception& e) {
        ReportException(Unwrap(pipeline), "podsync_discover_devices", e);
        return nullptr;
    }
}

PODSYNC_API void podsync_free_devices(PodSyncDeviceInfo* devices, uint32_t count) {
    if (!devices) {
        return;
    }
    for (uint32_t i = 0; i < count; ++i) {
        free(const_cast<char*>(devices[i].id));
        free(const_cast<char*>(devices[i].name));
        free(const_cast<char*>(devices[i].model));
        free(const_cast<char*>(devices[i].mount_point));
    }
    delete[] devices;
}

PODSYNC_API int podsync_device_capacity(podsync_pipeline_t pipeline,
                                        const char* device,
                                        uint64_t* total_bytes,
                                        uint64_t* free_bytes,
                                        uint64_t* used_bytes) {
    if (!pipeline || !device) {
        return PODSYNC_E_INVALID_ARGUMENT;
    }

    try {
        PipelineOrchestrator& orchestrator = *Unwrap(pipeline)->orchestrator;
        DeviceHandle handle;
        bool found = false;

        std::error_code ec;
        if (std::filesystem::is_directory(device, ec)) {
            handle.id = device;
            handle.name = device;
            handle.strategy = DiscoveryStrategy::Manual;
            handle.mount_point = std::string(device);
            found = true;
        } else {
            for (const auto& candidate : orchestrator.DiscoverDevices()) {
                if (candidate.id == device) {
                    handle = candidate;
                    found = true;
                    break;
                }
            }
        }
        if (!found) {
            return PODSYNC_E_DEVICE_UNAVAILABLE;
        }

        DeviceCapacity capacity;
        Status status = orchestrator.QueryCapacity(handle, &capacity);
        if (!status.ok()) {
            return ToErrorCode(status.kind);
        }
        if (total_bytes) *total_bytes = capacity.total;
        if (free_bytes) *free_bytes = capacity.free;
        if (used_bytes) *used_bytes = capacity.used;
        return PODSYNC_OK;
    } catch (const std::exception& e) {
        ReportException(Unwrap(pipeline), "podsync_device_capacity", e);
        return PODSYNC_E_INTERNAL;
    }
}

} // extern "C"
