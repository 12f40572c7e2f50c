#ifndef PODSYNC_API_H
#define PODSYNC_API_H

#ifdef __cplusplus
extern "C" {
#endif

#if defined(_WIN32)
    #ifdef PODSYNC_EXPORTS
        #define PODSYNC_API __declspec(dllexport)
    #else
        #define PODSYNC_API __declspec(dllimport)
    #endif
#else
    #define PODSYNC_API __attribute__((visibility("default")))
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

// Opaque handle to a PipelineOrchestrator
typedef void* podsync_pipeline_t;

// Return codes
#define PODSYNC_OK                        0
#define PODSYNC_E_INVALID_ARGUMENT       -1
#define PODSYNC_E_SOURCE_UNAVAILABLE     -2
#define PODSYNC_E_FETCH_INCOMPLETE       -3
#define PODSYNC_E_UNSUPPORTED_FORMAT     -4
#define PODSYNC_E_DEVICE_UNAVAILABLE     -5
#define PODSYNC_E_INSUFFICIENT_SPACE     -6
#define PODSYNC_E_COPY_FAILED            -7
#define PODSYNC_E_PROCESS_TIMEOUT        -8
#define PODSYNC_E_TOOL_MISSING           -9
#define PODSYNC_E_INTERNAL               -10   // unexpected exception inside the library

// Pipeline states (PodSyncRunSummary.final_state)
#define PODSYNC_STATE_IDLE          0
#define PODSYNC_STATE_ACQUIRING     1
#define PODSYNC_STATE_CONVERTING    2
#define PODSYNC_STATE_TRANSFERRING  3
#define PODSYNC_STATE_DONE          4
#define PODSYNC_STATE_FAILED        5

// Stages (progress updates and failure records)
#define PODSYNC_STAGE_ACQUISITION   0
#define PODSYNC_STAGE_TRANSCODE     1
#define PODSYNC_STAGE_TRANSFER      2

// Callback types. Callbacks must not throw or longjmp.
typedef void (*podsync_log_callback_t)(const char* message);
typedef void (*podsync_progress_callback_t)(int stage, int percent, const char* message,
                                            bool indeterminate, uint32_t pulse);

// Pipeline settings; NULL strings and zero counts keep the defaults
struct PodSyncConfig {
    const char* temp_dir;               // default "temp"
    const char* output_dir;             // default "converted"
    const char* manual_mount_point;     // discovery fallback
    uint32_t workers;                   // default 2
    bool overwrite;
    bool skip_transfer;
    bool clean_temp;
    bool unmount_after_transfer;
};

struct PodSyncStageCounts {
    uint32_t attempted;
    uint32_t succeeded;
    uint32_t failed;
};

struct PodSyncFailure {
    int stage;                  // PODSYNC_STAGE_*
    const char* item_id;
    const char* title;
    int error_code;             // PODSYNC_E_*
    const char* message;
};

struct PodSyncRunSummary {
    int final_state;            // PODSYNC_STATE_*
    bool cancelled;
    int error_code;             // PODSYNC_OK unless final_state is FAILED
    const char* failure_reason;
    struct PodSyncStageCounts acquisition;
    struct PodSyncStageCounts transcode;
    struct PodSyncStageCounts transfer;
    struct PodSyncFailure* failures;
    uint32_t failure_count;
};

struct PodSyncDeviceInfo {
    const char* id;
    const char* name;
    const char* model;
    const char* strategy;       // "vendor-protocol", "volume-enumeration", "path-heuristic", "manual"
    const char* mount_point;    // NULL when not mounted
};

// --- Lifecycle ---
PODSYNC_API podsync_pipeline_t podsync_pipeline_create(const struct PodSyncConfig* config);
PODSYNC_API void podsync_pipeline_destroy(podsync_pipeline_t pipeline);

PODSYNC_API void podsync_set_log_callback(podsync_pipeline_t pipeline, podsync_log_callback_t callback);
PODSYNC_API void podsync_set_progress_callback(podsync_pipeline_t pipeline, podsync_progress_callback_t callback);

// --- Runs ---
// format: "m4a", "mp3" or "mp4". mount_point and device_id may be NULL.
// Blocks until the run ends. summary (optional) must be released with podsync_free_run_summary.
PODSYNC_API int podsync_pipeline_run(podsync_pipeline_t pipeline,
                                     const char* reference,
                                     const char* format,
                                     int quality_kbps,
                                     const char* mount_point,
                                     const char* device_id,
                                     struct PodSyncRunSummary* summary);
PODSYNC_API void podsync_free_run_summary(struct PodSyncRunSummary* summary);

// Safe to call from any thread while podsync_pipeline_run is blocked
PODSYNC_API void podsync_pipeline_cancel(podsync_pipeline_t pipeline);

// --- Devices ---
PODSYNC_API struct PodSyncDeviceInfo* podsync_discover_devices(podsync_pipeline_t pipeline, uint32_t* count);
PODSYNC_API void podsync_free_devices(struct PodSyncDeviceInfo* devices, uint32_t count);

// device: a discovered device id or a mount point path. Mounts the device if needed.
PODSYNC_API int podsync_device_capacity(podsync_pipeline_t pipeline,
                                        const char* device,
                                        uint64_t* total_bytes,
                                        uint64_t* free_bytes,
                                        uint64_t* used_bytes);

#ifdef __cplusplus
}
#endif

#endif // PODSYNC_API_H
