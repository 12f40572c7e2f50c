#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "PodSyncTypes.h"
#include "device/DeviceBackend.h"

/**
 * DeviceManager
 *
 * Front for a platform DeviceBackend. Adds per-device serialization and the
 * file placement rules for the device's Music/ tree.
 *
 * Every operation on a handle runs inside that handle's exclusive section.
 * The sections live in a process-wide registry keyed by mount point or device id, so two
 * managers (or two pipeline runs) targeting the same device never interleave.
 */
class DeviceManager {
public:
    using LogCallback = std::function<void(const std::string& message)>;

    struct TreeResult {
        uint32_t attempted = 0;
        uint32_t transferred = 0;
        uint32_t failed = 0;
        std::vector<std::string> placed;   // destination paths
    };

    DeviceManager(std::shared_ptr<podsync::DeviceBackend> backend, LogCallback log_callback);
    ~DeviceManager() = default;

    DeviceManager(const DeviceManager&) = delete;
    DeviceManager& operator=(const DeviceManager&) = delete;

    // --- Discovery & Mounting ---
    std::vector<DeviceHandle> Discover();
    Status Mount(DeviceHandle& handle);
    Status Unmount(DeviceHandle& handle);
    Status Capacity(const DeviceHandle& handle, DeviceCapacity* out);

    // Capacity plus a summary of the Music/ tree
    Status Inspect(const DeviceHandle& handle, DeviceInfo* out);

    // --- Placement ---

    /**
     * Copy one file into the device tree.
     * @param hint Relative destination directory; empty derives
     *             Music/<artist>/<album> from the source's two parent directories
     * @param dest_out Receives the final destination path
     * @return CopyFailed on I/O error (no partial file left behind),
     *         DeviceUnavailable if the handle is not mounted
     */
    Status PlaceFile(const DeviceHandle& handle,
                     const std::string& source_path,
                     const std::string& hint,
                     std::string* dest_out = nullptr);

    /**
     * Mirror the media files below source_dir into <mount>/<hint or Music>.
     * Per-file failures are logged and counted; succeeds if anything transferred.
     */
    Status PlaceTree(const DeviceHandle& handle,
                     const std::string& source_dir,
                     const std::string& hint,
                     TreeResult* out = nullptr);

    /**
     * Hold the device's exclusive section across several calls.
     * The section is recursive, so the holder may keep calling into the manager.
     * A mounted handle is keyed by its canonical mount point, so the same
     * volume reached by path or by discovery shares one section; an unmounted
     * handle is keyed by id. Callers that mount inside a section should
     * acquire again afterwards to hold the mount point's section too.
     */
    std::unique_lock<std::recursive_mutex> AcquireExclusive(const DeviceHandle& handle);

    // Registry key used by AcquireExclusive
    static std::string ExclusiveKey(const DeviceHandle& handle);

    // Media extensions accepted by PlaceTree and counted by Inspect
    static bool IsTransferableMedia(const std::string& path);

    static std::string DescribeModel(uint16_t usb_product_id);
    static std::string DescribeModel(const std::string& product_type);

    podsync::DeviceBackend& Backend() { return *backend_; }

private:
    std::shared_ptr<podsync::DeviceBackend> backend_;
    LogCallback log_callback_;

    Status CopyAtomically(const std::string& source, const std::string& destination);
    void Log(const std::string& message);
};
