#pragma once

#include "../PodSyncTypes.h"
#include "../ProcessRunner.h"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace podsync {

/// Device layer settings. Empty scan_roots means the platform defaults.
struct DeviceConfig {
    std::string manual_mount_point;           // last-resort fallback for Discover()
    std::vector<std::string> scan_roots;      // path-heuristic roots
    std::string mount_root = "/tmp/podsync_mount";  // where ifuse mounts land
    bool probe_usb = true;                    // USB descriptor scan in the vendor strategy
    std::chrono::milliseconds command_timeout{15000};
};

/**
 * Abstract base class for platform device backends.
 *
 * Discover() runs the three discovery strategies in order of decreasing
 * reliability and stops at the first one that yields a device; derived
 * classes only supply the strategies and the mount/unmount mechanics.
 * Missing tools are logged and treated as "nothing found".
 */
class DeviceBackend {
public:
    using LogCallback = std::function<void(const std::string& message)>;

    DeviceBackend(const DeviceConfig& config,
                  std::shared_ptr<ProcessRunner> runner,
                  LogCallback log_callback);
    virtual ~DeviceBackend() = default;

    DeviceBackend(const DeviceBackend&) = delete;
    DeviceBackend& operator=(const DeviceBackend&) = delete;

    /**
     * Probe the host for attached iPods.
     * @return Handles found by the first productive strategy, the manual mount
     *         point if none was, or an empty vector
     */
    std::vector<DeviceHandle> Discover();

    /**
     * Mount a device. Returns immediately when the handle already carries an
     * existing mount point.
     * @param handle Device to mount; mount_point is set on success
     * @return DeviceUnavailable if the platform mechanism fails or times out
     */
    Status Mount(DeviceHandle& handle);

    /**
     * Unmount a device and clear its mount point.
     * @return DeviceUnavailable if no mount point is recorded or the command fails
     */
    Status Unmount(DeviceHandle& handle);

    /**
     * Query live capacity of the mounted filesystem.
     * @return DeviceUnavailable if the handle is not mounted
     */
    virtual Status Capacity(const DeviceHandle& handle, DeviceCapacity* out);

    virtual const char* PlatformName() const = 0;

    const DeviceConfig& GetConfig() const { return config_; }

protected:
    virtual std::vector<DeviceHandle> QueryVendorProtocol() = 0;
    virtual std::vector<DeviceHandle> EnumerateVolumes() = 0;
    virtual std::vector<DeviceHandle> ScanMountDirectories() = 0;

    virtual Status DoMount(const DeviceHandle& handle, std::string* mount_point) = 0;
    virtual Status DoUnmount(const DeviceHandle& handle) = 0;

    /// Scan the USB bus for Apple iPods (android-file-transfer usb::Context)
    std::vector<DeviceHandle> ProbeUsbBus();

    /// idevice_id -l followed by ideviceinfo -u for each udid
    std::vector<DeviceHandle> QueryLibimobiledevice();

    /**
     * Look for iPod volumes below each root, `depth` levels deep.
     * A directory qualifies when its name mentions iPod or it holds iPod_Control.
     */
    std::vector<DeviceHandle> ScanDirectoriesForPods(const std::vector<std::string>& roots,
                                                     int depth);

    ProcessRunner::Result RunTool(const std::vector<std::string>& argv);

    static bool NameLooksLikePod(const std::string& name);
    static bool HasPodControlDir(const std::string& path);

    void Log(const std::string& message);

    DeviceConfig config_;
    std::shared_ptr<ProcessRunner> runner_;
    LogCallback log_callback_;
};

} // namespace podsync
