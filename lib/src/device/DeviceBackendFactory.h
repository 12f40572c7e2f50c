#pragma once

#include "DeviceBackend.h"
#include <memory>

namespace podsync {

enum class HostPlatform {
    Linux,
    MacOS,
    Windows
};

/// Platform the library was compiled for
HostPlatform DetectHostPlatform();

/**
 * Factory for platform device backends.
 *
 * Routes to the backend implementing that platform's discovery strategies:
 * - Linux → LinuxDeviceBackend (USB, lsblk, /media scan)
 * - MacOS → MacDeviceBackend (USB, diskutil, /Volumes scan)
 * - Windows → WindowsDeviceBackend (USB, drive labels, iPod_Control scan)
 */
class DeviceBackendFactory {
public:
    /**
     * Create a backend for an explicit platform.
     *
     * @param platform Target platform
     * @param config Device layer settings
     * @param runner Process runner used for external tools; nullptr for the default
     * @param log_callback Log sink, may be empty
     * @return Unique pointer to backend instance
     */
    static std::unique_ptr<DeviceBackend> CreateBackend(HostPlatform platform,
                                                        const DeviceConfig& config,
                                                        std::shared_ptr<ProcessRunner> runner,
                                                        DeviceBackend::LogCallback log_callback);

    /// Same as CreateBackend(DetectHostPlatform(), ...)
    static std::unique_ptr<DeviceBackend> CreateForHost(const DeviceConfig& config,
                                                        std::shared_ptr<ProcessRunner> runner,
                                                        DeviceBackend::LogCallback log_callback);
};

} // namespace podsync
