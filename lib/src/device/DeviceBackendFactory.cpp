#include "DeviceBackendFactory.h"
#include "LinuxDeviceBackend.h"
#include "MacDeviceBackend.h"
#include "WindowsDeviceBackend.h"

namespace podsync {

HostPlatform DetectHostPlatform() {
#if defined(_WIN32)
    return HostPlatform::Windows;
#elif defined(__APPLE__)
    return HostPlatform::MacOS;
#else
    return HostPlatform::Linux;
#endif
}

std::unique_ptr<DeviceBackend> DeviceBackendFactory::CreateBackend(
    HostPlatform platform,
    const DeviceConfig& config,
    std::shared_ptr<ProcessRunner> runner,
    DeviceBackend::LogCallback log_callback) {

    switch (platform) {
        case HostPlatform::MacOS:
            return std::make_unique<MacDeviceBackend>(config, std::move(runner),
                                                      std::move(log_callback));
        case HostPlatform::Windows:
            return std::make_unique<WindowsDeviceBackend>(config, std::move(runner),
                                                          std::move(log_callback));
        case HostPlatform::Linux:
        default:
            return std::make_unique<LinuxDeviceBackend>(config, std::move(runner),
                                                        std::move(log_callback));
    }
}

std::unique_ptr<DeviceBackend> DeviceBackendFactory::CreateForHost(
    const DeviceConfig& config,
    std::shared_ptr<ProcessRunner> runner,
    DeviceBackend::LogCallback log_callback) {
    return CreateBackend(DetectHostPlatform(), config, std::move(runner), std::move(log_callback));
}

} // namespace podsync
