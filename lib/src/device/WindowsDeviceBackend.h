#pragma once

#include "DeviceBackend.h"

namespace podsync {

/// Windows backend: drive letters by volume label, then by iPod_Control
class WindowsDeviceBackend : public DeviceBackend {
public:
    using DeviceBackend::DeviceBackend;

    const char* PlatformName() const override { return "windows"; }

protected:
    std::vector<DeviceHandle> QueryVendorProtocol() override;
    std::vector<DeviceHandle> EnumerateVolumes() override;
    std::vector<DeviceHandle> ScanMountDirectories() override;

    Status DoMount(const DeviceHandle& handle, std::string* mount_point) override;
    Status DoUnmount(const DeviceHandle& handle) override;
};

} // namespace podsync
