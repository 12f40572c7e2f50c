#pragma once

#include "DeviceBackend.h"

namespace podsync {

/// macOS backend: diskutil for volumes, /Volumes for the path heuristic
class MacDeviceBackend : public DeviceBackend {
public:
    using DeviceBackend::DeviceBackend;

    const char* PlatformName() const override { return "macos"; }

protected:
    std::vector<DeviceHandle> QueryVendorProtocol() override;
    std::vector<DeviceHandle> EnumerateVolumes() override;
    std::vector<DeviceHandle> ScanMountDirectories() override;

    Status DoMount(const DeviceHandle& handle, std::string* mount_point) override;
    Status DoUnmount(const DeviceHandle& handle) override;

private:
    std::string MountPointOf(const std::string& disk_id);
};

} // namespace podsync
