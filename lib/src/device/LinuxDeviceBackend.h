#pragma once

#include "DeviceBackend.h"

namespace podsync {

/**
 * Linux backend.
 *
 * Vendor protocol: USB descriptor scan, then libimobiledevice.
 * Volumes: lsblk partitions labelled iPod or hanging off an Apple disk.
 * Paths: /media and /run/media two levels deep, /mnt one level.
 * Mounting goes through udisksctl for block devices and ifuse otherwise.
 */
class LinuxDeviceBackend : public DeviceBackend {
public:
    using DeviceBackend::DeviceBackend;

    const char* PlatformName() const override { return "linux"; }

protected:
    std::vector<DeviceHandle> QueryVendorProtocol() override;
    std::vector<DeviceHandle> EnumerateVolumes() override;
    std::vector<DeviceHandle> ScanMountDirectories() override;

    Status DoMount(const DeviceHandle& handle, std::string* mount_point) override;
    Status DoUnmount(const DeviceHandle& handle) override;

private:
    struct BlockDevice {
        std::string name;
        std::string label;
        std::string mount_point;
        std::string vendor;
        std::string model;
        std::string type;
        std::string parent;
    };

    std::vector<BlockDevice> ListBlockDevices();
    std::string FindMountPointFor(const std::string& device_path);
    std::string FindPodPartition();
    Status MountBlockDevice(const std::string& device_path, std::string* mount_point);
    Status MountWithIfuse(const DeviceHandle& handle, std::string* mount_point);
};

} // namespace podsync
