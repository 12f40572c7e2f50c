#include "WindowsDeviceBackend.h"
#include <cstring>
#include <filesystem>
#include <system_error>

#if defined(_WIN32)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace fs = std::filesystem;

namespace podsync {

std::vector<DeviceHandle> WindowsDeviceBackend::QueryVendorProtocol() {
    return ProbeUsbBus();
}

std::vector<DeviceHandle> WindowsDeviceBackend::EnumerateVolumes() {
    std::vector<DeviceHandle> found;
#if defined(_WIN32)
    char drives[256] = {};
    DWORD len = GetLogicalDriveStringsA(sizeof(drives) - 1, drives);
    if (len == 0 || len >= sizeof(drives)) {
        Log("GetLogicalDriveStrings failed");
        return found;
    }

    for (const char* root = drives; *root; root += strlen(root) + 1) {
        char label[MAX_PATH + 1] = {};
        if (!GetVolumeInformationA(root, label, sizeof(label), nullptr, nullptr,
                                   nullptr, nullptr, 0)) {
            continue;
        }
        if (!NameLooksLikePod(label)) continue;

        std::string drive(root, 2);  // "E:"
        DeviceHandle handle;
        handle.id = drive;
        handle.name = label;
        handle.model = "Unknown";
        handle.strategy = DiscoveryStrategy::VolumeEnumeration;
        handle.mount_point = std::string(root);
        found.push_back(handle);
    }
#else
    Log("Volume enumeration requires the Win32 API, skipping");
#endif
    return found;
}

std::vector<DeviceHandle> WindowsDeviceBackend::ScanMountDirectories() {
    if (!config_.scan_roots.empty()) {
        return ScanDirectoriesForPods(config_.scan_roots, 2);
    }

    std::vector<DeviceHandle> found;
    for (char letter = 'D'; letter <= 'Z'; ++letter) {
        std::string root = std::string(1, letter) + ":\\";
        if (!HasPodControlDir(root)) continue;

        DeviceHandle handle;
        handle.id = std::string(1, letter) + ":";
        handle.name = "iPod (" + handle.id + ")";
        handle.model = "Unknown";
        handle.strategy = DiscoveryStrategy::PathHeuristic;
        handle.mount_point = root;
        found.push_back(handle);
    }
    return found;
}

Status WindowsDeviceBackend::DoMount(const DeviceHandle& handle, std::string* mount_point) {
    // Windows assigns drive letters on arrival; a letter id is its own mount point
    if (handle.id.size() == 2 && handle.id[1] == ':') {
        std::string root = handle.id + "\\";
        std::error_code ec;
        if (fs::exists(root, ec)) {
            *mount_point = root;
            return Status::Ok();
        }
    }

    auto volumes = EnumerateVolumes();
    if (!volumes.empty() && volumes.front().mount_point) {
        *mount_point = *volumes.front().mount_point;
        return Status::Ok();
    }
    return Status::Error(ErrorKind::DeviceUnavailable,
                         "no drive letter assigned to " + handle.id);
}

Status WindowsDeviceBackend::DoUnmount(const DeviceHandle& handle) {
    std::string drive = handle.mount_point->substr(0, 2);
    auto result = RunTool({"mountvol", drive, "/p"});
    if (!result.Succeeded()) {
        return Status::Error(ErrorKind::DeviceUnavailable,
                             "mountvol failed for " + drive + ": " + result.Joined());
    }
    return Status::Ok();
}

} // namespace podsync
