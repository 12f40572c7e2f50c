#include "MacDeviceBackend.h"
#include <sstream>

namespace podsync {

static std::string Trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

static std::vector<std::string> SplitWhitespace(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream iss(line);
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::vector<DeviceHandle> MacDeviceBackend::QueryVendorProtocol() {
    std::vector<DeviceHandle> devices = ProbeUsbBus();
    if (!devices.empty()) {
        return devices;
    }
    return QueryLibimobiledevice();
}

std::string MacDeviceBackend::MountPointOf(const std::string& disk_id) {
    auto info = RunTool({"diskutil", "info", disk_id});
    if (!info.Succeeded()) {
        return "";
    }
    for (const auto& line : info.output) {
        size_t key = line.find("Mount Point:");
        if (key != std::string::npos) {
            return Trim(line.substr(key + 12));
        }
    }
    return "";
}

std::vector<DeviceHandle> MacDeviceBackend::EnumerateVolumes() {
    std::vector<DeviceHandle> found;

    auto list = RunTool({"diskutil", "list"});
    if (list.error == ErrorKind::ToolMissing) {
        Log("diskutil not found, skipping volume enumeration");
        return found;
    }
    if (!list.Succeeded()) {
        return found;
    }

    // Partition rows end with the identifier, e.g. "1: DOS_FAT_32 IPOD 7.9 GB disk4s2"
    for (const auto& line : list.output) {
        if (!NameLooksLikePod(line)) continue;

        auto tokens = SplitWhitespace(line);
        if (tokens.empty() || tokens.back().rfind("disk", 0) != 0) continue;

        DeviceHandle handle;
        handle.id = tokens.back();
        handle.name = "iPod";
        for (const auto& token : tokens) {
            if (NameLooksLikePod(token)) {
                handle.name = token;
                break;
            }
        }
        handle.model = "Unknown";
        handle.strategy = DiscoveryStrategy::VolumeEnumeration;

        std::string mp = MountPointOf(handle.id);
        if (!mp.empty()) {
            handle.mount_point = mp;
        }
        found.push_back(handle);
    }
    return found;
}

std::vector<DeviceHandle> MacDeviceBackend::ScanMountDirectories() {
    if (!config_.scan_roots.empty()) {
        return ScanDirectoriesForPods(config_.scan_roots, 2);
    }
    return ScanDirectoriesForPods({"/Volumes"}, 1);
}

Status MacDeviceBackend::DoMount(const DeviceHandle& handle, std::string* mount_point) {
    if (handle.id.rfind("disk", 0) == 0) {
        auto result = RunTool({"diskutil", "mount", handle.id});
        if (result.error == ErrorKind::ToolMissing) {
            return Status::Error(ErrorKind::DeviceUnavailable, "diskutil not found");
        }
        if (!result.Succeeded()) {
            return Status::Error(ErrorKind::DeviceUnavailable,
                                 "diskutil mount failed: " + Trim(result.Joined()));
        }
        *mount_point = MountPointOf(handle.id);
        return Status::Ok();
    }

    // Anything else: the Finder has usually mounted it already, find it in df
    auto df = RunTool({"df"});
    if (df.Succeeded()) {
        for (const auto& line : df.output) {
            if (!NameLooksLikePod(line)) continue;
            auto tokens = SplitWhitespace(line);
            if (tokens.size() < 9) continue;

            std::string path = tokens[8];
            for (size_t i = 9; i < tokens.size(); ++i) {
                path += " " + tokens[i];
            }
            *mount_point = path;
            return Status::Ok();
        }
    }
    return Status::Error(ErrorKind::DeviceUnavailable,
                         "no mounted iPod volume found for " + handle.id);
}

Status MacDeviceBackend::DoUnmount(const DeviceHandle& handle) {
    auto result = RunTool({"diskutil", "eject", *handle.mount_point});
    if (!result.Succeeded()) {
        return Status::Error(ErrorKind::DeviceUnavailable,
                             "diskutil eject failed: " + Trim(result.Joined()));
    }
    return Status::Ok();
}

} // namespace podsync
