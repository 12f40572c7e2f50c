#include "LinuxDeviceBackend.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace podsync {

// lsblk -P prints KEY="value" pairs and escapes unsafe bytes as \xNN
static std::string DecodeLsblkValue(const std::string& raw) {
    std::string out;
    for (size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] == '\\' && i + 3 < raw.size() && raw[i + 1] == 'x' &&
            std::isxdigit(static_cast<unsigned char>(raw[i + 2])) &&
            std::isxdigit(static_cast<unsigned char>(raw[i + 3]))) {
            out.push_back(static_cast<char>(std::stoi(raw.substr(i + 2, 2), nullptr, 16)));
            i += 3;
        } else {
            out.push_back(raw[i]);
        }
    }
    return out;
}

static std::string Trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

static std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::vector<LinuxDeviceBackend::BlockDevice> LinuxDeviceBackend::ListBlockDevices() {
    std::vector<BlockDevice> devices;

    auto result = RunTool({"lsblk", "-P", "-o", "NAME,LABEL,MOUNTPOINT,VENDOR,MODEL,TYPE,PKNAME"});
    if (result.error == ErrorKind::ToolMissing) {
        Log("lsblk not found, skipping volume enumeration");
        return devices;
    }
    if (!result.Succeeded()) {
        return devices;
    }

    for (const auto& line : result.output) {
        BlockDevice dev;
        size_t pos = 0;
        while (pos < line.size()) {
            size_t eq = line.find("=\"", pos);
            if (eq == std::string::npos) break;
            size_t end = line.find('"', eq + 2);
            if (end == std::string::npos) break;

            std::string key = Trim(line.substr(pos, eq - pos));
            std::string value = Trim(DecodeLsblkValue(line.substr(eq + 2, end - eq - 2)));

            if (key == "NAME") dev.name = value;
            else if (key == "LABEL") dev.label = value;
            else if (key == "MOUNTPOINT") dev.mount_point = value;
            else if (key == "VENDOR") dev.vendor = value;
            else if (key == "MODEL") dev.model = value;
            else if (key == "TYPE") dev.type = value;
            else if (key == "PKNAME") dev.parent = value;

            pos = end + 1;
        }
        if (!dev.name.empty()) {
            devices.push_back(dev);
        }
    }
    return devices;
}

std::vector<DeviceHandle> LinuxDeviceBackend::QueryVendorProtocol() {
    std::vector<DeviceHandle> devices = ProbeUsbBus();
    if (!devices.empty()) {
        return devices;
    }
    return QueryLibimobiledevice();
}

std::vector<DeviceHandle> LinuxDeviceBackend::EnumerateVolumes() {
    std::vector<DeviceHandle> found;
    auto devices = ListBlockDevices();

    for (const auto& dev : devices) {
        if (dev.type != "part") continue;

        bool labelled = NameLooksLikePod(dev.label);
        bool apple_parent = false;
        std::string model;
        for (const auto& disk : devices) {
            if (disk.name != dev.parent) continue;
            std::string vendor = ToLower(disk.vendor);
            apple_parent = vendor.find("apple") != std::string::npos ||
                           NameLooksLikePod(disk.model);
            model = disk.model;
        }
        if (!labelled && !apple_parent) continue;

        DeviceHandle handle;
        handle.id = "/dev/" + dev.name;
        handle.name = dev.label.empty() ? "iPod" : dev.label;
        handle.model = model.empty() ? "Unknown" : model;
        handle.strategy = DiscoveryStrategy::VolumeEnumeration;
        if (!dev.mount_point.empty()) {
            handle.mount_point = dev.mount_point;
        }
        found.push_back(handle);
    }
    return found;
}

std::vector<DeviceHandle> LinuxDeviceBackend::ScanMountDirectories() {
    if (!config_.scan_roots.empty()) {
        return ScanDirectoriesForPods(config_.scan_roots, 2);
    }

    std::vector<DeviceHandle> found = ScanDirectoriesForPods({"/media", "/run/media"}, 2);
    auto mnt = ScanDirectoriesForPods({"/mnt"}, 1);
    found.insert(found.end(), mnt.begin(), mnt.end());
    return found;
}

std::string LinuxDeviceBackend::FindMountPointFor(const std::string& device_path) {
    for (const auto& dev : ListBlockDevices()) {
        if ("/dev/" + dev.name == device_path) {
            return dev.mount_point;
        }
    }
    return "";
}

std::string LinuxDeviceBackend::FindPodPartition() {
    auto volumes = EnumerateVolumes();
    return volumes.empty() ? "" : volumes.front().id;
}

Status LinuxDeviceBackend::MountBlockDevice(const std::string& device_path,
                                            std::string* mount_point) {
    auto result = RunTool({"udisksctl", "mount", "-b", device_path, "--no-user-interaction"});
    if (result.error == ErrorKind::ToolMissing) {
        return Status::Error(ErrorKind::DeviceUnavailable, "udisksctl not found");
    }
    if (result.error == ErrorKind::ProcessTimeout) {
        return Status::Error(ErrorKind::DeviceUnavailable, "udisksctl mount timed out");
    }

    std::string joined = result.Joined();

    // "Mounted /dev/sdb1 at /media/user/IPOD" (older releases add a trailing '.')
    if (result.Succeeded()) {
        size_t at = joined.find(" at ");
        if (at != std::string::npos) {
            std::string path = Trim(joined.substr(at + 4));
            if (!path.empty() && path.back() == '.') path.pop_back();
            *mount_point = path;
            return Status::Ok();
        }
    }

    if (result.Succeeded() || joined.find("AlreadyMounted") != std::string::npos) {
        std::string existing = FindMountPointFor(device_path);
        if (!existing.empty()) {
            *mount_point = existing;
            return Status::Ok();
        }
    }

    return Status::Error(ErrorKind::DeviceUnavailable,
                         "udisksctl mount failed: " + Trim(joined));
}

Status LinuxDeviceBackend::MountWithIfuse(const DeviceHandle& handle,
                                          std::string* mount_point) {
    std::string safe_id = handle.id;
    std::replace(safe_id.begin(), safe_id.end(), ':', '_');
    fs::path target = fs::path(config_.mount_root) / safe_id;

    std::error_code ec;
    fs::create_directories(target, ec);
    if (ec) {
        return Status::Error(ErrorKind::DeviceUnavailable,
                             "cannot create mount directory " + target.string() + ": " + ec.message());
    }

    std::vector<std::string> argv = {"ifuse", target.string()};
    if (handle.id.rfind("usb:", 0) != 0) {
        argv.push_back("-u");
        argv.push_back(handle.id);
    }

    auto result = RunTool(argv);
    if (result.error == ErrorKind::ToolMissing) {
        return Status::Error(ErrorKind::DeviceUnavailable, "ifuse not found");
    }
    if (!result.Succeeded()) {
        return Status::Error(ErrorKind::DeviceUnavailable,
                             "ifuse failed: " + Trim(result.Joined()));
    }

    *mount_point = target.string();
    return Status::Ok();
}

Status LinuxDeviceBackend::DoMount(const DeviceHandle& handle, std::string* mount_point) {
    if (handle.id.rfind("/dev/", 0) == 0) {
        return MountBlockDevice(handle.id, mount_point);
    }

    if (handle.id.rfind("usb:", 0) == 0) {
        // Disk-mode iPods show up as a block device once the kernel binds them
        std::string partition = FindPodPartition();
        if (!partition.empty()) {
            return MountBlockDevice(partition, mount_point);
        }
    }

    return MountWithIfuse(handle, mount_point);
}

Status LinuxDeviceBackend::DoUnmount(const DeviceHandle& handle) {
    const std::string& mp = *handle.mount_point;

    if (mp.rfind(config_.mount_root, 0) == 0) {
        auto result = RunTool({"fusermount", "-u", mp});
        if (!result.Succeeded()) {
            return Status::Error(ErrorKind::DeviceUnavailable,
                                 "fusermount failed: " + Trim(result.Joined()));
        }
        return Status::Ok();
    }

    std::string device_path;
    for (const auto& dev : ListBlockDevices()) {
        if (dev.mount_point == mp) {
            device_path = "/dev/" + dev.name;
            break;
        }
    }
    if (device_path.empty()) {
        return Status::Error(ErrorKind::DeviceUnavailable,
                             "no block device mounted at " + mp);
    }

    auto result = RunTool({"udisksctl", "unmount", "-b", device_path, "--no-user-interaction"});
    if (!result.Succeeded()) {
        return Status::Error(ErrorKind::DeviceUnavailable,
                             "udisksctl unmount failed: " + Trim(result.Joined()));
    }
    return Status::Ok();
}

} // namespace podsync
