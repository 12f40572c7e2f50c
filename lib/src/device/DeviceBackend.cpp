#include "DeviceBackend.h"
#include "PodIdentification.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <usb/Context.h>
#include <usb/DeviceDescriptor.h>

namespace fs = std::filesystem;

namespace podsync {

DeviceBackend::DeviceBackend(const DeviceConfig& config,
                             std::shared_ptr<ProcessRunner> runner,
                             LogCallback log_callback)
    : config_(config), runner_(std::move(runner)), log_callback_(std::move(log_callback)) {
    if (!runner_) {
        runner_ = ProcessRunner::CreateDefault();
    }
}

std::vector<DeviceHandle> DeviceBackend::Discover() {
    Log(std::string("Discovering devices (") + PlatformName() + ")...");

    std::vector<DeviceHandle> devices = QueryVendorProtocol();
    if (!devices.empty()) {
        Log("  ✓ " + std::to_string(devices.size()) + " device(s) via vendor protocol");
        return devices;
    }

    devices = EnumerateVolumes();
    if (!devices.empty()) {
        Log("  ✓ " + std::to_string(devices.size()) + " device(s) via volume enumeration");
        return devices;
    }

    devices = ScanMountDirectories();
    if (!devices.empty()) {
        Log("  ✓ " + std::to_string(devices.size()) + " device(s) via mount directory scan");
        return devices;
    }

    if (!config_.manual_mount_point.empty()) {
        std::error_code ec;
        if (fs::exists(config_.manual_mount_point, ec)) {
            DeviceHandle manual;
            manual.id = "manual";
            manual.name = fs::path(config_.manual_mount_point).filename().string();
            if (manual.name.empty()) {
                manual.name = config_.manual_mount_point;
            }
            manual.model = "Unknown";
            manual.strategy = DiscoveryStrategy::Manual;
            manual.mount_point = config_.manual_mount_point;
            Log("  Using manual mount point: " + config_.manual_mount_point);
            devices.push_back(manual);
            return devices;
        }
        Log("  Manual mount point does not exist: " + config_.manual_mount_point);
    }

    Log("  No devices found");
    return devices;
}

Status DeviceBackend::Mount(DeviceHandle& handle) {
    if (handle.IsMounted()) {
        return Status::Ok();
    }

    std::string mount_point;
    Status status = DoMount(handle, &mount_point);
    if (!status.ok()) {
        Log("Failed to mount " + handle.name + ": " + status.message);
        return status;
    }

    std::error_code ec;
    if (mount_point.empty() || !fs::exists(mount_point, ec)) {
        return Status::Error(ErrorKind::DeviceUnavailable,
                             "mount reported no usable mount point for " + handle.id);
    }

    handle.mount_point = mount_point;
    Log("Device mounted at: " + mount_point);
    return Status::Ok();
}

Status DeviceBackend::Unmount(DeviceHandle& handle) {
    if (!handle.mount_point || handle.mount_point->empty()) {
        return Status::Error(ErrorKind::DeviceUnavailable, "no device mounted");
    }

    Status status = DoUnmount(handle);
    if (!status.ok()) {
        Log("Failed to unmount " + *handle.mount_point + ": " + status.message);
        return status;
    }

    Log("Device unmounted: " + *handle.mount_point);
    handle.mount_point.reset();
    return Status::Ok();
}

Status DeviceBackend::Capacity(const DeviceHandle& handle, DeviceCapacity* out) {
    if (!handle.IsMounted()) {
        return Status::Error(ErrorKind::DeviceUnavailable, "device is not mounted");
    }

    std::error_code ec;
    fs::space_info info = fs::space(*handle.mount_point, ec);
    if (ec) {
        return Status::Error(ErrorKind::DeviceUnavailable,
                             "free-space query failed: " + ec.message());
    }

    if (out) {
        out->total = info.capacity;
        out->free = info.available;
        out->used = info.capacity - info.free;
    }
    return Status::Ok();
}

std::vector<DeviceHandle> DeviceBackend::ProbeUsbBus() {
    std::vector<DeviceHandle> found;
    if (!config_.probe_usb) {
        return found;
    }

    try {
        auto ctx = std::make_shared<mtp::usb::Context>();
        auto devices = ctx->GetDevices();

        for (auto desc : devices) {
            if (desc->GetVendorId() != kAppleVendorId) continue;

            PodIdentification ident = IdentifyUsbProduct(desc->GetProductId());
            if (!ident.valid) continue;

            std::ostringstream id;
            id << "usb:" << std::hex << std::setfill('0') << std::setw(4) << kAppleVendorId
               << ":" << std::setw(4) << ident.product_id;

            DeviceHandle handle;
            handle.id = id.str();
            handle.name = ident.model_name;
            handle.model = ident.model_name;
            handle.strategy = DiscoveryStrategy::VendorProtocol;
            found.push_back(handle);
        }
    } catch (const std::exception& e) {
        Log("USB probe unavailable: " + std::string(e.what()));
    }
    return found;
}

std::vector<DeviceHandle> DeviceBackend::QueryLibimobiledevice() {
    std::vector<DeviceHandle> found;

    auto list = RunTool({"idevice_id", "-l"});
    if (list.error == ErrorKind::ToolMissing) {
        Log("libimobiledevice not found, skipping idevice query");
        return found;
    }
    if (!list.Succeeded()) {
        return found;
    }

    for (const auto& raw : list.output) {
        std::string udid = raw;
        udid.erase(std::remove_if(udid.begin(), udid.end(),
                                  [](unsigned char c) { return std::isspace(c); }),
                   udid.end());
        if (udid.empty()) continue;

        auto info = RunTool({"ideviceinfo", "-u", udid});
        if (!info.Succeeded()) continue;

        std::string product_type;
        std::string device_name;
        for (const auto& line : info.output) {
            size_t colon = line.find(':');
            if (colon == std::string::npos) continue;
            std::string key = line.substr(0, colon);
            std::string value = line.substr(colon + 1);
            size_t first = value.find_first_not_of(" \t");
            value = (first == std::string::npos) ? "" : value.substr(first);

            if (key == "ProductType") product_type = value;
            else if (key == "DeviceName") device_name = value;
        }

        if (product_type.find("iPod") == std::string::npos) continue;

        PodIdentification ident = IdentifyProductType(product_type);
        DeviceHandle handle;
        handle.id = udid;
        handle.name = device_name.empty() ? "iPod" : device_name;
        handle.model = ident.model_name;
        handle.strategy = DiscoveryStrategy::VendorProtocol;
        found.push_back(handle);
    }
    return found;
}

std::vector<DeviceHandle> DeviceBackend::ScanDirectoriesForPods(
    const std::vector<std::string>& roots, int depth) {

    std::vector<DeviceHandle> found;

    std::function<void(const fs::path&, int)> scan = [&](const fs::path& dir, int remaining) {
        std::error_code ec;
        fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        if (ec) return;

        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) break;
            std::error_code type_ec;
            if (!it->is_directory(type_ec)) continue;

            std::string name = it->path().filename().string();
            std::string path = it->path().string();
            if (NameLooksLikePod(name) || HasPodControlDir(path)) {
                DeviceHandle handle;
                handle.id = path;
                handle.name = name;
                handle.model = "Unknown";
                handle.strategy = DiscoveryStrategy::PathHeuristic;
                handle.mount_point = path;
                found.push_back(handle);
            } else if (remaining > 1) {
                scan(it->path(), remaining - 1);
            }
        }
    };

    for (const auto& root : roots) {
        std::error_code ec;
        if (!fs::is_directory(root, ec)) continue;
        scan(root, depth);
    }
    return found;
}

ProcessRunner::Result DeviceBackend::RunTool(const std::vector<std::string>& argv) {
    auto result = runner_->Run(argv, config_.command_timeout);
    if (result.error == ErrorKind::ProcessTimeout) {
        Log("Command timed out: " + argv.front());
    }
    return result;
}

bool DeviceBackend::NameLooksLikePod(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower.find("ipod") != std::string::npos;
}

bool DeviceBackend::HasPodControlDir(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(fs::path(path) / "iPod_Control", ec);
}

void DeviceBackend::Log(const std::string& message) {
    if (log_callback_) {
        log_callback_(message);
    }
}

} // namespace podsync
