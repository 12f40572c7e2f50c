/**
 * Device Probe CLI - Lists attached iPods and dumps capacity and Music/ summary
 */

#include "DeviceManager.h"
#include "device/DeviceBackendFactory.h"
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

static bool g_verbose = false;

std::string format_bytes(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);
    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        unit_index++;
    }
    std::stringstream ss;
    ss << std::fixed << std::setprecision(2) << size << " " << units[unit_index];
    return ss.str();
}

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --mount-point <path>  Fallback mount point when discovery finds nothing" << std::endl;
    std::cout << "  --scan-root <path>    Scan this directory instead of the platform defaults (repeatable)" << std::endl;
    std::cout << "  --no-usb              Skip the USB descriptor scan" << std::endl;
    std::cout << "  --mount               Mount devices that are not mounted yet" << std::endl;
    std::cout << "  --unmount             Unmount each device after inspecting it" << std::endl;
    std::cout << "  --verbose             Show discovery logging" << std::endl;
}

int main(int argc, char* argv[]) {
    podsync::DeviceConfig config;
    bool do_mount = false;
    bool do_unmount = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help") { print_usage(argv[0]); return 0; }
        else if (arg == "--verbose") g_verbose = true;
        else if (arg == "--no-usb") config.probe_usb = false;
        else if (arg == "--mount") do_mount = true;
        else if (arg == "--unmount") do_unmount = true;
        else if (arg == "--mount-point" && i + 1 < argc) config.manual_mount_point = argv[++i];
        else if (arg == "--scan-root" && i + 1 < argc) config.scan_roots.push_back(argv[++i]);
        else {
            std::cerr << "ERROR: Unknown option " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    auto log = [](const std::string& msg) {
        if (g_verbose) std::cout << "  [device] " << msg << std::endl;
    };

    std::shared_ptr<podsync::DeviceBackend> backend =
        podsync::DeviceBackendFactory::CreateForHost(config, nullptr, log);
    DeviceManager manager(backend, log);

    std::cout << "Platform: " << backend->PlatformName() << std::endl;
    auto devices = manager.Discover();
    if (devices.empty()) {
        std::cerr << "ERROR: No iPod found" << std::endl;
        return 1;
    }

    int failures = 0;
    for (size_t i = 0; i < devices.size(); ++i) {
        DeviceHandle& handle = devices[i];
        std::cout << std::endl;
        std::cout << "Device " << (i + 1) << ":" << std::endl;
        std::cout << "  Id:        " << handle.id << std::endl;
        std::cout << "  Name:      " << handle.name << std::endl;
        std::cout << "  Model:     " << handle.model << std::endl;
        std::cout << "  Found via: " << DiscoveryStrategyToString(handle.strategy) << std::endl;

        if (!handle.IsMounted()) {
            if (!do_mount) {
                std::cout << "  Not mounted (pass --mount to mount it)" << std::endl;
                continue;
            }
            Status status = manager.Mount(handle);
            if (!status.ok()) {
                std::cerr << "  ERROR: " << status.message << std::endl;
                failures++;
                continue;
            }
        }

        DeviceInfo info;
        Status status = manager.Inspect(handle, &info);
        if (!status.ok()) {
            std::cerr << "  ERROR: " << status.message << std::endl;
            failures++;
            continue;
        }

        std::cout << "  Mounted:   " << info.mount_point << std::endl;
        std::cout << "  Capacity:  " << format_bytes(info.capacity.total) << std::endl;
        std::cout << "  Used:      " << format_bytes(info.capacity.used) << std::endl;
        std::cout << "  Free:      " << format_bytes(info.capacity.free) << std::endl;
        if (info.has_music_dir) {
            std::cout << "  Music/:    " << info.music_file_count << " media file(s)" << std::endl;
        } else {
            std::cout << "  Music/:    (missing)" << std::endl;
        }

        if (do_unmount) {
            status = manager.Unmount(handle);
            if (!status.ok()) {
                std::cerr << "  ERROR: " << status.message << std::endl;
                failures++;
            }
        }
    }

    return failures == 0 ? 0 : 1;
}
