#include "DeviceManager.h"
#include "device/PodIdentification.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <system_error>

namespace fs = std::filesystem;

// Process-wide exclusive sections, one per key
static std::shared_ptr<std::recursive_mutex> DeviceLockFor(const std::string& key) {
    static std::mutex registry_mutex;
    static std::map<std::string, std::shared_ptr<std::recursive_mutex>> registry;

    std::lock_guard<std::mutex> lock(registry_mutex);
    auto& entry = registry[key];
    if (!entry) {
        entry = std::make_shared<std::recursive_mutex>();
    }
    return entry;
}

DeviceManager::DeviceManager(std::shared_ptr<podsync::DeviceBackend> backend,
                             LogCallback log_callback)
    : backend_(std::move(backend)), log_callback_(std::move(log_callback)) {
}

std::string DeviceManager::ExclusiveKey(const DeviceHandle& handle) {
    if (handle.IsMounted()) {
        std::error_code ec;
        fs::path canonical = fs::weakly_canonical(*handle.mount_point, ec);
        return "mount:" + (ec ? *handle.mount_point : canonical.string());
    }
    return "id:" + handle.id;
}

std::unique_lock<std::recursive_mutex> DeviceManager::AcquireExclusive(const DeviceHandle& handle) {
    // The registry keeps every mutex alive for the life of the process
    return std::unique_lock<std::recursive_mutex>(*DeviceLockFor(ExclusiveKey(handle)));
}

std::vector<DeviceHandle> DeviceManager::Discover() {
    return backend_->Discover();
}

Status DeviceManager::Mount(DeviceHandle& handle) {
    auto lock = AcquireExclusive(handle);
    return backend_->Mount(handle);
}

Status DeviceManager::Unmount(DeviceHandle& handle) {
    auto lock = AcquireExclusive(handle);
    return backend_->Unmount(handle);
}

Status DeviceManager::Capacity(const DeviceHandle& handle, DeviceCapacity* out) {
    auto lock = AcquireExclusive(handle);
    return backend_->Capacity(handle, out);
}

Status DeviceManager::Inspect(const DeviceHandle& handle, DeviceInfo* out) {
    auto lock = AcquireExclusive(handle);

    DeviceInfo info;
    Status status = backend_->Capacity(handle, &info.capacity);
    if (!status.ok()) {
        return status;
    }
    info.mount_point = *handle.mount_point;

    fs::path music = fs::path(info.mount_point) / "Music";
    std::error_code ec;
    info.has_music_dir = fs::is_directory(music, ec);
    if (info.has_music_dir) {
        fs::recursive_directory_iterator it(music, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            std::error_code type_ec;
            if (it->is_regular_file(type_ec) && IsTransferableMedia(it->path().string())) {
                info.music_file_count++;
            }
        }
    }

    if (out) {
        *out = info;
    }
    return Status::Ok();
}

bool DeviceManager::IsTransferableMedia(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return ext == ".m4a" || ext == ".mp3" || ext == ".aac" || ext == ".mp4";
}

std::string DeviceManager::DescribeModel(uint16_t usb_product_id) {
    return podsync::IdentifyUsbProduct(usb_product_id).model_name;
}

std::string DeviceManager::DescribeModel(const std::string& product_type) {
    return podsync::IdentifyProductType(product_type).model_name;
}

Status DeviceManager::CopyAtomically(const std::string& source, const std::string& destination) {
    fs::path dest(destination);
    fs::path temp = dest.parent_path() / ("." + dest.filename().string() + ".part");

    std::error_code ec;
    auto cleanup = [&temp]() {
        std::error_code ignored;
        fs::remove(temp, ignored);
    };

    uintmax_t expected = fs::file_size(source, ec);
    if (ec) {
        return Status::Error(ErrorKind::CopyFailed, "cannot read " + source + ": " + ec.message());
    }

    fs::copy_file(source, temp, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        cleanup();
        return Status::Error(ErrorKind::CopyFailed, "copy failed: " + ec.message());
    }

    uintmax_t written = fs::file_size(temp, ec);
    if (ec || written != expected) {
        cleanup();
        return Status::Error(ErrorKind::CopyFailed,
                             "size mismatch after copy (" + std::to_string(written) +
                             " of " + std::to_string(expected) + " bytes)");
    }

    auto mtime = fs::last_write_time(source, ec);
    if (!ec) {
        fs::last_write_time(temp, mtime, ec);
    }
    if (ec) {
        cleanup();
        return Status::Error(ErrorKind::CopyFailed, "cannot preserve modification time: " + ec.message());
    }

    fs::rename(temp, dest, ec);
    if (ec) {
        cleanup();
        return Status::Error(ErrorKind::CopyFailed, "rename failed: " + ec.message());
    }
    return Status::Ok();
}

Status DeviceManager::PlaceFile(const DeviceHandle& handle,
                                const std::string& source_path,
                                const std::string& hint,
                                std::string* dest_out) {
    auto lock = AcquireExclusive(handle);

    if (!handle.IsMounted()) {
        return Status::Error(ErrorKind::DeviceUnavailable, "device is not mounted");
    }

    std::error_code ec;
    if (!fs::is_regular_file(source_path, ec)) {
        return Status::Error(ErrorKind::CopyFailed, "source file missing: " + source_path);
    }

    fs::path source(source_path);
    fs::path dest_dir = fs::path(*handle.mount_point);
    if (!hint.empty()) {
        dest_dir /= hint;
    } else {
        // <...>/<artist>/<album>/<file> -> Music/<artist>/<album>
        fs::path album_dir = source.parent_path();
        fs::path artist_dir = album_dir.parent_path();
        dest_dir /= "Music";
        if (!artist_dir.filename().empty()) dest_dir /= artist_dir.filename();
        if (!album_dir.filename().empty()) dest_dir /= album_dir.filename();
    }

    fs::create_directories(dest_dir, ec);
    if (ec) {
        return Status::Error(ErrorKind::CopyFailed,
                             "cannot create " + dest_dir.string() + ": " + ec.message());
    }

    fs::path dest = dest_dir / source.filename();
    Status status = CopyAtomically(source_path, dest.string());
    if (!status.ok()) {
        Log("  ✗ " + source.filename().string() + ": " + status.message);
        return status;
    }

    Log("  ✓ Copied " + source.filename().string() + " -> " + dest.string());
    if (dest_out) {
        *dest_out = dest.string();
    }
    return Status::Ok();
}

Status DeviceManager::PlaceTree(const DeviceHandle& handle,
                                const std::string& source_dir,
                                const std::string& hint,
                                TreeResult* out) {
    auto lock = AcquireExclusive(handle);

    if (!handle.IsMounted()) {
        return Status::Error(ErrorKind::DeviceUnavailable, "device is not mounted");
    }

    std::error_code ec;
    if (!fs::is_directory(source_dir, ec)) {
        return Status::Error(ErrorKind::CopyFailed, "source directory missing: " + source_dir);
    }

    fs::path dest_root = fs::path(*handle.mount_point) / (hint.empty() ? "Music" : hint);
    Log("Mirroring " + source_dir + " -> " + dest_root.string());

    TreeResult result;
    fs::recursive_directory_iterator it(source_dir, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;
        if (!IsTransferableMedia(it->path().string())) continue;

        result.attempted++;
        fs::path relative = fs::relative(it->path(), source_dir, type_ec);
        if (type_ec) {
            result.failed++;
            Log("  ✗ " + it->path().string() + ": " + type_ec.message());
            continue;
        }

        fs::path dest = dest_root / relative;
        fs::create_directories(dest.parent_path(), type_ec);
        Status status = type_ec
            ? Status::Error(ErrorKind::CopyFailed, type_ec.message())
            : CopyAtomically(it->path().string(), dest.string());

        if (status.ok()) {
            result.transferred++;
            result.placed.push_back(dest.string());
        } else {
            result.failed++;
            Log("  ✗ " + relative.string() + ": " + status.message);
        }
    }

    Log("Transferred " + std::to_string(result.transferred) + "/" +
        std::to_string(result.attempted) + " file(s)");

    if (out) {
        *out = result;
    }
    if (result.transferred == 0) {
        return Status::Error(ErrorKind::CopyFailed,
                             result.attempted == 0 ? "no media files in " + source_dir
                                                   : "no file transferred");
    }
    return Status::Ok();
}

void DeviceManager::Log(const std::string& message) {
    if (log_callback_) {
        log_callback_(message);
    }
}
