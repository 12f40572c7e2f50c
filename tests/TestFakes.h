/**
 * TestFakes.h
 *
 * In-process stand-ins for the external boundaries (fetch tool, encoder,
 * process runner, device backend) plus scratch-directory helpers.
 */

#pragma once

#include "lib/src/PodSyncTypes.h"
#include "lib/src/ProcessRunner.h"
#include "lib/src/acquisition/FetchEngine.h"
#include "lib/src/device/DeviceBackend.h"
#include "lib/src/transcode/TagWriter.h"
#include "lib/src/transcode/Transcoder.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Scratch directory removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        std::random_device rd;
        path_ = fs::temp_directory_path() /
                ("podsync_" + tag + "_" + std::to_string(rd()));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    const fs::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

private:
    fs::path path_;
};

inline void WriteFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

inline std::string ReadFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

/**
 * Fetch engine serving a fixed catalogue. Items listed in `unavailable`
 * fail to resolve; items listed in `broken` resolve but fail to download.
 */
class FakeFetchEngine : public podsync::FetchEngine {
public:
    struct Item {
        std::string id;
        std::string title;
    };

    std::string collection_title = "Road Trip";
    std::vector<Item> items;
    std::set<std::string> unavailable;
    std::set<std::string> broken;
    bool report_unknown_size = false;
    std::atomic<int> downloads{0};
    std::atomic<int> resolves{0};
    std::function<void(const std::string& reference)> on_resolve;   // runs before each lookup

    Status ResolveItem(const std::string& reference, podsync::ItemMetadata* out) override {
        resolves++;
        if (on_resolve) {
            on_resolve(reference);
        }
        for (const auto& item : items) {
            if (reference.find(item.id) == std::string::npos) continue;
            if (unavailable.count(item.id)) {
                return Status::Error(ErrorKind::SourceUnavailable, "Video unavailable");
            }
            out->id = item.id;
            out->title = item.title;
            out->duration_seconds = 200;
            return Status::Ok();
        }
        return Status::Error(ErrorKind::SourceUnavailable, "unknown reference " + reference);
    }

    Status EnumerateCollection(const std::string& reference, podsync::CollectionListing* out) override {
        if (items.empty()) {
            return Status::Error(ErrorKind::SourceUnavailable, "empty listing");
        }
        out->id = reference;
        out->title = collection_title;
        for (const auto& item : items) {
            podsync::ItemReference ref;
            ref.id = item.id;
            ref.url = "https://www.youtube.com/watch?v=" + item.id;
            ref.title = item.title;
            out->entries.push_back(ref);
        }
        return Status::Ok();
    }

    Status Download(const podsync::DownloadRequest& request,
                    const ByteProgress& progress,
                    std::string* output_path) override {
        downloads++;
        for (const auto& id : broken) {
            if (request.reference.find(id) != std::string::npos) {
                return Status::Error(ErrorKind::FetchIncomplete, "connection reset");
            }
        }
        if (progress) {
            progress(512, report_unknown_size ? 0 : 1024);
            progress(1024, report_unknown_size ? 0 : 1024);
        }
        std::string path = request.output_stem + "." + request.format;
        WriteFile(path, "raw:" + request.reference);
        *output_path = path;
        return Status::Ok();
    }
};

// Encoder that copies input to output and counts invocations
class FakeTranscoder : public podsync::Transcoder {
public:
    std::atomic<int> calls{0};
    std::set<std::string> reject;   // input filename substrings that fail

    Status Transcode(const podsync::TranscodeRequest& request) override {
        calls++;
        for (const auto& r : reject) {
            if (request.input_path.find(r) != std::string::npos) {
                return Status::Error(ErrorKind::UnsupportedFormat, "decoder error");
            }
        }
        std::error_code ec;
        fs::create_directories(fs::path(request.output_path).parent_path(), ec);
        fs::copy_file(request.input_path, request.output_path,
                      fs::copy_options::overwrite_existing, ec);
        if (ec) {
            return Status::Error(ErrorKind::UnsupportedFormat, ec.message());
        }
        return Status::Ok();
    }
};

// Tag writer that records calls instead of touching the file
class RecordingTagWriter : public podsync::TagWriter {
public:
    RecordingTagWriter() : podsync::TagWriter(nullptr, nullptr) {}

    std::atomic<int> writes{0};

    Status Write(const std::string&, const ContentDescriptor&) override {
        writes++;
        return Status::Ok();
    }
};

// Answers commands from a table keyed by argv[0]; unknown tools are missing
class FakeProcessRunner : public ProcessRunner {
public:
    std::map<std::string, Result> responses;
    std::vector<std::vector<std::string>> calls;
    std::function<void(const std::vector<std::string>& argv)> on_run;   // side effects of the tool
    std::mutex mutex;

    Result Run(const std::vector<std::string>& argv,
               std::chrono::milliseconds,
               const LineCallback& on_line = nullptr) override {
        std::lock_guard<std::mutex> lock(mutex);
        calls.push_back(argv);
        auto it = responses.find(argv.empty() ? "" : argv.front());
        if (it == responses.end()) {
            Result missing;
            missing.error = ErrorKind::ToolMissing;
            return missing;
        }
        if (on_run) {
            on_run(argv);
        }
        if (on_line) {
            for (const auto& line : it->second.output) on_line(line);
        }
        return it->second;
    }

    static Result Ok(const std::vector<std::string>& lines) {
        Result r;
        r.exit_code = 0;
        r.output = lines;
        return r;
    }
};

/**
 * Backend over plain directories. Discover() returns the configured
 * handles; Capacity() can be overridden to simulate a full device.
 */
class FakeDeviceBackend : public podsync::DeviceBackend {
public:
    explicit FakeDeviceBackend(const std::string& root)
        : podsync::DeviceBackend(podsync::DeviceConfig(), std::make_shared<FakeProcessRunner>(), nullptr),
          root_(root) {}

    std::vector<DeviceHandle> handles;
    bool override_capacity = false;
    DeviceCapacity fixed_capacity;
    std::atomic<int> mounts{0};
    std::atomic<int> unmounts{0};
    std::function<void()> on_capacity;   // runs before each capacity query

    Status Capacity(const DeviceHandle& handle, DeviceCapacity* out) override {
        if (on_capacity) {
            on_capacity();
        }
        if (!override_capacity) {
            return podsync::DeviceBackend::Capacity(handle, out);
        }
        if (!handle.IsMounted()) {
            return Status::Error(ErrorKind::DeviceUnavailable, "device is not mounted");
        }
        *out = fixed_capacity;
        return Status::Ok();
    }

    const char* PlatformName() const override { return "fake"; }

protected:
    std::vector<DeviceHandle> QueryVendorProtocol() override { return handles; }
    std::vector<DeviceHandle> EnumerateVolumes() override { return {}; }
    std::vector<DeviceHandle> ScanMountDirectories() override { return {}; }

    Status DoMount(const DeviceHandle& handle, std::string* mount_point) override {
        mounts++;
        fs::path target = fs::path(root_) / handle.name;
        std::error_code ec;
        fs::create_directories(target, ec);
        *mount_point = target.string();
        return Status::Ok();
    }

    Status DoUnmount(const DeviceHandle&) override {
        unmounts++;
        return Status::Ok();
    }

private:
    std::string root_;
};
