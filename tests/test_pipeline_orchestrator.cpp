/**
 * test_pipeline_orchestrator.cpp
 *
 * End-to-end tests for PipelineOrchestrator with every external boundary
 * replaced by an in-process fake
 */

#include "lib/src/PipelineOrchestrator.h"
#include "TestFakes.h"
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

template<typename T>
bool AssertEqual(const T& actual, const T& expected, const std::string& msg) {
    if (actual != expected) {
        std::cerr << "FAIL: " << msg << std::endl;
        std::cerr << "  Expected: " << expected << std::endl;
        std::cerr << "  Got:      " << actual << std::endl;
        return false;
    }
    return true;
}

template<>
bool AssertEqual(const ErrorKind& actual, const ErrorKind& expected, const std::string& msg) {
    if (actual != expected) {
        std::cerr << "FAIL: " << msg << std::endl;
        std::cerr << "  Expected: " << ErrorKindToString(expected) << std::endl;
        std::cerr << "  Got:      " << ErrorKindToString(actual) << std::endl;
        return false;
    }
    return true;
}

template<>
bool AssertEqual(const PipelineState& actual, const PipelineState& expected, const std::string& msg) {
    if (actual != expected) {
        std::cerr << "FAIL: " << msg << std::endl;
        std::cerr << "  Expected: " << PipelineStateToString(expected) << std::endl;
        std::cerr << "  Got:      " << PipelineStateToString(actual) << std::endl;
        return false;
    }
    return true;
}

#define ASSERT_EQ(actual, expected, msg) \
    if (!AssertEqual(actual, expected, msg)) return false;

#define ASSERT_TRUE(condition, msg) \
    if (!(condition)) { \
        std::cerr << "FAIL: " << msg << std::endl; \
        std::cerr << "  Condition evaluated to false" << std::endl; \
        return false; \
    }

#define ASSERT_FALSE(condition, msg) \
    if (condition) { \
        std::cerr << "FAIL: " << msg << std::endl; \
        std::cerr << "  Condition evaluated to true (expected false)" << std::endl; \
        return false; \
    }

static const std::string kPlaylist = "https://www.youtube.com/playlist?list=PLroadtrip";

// Requests cancellation of the owning run once the first download finishes
class CancellingFetchEngine : public FakeFetchEngine {
public:
    PipelineOrchestrator* target = nullptr;

    Status Download(const podsync::DownloadRequest& request,
                    const ByteProgress& progress,
                    std::string* output_path) override {
        Status status = FakeFetchEngine::Download(request, progress, output_path);
        if (target) target->Cancel();
        return status;
    }
};

struct Harness {
    TempDir temp{"pipeline"};
    std::shared_ptr<FakeFetchEngine> engine;
    std::shared_ptr<FakeTranscoder> transcoder = std::make_shared<FakeTranscoder>();
    std::shared_ptr<RecordingTagWriter> tagger = std::make_shared<RecordingTagWriter>();
    std::shared_ptr<FakeDeviceBackend> backend;
    PipelineConfig config;

    explicit Harness(std::shared_ptr<FakeFetchEngine> fetch = std::make_shared<FakeFetchEngine>())
        : engine(std::move(fetch)) {
        engine->items = {
            {"vid1", "Artist One - First Song"},
            {"vid2", "Artist Two - Second Song"},
            {"vid3", "Third Song"}
        };
        backend = std::make_shared<FakeDeviceBackend>(temp.str());
        DeviceHandle pod;
        pod.id = "usb:05ac:1267";
        pod.name = "IPOD";
        pod.model = "iPod Nano (7th Gen)";
        pod.strategy = DiscoveryStrategy::VendorProtocol;
        backend->handles.push_back(pod);

        config.temp_dir = (temp.path() / "temp").string();
        config.output_dir = (temp.path() / "converted").string();
        config.workers = 2;
    }

    PipelineOrchestrator::Collaborators Collaborators() const {
        PipelineOrchestrator::Collaborators c;
        c.fetch_engine = engine;
        c.transcoder = transcoder;
        c.tag_writer = tagger;
        c.device_backend = backend;
        return c;
    }

    fs::path Mount() const { return temp.path() / "IPOD"; }
};

static size_t CountFiles(const fs::path& root) {
    size_t count = 0;
    std::error_code ec;
    if (!fs::exists(root, ec)) return 0;
    for (auto& entry : fs::recursive_directory_iterator(root)) {
        if (entry.is_regular_file()) count++;
    }
    return count;
}

bool TestEndToEndWithOneFailure() {
    std::cout << "Testing full run with one failing item..." << std::endl;

    Harness h;
    h.engine->broken.insert("vid2");

    std::mutex updates_mutex;
    std::vector<ProgressUpdate> updates;
    PipelineOrchestrator orchestrator(h.config, h.Collaborators(), nullptr);
    orchestrator.SetProgressCallback([&](const ProgressUpdate& u) {
        std::lock_guard<std::mutex> lock(updates_mutex);
        updates.push_back(u);
    });

    RunSummary summary;
    Status status = orchestrator.Run(kPlaylist, "m4a", 256, DeviceSelector(), &summary);

    ASSERT_TRUE(status.ok(), "Run should succeed");
    ASSERT_EQ(summary.final_state, PipelineState::Done, "Final state");
    ASSERT_EQ(orchestrator.GetState(), PipelineState::Done, "Orchestrator state");
    ASSERT_FALSE(summary.cancelled, "Not cancelled");

    ASSERT_EQ(summary.acquisition.attempted, 3u, "Three attempted");
    ASSERT_EQ(summary.acquisition.succeeded, 2u, "Two fetched");
    ASSERT_EQ(summary.acquisition.failed, 1u, "One fetch failure");
    ASSERT_EQ(summary.transcode.succeeded, 2u, "Two converted");
    ASSERT_EQ(summary.transfer.succeeded, 2u, "Two transferred");
    ASSERT_EQ(h.tagger->writes.load(), 2, "Two tagged");

    ASSERT_EQ(summary.failures.size(), static_cast<size_t>(1), "One failure record");
    ASSERT_EQ(summary.failures[0].item_id, std::string("vid2"), "Failed item id");
    ASSERT_EQ(summary.failures[0].error, ErrorKind::FetchIncomplete, "Failure kind");
    ASSERT_TRUE(summary.failures[0].stage == PipelineStage::Acquisition, "Failure stage");

    fs::path first = h.Mount() / "Music" / "Artist One" / "Road Trip" / "01 - First Song.m4a";
    fs::path third = h.Mount() / "Music" / "Unknown Artist" / "Road Trip" / "03 - Third Song.m4a";
    ASSERT_TRUE(fs::exists(first), "First item on device");
    ASSERT_TRUE(fs::exists(third), "Third item on device");
    ASSERT_EQ(summary.transferred_paths.size(), static_cast<size_t>(2), "Transferred paths");
    ASSERT_EQ(summary.transferred_paths[0], first.string(), "Transfer order follows source order");

    int last[3] = {-1, -1, -1};
    for (const auto& u : updates) {
        int& prev = last[static_cast<int>(u.stage)];
        ASSERT_TRUE(u.percent >= prev, "Percent never decreases within a stage");
        prev = u.percent;
    }
    ASSERT_EQ(last[static_cast<int>(PipelineStage::Transfer)], 100, "Transfer completes");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestUnresolvableItemRenumbersSurvivors() {
    std::cout << "Testing full run where the second item cannot be resolved..." << std::endl;

    Harness h;
    h.engine->unavailable = {"vid2"};

    PipelineOrchestrator orchestrator(h.config, h.Collaborators(), nullptr);
    RunSummary summary;
    Status status = orchestrator.Run(kPlaylist, "m4a", 256, DeviceSelector(), &summary);

    ASSERT_TRUE(status.ok(), "Run should succeed");
    ASSERT_EQ(summary.final_state, PipelineState::Done, "Final state");
    ASSERT_EQ(summary.acquisition.attempted, 3u, "Three attempted");
    ASSERT_EQ(summary.acquisition.succeeded, 2u, "Two acquired");
    ASSERT_EQ(summary.transcode.succeeded, 2u, "Two converted");
    ASSERT_EQ(summary.transfer.succeeded, 2u, "Two transferred");

    ASSERT_EQ(summary.failures.size(), static_cast<size_t>(1), "One failure record");
    ASSERT_EQ(summary.failures[0].item_id, std::string("vid2"), "Failed item id");
    ASSERT_EQ(summary.failures[0].error, ErrorKind::SourceUnavailable, "Failure kind");
    ASSERT_TRUE(summary.failures[0].stage == PipelineStage::Acquisition, "Failure stage");

    // Survivors are numbered 1 and 2 all the way onto the device
    fs::path first = h.Mount() / "Music" / "Artist One" / "Road Trip" / "01 - First Song.m4a";
    fs::path second = h.Mount() / "Music" / "Unknown Artist" / "Road Trip" / "02 - Third Song.m4a";
    ASSERT_TRUE(fs::exists(first), "First item on device");
    ASSERT_TRUE(fs::exists(second), "Third source item placed as track 02");
    ASSERT_FALSE(fs::exists(h.Mount() / "Music" / "Unknown Artist" / "Road Trip" / "03 - Third Song.m4a"),
                 "No gap left in the numbering");
    ASSERT_EQ(CountFiles(h.Mount()), static_cast<size_t>(2), "Exactly two files on device");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestInsufficientSpaceCopiesNothing() {
    std::cout << "Testing insufficient space..." << std::endl;

    Harness h;
    h.backend->override_capacity = true;
    h.backend->fixed_capacity.total = 1000;
    h.backend->fixed_capacity.used = 999;
    h.backend->fixed_capacity.free = 1;

    PipelineOrchestrator orchestrator(h.config, h.Collaborators(), nullptr);
    RunSummary summary;
    Status status = orchestrator.Run(kPlaylist, "m4a", 256, DeviceSelector(), &summary);

    ASSERT_EQ(status.kind, ErrorKind::InsufficientSpace, "InsufficientSpace");
    ASSERT_EQ(summary.final_state, PipelineState::Failed, "Failed");
    ASSERT_EQ(summary.run_error, ErrorKind::InsufficientSpace, "Run error recorded");
    ASSERT_FALSE(summary.failure_reason.empty(), "Reason recorded");
    ASSERT_EQ(summary.transfer.attempted, 0u, "No copy attempted");
    ASSERT_EQ(CountFiles(h.Mount()), static_cast<size_t>(0), "Device untouched");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestSkipTransfer() {
    std::cout << "Testing run without transfer..." << std::endl;

    Harness h;
    h.config.skip_transfer = true;
    h.config.clean_temp = true;

    PipelineOrchestrator orchestrator(h.config, h.Collaborators(), nullptr);
    RunSummary summary;
    Status status = orchestrator.Run("https://www.youtube.com/watch?v=vid1", "mp3", 192,
                                     DeviceSelector(), &summary);

    ASSERT_TRUE(status.ok(), "Run should succeed");
    ASSERT_EQ(summary.final_state, PipelineState::Done, "Done after converting");
    ASSERT_EQ(summary.transcode.succeeded, 1u, "Converted");
    ASSERT_EQ(h.backend->mounts.load(), 0, "Device never mounted");
    ASSERT_TRUE(fs::exists(fs::path(h.config.output_dir) / "Artist One" / "Artist One" / "First Song.mp3"),
                "Converted output kept");
    ASSERT_EQ(CountFiles(h.config.temp_dir), static_cast<size_t>(0), "Temp files cleaned");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestCancellationStopsCleanly() {
    std::cout << "Testing cooperative cancellation..." << std::endl;

    auto engine = std::make_shared<CancellingFetchEngine>();
    Harness h(engine);
    h.config.workers = 1;

    PipelineOrchestrator orchestrator(h.config, h.Collaborators(), nullptr);
    engine->target = &orchestrator;

    RunSummary summary;
    Status status = orchestrator.Run(kPlaylist, "m4a", 256, DeviceSelector(), &summary);

    ASSERT_TRUE(status.ok(), "Cancelled run is not an error");
    ASSERT_TRUE(summary.cancelled, "Cancelled flag");
    ASSERT_EQ(summary.final_state, PipelineState::Done, "Ends in Done");
    ASSERT_EQ(summary.acquisition.succeeded, 1u, "Only the in-flight item finished");
    ASSERT_EQ(engine->downloads.load(), 1, "No new item started");
    ASSERT_EQ(summary.transcode.attempted, 0u, "Nothing converted");
    ASSERT_EQ(CountFiles(h.Mount()), static_cast<size_t>(0), "Nothing transferred");

    // The next run starts with a fresh cancellation flag
    engine->target = nullptr;
    status = orchestrator.Run(kPlaylist, "m4a", 256, DeviceSelector(), &summary);
    ASSERT_TRUE(status.ok(), "Second run");
    ASSERT_FALSE(summary.cancelled, "Second run not cancelled");
    ASSERT_EQ(summary.transfer.succeeded, 3u, "Second run transfers everything");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestCancelWhileResolving() {
    std::cout << "Testing cancellation during collection resolution..." << std::endl;

    Harness h;
    PipelineOrchestrator orchestrator(h.config, h.Collaborators(), nullptr);
    h.engine->on_resolve = [&h, &orchestrator](const std::string&) {
        if (h.engine->resolves.load() == 1) orchestrator.Cancel();
    };

    RunSummary summary;
    Status status = orchestrator.Run(kPlaylist, "m4a", 256, DeviceSelector(), &summary);

    ASSERT_TRUE(status.ok(), "Cancelled run is not an error");
    ASSERT_TRUE(summary.cancelled, "Cancelled flag");
    ASSERT_EQ(summary.final_state, PipelineState::Done, "Ends in Done");
    ASSERT_EQ(h.engine->resolves.load(), 1, "Remaining members never looked up");
    ASSERT_EQ(summary.acquisition.attempted, 1u, "One entry examined");
    ASSERT_EQ(h.engine->downloads.load(), 0, "Nothing fetched");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestCancelDuringTransferStillUnmounts() {
    std::cout << "Testing unmount after a cancelled transfer..." << std::endl;

    Harness h;
    h.config.unmount_after_transfer = true;
    PipelineOrchestrator orchestrator(h.config, h.Collaborators(), nullptr);
    // Cancel lands once the device is mounted and measured
    h.backend->on_capacity = [&orchestrator]() { orchestrator.Cancel(); };

    RunSummary summary;
    Status status = orchestrator.Run(kPlaylist, "m4a", 256, DeviceSelector(), &summary);

    ASSERT_TRUE(status.ok(), "Cancelled run is not an error");
    ASSERT_TRUE(summary.cancelled, "Cancelled flag");
    ASSERT_EQ(summary.transfer.attempted, 0u, "No copy started");
    ASSERT_EQ(h.backend->mounts.load(), 1, "Device was mounted");
    ASSERT_EQ(h.backend->unmounts.load(), 1, "Device unmounted despite cancellation");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestStageFailures() {
    std::cout << "Testing stage-level failures..." << std::endl;

    {
        Harness h;
        PipelineOrchestrator orchestrator(h.config, h.Collaborators(), nullptr);
        RunSummary summary;
        Status status = orchestrator.Run(kPlaylist, "flac", 256, DeviceSelector(), &summary);
        ASSERT_EQ(status.kind, ErrorKind::UnsupportedFormat, "Unknown format");
        ASSERT_EQ(summary.final_state, PipelineState::Failed, "Failed");
    }
    {
        Harness h;
        h.engine->unavailable = {"vid1", "vid2", "vid3"};
        PipelineOrchestrator orchestrator(h.config, h.Collaborators(), nullptr);
        RunSummary summary;
        Status status = orchestrator.Run(kPlaylist, "m4a", 256, DeviceSelector(), &summary);
        ASSERT_EQ(status.kind, ErrorKind::SourceUnavailable, "Nothing resolvable");
        ASSERT_EQ(summary.failures.size(), static_cast<size_t>(3), "Every skip recorded");
    }
    {
        Harness h;
        h.engine->broken = {"vid1", "vid2", "vid3"};
        PipelineOrchestrator orchestrator(h.config, h.Collaborators(), nullptr);
        RunSummary summary;
        Status status = orchestrator.Run(kPlaylist, "m4a", 256, DeviceSelector(), &summary);
        ASSERT_EQ(status.kind, ErrorKind::FetchIncomplete, "Nothing fetched");
        ASSERT_EQ(h.transcoder->calls.load(), 0, "Converting never started");
    }
    {
        Harness h;
        h.transcoder->reject = {"First", "Second", "Third"};
        PipelineOrchestrator orchestrator(h.config, h.Collaborators(), nullptr);
        RunSummary summary;
        Status status = orchestrator.Run(kPlaylist, "m4a", 256, DeviceSelector(), &summary);
        ASSERT_EQ(status.kind, ErrorKind::UnsupportedFormat, "Nothing converted");
        ASSERT_EQ(summary.transcode.failed, 3u, "Three conversion failures");
    }
    {
        Harness h;
        h.backend->handles.clear();
        PipelineOrchestrator orchestrator(h.config, h.Collaborators(), nullptr);
        RunSummary summary;
        Status status = orchestrator.Run(kPlaylist, "m4a", 256, DeviceSelector(), &summary);
        ASSERT_EQ(status.kind, ErrorKind::DeviceUnavailable, "No device");
        ASSERT_EQ(summary.transcode.succeeded, 3u, "Earlier stages completed");
    }

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestExplicitMountPoint() {
    std::cout << "Testing explicit mount point selection..." << std::endl;

    Harness h;
    h.config.unmount_after_transfer = true;
    fs::path manual = h.temp.path() / "manual_pod";
    fs::create_directories(manual);

    PipelineOrchestrator orchestrator(h.config, h.Collaborators(), nullptr);
    DeviceSelector selector;
    selector.mount_point = manual.string();

    RunSummary summary;
    Status status = orchestrator.Run("https://www.youtube.com/watch?v=vid3", "m4a", 256,
                                     selector, &summary);
    ASSERT_TRUE(status.ok(), "Run should succeed");
    ASSERT_TRUE(fs::exists(manual / "Music" / "Unknown Artist" / "Unknown Artist" / "Third Song.m4a"),
                "File placed under the given mount point");
    ASSERT_EQ(h.backend->mounts.load(), 0, "Backend mount skipped");
    ASSERT_EQ(h.backend->unmounts.load(), 1, "Unmounted after transfer");

    selector.mount_point = (h.temp.path() / "missing").string();
    status = orchestrator.Run("https://www.youtube.com/watch?v=vid3", "m4a", 256, selector, &summary);
    ASSERT_EQ(status.kind, ErrorKind::DeviceUnavailable, "Missing mount point");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestDeviceQueries() {
    std::cout << "Testing device queries outside a run..." << std::endl;

    Harness h;
    PipelineOrchestrator orchestrator(h.config, h.Collaborators(), nullptr);

    auto devices = orchestrator.DiscoverDevices();
    ASSERT_EQ(devices.size(), static_cast<size_t>(1), "One device");

    DeviceCapacity capacity;
    ASSERT_TRUE(orchestrator.QueryCapacity(devices[0], &capacity).ok(), "Capacity");
    ASSERT_TRUE(devices[0].IsMounted(), "Mounted for the query");
    ASSERT_TRUE(capacity.total > 0, "Total reported");
    ASSERT_EQ(orchestrator.GetState(), PipelineState::Idle, "No run started");

    std::cout << "  PASS" << std::endl;
    return true;
}

int main() {
    std::cout << "======================================" << std::endl;
    std::cout << " PipelineOrchestrator Tests" << std::endl;
    std::cout << "======================================" << std::endl << std::endl;

    int passed = 0;
    int total = 0;

    auto run_test = [&](bool (*test_func)(), const std::string& name) {
        total++;
        if (test_func()) {
            passed++;
        } else {
            std::cout << "  TEST FAILED: " << name << std::endl;
        }
        std::cout << std::endl;
    };

    run_test(TestEndToEndWithOneFailure, "End to End");
    run_test(TestUnresolvableItemRenumbersSurvivors, "End to End With Unresolvable Item");
    run_test(TestInsufficientSpaceCopiesNothing, "Insufficient Space");
    run_test(TestSkipTransfer, "Skip Transfer");
    run_test(TestCancellationStopsCleanly, "Cancellation");
    run_test(TestCancelWhileResolving, "Cancel While Resolving");
    run_test(TestCancelDuringTransferStillUnmounts, "Cancel During Transfer");
    run_test(TestStageFailures, "Stage Failures");
    run_test(TestExplicitMountPoint, "Explicit Mount Point");
    run_test(TestDeviceQueries, "Device Queries");

    std::cout << "======================================" << std::endl;
    std::cout << " Test Results: " << passed << "/" << total << " passed" << std::endl;
    std::cout << "======================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
