/**
 * test_transcode_cache.cpp
 *
 * Unit tests for TranscodeManager output naming and conversion reuse
 */

#include "lib/src/TranscodeManager.h"
#include "TestFakes.h"
#include <iostream>
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

static ContentDescriptor MakeFetched(const TempDir& temp, const std::string& id,
                                     const std::string& artist, const std::string& title) {
    ContentDescriptor descriptor(id);
    descriptor.artist = artist;
    descriptor.title = title;
    descriptor.album = artist;
    fs::path raw = temp.path() / "raw" / (id + ".webm");
    WriteFile(raw, "raw:" + id);
    return *descriptor.Fetched(raw.string());
}

bool TestOutputPathSingleItem() {
    std::cout << "Testing output path for a single item..." << std::endl;

    TranscodeManager::Config config;
    config.output_dir = "converted";
    TranscodeManager manager(config, std::make_shared<FakeTranscoder>(), nullptr, nullptr);

    ContentDescriptor descriptor("abc");
    descriptor.artist = "Band";
    descriptor.album = "Band";
    descriptor.title = "Song";
    ASSERT_EQ(manager.OutputPathFor(descriptor, MediaFormat::M4A),
              (fs::path("converted") / "Band" / "Band" / "Song.m4a").string(),
              "Artist/album/title layout");

    ContentDescriptor anonymous("xyz");
    anonymous.title = "Untitled: Thing?";
    ASSERT_EQ(manager.OutputPathFor(anonymous, MediaFormat::MP3),
              (fs::path("converted") / "Unknown Artist" / "Unknown Artist" / "Untitled_ Thing_.mp3").string(),
              "Missing artist falls back and names are sanitized");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestOutputPathCollection() {
    std::cout << "Testing output path for a collection member..." << std::endl;

    TranscodeManager::Config config;
    config.output_dir = "out";
    TranscodeManager manager(config, std::make_shared<FakeTranscoder>(), nullptr, nullptr);

    ContentDescriptor descriptor("abc");
    descriptor.artist = "Band";
    descriptor.title = "Song";
    descriptor.collection_id = std::string("PL1");
    descriptor.collection_title = std::string("Mix/Tape");
    descriptor.album = "Mix/Tape";
    descriptor.track_number = 7;
    ASSERT_EQ(manager.OutputPathFor(descriptor, MediaFormat::MP4Video),
              (fs::path("out") / "Band" / "Mix_Tape" / "07 - Song.mp4").string(),
              "Ordinal prefix inside the collection directory");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestConvertReusesExistingOutput() {
    std::cout << "Testing conversion reuse of an existing output..." << std::endl;

    TempDir temp("tc_reuse");
    auto transcoder = std::make_shared<FakeTranscoder>();
    TranscodeManager::Config config;
    config.output_dir = (temp.path() / "converted").string();
    TranscodeManager manager(config, transcoder, nullptr, nullptr);

    ContentDescriptor item = MakeFetched(temp, "id1", "Band", "Song");

    std::string first;
    ASSERT_TRUE(manager.Convert(item, item.local_path(), "m4a", 256, &first).ok(), "First conversion");
    ASSERT_EQ(transcoder->calls.load(), 1, "Encoder invoked once");
    ASSERT_TRUE(fs::exists(first), "Output written");

    std::string second;
    ASSERT_TRUE(manager.Convert(item, item.local_path(), "m4a", 256, &second).ok(), "Second conversion");
    ASSERT_EQ(transcoder->calls.load(), 1, "Encoder not invoked again");
    ASSERT_EQ(second, first, "Same output path");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestConvertOverwrite() {
    std::cout << "Testing conversion with overwrite enabled..." << std::endl;

    TempDir temp("tc_overwrite");
    auto transcoder = std::make_shared<FakeTranscoder>();
    TranscodeManager::Config config;
    config.output_dir = (temp.path() / "converted").string();
    config.overwrite = true;
    TranscodeManager manager(config, transcoder, nullptr, nullptr);

    ContentDescriptor item = MakeFetched(temp, "id1", "Band", "Song");
    std::string out;
    ASSERT_TRUE(manager.Convert(item, item.local_path(), MediaFormat::MP3, 192, &out).ok(), "First");
    ASSERT_TRUE(manager.Convert(item, item.local_path(), MediaFormat::MP3, 192, &out).ok(), "Second");
    ASSERT_EQ(transcoder->calls.load(), 2, "Encoder invoked for each call");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestUnknownFormatName() {
    std::cout << "Testing unknown target format..." << std::endl;

    TempDir temp("tc_format");
    auto transcoder = std::make_shared<FakeTranscoder>();
    TranscodeManager::Config config;
    config.output_dir = temp.str();
    TranscodeManager manager(config, transcoder, nullptr, nullptr);

    ContentDescriptor item = MakeFetched(temp, "id1", "Band", "Song");
    std::string out;
    Status status = manager.Convert(item, item.local_path(), "flac", 256, &out);
    ASSERT_EQ(status.kind, ErrorKind::UnsupportedFormat, "Unknown format rejected");
    ASSERT_EQ(transcoder->calls.load(), 0, "Encoder never invoked");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestConvertAllKeepsOrder() {
    std::cout << "Testing batch conversion order and failures..." << std::endl;

    TempDir temp("tc_batch");
    auto transcoder = std::make_shared<FakeTranscoder>();
    transcoder->reject.insert("id2");
    auto tagger = std::make_shared<RecordingTagWriter>();

    TranscodeManager::Config config;
    config.output_dir = (temp.path() / "converted").string();
    config.workers = 3;

    std::vector<ProgressUpdate> updates;
    std::mutex updates_mutex;
    TranscodeManager manager(config, transcoder, tagger, nullptr,
        [&](const ProgressUpdate& u) {
            std::lock_guard<std::mutex> lock(updates_mutex);
            updates.push_back(u);
        });

    std::vector<ContentDescriptor> items = {
        MakeFetched(temp, "id1", "A", "One"),
        MakeFetched(temp, "id2", "B", "Two"),
        MakeFetched(temp, "id3", "C", "Three")
    };

    auto outcomes = manager.ConvertAll(items, MediaFormat::M4A, 256);
    ASSERT_EQ(outcomes.size(), static_cast<size_t>(3), "Outcomes aligned with input");
    ASSERT_TRUE(outcomes[0].status.ok(), "Item 1 converted");
    ASSERT_EQ(outcomes[1].status.kind, ErrorKind::UnsupportedFormat, "Item 2 failed");
    ASSERT_TRUE(outcomes[2].status.ok(), "Item 3 converted");
    ASSERT_EQ(outcomes[2].item.descriptor.source_id(), std::string("id3"), "Item 3 descriptor");
    ASSERT_EQ(tagger->writes.load(), 2, "Only converted files tagged");

    ASSERT_FALSE(updates.empty(), "Progress reported");
    ASSERT_EQ(updates.back().percent, 100, "Progress completes");
    ASSERT_TRUE(updates.back().stage == PipelineStage::Transcode, "Transcode stage");

    std::cout << "  PASS" << std::endl;
    return true;
}

int main() {
    std::cout << "======================================" << std::endl;
    std::cout << " TranscodeManager Unit Tests" << std::endl;
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

    run_test(TestOutputPathSingleItem, "Output Path Single Item");
    run_test(TestOutputPathCollection, "Output Path Collection");
    run_test(TestConvertReusesExistingOutput, "Reuse Existing Output");
    run_test(TestConvertOverwrite, "Overwrite");
    run_test(TestUnknownFormatName, "Unknown Format");
    run_test(TestConvertAllKeepsOrder, "Batch Conversion");

    std::cout << "======================================" << std::endl;
    std::cout << " Test Results: " << passed << "/" << total << " passed" << std::endl;
    std::cout << "======================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
