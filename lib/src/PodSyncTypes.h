#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Failure taxonomy shared by every stage.
// ProcessTimeout and ToolMissing only come out of ProcessRunner and are mapped
// to one of the stage-level kinds before they reach a RunSummary.
enum class ErrorKind {
    None = 0,
    SourceUnavailable,
    FetchIncomplete,
    UnsupportedFormat,
    DeviceUnavailable,
    InsufficientSpace,
    CopyFailed,
    ProcessTimeout,
    ToolMissing
};

const char* ErrorKindToString(ErrorKind kind);

struct Status {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    bool ok() const { return kind == ErrorKind::None; }

    static Status Ok() { return Status(); }
    static Status Error(ErrorKind kind, const std::string& message) {
        Status s;
        s.kind = kind;
        s.message = message;
        return s;
    }
};

/**
 * ContentDescriptor
 *
 * Metadata for one playable item. The source id and the local file path are
 * private: the id is fixed at construction and the path can only be attached
 * by Fetched(), which hands back a new descriptor.
 */
class ContentDescriptor {
public:
    ContentDescriptor() = default;
    explicit ContentDescriptor(const std::string& source_id) : source_id_(source_id) {}

    const std::string& source_id() const { return source_id_; }
    const std::string& local_path() const { return local_path_; }
    bool IsFetched() const { return !local_path_.empty(); }
    bool InCollection() const { return collection_title.has_value(); }

    // Returns a copy carrying `path`. Fails if this descriptor was already
    // fetched or if `path` does not exist on disk.
    std::optional<ContentDescriptor> Fetched(const std::string& path) const;

    std::string title;
    std::string artist;
    std::string album;
    std::string thumbnail_url;
    int duration_seconds = 0;
    std::optional<int> track_number;        // 1-based, contiguous over surviving items
    std::optional<std::string> collection_id;
    std::optional<std::string> collection_title;
    int collection_index = 0;               // position in the source listing (1-based, 0 = none)

private:
    std::string source_id_;
    std::string local_path_;
};

struct TranscodedItem {
    ContentDescriptor descriptor;
    std::string output_path;
};

enum class DiscoveryStrategy {
    VendorProtocol,
    VolumeEnumeration,
    PathHeuristic,
    Manual
};

const char* DiscoveryStrategyToString(DiscoveryStrategy strategy);

struct DeviceHandle {
    std::string id;            // opaque platform id (/dev/sdb1, udid, usb:05ac:1267, E:)
    std::string name;
    std::string model;
    DiscoveryStrategy strategy = DiscoveryStrategy::Manual;
    std::optional<std::string> mount_point;

    // Mounted only when a mount point is recorded and still present on disk
    bool IsMounted() const;
};

struct DeviceCapacity {
    uint64_t total = 0;
    uint64_t free = 0;
    uint64_t used = 0;
};

struct DeviceInfo {
    std::string mount_point;
    DeviceCapacity capacity;
    bool has_music_dir = false;
    uint32_t music_file_count = 0;
};

// Output formats the transcoder and tagger understand
enum class MediaFormat {
    M4A,
    MP3,
    MP4Video
};

bool ParseMediaFormat(const std::string& name, MediaFormat* out);
const char* MediaFormatExtension(MediaFormat format);

enum class PipelineState {
    Idle,
    Acquiring,
    Converting,
    Transferring,
    Done,
    Failed
};

const char* PipelineStateToString(PipelineState state);

enum class PipelineStage {
    Acquisition,
    Transcode,
    Transfer
};

const char* PipelineStageToString(PipelineStage stage);

struct FailureRecord {
    PipelineStage stage = PipelineStage::Acquisition;
    std::string item_id;
    std::string title;
    ErrorKind error = ErrorKind::None;
    std::string message;
};

struct StageSummary {
    uint32_t attempted = 0;
    uint32_t succeeded = 0;
    uint32_t failed = 0;
};

struct RunSummary {
    PipelineState final_state = PipelineState::Idle;
    bool cancelled = false;
    ErrorKind run_error = ErrorKind::None;
    std::string failure_reason;
    StageSummary acquisition;
    StageSummary transcode;
    StageSummary transfer;
    std::vector<FailureRecord> failures;
    std::vector<std::string> transferred_paths;   // destination paths on the device
};

struct ProgressUpdate {
    PipelineStage stage = PipelineStage::Acquisition;
    int percent = 0;            // 0..100, never decreases within a stage
    std::string message;
    bool indeterminate = false;
    uint32_t pulse = 0;         // cycles while indeterminate
};
