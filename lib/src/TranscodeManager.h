#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "PodSyncTypes.h"
#include "pipeline/ProgressChannel.h"
#include "transcode/TagWriter.h"
#include "transcode/Transcoder.h"

/**
 * TranscodeManager
 *
 * Converts fetched files into device-ready files under the output root and
 * tags them. Output paths are deterministic:
 *
 *   <root>/<artist>/<collection>/NN - <title>.<ext>   collection members
 *   <root>/<artist>/<album or artist>/<title>.<ext>   everything else
 *
 * An existing output is reused unless overwrite is set.
 */
class TranscodeManager {
public:
    using LogCallback = std::function<void(const std::string& message)>;
    using ProgressSink = podsync::StageProgress::Sink;

    struct Config {
        std::string output_dir = "converted";
        bool overwrite = false;
        size_t workers = 2;
        std::string video_resolution = "640x480";
        int video_bitrate_kbps = 1500;
    };

    struct ConvertOutcome {
        bool attempted = false;
        Status status;
        TranscodedItem item;
    };

    TranscodeManager(const Config& config,
                     std::shared_ptr<podsync::Transcoder> transcoder,
                     std::shared_ptr<podsync::TagWriter> tag_writer,
                     LogCallback log_callback,
                     ProgressSink progress = nullptr);

    std::string OutputPathFor(const ContentDescriptor& descriptor, MediaFormat format) const;

    /**
     * Convert one file.
     * @param format_name "m4a", "mp3" or "mp4"
     * @return UnsupportedFormat for an unknown format name or a failed conversion
     */
    Status Convert(const ContentDescriptor& descriptor,
                   const std::string& input_path,
                   const std::string& format_name,
                   int bitrate_kbps,
                   std::string* output_path);

    Status Convert(const ContentDescriptor& descriptor,
                   const std::string& input_path,
                   MediaFormat format,
                   int bitrate_kbps,
                   std::string* output_path);

    /// Write tags for `descriptor` into `path` (UnsupportedFormat for unknown containers)
    Status Tag(const std::string& path, const ContentDescriptor& descriptor);

    /**
     * Convert and tag every fetched descriptor, up to Config::workers at a time.
     * Outcomes are index-aligned with the input.
     */
    std::vector<ConvertOutcome> ConvertAll(const std::vector<ContentDescriptor>& fetched,
                                           MediaFormat format,
                                           int bitrate_kbps,
                                           const std::atomic<bool>* cancel = nullptr);

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    std::shared_ptr<podsync::Transcoder> transcoder_;
    std::shared_ptr<podsync::TagWriter> tag_writer_;
    LogCallback log_callback_;
    ProgressSink progress_sink_;

    void Log(const std::string& message);
};
