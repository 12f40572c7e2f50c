#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "Transcoder.h"
#include "../ProcessRunner.h"

namespace podsync {

/// Transcoder backed by the ffmpeg executable
class FfmpegTranscoder : public Transcoder {
public:
    using LogCallback = std::function<void(const std::string& message)>;

    struct Config {
        std::string executable = "ffmpeg";
        std::chrono::milliseconds timeout{30 * 60 * 1000};
    };

    FfmpegTranscoder(const Config& config,
                     std::shared_ptr<ProcessRunner> runner,
                     LogCallback log_callback);

    Status Transcode(const TranscodeRequest& request) override;

    /// Hidden sibling the encoder writes before the final rename
    static std::string TemporaryPathFor(const std::string& output_path);

    /// Full ffmpeg argv writing to `target`
    std::vector<std::string> BuildArguments(const TranscodeRequest& request,
                                            const std::string& target) const;

private:
    Config config_;
    std::shared_ptr<ProcessRunner> runner_;
    LogCallback log_callback_;

    void Log(const std::string& message);
};

} // namespace podsync
