#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "FetchEngine.h"
#include "../ProcessRunner.h"

namespace podsync {

/**
 * FetchEngine backed by the yt-dlp executable.
 *
 * Metadata comes from --print templates with tab-separated fields; download
 * progress from a --progress-template line that carries raw byte counts.
 */
class YtDlpFetchEngine : public FetchEngine {
public:
    using LogCallback = std::function<void(const std::string& message)>;

    struct Config {
        std::string executable = "yt-dlp";
        std::chrono::milliseconds metadata_timeout{60000};
        std::chrono::milliseconds download_timeout{600000};
    };

    YtDlpFetchEngine(const Config& config,
                     std::shared_ptr<ProcessRunner> runner,
                     LogCallback log_callback);

    Status ResolveItem(const std::string& reference, ItemMetadata* out) override;
    Status EnumerateCollection(const std::string& reference, CollectionListing* out) override;
    Status Download(const DownloadRequest& request,
                    const ByteProgress& progress,
                    std::string* output_path) override;

    /// Parse one progress-template line; false if the line is not ours
    static bool ParseProgressLine(const std::string& line, uint64_t* downloaded, uint64_t* total);

    /// True when engine output says the item itself is gone (private, removed, 404)
    static bool LooksUnavailable(const std::string& output);

private:
    Config config_;
    std::shared_ptr<ProcessRunner> runner_;
    LogCallback log_callback_;

    void Log(const std::string& message);
};

} // namespace podsync
