#include "YtDlpFetchEngine.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace podsync {

static const char* kProgressMarker = "[podsync]";

// yt-dlp prints "NA" for fields it does not have
static std::string FieldOrEmpty(const std::string& value) {
    return value == "NA" ? "" : value;
}

static std::vector<std::string> SplitTabs(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream iss(line);
    while (std::getline(iss, field, '\t')) {
        fields.push_back(FieldOrEmpty(field));
    }
    if (!line.empty() && line.back() == '\t') {
        fields.push_back("");
    }
    return fields;
}

static uint64_t ParseByteCount(const std::string& token) {
    if (token.empty() || token == "NA" || token == "None") return 0;
    try {
        double value = std::stod(token);
        return value > 0 ? static_cast<uint64_t>(value) : 0;
    } catch (const std::exception&) {
        return 0;
    }
}

YtDlpFetchEngine::YtDlpFetchEngine(const Config& config,
                                   std::shared_ptr<ProcessRunner> runner,
                                   LogCallback log_callback)
    : config_(config), runner_(std::move(runner)), log_callback_(std::move(log_callback)) {
    if (!runner_) {
        runner_ = ProcessRunner::CreateDefault();
    }
}

bool YtDlpFetchEngine::ParseProgressLine(const std::string& line,
                                         uint64_t* downloaded, uint64_t* total) {
    size_t marker = line.find(kProgressMarker);
    if (marker == std::string::npos) return false;

    std::istringstream iss(line.substr(marker + std::char_traits<char>::length(kProgressMarker)));
    std::string done_tok, total_tok, estimate_tok;
    if (!(iss >> done_tok)) return false;
    iss >> total_tok >> estimate_tok;

    *downloaded = ParseByteCount(done_tok);
    uint64_t exact = ParseByteCount(total_tok);
    *total = exact ? exact : ParseByteCount(estimate_tok);
    return true;
}

bool YtDlpFetchEngine::LooksUnavailable(const std::string& output) {
    static const char* kMarkers[] = {
        "Video unavailable",
        "Private video",
        "This video has been removed",
        "is not available",
        "HTTP Error 404",
        "HTTP Error 410",
        "Unsupported URL",
        "Incomplete YouTube ID",
        "does not exist"
    };
    for (const char* marker : kMarkers) {
        if (output.find(marker) != std::string::npos) return true;
    }
    return false;
}

Status YtDlpFetchEngine::ResolveItem(const std::string& reference, ItemMetadata* out) {
    auto result = runner_->Run({
        config_.executable,
        "--skip-download",
        "--no-playlist",
        "--no-warnings",
        "--print", "%(id)s\t%(title)s\t%(thumbnail)s\t%(duration)s",
        reference
    }, config_.metadata_timeout);

    if (result.error == ErrorKind::ToolMissing) {
        return Status::Error(ErrorKind::SourceUnavailable, config_.executable + " not found");
    }
    if (result.error == ErrorKind::ProcessTimeout) {
        return Status::Error(ErrorKind::SourceUnavailable, "metadata query timed out");
    }

    for (const auto& line : result.output) {
        auto fields = SplitTabs(line);
        if (fields.size() < 4 || fields[0].empty()) continue;

        ItemMetadata meta;
        meta.id = fields[0];
        meta.title = fields[1];
        meta.thumbnail_url = fields[2];
        meta.duration_seconds = static_cast<int>(ParseByteCount(fields[3]));
        if (out) *out = meta;
        return Status::Ok();
    }

    return Status::Error(ErrorKind::SourceUnavailable,
                         "could not resolve " + reference + ": " + result.Joined());
}

Status YtDlpFetchEngine::EnumerateCollection(const std::string& reference,
                                             CollectionListing* out) {
    auto result = runner_->Run({
        config_.executable,
        "--flat-playlist",
        "--ignore-errors",
        "--no-warnings",
        "--print", "%(playlist_id)s\t%(playlist_title)s\t%(id)s\t%(url)s\t%(title)s",
        reference
    }, config_.metadata_timeout);

    if (result.error == ErrorKind::ToolMissing) {
        return Status::Error(ErrorKind::SourceUnavailable, config_.executable + " not found");
    }
    if (result.error == ErrorKind::ProcessTimeout) {
        return Status::Error(ErrorKind::SourceUnavailable, "collection listing timed out");
    }

    CollectionListing listing;
    for (const auto& line : result.output) {
        auto fields = SplitTabs(line);
        if (fields.size() < 5) continue;

        if (listing.id.empty()) listing.id = fields[0];
        if (listing.title.empty()) listing.title = fields[1];

        ItemReference entry;
        entry.id = fields[2];
        entry.url = fields[3].empty() && !entry.id.empty()
            ? "https://www.youtube.com/watch?v=" + entry.id
            : fields[3];
        entry.title = fields[4];
        // Deleted entries keep their slot so listing positions stay stable
        listing.entries.push_back(entry);
    }

    if (listing.entries.empty()) {
        return Status::Error(ErrorKind::SourceUnavailable,
                             "could not list collection " + reference);
    }
    if (out) *out = listing;
    return Status::Ok();
}

Status YtDlpFetchEngine::Download(const DownloadRequest& request,
                                  const ByteProgress& progress,
                                  std::string* output_path) {
    std::vector<std::string> argv = {
        config_.executable,
        "--no-playlist",
        "--newline",
        "--no-warnings",
        "--progress-template",
        std::string("download:") + kProgressMarker +
            " %(progress.downloaded_bytes)s %(progress.total_bytes)s %(progress.total_bytes_estimate)s",
        "-o", request.output_stem + ".%(ext)s"
    };

    if (request.video) {
        argv.insert(argv.end(), {
            "-f", "bestvideo[ext=mp4]+bestaudio[ext=m4a]/best[ext=mp4]/best",
            "--merge-output-format", "mp4"
        });
    } else {
        argv.insert(argv.end(), {
            "-f", "bestaudio/best",
            "-x",
            "--audio-format", request.format,
            "--audio-quality", std::to_string(request.quality_kbps) + "K"
        });
    }
    argv.push_back(request.reference);

    Log("yt-dlp: fetching " + request.reference + (request.video ? " (video)" : ""));

    auto on_line = [&progress](const std::string& line) {
        uint64_t done = 0;
        uint64_t total = 0;
        if (progress && ParseProgressLine(line, &done, &total)) {
            progress(done, total);
        }
    };

    auto result = runner_->Run(argv, config_.download_timeout, on_line);
    std::string expected = request.output_stem + "." + (request.video ? "mp4" : request.format);

    if (result.error == ErrorKind::ToolMissing) {
        return Status::Error(ErrorKind::SourceUnavailable, config_.executable + " not found");
    }
    if (result.error == ErrorKind::ProcessTimeout) {
        std::error_code ec;
        fs::remove(expected, ec);
        return Status::Error(ErrorKind::FetchIncomplete, "download timed out");
    }

    std::error_code ec;
    if (result.Succeeded() && fs::is_regular_file(expected, ec) && fs::file_size(expected, ec) > 0) {
        if (output_path) *output_path = expected;
        return Status::Ok();
    }

    std::string joined = result.Joined();
    if (LooksUnavailable(joined)) {
        return Status::Error(ErrorKind::SourceUnavailable, "source unavailable: " + request.reference);
    }

    Log("yt-dlp exited with code " + std::to_string(result.exit_code) + " for " + request.reference);
    std::string tail = result.output.empty() ? "no output" : result.output.back();
    return Status::Error(ErrorKind::FetchIncomplete,
                         "download did not produce " + fs::path(expected).filename().string() +
                         " (" + tail + ")");
}

void YtDlpFetchEngine::Log(const std::string& message) {
    if (log_callback_) {
        log_callback_(message);
    }
}

} // namespace podsync
