#include "TranscodeManager.h"
#include "acquisition/NamingUtils.h"
#include "pipeline/OrderedWorkers.h"
#include <filesystem>
#include <mutex>
#include <system_error>

namespace fs = std::filesystem;

TranscodeManager::TranscodeManager(const Config& config,
                                   std::shared_ptr<podsync::Transcoder> transcoder,
                                   std::shared_ptr<podsync::TagWriter> tag_writer,
                                   LogCallback log_callback,
                                   ProgressSink progress)
    : config_(config),
      transcoder_(std::move(transcoder)),
      tag_writer_(std::move(tag_writer)),
      log_callback_(std::move(log_callback)),
      progress_sink_(std::move(progress)) {
}

std::string TranscodeManager::OutputPathFor(const ContentDescriptor& descriptor,
                                            MediaFormat format) const {
    std::string artist = descriptor.artist.empty() ? "Unknown Artist" : descriptor.artist;
    std::string title = descriptor.title.empty() ? descriptor.source_id() : descriptor.title;
    const std::string ext = MediaFormatExtension(format);

    fs::path dir = fs::path(config_.output_dir) / podsync::SanitizeFilename(artist);
    std::string filename;

    if (descriptor.InCollection()) {
        dir /= podsync::SanitizeFilename(*descriptor.collection_title);
        if (descriptor.track_number) {
            filename = podsync::FormatOrdinal(*descriptor.track_number) + " - ";
        }
    } else {
        dir /= podsync::SanitizeFilename(descriptor.album.empty() ? artist : descriptor.album);
    }
    filename += podsync::SanitizeFilename(title) + "." + ext;

    return (dir / filename).string();
}

Status TranscodeManager::Convert(const ContentDescriptor& descriptor,
                                 const std::string& input_path,
                                 const std::string& format_name,
                                 int bitrate_kbps,
                                 std::string* output_path) {
    MediaFormat format;
    if (!ParseMediaFormat(format_name, &format)) {
        return Status::Error(ErrorKind::UnsupportedFormat, "unknown target format: " + format_name);
    }
    return Convert(descriptor, input_path, format, bitrate_kbps, output_path);
}

Status TranscodeManager::Convert(const ContentDescriptor& descriptor,
                                 const std::string& input_path,
                                 MediaFormat format,
                                 int bitrate_kbps,
                                 std::string* output_path) {
    const std::string target = OutputPathFor(descriptor, format);

    std::error_code ec;
    if (!config_.overwrite && fs::exists(target, ec)) {
        Log("File already exists: " + target);
        if (output_path) *output_path = target;
        return Status::Ok();
    }

    fs::create_directories(fs::path(target).parent_path(), ec);
    if (ec) {
        return Status::Error(ErrorKind::UnsupportedFormat,
                             "cannot create " + fs::path(target).parent_path().string() +
                             ": " + ec.message());
    }

    podsync::TranscodeRequest request;
    request.input_path = input_path;
    request.output_path = target;
    request.format = format;
    request.audio_bitrate_kbps = bitrate_kbps;
    request.video_resolution = config_.video_resolution;
    request.video_bitrate_kbps = config_.video_bitrate_kbps;

    Log("Converting " + fs::path(input_path).filename().string() + " to " +
        MediaFormatExtension(format));

    Status status = transcoder_->Transcode(request);
    if (!status.ok()) {
        Log("  ✗ Conversion failed: " + status.message);
        // Process-level failures surface as a failed conversion of this item
        return Status::Error(ErrorKind::UnsupportedFormat, status.message);
    }

    Log("  ✓ Conversion complete: " + target);
    if (output_path) *output_path = target;
    return Status::Ok();
}

Status TranscodeManager::Tag(const std::string& path, const ContentDescriptor& descriptor) {
    if (!tag_writer_) {
        return Status::Ok();
    }
    return tag_writer_->Write(path, descriptor);
}

std::vector<TranscodeManager::ConvertOutcome> TranscodeManager::ConvertAll(
    const std::vector<ContentDescriptor>& fetched,
    MediaFormat format,
    int bitrate_kbps,
    const std::atomic<bool>* cancel) {

    std::vector<ConvertOutcome> outcomes(fetched.size());
    if (fetched.empty()) {
        return outcomes;
    }

    podsync::StageProgress progress(PipelineStage::Transcode, progress_sink_);
    std::mutex done_mutex;
    size_t done = 0;
    const size_t total = fetched.size();

    progress.Report(0, "Converting " + std::to_string(total) + " item(s)");

    podsync::RunOrdered(total, config_.workers, cancel, [&](size_t index) {
        const ContentDescriptor& descriptor = fetched[index];
        ConvertOutcome& outcome = outcomes[index];
        outcome.attempted = true;

        std::string output;
        outcome.status = Convert(descriptor, descriptor.local_path(), format, bitrate_kbps, &output);
        if (outcome.status.ok()) {
            outcome.status = Tag(output, descriptor);
            if (outcome.status.ok()) {
                outcome.item = TranscodedItem{descriptor, output};
            } else {
                Log("  ✗ Tagging failed for " + descriptor.title + ": " + outcome.status.message);
            }
        }

        size_t finished;
        {
            std::lock_guard<std::mutex> lock(done_mutex);
            finished = ++done;
        }
        progress.Report(static_cast<int>(finished * 100 / total),
                        "Converted " + std::to_string(finished) + "/" + std::to_string(total));
    });

    return outcomes;
}

void TranscodeManager::Log(const std::string& message) {
    if (log_callback_) {
        log_callback_(message);
    }
}
