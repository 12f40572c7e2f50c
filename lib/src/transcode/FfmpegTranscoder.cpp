#include "FfmpegTranscoder.h"
#include <algorithm>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace podsync {

FfmpegTranscoder::FfmpegTranscoder(const Config& config,
                                   std::shared_ptr<ProcessRunner> runner,
                                   LogCallback log_callback)
    : config_(config), runner_(std::move(runner)), log_callback_(std::move(log_callback)) {
    if (!runner_) {
        runner_ = ProcessRunner::CreateDefault();
    }
}

std::string FfmpegTranscoder::TemporaryPathFor(const std::string& output_path) {
    fs::path out(output_path);
    // Extension stays last so ffmpeg still picks the muxer from it
    return (out.parent_path() / ("." + out.stem().string() + ".partial" +
                                 out.extension().string())).string();
}

std::vector<std::string> FfmpegTranscoder::BuildArguments(const TranscodeRequest& request,
                                                          const std::string& target) const {
    std::vector<std::string> argv = {
        config_.executable, "-hide_banner", "-nostdin", "-y",
        "-i", request.input_path
    };

    const std::string audio_bitrate = std::to_string(request.audio_bitrate_kbps) + "k";

    switch (request.format) {
        case MediaFormat::M4A:
            argv.insert(argv.end(), {"-vn", "-c:a", "aac", "-b:a", audio_bitrate});
            break;
        case MediaFormat::MP3:
            argv.insert(argv.end(), {"-vn", "-c:a", "libmp3lame", "-b:a", audio_bitrate});
            break;
        case MediaFormat::MP4Video: {
            std::string scale = request.video_resolution;
            std::replace(scale.begin(), scale.end(), 'x', ':');
            argv.insert(argv.end(), {
                "-c:v", "h264",
                "-b:v", std::to_string(request.video_bitrate_kbps) + "k",
                "-vf", "scale=" + scale,
                "-pix_fmt", "yuv420p",
                "-c:a", "aac", "-b:a", audio_bitrate
            });
            break;
        }
    }

    if (request.keep_metadata) {
        argv.insert(argv.end(), {"-map_metadata", "0"});
    }
    argv.push_back(target);
    return argv;
}

Status FfmpegTranscoder::Transcode(const TranscodeRequest& request) {
    std::error_code ec;
    if (!fs::is_regular_file(request.input_path, ec)) {
        return Status::Error(ErrorKind::UnsupportedFormat,
                             "input missing: " + request.input_path);
    }

    fs::create_directories(fs::path(request.output_path).parent_path(), ec);
    if (ec) {
        return Status::Error(ErrorKind::UnsupportedFormat,
                             "cannot create output directory: " + ec.message());
    }

    const std::string temp = TemporaryPathFor(request.output_path);
    Log("ffmpeg: " + fs::path(request.input_path).filename().string() + " -> " +
        fs::path(request.output_path).filename().string());

    auto result = runner_->Run(BuildArguments(request, temp), config_.timeout);

    auto discard = [&temp]() {
        std::error_code ignored;
        fs::remove(temp, ignored);
    };

    if (result.error == ErrorKind::ToolMissing) {
        discard();
        return Status::Error(ErrorKind::ToolMissing, config_.executable + " not found");
    }
    if (result.error == ErrorKind::ProcessTimeout) {
        discard();
        return Status::Error(ErrorKind::ProcessTimeout, "ffmpeg timed out");
    }
    if (!result.Succeeded() || !fs::is_regular_file(temp, ec) || fs::file_size(temp, ec) == 0) {
        discard();
        std::string tail = result.output.empty() ? "no output" : result.output.back();
        return Status::Error(ErrorKind::UnsupportedFormat,
                             "ffmpeg exited with code " + std::to_string(result.exit_code) +
                             ": " + tail);
    }

    fs::rename(temp, request.output_path, ec);
    if (ec) {
        discard();
        return Status::Error(ErrorKind::UnsupportedFormat,
                             "cannot publish " + request.output_path + ": " + ec.message());
    }
    return Status::Ok();
}

void FfmpegTranscoder::Log(const std::string& message) {
    if (log_callback_) {
        log_callback_(message);
    }
}

} // namespace podsync
