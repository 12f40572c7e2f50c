#include "PodSyncTypes.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

const char* ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:              return "None";
        case ErrorKind::SourceUnavailable: return "SourceUnavailable";
        case ErrorKind::FetchIncomplete:   return "FetchIncomplete";
        case ErrorKind::UnsupportedFormat: return "UnsupportedFormat";
        case ErrorKind::DeviceUnavailable: return "DeviceUnavailable";
        case ErrorKind::InsufficientSpace: return "InsufficientSpace";
        case ErrorKind::CopyFailed:        return "CopyFailed";
        case ErrorKind::ProcessTimeout:    return "ProcessTimeout";
        case ErrorKind::ToolMissing:       return "ToolMissing";
        default:                           return "Unknown";
    }
}

const char* DiscoveryStrategyToString(DiscoveryStrategy strategy) {
    switch (strategy) {
        case DiscoveryStrategy::VendorProtocol:    return "vendor-protocol";
        case DiscoveryStrategy::VolumeEnumeration: return "volume-enumeration";
        case DiscoveryStrategy::PathHeuristic:     return "path-heuristic";
        case DiscoveryStrategy::Manual:            return "manual";
        default:                                   return "unknown";
    }
}

const char* PipelineStateToString(PipelineState state) {
    switch (state) {
        case PipelineState::Idle:         return "Idle";
        case PipelineState::Acquiring:    return "Acquiring";
        case PipelineState::Converting:   return "Converting";
        case PipelineState::Transferring: return "Transferring";
        case PipelineState::Done:         return "Done";
        case PipelineState::Failed:       return "Failed";
        default:                          return "Unknown";
    }
}

const char* PipelineStageToString(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::Acquisition: return "acquisition";
        case PipelineStage::Transcode:   return "transcode";
        case PipelineStage::Transfer:    return "transfer";
        default:                         return "unknown";
    }
}

bool ParseMediaFormat(const std::string& name, MediaFormat* out) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (!lower.empty() && lower[0] == '.') {
        lower.erase(0, 1);
    }

    MediaFormat format;
    if (lower == "m4a" || lower == "aac") {
        format = MediaFormat::M4A;
    } else if (lower == "mp3") {
        format = MediaFormat::MP3;
    } else if (lower == "mp4" || lower == "video") {
        format = MediaFormat::MP4Video;
    } else {
        return false;
    }

    if (out) *out = format;
    return true;
}

const char* MediaFormatExtension(MediaFormat format) {
    switch (format) {
        case MediaFormat::M4A:      return "m4a";
        case MediaFormat::MP3:      return "mp3";
        case MediaFormat::MP4Video: return "mp4";
        default:                    return "";
    }
}

std::optional<ContentDescriptor> ContentDescriptor::Fetched(const std::string& path) const {
    if (!local_path_.empty() || path.empty()) {
        return std::nullopt;
    }
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::nullopt;
    }
    ContentDescriptor copy = *this;
    copy.local_path_ = path;
    return copy;
}

bool DeviceHandle::IsMounted() const {
    if (!mount_point || mount_point->empty()) {
        return false;
    }
    std::error_code ec;
    return fs::exists(*mount_point, ec);
}
