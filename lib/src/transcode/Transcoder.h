#pragma once

#include <string>

#include "../PodSyncTypes.h"

namespace podsync {

struct TranscodeRequest {
    std::string input_path;
    std::string output_path;
    MediaFormat format = MediaFormat::M4A;
    int audio_bitrate_kbps = 256;
    std::string video_resolution = "640x480";   // video only
    int video_bitrate_kbps = 1500;              // video only
    bool keep_metadata = true;                  // copy container metadata from the input
};

/**
 * Transcoder
 *
 * Boundary to the external encoder. Implementations must not leave a
 * partially written file at output_path when they fail.
 */
class Transcoder {
public:
    virtual ~Transcoder() = default;

    virtual Status Transcode(const TranscodeRequest& request) = 0;
};

} // namespace podsync
