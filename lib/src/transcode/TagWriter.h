#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "../PodSyncTypes.h"

class HttpClient;

namespace podsync {

enum class ContainerFamily {
    Unknown,
    MP4,    // .m4a .m4b .mp4 .m4v
    MPEG    // .mp3
};

ContainerFamily ContainerFamilyFor(const std::string& path);

/**
 * TagWriter
 *
 * Writes title, artist, album, track number and cover art into a file's
 * native tag format with TagLib. Existing values of those fields are
 * replaced; other fields are left alone.
 *
 * Cover art comes from the descriptor's thumbnail URL. A failed or
 * unusable download is logged and the tags are written without artwork.
 */
class TagWriter {
public:
    using LogCallback = std::function<void(const std::string& message)>;

    /// @param http Client for artwork downloads; null disables artwork
    TagWriter(std::shared_ptr<HttpClient> http, LogCallback log_callback);
    virtual ~TagWriter() = default;

    /**
     * Tag one file.
     * @return UnsupportedFormat for unknown containers or files TagLib cannot open
     */
    virtual Status Write(const std::string& path, const ContentDescriptor& descriptor);

private:
    struct Artwork {
        std::vector<uint8_t> data;
        bool png = false;
    };

    bool FetchArtwork(const std::string& url, Artwork* out);
    Status WriteMp4(const std::string& path, const ContentDescriptor& descriptor,
                    const Artwork* artwork);
    Status WriteMpeg(const std::string& path, const ContentDescriptor& descriptor,
                     const Artwork* artwork);

    void Log(const std::string& message);

    std::shared_ptr<HttpClient> http_;
    LogCallback log_callback_;
};

} // namespace podsync
