#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "../PodSyncTypes.h"

namespace podsync {

/// One entry of a collection listing, in listing order
struct ItemReference {
    std::string id;
    std::string url;
    std::string title;
};

/// Collection listing as returned by the engine
struct CollectionListing {
    std::string id;
    std::string title;
    std::vector<ItemReference> entries;
};

/// Metadata for one resolvable item
struct ItemMetadata {
    std::string id;
    std::string title;          // raw title, artist not yet split off
    std::string thumbnail_url;
    int duration_seconds = 0;
};

struct DownloadRequest {
    std::string reference;      // item URL or id
    std::string output_stem;    // destination path without extension
    std::string format;         // audio extension (m4a, mp3) or "mp4" for video
    int quality_kbps = 256;
    bool video = false;
};

/**
 * FetchEngine
 *
 * Boundary to the external tool that talks to the remote source. The engine
 * knows nothing about ordinals, naming or progress scaling; AcquisitionManager
 * layers those on top.
 */
class FetchEngine {
public:
    /// downloaded/total in bytes; total is 0 when the size is unknown
    using ByteProgress = std::function<void(uint64_t downloaded, uint64_t total)>;

    virtual ~FetchEngine() = default;

    /// @return SourceUnavailable when the item cannot be resolved
    virtual Status ResolveItem(const std::string& reference, ItemMetadata* out) = 0;

    /// @return SourceUnavailable when the collection cannot be listed
    virtual Status EnumerateCollection(const std::string& reference, CollectionListing* out) = 0;

    /**
     * Download one item to request.output_stem + "." + request.format.
     * @param output_path Receives the path of the finished file
     * @return SourceUnavailable or FetchIncomplete
     */
    virtual Status Download(const DownloadRequest& request,
                            const ByteProgress& progress,
                            std::string* output_path) = 0;
};

} // namespace podsync
