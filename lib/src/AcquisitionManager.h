#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "PodSyncTypes.h"
#include "acquisition/FetchEngine.h"
#include "pipeline/ProgressChannel.h"

/**
 * AcquisitionManager
 *
 * Turns a source reference into ordered ContentDescriptors and fetches raw
 * media for them through a FetchEngine.
 *
 * Progress for a batch: 0-10% while a collection is enumerated, 10-100%
 * apportioned over the items being fetched. Items without a known size
 * produce indeterminate pulses instead of moving the percentage.
 */
class AcquisitionManager {
public:
    using LogCallback = std::function<void(const std::string& message)>;
    using ProgressSink = podsync::StageProgress::Sink;

    struct Config {
        std::string temp_dir = "temp";
        size_t workers = 2;
    };

    struct ResolveReport {
        uint32_t entries = 0;                 // listing entries examined (1 for a single item)
        bool cancelled = false;               // stopped before the end of the listing
        std::string collection_id;
        std::string collection_title;
        std::vector<FailureRecord> skipped;   // entries that failed to resolve
    };

    struct FetchOutcome {
        bool attempted = false;
        Status status;
        ContentDescriptor descriptor;         // fetched copy on success
    };

    AcquisitionManager(const Config& config,
                       std::shared_ptr<podsync::FetchEngine> engine,
                       LogCallback log_callback,
                       ProgressSink progress = nullptr);

    /**
     * Resolve a reference into descriptors, in source order.
     * Collection members that fail to resolve are skipped and listed in the
     * report; ordinals stay contiguous from 1 over the survivors.
     * The cancel flag is checked before each member; a cancelled resolve
     * returns Ok with the members resolved so far.
     * @return SourceUnavailable if nothing could be listed or resolved
     */
    Status Resolve(const std::string& reference,
                   std::vector<ContentDescriptor>* out,
                   ResolveReport* report = nullptr,
                   const std::atomic<bool>* cancel = nullptr);

    /**
     * Fetch raw media for one descriptor into the temp directory.
     * @param fetched Receives a new descriptor carrying the local path
     * @return SourceUnavailable or FetchIncomplete
     */
    Status Fetch(const ContentDescriptor& descriptor,
                 MediaFormat format,
                 int quality_kbps,
                 ContentDescriptor* fetched);

    /**
     * Fetch every descriptor with up to Config::workers in flight.
     * Outcomes are index-aligned with the input. Items not started because
     * of cancellation have attempted=false.
     */
    std::vector<FetchOutcome> FetchAll(const std::vector<ContentDescriptor>& descriptors,
                                       MediaFormat format,
                                       int quality_kbps,
                                       const std::atomic<bool>* cancel = nullptr);

    /// Temp path without extension: "<temp>/NN. <title>" or "<temp>/<title>"
    std::string FetchStemFor(const ContentDescriptor& descriptor) const;

    static std::string CollectionUrl(const std::string& collection_id);

private:
    Config config_;
    std::shared_ptr<podsync::FetchEngine> engine_;
    LogCallback log_callback_;
    ProgressSink progress_sink_;

    // fraction_done receives 0..1, or a negative value when the total is unknown
    Status FetchOne(const ContentDescriptor& descriptor,
                    MediaFormat format,
                    int quality_kbps,
                    const std::function<void(double fraction_done)>& on_progress,
                    ContentDescriptor* fetched);

    bool DescribeItem(const podsync::ItemMetadata& meta,
                      const std::string& fallback_id,
                      ContentDescriptor* out);

    void Log(const std::string& message);
};
