#include "AcquisitionManager.h"
#include "acquisition/NamingUtils.h"
#include "pipeline/OrderedWorkers.h"
#include <algorithm>
#include <filesystem>
#include <mutex>
#include <system_error>

namespace fs = std::filesystem;

AcquisitionManager::AcquisitionManager(const Config& config,
                                       std::shared_ptr<podsync::FetchEngine> engine,
                                       LogCallback log_callback,
                                       ProgressSink progress)
    : config_(config),
      engine_(std::move(engine)),
      log_callback_(std::move(log_callback)),
      progress_sink_(std::move(progress)) {
}

std::string AcquisitionManager::CollectionUrl(const std::string& collection_id) {
    return "https://www.youtube.com/playlist?list=" + collection_id;
}

bool AcquisitionManager::DescribeItem(const podsync::ItemMetadata& meta,
                                      const std::string& fallback_id,
                                      ContentDescriptor* out) {
    std::string id = meta.id.empty() ? fallback_id : meta.id;
    if (id.empty()) {
        return false;
    }

    ContentDescriptor descriptor(id);
    auto split = podsync::SplitArtistTitle(meta.title);
    descriptor.artist = split.first;
    descriptor.title = split.second;
    descriptor.album = descriptor.artist;
    descriptor.thumbnail_url = meta.thumbnail_url;
    descriptor.duration_seconds = meta.duration_seconds;
    *out = descriptor;
    return true;
}

Status AcquisitionManager::Resolve(const std::string& reference,
                                   std::vector<ContentDescriptor>* out,
                                   ResolveReport* report,
                                   const std::atomic<bool>* cancel) {
    podsync::StageProgress progress(PipelineStage::Acquisition, progress_sink_);
    ResolveReport local_report;
    std::vector<ContentDescriptor> descriptors;

    std::string collection_id = podsync::ExtractCollectionId(reference);

    if (collection_id.empty()) {
        Log("Resolving item: " + reference);
        local_report.entries = 1;

        podsync::ItemMetadata meta;
        Status status = engine_->ResolveItem(reference, &meta);
        ContentDescriptor descriptor;
        if (status.ok() && !DescribeItem(meta, reference, &descriptor)) {
            status = Status::Error(ErrorKind::SourceUnavailable, "engine returned no identifier");
        }
        if (!status.ok()) {
            Log("  ✗ Could not resolve " + reference + ": " + status.message);
            FailureRecord failure;
            failure.stage = PipelineStage::Acquisition;
            failure.item_id = reference;
            failure.error = ErrorKind::SourceUnavailable;
            failure.message = status.message;
            local_report.skipped.push_back(failure);
            if (report) *report = local_report;
            return Status::Error(ErrorKind::SourceUnavailable, status.message);
        }

        descriptors.push_back(descriptor);
        progress.Report(10, "Resolved: " + descriptor.title);
        Log("  ✓ " + (descriptor.artist.empty() ? "" : descriptor.artist + " - ") + descriptor.title);
    } else {
        Log("Resolving collection: " + collection_id);

        podsync::CollectionListing listing;
        Status status = engine_->EnumerateCollection(CollectionUrl(collection_id), &listing);
        if (!status.ok()) {
            Log("  ✗ Could not list collection: " + status.message);
            if (report) *report = local_report;
            return status;
        }

        std::string collection_title = listing.title.empty() ? "Unknown Playlist" : listing.title;
        local_report.collection_id = collection_id;
        local_report.collection_title = collection_title;
        progress.Report(0, "Analyzing collection: " + collection_title);

        int ordinal = 1;
        const size_t total = listing.entries.size();
        for (size_t i = 0; i < total; ++i) {
            if (cancel && cancel->load()) {
                Log("Collection resolve cancelled after " + std::to_string(i) + " of " +
                    std::to_string(total) + " entries");
                local_report.cancelled = true;
                break;
            }
            const auto& entry = listing.entries[i];
            int index = static_cast<int>(i) + 1;
            local_report.entries = static_cast<uint32_t>(index);
            progress.Report(static_cast<int>(index * 10 / total),
                            "Analyzing collection: " + std::to_string(index) + "/" +
                            std::to_string(total) + " items");

            podsync::ItemMetadata meta;
            ContentDescriptor descriptor;
            Status item_status = entry.url.empty()
                ? Status::Error(ErrorKind::SourceUnavailable, "entry has no reference")
                : engine_->ResolveItem(entry.url, &meta);
            if (item_status.ok() && !DescribeItem(meta, entry.id, &descriptor)) {
                item_status = Status::Error(ErrorKind::SourceUnavailable, "engine returned no identifier");
            }

            if (!item_status.ok()) {
                Log("  Skipping unavailable entry " + std::to_string(index) + " (" +
                    (entry.id.empty() ? "?" : entry.id) + "): " + item_status.message);
                FailureRecord failure;
                failure.stage = PipelineStage::Acquisition;
                failure.item_id = entry.id;
                failure.title = entry.title;
                failure.error = ErrorKind::SourceUnavailable;
                failure.message = item_status.message;
                local_report.skipped.push_back(failure);
                continue;
            }

            descriptor.album = collection_title;
            descriptor.collection_id = collection_id;
            descriptor.collection_title = collection_title;
            descriptor.collection_index = index;
            descriptor.track_number = ordinal++;
            descriptors.push_back(descriptor);
        }

        Log("Resolved " + std::to_string(descriptors.size()) + " of " +
            std::to_string(total) + " collection entries");
    }

    if (report) *report = local_report;
    if (out) *out = descriptors;

    if (local_report.cancelled) {
        return Status::Ok();
    }
    if (descriptors.empty()) {
        return Status::Error(ErrorKind::SourceUnavailable, "no item could be resolved");
    }
    return Status::Ok();
}

std::string AcquisitionManager::FetchStemFor(const ContentDescriptor& descriptor) const {
    std::string name = podsync::SanitizeFilename(
        descriptor.title.empty() ? descriptor.source_id() : descriptor.title);
    if (descriptor.InCollection() && descriptor.track_number) {
        name = podsync::FormatOrdinal(*descriptor.track_number) + ". " + name;
    }
    return (fs::path(config_.temp_dir) / name).string();
}

Status AcquisitionManager::FetchOne(const ContentDescriptor& descriptor,
                                    MediaFormat format,
                                    int quality_kbps,
                                    const std::function<void(double)>& on_progress,
                                    ContentDescriptor* fetched) {
    if (descriptor.IsFetched()) {
        std::error_code ec;
        if (fs::exists(descriptor.local_path(), ec)) {
            *fetched = descriptor;
            return Status::Ok();
        }
        return Status::Error(ErrorKind::FetchIncomplete,
                             "fetched file disappeared: " + descriptor.local_path());
    }

    std::error_code ec;
    fs::create_directories(config_.temp_dir, ec);
    if (ec) {
        return Status::Error(ErrorKind::FetchIncomplete,
                             "cannot create temp directory " + config_.temp_dir + ": " + ec.message());
    }

    podsync::DownloadRequest request;
    request.reference = descriptor.source_id();
    request.output_stem = FetchStemFor(descriptor);
    request.video = (format == MediaFormat::MP4Video);
    request.format = MediaFormatExtension(format);
    request.quality_kbps = quality_kbps;

    Log("Fetching: " + descriptor.title);

    auto byte_progress = [&on_progress](uint64_t done, uint64_t total) {
        if (!on_progress) return;
        if (total > 0) {
            on_progress(std::min(1.0, static_cast<double>(done) / static_cast<double>(total)));
        } else {
            on_progress(-1.0);
        }
    };

    std::string path;
    Status status = engine_->Download(request, byte_progress, &path);
    if (!status.ok()) {
        ErrorKind kind = status.kind == ErrorKind::SourceUnavailable
            ? ErrorKind::SourceUnavailable : ErrorKind::FetchIncomplete;
        Log("  ✗ Fetch failed for " + descriptor.title + ": " + status.message);
        return Status::Error(kind, status.message);
    }

    auto updated = descriptor.Fetched(path);
    if (!updated) {
        Log("  ✗ Fetch reported " + path + " but the file is missing");
        return Status::Error(ErrorKind::FetchIncomplete, "downloaded file missing: " + path);
    }

    if (on_progress) on_progress(1.0);
    Log("  ✓ Fetched " + fs::path(path).filename().string());
    *fetched = *updated;
    return Status::Ok();
}

Status AcquisitionManager::Fetch(const ContentDescriptor& descriptor,
                                 MediaFormat format,
                                 int quality_kbps,
                                 ContentDescriptor* fetched) {
    podsync::StageProgress progress(PipelineStage::Acquisition, progress_sink_);
    const std::string label = "Downloading " + descriptor.title;

    ContentDescriptor result;
    Status status = FetchOne(descriptor, format, quality_kbps,
        [&](double fraction) {
            if (fraction < 0) {
                progress.Pulse(label);
            } else {
                progress.Report(10 + static_cast<int>(fraction * 90), label);
            }
        }, &result);

    if (status.ok() && fetched) {
        *fetched = result;
    }
    return status;
}

std::vector<AcquisitionManager::FetchOutcome> AcquisitionManager::FetchAll(
    const std::vector<ContentDescriptor>& descriptors,
    MediaFormat format,
    int quality_kbps,
    const std::atomic<bool>* cancel) {

    std::vector<FetchOutcome> outcomes(descriptors.size());
    if (descriptors.empty()) {
        return outcomes;
    }

    podsync::StageProgress progress(PipelineStage::Acquisition, progress_sink_);
    std::mutex fraction_mutex;
    std::vector<double> fractions(descriptors.size(), 0.0);
    const double count = static_cast<double>(descriptors.size());

    progress.Report(10, "Fetching " + std::to_string(descriptors.size()) + " item(s)");

    podsync::RunOrdered(descriptors.size(), config_.workers, cancel, [&](size_t index) {
        const ContentDescriptor& descriptor = descriptors[index];
        const std::string label = "Downloading " + descriptor.title;

        auto on_progress = [&, index](double fraction) {
            if (fraction < 0) {
                progress.Pulse(label);
                return;
            }
            double sum = 0.0;
            {
                std::lock_guard<std::mutex> lock(fraction_mutex);
                fractions[index] = std::max(fractions[index], fraction);
                for (double f : fractions) sum += f;
            }
            progress.Report(10 + static_cast<int>(90.0 * sum / count), label);
        };

        FetchOutcome& outcome = outcomes[index];
        outcome.attempted = true;
        outcome.status = FetchOne(descriptor, format, quality_kbps, on_progress, &outcome.descriptor);
        if (!outcome.status.ok()) {
            // Failed items count as finished for progress purposes
            on_progress(1.0);
        }
    });

    return outcomes;
}

void AcquisitionManager::Log(const std::string& message) {
    if (log_callback_) {
        log_callback_(message);
    }
}
