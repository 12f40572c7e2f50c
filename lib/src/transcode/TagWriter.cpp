#include "TagWriter.h"
#include "../protocols/http/HttpClient.h"
#include <algorithm>
#include <cctype>
#include <filesystem>

#include <taglib/attachedpictureframe.h>
#include <taglib/id3v2tag.h>
#include <taglib/mp4coverart.h>
#include <taglib/mp4file.h>
#include <taglib/mp4item.h>
#include <taglib/mp4tag.h>
#include <taglib/mpegfile.h>
#include <taglib/tbytevector.h>
#include <taglib/tstring.h>

namespace fs = std::filesystem;

namespace podsync {

static TagLib::String ToTagString(const std::string& value) {
    return TagLib::String(value, TagLib::String::UTF8);
}

static std::string EffectiveAlbum(const ContentDescriptor& descriptor) {
    return descriptor.album.empty() ? descriptor.artist : descriptor.album;
}

ContainerFamily ContainerFamilyFor(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (ext == ".m4a" || ext == ".m4b" || ext == ".mp4" || ext == ".m4v") {
        return ContainerFamily::MP4;
    }
    if (ext == ".mp3") {
        return ContainerFamily::MPEG;
    }
    return ContainerFamily::Unknown;
}

TagWriter::TagWriter(std::shared_ptr<HttpClient> http, LogCallback log_callback)
    : http_(std::move(http)), log_callback_(std::move(log_callback)) {
}

bool TagWriter::FetchArtwork(const std::string& url, Artwork* out) {
    if (url.empty()) {
        return false;
    }
    if (!http_) {
        Log("  Artwork skipped (no HTTP client)");
        return false;
    }

    HttpClient::Response response = http_->Get(url);
    if (!response.ok()) {
        Log("  Artwork fetch failed (" +
            (response.error.empty() ? "HTTP " + std::to_string(response.status_code)
                                    : response.error) +
            "), tagging without cover");
        return false;
    }

    // Trust the bytes, not the header
    std::string type = HttpClient::DetectContentType(response.body);
    if (type != "image/jpeg" && type != "image/png") {
        Log("  Artwork is not JPEG or PNG (" + response.ContentType() + "), tagging without cover");
        return false;
    }

    out->data = std::move(response.body);
    out->png = (type == "image/png");
    return true;
}

Status TagWriter::WriteMp4(const std::string& path, const ContentDescriptor& descriptor,
                           const Artwork* artwork) {
    TagLib::MP4::File file(path.c_str());
    if (!file.isValid() || !file.tag()) {
        return Status::Error(ErrorKind::UnsupportedFormat, "TagLib cannot open MP4 file: " + path);
    }

    TagLib::MP4::Tag* tag = file.tag();
    for (const char* key : {"\251nam", "\251ART", "\251alb", "trkn", "covr"}) {
        if (tag->contains(key)) {
            tag->removeItem(key);
        }
    }

    tag->setTitle(ToTagString(descriptor.title));
    tag->setArtist(ToTagString(descriptor.artist));
    tag->setAlbum(ToTagString(EffectiveAlbum(descriptor)));
    if (descriptor.track_number) {
        tag->setItem("trkn", TagLib::MP4::Item(*descriptor.track_number, 0));
    }

    if (artwork) {
        TagLib::MP4::CoverArt cover(
            artwork->png ? TagLib::MP4::CoverArt::PNG : TagLib::MP4::CoverArt::JPEG,
            TagLib::ByteVector(reinterpret_cast<const char*>(artwork->data.data()),
                               static_cast<unsigned int>(artwork->data.size())));
        TagLib::MP4::CoverArtList covers;
        covers.append(cover);
        tag->setItem("covr", TagLib::MP4::Item(covers));
    }

    if (!file.save()) {
        return Status::Error(ErrorKind::UnsupportedFormat, "TagLib failed to save " + path);
    }
    return Status::Ok();
}

Status TagWriter::WriteMpeg(const std::string& path, const ContentDescriptor& descriptor,
                            const Artwork* artwork) {
    TagLib::MPEG::File file(path.c_str());
    if (!file.isValid()) {
        return Status::Error(ErrorKind::UnsupportedFormat, "TagLib cannot open MPEG file: " + path);
    }

    // Start from a clean ID3v2 tag so stale frames (old APIC, TRCK) go away
    file.strip();
    TagLib::ID3v2::Tag* tag = file.ID3v2Tag(true);
    if (!tag) {
        return Status::Error(ErrorKind::UnsupportedFormat, "cannot create ID3v2 tag for " + path);
    }

    tag->setTitle(ToTagString(descriptor.title));
    tag->setArtist(ToTagString(descriptor.artist));
    tag->setAlbum(ToTagString(EffectiveAlbum(descriptor)));
    if (descriptor.track_number) {
        tag->setTrack(static_cast<unsigned int>(*descriptor.track_number));
    }

    if (artwork) {
        auto* frame = new TagLib::ID3v2::AttachedPictureFrame();
        frame->setMimeType(artwork->png ? "image/png" : "image/jpeg");
        frame->setType(TagLib::ID3v2::AttachedPictureFrame::FrontCover);
        frame->setPicture(TagLib::ByteVector(reinterpret_cast<const char*>(artwork->data.data()),
                                             static_cast<unsigned int>(artwork->data.size())));
        tag->addFrame(frame);  // tag takes ownership
    }

    if (!file.save()) {
        return Status::Error(ErrorKind::UnsupportedFormat, "TagLib failed to save " + path);
    }
    return Status::Ok();
}

Status TagWriter::Write(const std::string& path, const ContentDescriptor& descriptor) {
    ContainerFamily family = ContainerFamilyFor(path);
    if (family == ContainerFamily::Unknown) {
        return Status::Error(ErrorKind::UnsupportedFormat,
                             "no tag writer for " + fs::path(path).extension().string());
    }

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Status::Error(ErrorKind::UnsupportedFormat, "file missing: " + path);
    }

    Artwork artwork;
    bool have_artwork = FetchArtwork(descriptor.thumbnail_url, &artwork);

    try {
        Status status = (family == ContainerFamily::MP4)
            ? WriteMp4(path, descriptor, have_artwork ? &artwork : nullptr)
            : WriteMpeg(path, descriptor, have_artwork ? &artwork : nullptr);
        if (status.ok()) {
            Log("  ✓ Tagged " + fs::path(path).filename().string() +
                (have_artwork ? " (with cover)" : ""));
        }
        return status;
    } catch (const std::exception& e) {
        return Status::Error(ErrorKind::UnsupportedFormat,
                             "tagging failed for " + path + ": " + e.what());
    }
}

void TagWriter::Log(const std::string& message) {
    if (log_callback_) {
        log_callback_(message);
    }
}

} // namespace podsync
