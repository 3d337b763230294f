#include "KeyBuilder.h"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace mediadrop {

namespace {

std::string ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool EndsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string PadEpisode(int episode_number) {
    std::ostringstream oss;
    oss << std::setw(KeyBuilder::kEpisodePadWidth) << std::setfill('0') << episode_number;
    return oss.str();
}

} // namespace

MediaFormat KeyBuilder::ResolveFormat(MediaKind kind, const std::string& declared_mime_type) {
    const std::string mime = ToLower(declared_mime_type);

    switch (kind) {
        case MediaKind::Image:
            if (mime == "image/avif") return {"avif", "image/avif"};
            if (mime == "image/webp") return {"webp", "image/webp"};
            return {"jpg", "image/jpeg"};

        case MediaKind::Audio:
            if (mime == "audio/wav" || mime == "audio/x-wav") return {"wav", "audio/wav"};
            if (mime == "audio/opus" || mime == "audio/ogg") return {"opus", "audio/opus"};
            return {"mp3", "audio/mpeg"};

        case MediaKind::Video:
            if (mime == "video/webm") return {"webm", "video/webm"};
            return {"mp4", "video/mp4"};
    }
    return {"bin", "application/octet-stream"};
}

bool KeyBuilder::IsAcceptedMimeType(MediaKind kind, const std::string& declared_mime_type) {
    const std::string mime = ToLower(declared_mime_type);

    switch (kind) {
        case MediaKind::Image:
            return EndsWith(mime, "jpeg") || EndsWith(mime, "jpg") ||
                   EndsWith(mime, "webp") || mime == "image/avif";

        case MediaKind::Audio:
            return EndsWith(mime, "mpeg") || EndsWith(mime, "wav") ||
                   EndsWith(mime, "opus") || mime == "audio/ogg";

        case MediaKind::Video:
            return mime == "video/mp4" || mime == "video/webm";
    }
    return false;
}

std::string KeyBuilder::EpisodeFolder(const std::string& content_slug, int episode_number) {
    return content_slug + "_" + PadEpisode(episode_number);
}

std::string KeyBuilder::LegacyEpisodeFolder(const std::string& content_slug, int episode_number) {
    return content_slug + "_" + std::to_string(episode_number);
}

std::string KeyBuilder::EpisodeRoot(const std::string& content_slug) {
    return "items/" + content_slug + "/episodes/";
}

void KeyBuilder::ValidateSlug(const std::string& content_slug) {
    if (content_slug.empty()) {
        throw PlanningError("Content slug is required");
    }
}

void KeyBuilder::ValidateEpisode(int episode_number) {
    if (episode_number < 1) {
        throw PlanningError("Episode number must be >= 1 (got " + std::to_string(episode_number) + ")");
    }
}

KeySet KeyBuilder::BuildItemKeys(const std::string& content_slug, int episode_number,
                                 MediaKind kind, const std::string& logical_id,
                                 const std::string& declared_mime_type) {
    ValidateSlug(content_slug);
    ValidateEpisode(episode_number);
    if (logical_id.empty()) {
        throw PlanningError("Logical ID is required");
    }

    MediaFormat format = ResolveFormat(kind, declared_mime_type);
    const std::string folder = EpisodeFolder(content_slug, episode_number);
    const std::string file_name = folder + "_" + logical_id + "." + format.extension;
    const std::string kind_dir = MediaKindToString(kind);

    KeySet keys;
    keys.primary_key = EpisodeRoot(content_slug) + folder + "/" + kind_dir + "/" + file_name;
    keys.legacy_key = EpisodeRoot(content_slug) + LegacyEpisodeFolder(content_slug, episode_number) +
                      "/" + kind_dir + "/" + file_name;
    keys.content_type = format.content_type;
    return keys;
}

KeySet KeyBuilder::BuildFullMediaKeys(const std::string& content_slug, int episode_number,
                                      MediaKind kind, const std::string& declared_mime_type) {
    ValidateSlug(content_slug);
    ValidateEpisode(episode_number);
    if (kind == MediaKind::Image) {
        throw PlanningError("Full episode media must be audio or video");
    }

    MediaFormat format = ResolveFormat(kind, declared_mime_type);
    const std::string file_name = std::string(MediaKindToString(kind)) + "." + format.extension;

    KeySet keys;
    keys.primary_key = EpisodeRoot(content_slug) + EpisodeFolder(content_slug, episode_number) +
                       "/full/" + file_name;
    keys.legacy_key = EpisodeRoot(content_slug) + LegacyEpisodeFolder(content_slug, episode_number) +
                      "/full/" + file_name;
    keys.content_type = format.content_type;
    return keys;
}

KeySet KeyBuilder::BuildEpisodeCoverKeys(const std::string& content_slug, int episode_number,
                                         const std::string& declared_mime_type, bool landscape) {
    ValidateSlug(content_slug);
    ValidateEpisode(episode_number);

    MediaFormat format = ResolveFormat(MediaKind::Image, declared_mime_type);
    const std::string file_name = std::string(landscape ? "cover_landscape." : "cover.") + format.extension;

    KeySet keys;
    keys.primary_key = EpisodeRoot(content_slug) + EpisodeFolder(content_slug, episode_number) +
                       "/cover/" + file_name;
    keys.legacy_key = EpisodeRoot(content_slug) + LegacyEpisodeFolder(content_slug, episode_number) +
                      "/cover/" + file_name;
    keys.content_type = format.content_type;
    return keys;
}

KeySet KeyBuilder::BuildContentCoverKeys(const std::string& content_slug,
                                         const std::string& declared_mime_type, bool landscape) {
    ValidateSlug(content_slug);

    MediaFormat format = ResolveFormat(MediaKind::Image, declared_mime_type);
    const std::string file_name = std::string(landscape ? "cover_landscape." : "cover.") + format.extension;

    KeySet keys;
    keys.primary_key = "items/" + content_slug + "/cover_image/" + file_name;
    keys.content_type = format.content_type;
    return keys;
}

} // namespace mediadrop
