#pragma once

#include <string>

#include "MediaTypes.h"

namespace mediadrop {

/// Extension and normalized content type chosen for a declared MIME type
struct MediaFormat {
    std::string extension;
    std::string content_type;
};

/**
 * KeyBuilder
 *
 * Pure mapping from (content slug, episode number, media kind, logical ID,
 * declared MIME type) to storage keys. No I/O.
 *
 * Bucket layout:
 *   items/{slug}/episodes/{slug}_{ep:03}/{kind}/{slug}_{ep:03}_{id}.{ext}   primary
 *   items/{slug}/episodes/{slug}_{ep}/{kind}/{slug}_{ep:03}_{id}.{ext}      legacy
 *   items/{slug}/episodes/{slug}_{ep:03}/full/{audio|video}.{ext}          full episode media
 *   items/{slug}/episodes/{slug}_{ep:03}/cover/cover[_landscape].{ext}     episode cover
 *   items/{slug}/cover_image/cover[_landscape].{ext}                       content cover
 *
 * The legacy layout differs only in the unpadded episode folder; objects
 * written before the migration live there.
 */
class KeyBuilder {
public:
    static constexpr int kEpisodePadWidth = 3;

    /**
     * Resolve extension and content type. Ambiguous or unknown types fall back
     * to the kind's default (jpg, mp3, mp4).
     */
    static MediaFormat ResolveFormat(MediaKind kind, const std::string& declared_mime_type);

    /// Whether the declared MIME type may be uploaded as this kind
    static bool IsAcceptedMimeType(MediaKind kind, const std::string& declared_mime_type);

    /**
     * Keys for one card image/audio item
     * @throws PlanningError for an empty slug, episode < 1 or empty logical ID
     */
    static KeySet BuildItemKeys(const std::string& content_slug, int episode_number,
                                MediaKind kind, const std::string& logical_id,
                                const std::string& declared_mime_type);

    /// Keys for full-episode audio or video
    static KeySet BuildFullMediaKeys(const std::string& content_slug, int episode_number,
                                     MediaKind kind, const std::string& declared_mime_type);

    /// Keys for an episode cover image
    static KeySet BuildEpisodeCoverKeys(const std::string& content_slug, int episode_number,
                                        const std::string& declared_mime_type, bool landscape);

    /// Key for a content (film/series) cover image; there is no legacy layout
    static KeySet BuildContentCoverKeys(const std::string& content_slug,
                                        const std::string& declared_mime_type, bool landscape);

    /// "{slug}_{ep:03}"
    static std::string EpisodeFolder(const std::string& content_slug, int episode_number);

    /// "{slug}_{ep}"
    static std::string LegacyEpisodeFolder(const std::string& content_slug, int episode_number);

private:
    static void ValidateSlug(const std::string& content_slug);
    static void ValidateEpisode(int episode_number);
    static std::string EpisodeRoot(const std::string& content_slug);
};

} // namespace mediadrop
