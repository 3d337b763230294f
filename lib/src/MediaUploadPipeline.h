#pragma once

#include <optional>
#include <string>
#include <vector>

#include "MediaTypes.h"
#include "services/AuthorizationService.h"
#include "services/MultipartStorageService.h"
#include "services/RawTransport.h"
#include "sync/CancellationToken.h"

namespace mediadrop {

struct BatchUploadOptions {
    std::string content_slug;
    int episode_number = 1;
    uint64_t start_index = 0;          // First sequential ID
    int pad_width = 3;
    bool infer_from_name = false;      // Use trailing digits of file names
    std::optional<std::vector<std::string>> explicit_ids;
};

struct LargeFileOptions {
    std::string content_slug;
    int episode_number = 1;
    std::optional<uint64_t> part_size_bytes;    // Overrides PipelineConfig
    std::optional<size_t> part_concurrency;     // Overrides PipelineConfig
};

/// Planned batch without any network I/O (dry runs, previews)
struct BatchPlan {
    std::vector<PlanEntry> entries;
    std::vector<KeySet> keys;          // keys[i] belongs to entries[i]
};

/**
 * MediaUploadPipeline
 *
 * Entry point for uploading episode media to the object store.
 *
 * A batch runs IdentifierPlanner -> KeyBuilder -> BatchAuthorizer ->
 * BoundedUploader. Large single files (full-episode audio/video) and cover
 * images go through ChunkedUploader. Each call is independent: it carries its
 * own cancellation token and shares no mutable state with other calls, so
 * one pipeline may serve several calls at once.
 *
 * Usage:
 *   WorkerApiClient api({"https://media.example.com"});
 *   CurlTransport transport;
 *   MediaUploadPipeline pipeline(api, api, transport);
 *
 *   BatchUploadOptions options;
 *   options.content_slug = "naruto";
 *   options.episode_number = 1;
 *   BatchOutcome outcome = pipeline.UploadMediaBatch(MediaKind::Image, files, options,
 *                                                    on_progress, cancel);
 */
class MediaUploadPipeline {
public:
    MediaUploadPipeline(AuthorizationService& authorization, MultipartStorageService& multipart,
                        RawTransport& transport, const PipelineConfig& config = PipelineConfig());

    /**
     * Upload many card images or audio clips
     * @param kind Image or Audio (Video is accepted too)
     * @param files Input files in caller order
     * @param options Slug, episode and identifier options
     * @param on_progress (completed items, total items), once per terminal outcome
     * @param cancel Stops new authorization groups and new items
     * @return One result per planned item, in plan order
     * @throws PlanningError if the input is malformed; nothing is uploaded then
     */
    BatchOutcome UploadMediaBatch(MediaKind kind, const std::vector<MediaItem>& files,
                                  const BatchUploadOptions& options,
                                  ProgressCallback on_progress,
                                  const CancellationToken& cancel);

    /**
     * Plan a batch and derive its keys without uploading
     * @throws PlanningError if the input is malformed
     */
    BatchPlan PlanBatch(MediaKind kind, const std::vector<MediaItem>& files,
                        const BatchUploadOptions& options) const;

    /**
     * Upload full-episode audio or video with byte progress
     * @throws PlanningError for an Image kind, a bad slug/episode or an unsupported MIME type
     */
    LargeUploadOutcome UploadSingleLargeFile(MediaKind kind, const MediaItem& file,
                                             const LargeFileOptions& options,
                                             ProgressCallback on_byte_progress,
                                             const CancellationToken& cancel);

    /// Content (film/series) cover; single key, no fallback
    LargeUploadOutcome UploadContentCover(const std::string& content_slug, const MediaItem& file,
                                          bool landscape, const CancellationToken& cancel);

    /// Episode cover; primary key, then legacy key
    LargeUploadOutcome UploadEpisodeCover(const std::string& content_slug, int episode_number,
                                          const MediaItem& file, bool landscape,
                                          const CancellationToken& cancel);

    void SetLogCallback(LogCallback callback) { log_callback_ = std::move(callback); }

    const PipelineConfig& GetConfig() const { return config_; }

private:
    static void ValidateMimeTypes(MediaKind kind, const std::vector<MediaItem>& files);

    LargeUploadOutcome UploadOne(const MediaItem& file, const KeySet& keys,
                                 const PipelineConfig& config, ProgressCallback on_byte_progress,
                                 const CancellationToken& cancel);

    void Log(const std::string& message);

    AuthorizationService& authorization_;
    MultipartStorageService& multipart_;
    RawTransport& transport_;
    PipelineConfig config_;
    LogCallback log_callback_;
};

} // namespace mediadrop
