#include "MediaUploadPipeline.h"

#include "planning/IdentifierPlanner.h"
#include "planning/KeyBuilder.h"
#include "sync/ProgressReporter.h"
#include "transfer/BatchAuthorizer.h"
#include "transfer/BoundedUploader.h"
#include "transfer/ChunkedUploader.h"

namespace mediadrop {

MediaUploadPipeline::MediaUploadPipeline(AuthorizationService& authorization,
                                         MultipartStorageService& multipart,
                                         RawTransport& transport, const PipelineConfig& config)
    : authorization_(authorization),
      multipart_(multipart),
      transport_(transport),
      config_(config) {
}

void MediaUploadPipeline::ValidateMimeTypes(MediaKind kind, const std::vector<MediaItem>& files) {
    for (const auto& file : files) {
        if (!file.source) {
            throw PlanningError("file has no source");
        }
        if (!KeyBuilder::IsAcceptedMimeType(kind, file.declared_mime_type)) {
            throw PlanningError("unsupported " + std::string(MediaKindToString(kind)) +
                                " type '" + file.declared_mime_type + "' for " + file.Name());
        }
    }
}

BatchPlan MediaUploadPipeline::PlanBatch(MediaKind kind, const std::vector<MediaItem>& files,
                                         const BatchUploadOptions& options) const {
    ValidateMimeTypes(kind, files);

    PlanRequest request;
    request.files = files;
    request.explicit_ids = options.explicit_ids;
    request.pad_width = options.pad_width;
    request.start_index = options.start_index;
    request.infer_from_name = options.infer_from_name;

    BatchPlan plan;
    plan.entries = IdentifierPlanner::Plan(request);
    plan.keys.reserve(plan.entries.size());
    for (const auto& entry : plan.entries) {
        plan.keys.push_back(KeyBuilder::BuildItemKeys(options.content_slug, options.episode_number,
                                                      kind, entry.logical_id,
                                                      entry.item.declared_mime_type));
    }
    return plan;
}

BatchOutcome MediaUploadPipeline::UploadMediaBatch(MediaKind kind, const std::vector<MediaItem>& files,
                                                   const BatchUploadOptions& options,
                                                   ProgressCallback on_progress,
                                                   const CancellationToken& cancel) {
    BatchPlan plan = PlanBatch(kind, files, options);

    BatchOutcome outcome;
    if (plan.entries.empty()) {
        return outcome;
    }

    Log("Uploading " + std::to_string(plan.entries.size()) + " " + MediaKindToString(kind) +
        " items for " + KeyBuilder::EpisodeFolder(options.content_slug, options.episode_number));

    ProgressReporter progress(plan.entries.size(), std::move(on_progress));

    BatchAuthorizer authorizer(authorization_, config_.sign_batch_size);
    authorizer.SetLogCallback(log_callback_);
    AuthorizationTable table = authorizer.Authorize(plan.keys, cancel, &progress);

    BoundedUploader uploader(authorizer, transport_, config_.concurrency, config_.item_timeout_ms);
    uploader.SetLogCallback(log_callback_);
    uploader.SetVerbose(config_.verbose);
    outcome.results = uploader.Run(plan.entries, plan.keys, table, cancel, progress);
    outcome.cancelled = cancel.IsCancelled();

    Log("Batch finished: " + std::to_string(outcome.Succeeded()) + " succeeded, " +
        std::to_string(outcome.FellBack()) + " fell back, " +
        std::to_string(outcome.Failed()) + " failed, " +
        std::to_string(outcome.Cancelled()) + " cancelled, " +
        std::to_string(outcome.NotStarted()) + " not started" +
        (outcome.cancelled ? " (cancelled)" : ""));
    return outcome;
}

LargeUploadOutcome MediaUploadPipeline::UploadSingleLargeFile(MediaKind kind, const MediaItem& file,
                                                              const LargeFileOptions& options,
                                                              ProgressCallback on_byte_progress,
                                                              const CancellationToken& cancel) {
    if (kind == MediaKind::Image) {
        throw PlanningError("full-episode media must be audio or video");
    }
    ValidateMimeTypes(kind, {file});
    KeySet keys = KeyBuilder::BuildFullMediaKeys(options.content_slug, options.episode_number,
                                                 kind, file.declared_mime_type);

    PipelineConfig config = config_;
    if (options.part_size_bytes) config.part_size_bytes = *options.part_size_bytes;
    if (options.part_concurrency) config.part_concurrency = *options.part_concurrency;

    return UploadOne(file, keys, config, std::move(on_byte_progress), cancel);
}

LargeUploadOutcome MediaUploadPipeline::UploadContentCover(const std::string& content_slug,
                                                           const MediaItem& file, bool landscape,
                                                           const CancellationToken& cancel) {
    ValidateMimeTypes(MediaKind::Image, {file});
    KeySet keys = KeyBuilder::BuildContentCoverKeys(content_slug, file.declared_mime_type, landscape);
    return UploadOne(file, keys, config_, nullptr, cancel);
}

LargeUploadOutcome MediaUploadPipeline::UploadEpisodeCover(const std::string& content_slug,
                                                           int episode_number, const MediaItem& file,
                                                           bool landscape,
                                                           const CancellationToken& cancel) {
    ValidateMimeTypes(MediaKind::Image, {file});
    KeySet keys = KeyBuilder::BuildEpisodeCoverKeys(content_slug, episode_number,
                                                    file.declared_mime_type, landscape);
    return UploadOne(file, keys, config_, nullptr, cancel);
}

LargeUploadOutcome MediaUploadPipeline::UploadOne(const MediaItem& file, const KeySet& keys,
                                                  const PipelineConfig& config,
                                                  ProgressCallback on_byte_progress,
                                                  const CancellationToken& cancel) {
    BatchAuthorizer authorizer(authorization_, config.sign_batch_size);
    authorizer.SetLogCallback(log_callback_);

    ChunkedUploader uploader(authorizer, transport_, multipart_, config);
    uploader.SetLogCallback(log_callback_);

    LargeUploadOutcome outcome = uploader.Upload(file, keys, std::move(on_byte_progress), cancel);
    if (outcome.Ok()) {
        Log("Stored " + file.Name() + " at " + outcome.key_used);
    } else {
        Log("Upload of " + file.Name() + " ended " + TransferOutcomeToString(outcome.outcome) +
            (outcome.error_detail.empty() ? "" : ": " + outcome.error_detail));
    }
    return outcome;
}

void MediaUploadPipeline::Log(const std::string& message) {
    if (log_callback_) {
        log_callback_("[MediaUploadPipeline] " + message);
    }
}

} // namespace mediadrop
