#pragma once

#include <string>

#include "MediaTypes.h"
#include "services/MultipartStorageService.h"
#include "services/RawTransport.h"
#include "sync/CancellationToken.h"
#include "sync/ProgressReporter.h"
#include "transfer/BatchAuthorizer.h"

namespace mediadrop {

/**
 * ChunkedUploader
 *
 * Uploads one large file (full-episode audio/video) with byte-level
 * progress.
 *
 * Files below the multipart threshold take the single-shot path (primary
 * key, then legacy key). Larger files are split by a ChunkPlan and sent as a
 * multipart session with up to `part_concurrency` parts in flight; each part
 * is retried up to `max_part_attempts` times. An unrecoverable part aborts
 * the session and the whole file is retried as a fresh session on the
 * legacy key. Sessions are not key-interchangeable, so there is no per-part
 * key fallback.
 *
 * Byte progress counts acknowledged parts only and never goes backwards,
 * including across the legacy retry.
 */
class ChunkedUploader {
public:
    ChunkedUploader(BatchAuthorizer& authorizer, RawTransport& transport,
                    MultipartStorageService& multipart, const PipelineConfig& config);

    /**
     * @param item File to upload
     * @param keys Primary/legacy keys (legacy may be empty: no fallback)
     * @param on_byte_progress (done bytes, total bytes)
     * @param cancel Checked before each part and each retry
     */
    LargeUploadOutcome Upload(const MediaItem& item, const KeySet& keys,
                              ProgressCallback on_byte_progress,
                              const CancellationToken& cancel);

    /// Part size actually used (configured size raised to the object-store minimum)
    uint64_t EffectivePartSize() const;

    void SetLogCallback(LogCallback callback) { log_callback_ = std::move(callback); }

private:
    enum class SessionResult { Completed, Failed, Cancelled };

    LargeUploadOutcome UploadSingleShot(const MediaItem& item, const KeySet& keys,
                                        ProgressReporter& bytes, const CancellationToken& cancel);

    SessionResult UploadSession(const MediaItem& item, const std::string& key,
                                const std::string& content_type, const ChunkPlan& plan,
                                ProgressReporter& bytes, const CancellationToken& cancel,
                                std::string& error);

    /// Abort failures are logged; the object never becomes visible without Complete
    void AbortSession(const MultipartSession& session);
    void Log(const std::string& message);

    BatchAuthorizer& authorizer_;
    RawTransport& transport_;
    MultipartStorageService& multipart_;
    PipelineConfig config_;
    LogCallback log_callback_;
};

} // namespace mediadrop
