#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "media/MediaSource.h"

namespace mediadrop {

using LogCallback = std::function<void(const std::string& message)>;

/// Progress callbacks: (completed items, total items) or (done bytes, total bytes)
using ProgressCallback = std::function<void(uint64_t done, uint64_t total)>;

/// Media kind selected by the caller; also names the bucket sub-folder
enum class MediaKind : uint8_t {
    Image = 0,
    Audio = 1,
    Video = 2
};

/// Terminal state of one planned item
enum class TransferOutcome : uint8_t {
    NotStarted = 0,        // Never dispatched (cancellation observed first)
    Succeeded = 1,         // Written under the primary key
    FellBackToLegacy = 2,  // Primary failed, written under the legacy key
    Failed = 3,            // Both keys failed (or authorization failed)
    Cancelled = 4          // In-flight transfer aborted by cancellation
};

const char* MediaKindToString(MediaKind kind);
const char* TransferOutcomeToString(TransferOutcome outcome);

/// Malformed caller input: mismatched explicit IDs, missing slug, bad MIME type.
/// Raised before anything is uploaded.
class PlanningError : public std::runtime_error {
public:
    explicit PlanningError(const std::string& message)
        : std::runtime_error(message) {}
};

/// Failure reported by an external collaborator (authorization, multipart API)
class ServiceError : public std::runtime_error {
public:
    explicit ServiceError(const std::string& message, int status_code = 0)
        : std::runtime_error(message), status_code_(status_code) {}

    int StatusCode() const { return status_code_; }

private:
    int status_code_;
};

/// One input file. Owned by the caller; never mutated by the pipeline.
struct MediaItem {
    MediaSourcePtr source;
    uint64_t byte_size = 0;
    std::string declared_mime_type;

    std::string Name() const { return source ? source->Name() : std::string(); }

    static MediaItem FromSource(MediaSourcePtr source, std::string mime_type) {
        MediaItem item;
        item.byte_size = source ? source->Size() : 0;
        item.source = std::move(source);
        item.declared_mime_type = std::move(mime_type);
        return item;
    }
};

/// Result of identifier planning
struct PlanEntry {
    MediaItem item;
    std::string logical_id;
    size_t source_index = 0;   // Position in the caller's file list
};

/// Storage keys for one logical media item
struct KeySet {
    std::string primary_key;   // Canonical layout (zero-padded episode folder)
    std::string legacy_key;    // Pre-migration layout (unpadded episode folder)
    std::string content_type;
};

/// Short-lived, single-use write authorization for exactly one key
struct AuthorizedUpload {
    std::string key;
    std::string credential_url;
};

struct TransferResult {
    std::string logical_id;
    std::string key;           // Key actually written (or last attempted)
    TransferOutcome outcome = TransferOutcome::NotStarted;
    std::string error_detail;
};

/// Part layout for the multipart path.
/// Invariant: part_size_bytes * (part_count - 1) < total_bytes <= part_size_bytes * part_count
struct ChunkPlan {
    uint64_t total_bytes = 0;
    uint64_t part_size_bytes = 0;
    uint32_t part_count = 0;

    uint64_t PartOffset(uint32_t part_index) const { return part_index * part_size_bytes; }
    uint64_t PartLength(uint32_t part_index) const;
};

/// Build a ChunkPlan. Throws std::invalid_argument for a zero part size or zero total.
ChunkPlan ComputeChunkPlan(uint64_t total_bytes, uint64_t part_size_bytes);

/// Aggregate outcome of one batch invocation
struct BatchOutcome {
    std::vector<TransferResult> results;   // Plan order
    bool cancelled = false;

    size_t Count(TransferOutcome outcome) const;
    size_t Succeeded() const { return Count(TransferOutcome::Succeeded); }
    size_t FellBack() const { return Count(TransferOutcome::FellBackToLegacy); }
    size_t Failed() const { return Count(TransferOutcome::Failed); }
    size_t Cancelled() const { return Count(TransferOutcome::Cancelled); }
    size_t NotStarted() const { return Count(TransferOutcome::NotStarted); }
};

/// Outcome of a single-file upload (full episode media, covers)
struct LargeUploadOutcome {
    TransferOutcome outcome = TransferOutcome::NotStarted;
    std::string key_used;
    std::string error_detail;

    bool Ok() const {
        return outcome == TransferOutcome::Succeeded ||
               outcome == TransferOutcome::FellBackToLegacy;
    }
};

/// Tunables shared by the pipeline components
struct PipelineConfig {
    size_t sign_batch_size = 100;                       // Keys per SignBatch request
    size_t concurrency = 20;                            // Simultaneous single-shot transfers
    uint32_t item_timeout_ms = 120000;                  // Per-item PUT timeout
    uint64_t part_size_bytes = 8ull * 1024 * 1024;      // Multipart part size
    uint64_t min_part_size_bytes = 5ull * 1024 * 1024;  // Object-store minimum for non-final parts
    uint64_t multipart_threshold_bytes = 8ull * 1024 * 1024;
    size_t part_concurrency = 3;
    uint32_t max_part_attempts = 3;
    uint32_t part_retry_delay_ms = 500;                 // Linear backoff base between part attempts
    bool verbose = false;                               // Per-item log lines
};

} // namespace mediadrop
