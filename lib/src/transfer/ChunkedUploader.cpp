#include "ChunkedUploader.h"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

#include "transfer/ItemTransfer.h"

namespace mediadrop {

ChunkedUploader::ChunkedUploader(BatchAuthorizer& authorizer, RawTransport& transport,
                                 MultipartStorageService& multipart, const PipelineConfig& config)
    : authorizer_(authorizer),
      transport_(transport),
      multipart_(multipart),
      config_(config) {
}

uint64_t ChunkedUploader::EffectivePartSize() const {
    return std::max(config_.part_size_bytes, config_.min_part_size_bytes);
}

LargeUploadOutcome ChunkedUploader::Upload(const MediaItem& item, const KeySet& keys,
                                           ProgressCallback on_byte_progress,
                                           const CancellationToken& cancel) {
    const uint64_t total = item.byte_size;
    ProgressReporter bytes(total, std::move(on_byte_progress));

    if (total < config_.multipart_threshold_bytes) {
        return UploadSingleShot(item, keys, bytes, cancel);
    }

    const ChunkPlan plan = ComputeChunkPlan(total, EffectivePartSize());
    Log("Multipart upload of " + item.Name() + ": " + std::to_string(total) + " bytes in " +
        std::to_string(plan.part_count) + " parts");

    LargeUploadOutcome outcome;
    std::string error;

    // Nothing is stored until a session is committed
    bytes.SetCeiling(total - 1);

    SessionResult primary = UploadSession(item, keys.primary_key, keys.content_type, plan,
                                          bytes, cancel, error);
    if (primary == SessionResult::Completed) {
        bytes.ReleaseCeiling();
        outcome.outcome = TransferOutcome::Succeeded;
        outcome.key_used = keys.primary_key;
        return outcome;
    }
    if (primary == SessionResult::Cancelled) {
        outcome.outcome = TransferOutcome::Cancelled;
        outcome.key_used = keys.primary_key;
        outcome.error_detail = "cancelled";
        return outcome;
    }

    outcome.error_detail = "primary: " + error;
    if (keys.legacy_key.empty()) {
        outcome.outcome = TransferOutcome::Failed;
        outcome.key_used = keys.primary_key;
        return outcome;
    }

    Log("Primary multipart session failed (" + error + "), retrying on legacy key " + keys.legacy_key);
    bytes.Restart();
    error.clear();

    SessionResult legacy = UploadSession(item, keys.legacy_key, keys.content_type, plan,
                                         bytes, cancel, error);
    outcome.key_used = keys.legacy_key;
    switch (legacy) {
        case SessionResult::Completed:
            bytes.ReleaseCeiling();
            outcome.outcome = TransferOutcome::FellBackToLegacy;
            break;
        case SessionResult::Cancelled:
            outcome.outcome = TransferOutcome::Cancelled;
            outcome.error_detail += "; legacy: cancelled";
            break;
        case SessionResult::Failed:
            outcome.outcome = TransferOutcome::Failed;
            outcome.error_detail += "; legacy: " + error;
            break;
    }
    return outcome;
}

LargeUploadOutcome ChunkedUploader::UploadSingleShot(const MediaItem& item, const KeySet& keys,
                                                     ProgressReporter& bytes,
                                                     const CancellationToken& cancel) {
    ItemTransfer::Context context{authorizer_, transport_, config_.item_timeout_ms, cancel,
                                  log_callback_, config_.verbose};
    ItemTransfer transfer(context, item.Name(), item, keys, std::nullopt);
    TransferResult result = transfer.Run();

    LargeUploadOutcome outcome;
    outcome.outcome = result.outcome;
    outcome.key_used = result.key;
    outcome.error_detail = result.error_detail;

    if (outcome.Ok()) {
        bytes.Add(bytes.Total());
    }
    return outcome;
}

ChunkedUploader::SessionResult ChunkedUploader::UploadSession(const MediaItem& item,
                                                              const std::string& key,
                                                              const std::string& content_type,
                                                              const ChunkPlan& plan,
                                                              ProgressReporter& bytes,
                                                              const CancellationToken& cancel,
                                                              std::string& error) {
    if (cancel.IsCancelled()) {
        return SessionResult::Cancelled;
    }

    MultipartSession session;
    try {
        session = multipart_.InitMultipart(key, content_type);
    } catch (const std::exception& e) {
        error = std::string("init failed: ") + e.what();
        return SessionResult::Failed;
    } catch (...) {
        error = "init failed: unknown error";
        return SessionResult::Failed;
    }

    std::vector<CompletedPart> parts(plan.part_count);
    std::atomic<uint32_t> next_part{0};
    std::atomic<bool> failed{false};
    std::atomic<bool> cancelled{false};
    std::mutex error_mutex;

    auto record_error = [&](const std::string& message) {
        std::lock_guard<std::mutex> lock(error_mutex);
        if (error.empty()) {
            error = message;
        }
    };

    auto worker = [&]() {
        while (!failed && !cancelled) {
            if (cancel.IsCancelled()) {
                cancelled = true;
                return;
            }
            const uint32_t index = next_part.fetch_add(1);
            if (index >= plan.part_count) {
                return;
            }
            const uint32_t part_number = index + 1;
            const uint64_t length = plan.PartLength(index);

            ByteBuffer data;
            try {
                data = item.source->Read(plan.PartOffset(index), length);
            } catch (const std::exception& e) {
                record_error("part " + std::to_string(part_number) + " read failed: " + e.what());
                failed = true;
                return;
            } catch (...) {
                record_error("part " + std::to_string(part_number) + " read failed: unknown error");
                failed = true;
                return;
            }

            bool stored = false;
            std::string last_error;
            for (uint32_t attempt = 1; attempt <= config_.max_part_attempts; ++attempt) {
                if (cancel.IsCancelled()) {
                    cancelled = true;
                    return;
                }
                try {
                    std::string etag = multipart_.UploadPart(session, part_number, data);
                    parts[index] = CompletedPart{part_number, std::move(etag)};
                    stored = true;
                    break;
                } catch (const std::exception& e) {
                    last_error = e.what();
                } catch (...) {
                    last_error = "unknown error";
                }
                if (!stored) {
                    Log("Part " + std::to_string(part_number) + " attempt " + std::to_string(attempt) +
                        "/" + std::to_string(config_.max_part_attempts) + " failed: " + last_error);
                }
                if (attempt < config_.max_part_attempts &&
                    cancel.WaitFor(std::chrono::milliseconds(config_.part_retry_delay_ms * attempt))) {
                    cancelled = true;
                    return;
                }
            }

            if (!stored) {
                record_error("part " + std::to_string(part_number) + ": " + last_error);
                failed = true;
                return;
            }
            bytes.Add(length);
        }
    };

    const size_t worker_count = std::min<size_t>(std::max<size_t>(1, config_.part_concurrency),
                                                 plan.part_count);
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }

    if (cancelled) {
        Log("Cancelled, aborting multipart session for " + key);
        AbortSession(session);
        return SessionResult::Cancelled;
    }
    if (failed) {
        AbortSession(session);
        return SessionResult::Failed;
    }

    try {
        multipart_.CompleteMultipart(session, parts);
    } catch (const std::exception& e) {
        error = std::string("complete failed: ") + e.what();
        AbortSession(session);
        return SessionResult::Failed;
    } catch (...) {
        error = "complete failed: unknown error";
        AbortSession(session);
        return SessionResult::Failed;
    }

    Log("Completed multipart session for " + key);
    return SessionResult::Completed;
}

void ChunkedUploader::AbortSession(const MultipartSession& session) {
    try {
        multipart_.AbortMultipart(session);
    } catch (const std::exception& e) {
        Log("Abort failed for " + session.key + " (" + session.upload_id + "): " + e.what());
    } catch (...) {
        Log("Abort failed for " + session.key + " (" + session.upload_id + "): unknown error");
    }
}

void ChunkedUploader::Log(const std::string& message) {
    if (log_callback_) {
        log_callback_("[ChunkedUploader] " + message);
    }
}

} // namespace mediadrop
