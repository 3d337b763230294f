#pragma once

#include <atomic>
#include <vector>

#include "MediaTypes.h"
#include "services/RawTransport.h"
#include "sync/CancellationToken.h"
#include "sync/ProgressReporter.h"
#include "transfer/BatchAuthorizer.h"

namespace mediadrop {

/**
 * BoundedUploader
 *
 * Runs single-shot uploads for a planned batch on a fixed pool of worker
 * threads. Workers pull entry indices from a shared cursor until the queue
 * is exhausted or cancellation is observed, so at most `concurrency`
 * transfers are in flight regardless of batch size.
 *
 * Each entry runs an ItemTransfer (primary key, then individually signed
 * legacy key). Entries already resolved by the authorizer are skipped.
 * Entries never claimed because of cancellation stay NotStarted.
 *
 * The AuthorizationService and RawTransport are called from several
 * threads at once and must be thread-safe.
 */
class BoundedUploader {
public:
    BoundedUploader(BatchAuthorizer& authorizer, RawTransport& transport,
                    size_t concurrency = 20, uint32_t item_timeout_ms = 120000);

    /**
     * Upload every entry
     * @param entries Planned items
     * @param keys Keys for entries[i] at index i
     * @param table Credentials from BatchAuthorizer::Authorize
     * @param cancel Checked before each claim; forwarded to the transport
     * @param progress Ticked once per terminal outcome reached here
     * @return One result per entry, same order
     */
    std::vector<TransferResult> Run(const std::vector<PlanEntry>& entries,
                                    const std::vector<KeySet>& keys,
                                    const AuthorizationTable& table,
                                    const CancellationToken& cancel,
                                    ProgressReporter& progress);

    void SetLogCallback(LogCallback callback) { log_callback_ = std::move(callback); }
    void SetVerbose(bool verbose) { verbose_ = verbose; }

    /// Highest number of simultaneous transfers seen during the last Run()
    size_t PeakInFlight() const { return peak_in_flight_.load(); }

private:
    void Log(const std::string& message);
    void NoteInFlight(size_t in_flight);

    BatchAuthorizer& authorizer_;
    RawTransport& transport_;
    size_t concurrency_;
    uint32_t item_timeout_ms_;
    LogCallback log_callback_;
    bool verbose_ = false;

    std::atomic<size_t> in_flight_{0};
    std::atomic<size_t> peak_in_flight_{0};
};

} // namespace mediadrop
