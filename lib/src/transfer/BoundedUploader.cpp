#include "BoundedUploader.h"

#include <algorithm>
#include <stdexcept>
#include <thread>

#include "transfer/ItemTransfer.h"

namespace mediadrop {

BoundedUploader::BoundedUploader(BatchAuthorizer& authorizer, RawTransport& transport,
                                 size_t concurrency, uint32_t item_timeout_ms)
    : authorizer_(authorizer),
      transport_(transport),
      concurrency_(std::max<size_t>(1, concurrency)),
      item_timeout_ms_(item_timeout_ms) {
}

std::vector<TransferResult> BoundedUploader::Run(const std::vector<PlanEntry>& entries,
                                                 const std::vector<KeySet>& keys,
                                                 const AuthorizationTable& table,
                                                 const CancellationToken& cancel,
                                                 ProgressReporter& progress) {
    if (keys.size() != entries.size()) {
        throw std::invalid_argument("BoundedUploader: entries and keys differ in length");
    }

    std::vector<TransferResult> results(entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
        results[i].logical_id = entries[i].logical_id;
        results[i].key = keys[i].primary_key;
        results[i].outcome = TransferOutcome::NotStarted;
    }

    peak_in_flight_ = 0;
    in_flight_ = 0;

    ItemTransfer::Context context{authorizer_, transport_, item_timeout_ms_, cancel, log_callback_, verbose_};
    std::atomic<size_t> cursor{0};

    auto worker = [&]() {
        while (true) {
            if (cancel.IsCancelled()) {
                return;
            }
            const size_t index = cursor.fetch_add(1);
            if (index >= entries.size()) {
                return;
            }

            auto resolved = table.resolved.find(keys[index].primary_key);
            if (resolved != table.resolved.end()) {
                // Terminal in the authorizer's degrade path; already counted there
                results[index] = resolved->second;
                results[index].logical_id = entries[index].logical_id;
                continue;
            }

            std::optional<std::string> credential;
            if (const std::string* url = table.Find(keys[index].primary_key)) {
                credential = *url;
            }

            NoteInFlight(++in_flight_);
            try {
                ItemTransfer transfer(context, entries[index].logical_id, entries[index].item,
                                      keys[index], std::move(credential));
                results[index] = transfer.Run();
            } catch (const std::exception& e) {
                results[index].logical_id = entries[index].logical_id;
                results[index].outcome = TransferOutcome::Failed;
                results[index].error_detail = e.what();
            } catch (...) {
                results[index].logical_id = entries[index].logical_id;
                results[index].outcome = TransferOutcome::Failed;
                results[index].error_detail = "unknown error";
            }
            --in_flight_;

            progress.Tick();
        }
    };

    const size_t worker_count = std::min(concurrency_, entries.size());
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }

    if (cancel.IsCancelled()) {
        size_t not_started = std::count_if(results.begin(), results.end(), [](const TransferResult& r) {
            return r.outcome == TransferOutcome::NotStarted;
        });
        Log("Cancelled with " + std::to_string(not_started) + " of " +
            std::to_string(entries.size()) + " items not started");
    }

    return results;
}

void BoundedUploader::NoteInFlight(size_t in_flight) {
    size_t peak = peak_in_flight_.load();
    while (in_flight > peak && !peak_in_flight_.compare_exchange_weak(peak, in_flight)) {
    }
}

void BoundedUploader::Log(const std::string& message) {
    if (log_callback_) {
        log_callback_("[BoundedUploader] " + message);
    }
}

} // namespace mediadrop
