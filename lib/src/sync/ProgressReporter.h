#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>

#include "MediaTypes.h"

namespace mediadrop {

/**
 * ProgressReporter
 *
 * Shared counter (items) or accumulator (bytes) fed by concurrent workers.
 * Every value reached is delivered once, in increasing order, and never
 * above the total. Callbacks are serialized but run outside the counter
 * lock, so a callback may read Current() and Reported(). A slow callback
 * still delays the worker whose value is waiting to be delivered.
 *
 * Usage:
 *   ProgressReporter items(plan.size(), on_progress);
 *   items.Tick();            // one terminal outcome
 *
 *   ProgressReporter bytes(file_size, on_byte_progress);
 *   bytes.Add(part_bytes);   // only after the part was acknowledged
 */
class ProgressReporter {
public:
    ProgressReporter(uint64_t total, ProgressCallback callback);

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    /// Count one completed item
    void Tick() { Add(1); }

    /// Accumulate completed units
    void Add(uint64_t amount);

    /**
     * Start a new accumulation pass (whole-file retry on another key).
     * The running sum restarts at zero but nothing is reported until it
     * climbs past the highest value already reported.
     */
    void Restart();

    /**
     * Hold reported progress at or below ceiling until ReleaseCeiling().
     * Used to keep the last bytes of a multipart upload unreported until
     * the session is committed.
     */
    void SetCeiling(uint64_t ceiling);

    /// Lift the ceiling and report the running sum if it is now higher
    void ReleaseCeiling();

    uint64_t Current() const;
    uint64_t Reported() const;
    uint64_t Total() const { return total_; }

private:
    // Called with mutex_ held; releases it before invoking the callback
    void Publish(std::unique_lock<std::mutex>& lock);

    const uint64_t total_;
    ProgressCallback callback_;

    mutable std::mutex mutex_;
    uint64_t current_ = 0;
    uint64_t reported_ = 0;
    uint64_t ceiling_;
    bool any_reported_ = false;
    uint64_t next_ticket_ = 0;

    std::mutex delivery_mutex_;
    std::condition_variable delivery_cv_;
    uint64_t delivered_ = 0;
};

} // namespace mediadrop
