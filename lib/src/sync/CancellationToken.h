#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace mediadrop {

/**
 * CancellationToken
 *
 * Copyable handle to one shared cancellation flag. Every copy observes the
 * same state, so the caller keeps one copy and hands others to the pipeline.
 *
 * Cancellation is cooperative: the pipeline checks the token before each
 * authorization chunk, before claiming each item, before each multipart part,
 * and the HTTP transport polls it while a transfer is running. It never kills
 * a transfer that cannot be aborted mid-write.
 */
class CancellationToken {
public:
    CancellationToken();

    /// Signal cancellation. Idempotent; wakes every WaitFor() sleeper.
    void Cancel();

    bool IsCancelled() const;

    /**
     * Sleep for up to `duration`, returning early on cancellation
     * @return true if cancellation was signalled
     */
    bool WaitFor(std::chrono::milliseconds duration) const;

private:
    struct State {
        std::atomic<bool> cancelled{false};
        mutable std::mutex mutex;
        mutable std::condition_variable cv;
    };

    std::shared_ptr<State> state_;
};

} // namespace mediadrop
