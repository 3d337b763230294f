#include "CancellationToken.h"

namespace mediadrop {

CancellationToken::CancellationToken()
    : state_(std::make_shared<State>()) {
}

void CancellationToken::Cancel() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled.store(true);
    }
    state_->cv.notify_all();
}

bool CancellationToken::IsCancelled() const {
    return state_->cancelled.load();
}

bool CancellationToken::WaitFor(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, duration, [this] { return state_->cancelled.load(); });
}

} // namespace mediadrop
