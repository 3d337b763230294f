#include "ProgressReporter.h"

#include <algorithm>

namespace mediadrop {

ProgressReporter::ProgressReporter(uint64_t total, ProgressCallback callback)
    : total_(total), callback_(std::move(callback)), ceiling_(total) {
}

void ProgressReporter::Add(uint64_t amount) {
    if (amount == 0) {
        return;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    current_ = std::min(total_, current_ + amount);
    Publish(lock);
}

void ProgressReporter::Restart() {
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = 0;
}

void ProgressReporter::SetCeiling(uint64_t ceiling) {
    std::lock_guard<std::mutex> lock(mutex_);
    ceiling_ = std::min(total_, ceiling);
}

void ProgressReporter::ReleaseCeiling() {
    std::unique_lock<std::mutex> lock(mutex_);
    ceiling_ = total_;
    Publish(lock);
}

void ProgressReporter::Publish(std::unique_lock<std::mutex>& lock) {
    const uint64_t visible = std::min(current_, ceiling_);
    if (any_reported_ && visible <= reported_) {
        return;
    }
    reported_ = visible;
    any_reported_ = true;
    const uint64_t ticket = next_ticket_++;
    lock.unlock();

    // Tickets are handed out in value order; deliver them in the same order
    std::unique_lock<std::mutex> delivery(delivery_mutex_);
    delivery_cv_.wait(delivery, [&]() { return delivered_ == ticket; });
    ++delivered_;
    delivery_cv_.notify_all();

    if (callback_) {
        callback_(visible, total_);
    }
}

uint64_t ProgressReporter::Current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

uint64_t ProgressReporter::Reported() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reported_;
}

} // namespace mediadrop
