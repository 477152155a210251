#include "process/event_channel.hpp"

namespace execbox::process {

void EventChannel::Push(ProcessEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        events_.push(std::move(event));
    }
    cv_.notify_one();
}

void EventChannel::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool EventChannel::Next(ProcessEvent& event) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !events_.empty() || closed_; });
    if (events_.empty()) {
        return false;
    }
    event = std::move(events_.front());
    events_.pop();
    return true;
}

EventChannel::Status EventChannel::Next(ProcessEvent& event,
                                        std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_until(lock, deadline, [this] { return !events_.empty() || closed_; })) {
        return Status::kTimeout;
    }
    if (events_.empty()) {
        return Status::kClosed;
    }
    event = std::move(events_.front());
    events_.pop();
    return Status::kEvent;
}

bool EventChannel::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t EventChannel::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

}  // namespace execbox::process
