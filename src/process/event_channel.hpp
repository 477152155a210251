#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>

#include "process/events.hpp"

namespace execbox::process {

// Unbounded single-consumer queue of process events. Closing is single-fire;
// events already queued stay readable after Close().
class EventChannel {
public:
    enum class Status {
        kEvent,
        kClosed,
        kTimeout
    };

    void Push(ProcessEvent event);
    void Close();

    bool Next(ProcessEvent& event);
    Status Next(ProcessEvent& event, std::chrono::steady_clock::time_point deadline);

    bool IsClosed() const;
    std::size_t Size() const;

private:
    std::queue<ProcessEvent> events_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

}  // namespace execbox::process
