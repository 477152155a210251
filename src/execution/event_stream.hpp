#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "process/events.hpp"
#include "protocol/execution_result.hpp"

namespace execbox::execution {

class EventSource {
public:
    virtual ~EventSource() = default;
    // Blocks until the next event is available; nullopt once exhausted.
    virtual std::optional<process::ProcessEvent> Next() = 0;
    virtual void Cancel() = 0;
};

// Single-use sequence of process events: one ProcessStartedEvent, output
// chunks, then one ProcessCompletedEvent. Dropping it early cancels the
// producer.
class EventStream {
public:
    explicit EventStream(std::unique_ptr<EventSource> source);
    ~EventStream();

    EventStream(EventStream&& other) noexcept;
    EventStream& operator=(EventStream&& other) noexcept;
    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    static EventStream FromEvents(std::vector<process::ProcessEvent> events);
    // Replays a finished execution: started, stdout, stderr, completed. A
    // failure without stderr reports "<Type>: <error>" on stderr, and its
    // exit code is never 0.
    static EventStream FromResult(const std::string& process_id,
                                  const std::string& command,
                                  const protocol::ExecutionResult& result);

    std::optional<process::ProcessEvent> Next();
    std::vector<process::ProcessEvent> Collect();
    bool finished() const { return finished_; }

private:
    void Abandon() noexcept;

    std::unique_ptr<EventSource> source_;
    bool finished_ = false;
};

}  // namespace execbox::execution
