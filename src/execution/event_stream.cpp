#include "execution/event_stream.hpp"

#include <deque>
#include <exception>

#include "utils/logging.hpp"

namespace execbox::execution {
namespace {

class VectorEventSource : public EventSource {
public:
    explicit VectorEventSource(std::vector<process::ProcessEvent> events)
        : events_(events.begin(), events.end()) {}

    std::optional<process::ProcessEvent> Next() override {
        if (events_.empty()) {
            return std::nullopt;
        }
        auto event = std::move(events_.front());
        events_.pop_front();
        return event;
    }

    void Cancel() override { events_.clear(); }

private:
    std::deque<process::ProcessEvent> events_;
};

}  // namespace

EventStream::EventStream(std::unique_ptr<EventSource> source)
    : source_(std::move(source)),
      finished_(source_ == nullptr) {}

EventStream::~EventStream() {
    Abandon();
}

EventStream::EventStream(EventStream&& other) noexcept
    : source_(std::move(other.source_)),
      finished_(other.finished_) {
    other.finished_ = true;
}

EventStream& EventStream::operator=(EventStream&& other) noexcept {
    if (this != &other) {
        Abandon();
        source_ = std::move(other.source_);
        finished_ = other.finished_;
        other.finished_ = true;
    }
    return *this;
}

EventStream EventStream::FromEvents(std::vector<process::ProcessEvent> events) {
    return EventStream(std::make_unique<VectorEventSource>(std::move(events)));
}

EventStream EventStream::FromResult(const std::string& process_id,
                                    const std::string& command,
                                    const protocol::ExecutionResult& result) {
    std::vector<process::ProcessEvent> events;
    events.push_back(process::ProcessStartedEvent{process_id, command});
    if (!result.stdout_text.empty()) {
        events.push_back(process::OutputEvent{process_id, process::OutputStream::kStdout, result.stdout_text});
    }
    if (!result.stderr_text.empty()) {
        events.push_back(process::OutputEvent{process_id, process::OutputStream::kStderr, result.stderr_text});
    } else if (!result.success && result.error) {
        events.push_back(process::OutputEvent{
            process_id, process::OutputStream::kStderr,
            result.error_type.value_or(protocol::kCommandError) + ": " + *result.error + "\n"});
    }
    int exit_code = result.exit_code.value_or(result.success ? 0 : 1);
    if (!result.success && exit_code == 0) {
        exit_code = 1;
    }
    events.push_back(process::ProcessCompletedEvent{process_id, exit_code});
    return FromEvents(std::move(events));
}

std::optional<process::ProcessEvent> EventStream::Next() {
    if (finished_) {
        return std::nullopt;
    }
    auto event = source_->Next();
    if (!event) {
        finished_ = true;
        source_.reset();
    }
    return event;
}

std::vector<process::ProcessEvent> EventStream::Collect() {
    std::vector<process::ProcessEvent> events;
    while (auto event = Next()) {
        events.push_back(std::move(*event));
    }
    return events;
}

void EventStream::Abandon() noexcept {
    if (!finished_ && source_) {
        try {
            source_->Cancel();
        } catch (const std::exception& ex) {
            utils::Log(utils::LogLevel::kWarn, "stream", std::string("cancel failed: ") + ex.what());
        }
    }
    source_.reset();
    finished_ = true;
}

}  // namespace execbox::execution
