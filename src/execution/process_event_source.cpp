#include "execution/process_event_source.hpp"

#include <exception>

#include "process/process_errors.hpp"
#include "protocol/result_protocol.hpp"
#include "utils/logging.hpp"

namespace execbox::execution {
namespace {

// Drops the sentinel and its payload from each line of `text`; text before
// the sentinel on the same line is kept.
std::string StripSentinel(const std::string& text) {
    std::string kept;
    std::size_t start = 0;
    while (start < text.size()) {
        const auto end = text.find('\n', start);
        const auto line_end = end == std::string::npos ? text.size() : end;
        const auto line = text.substr(start, line_end - start);
        const auto pos = line.find(protocol::kResultSentinel);
        if (pos == std::string::npos) {
            kept += line;
            if (end != std::string::npos) {
                kept += '\n';
            }
        } else if (pos > 0) {
            kept += line.substr(0, pos);
            kept += '\n';
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return kept;
}

}  // namespace

ProcessEventSource::ProcessEventSource(process::ProcessRegistry& registry,
                                       std::string process_id,
                                       std::shared_ptr<process::EventChannel> channel,
                                       StreamMode mode,
                                       std::string display_command,
                                       std::optional<std::chrono::milliseconds> timeout,
                                       std::unique_ptr<TempScript> script)
    : registry_(registry),
      process_id_(std::move(process_id)),
      channel_(std::move(channel)),
      mode_(mode),
      display_command_(std::move(display_command)),
      timeout_(timeout),
      started_(std::chrono::steady_clock::now()),
      script_(std::move(script)) {}

ProcessEventSource::~ProcessEventSource() {
    try {
        Release();
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kWarn, "stream", std::string("release failed: ") + ex.what());
    }
}

std::optional<process::ProcessEvent> ProcessEventSource::Next() {
    while (pending_.empty() && !done_) {
        process::ProcessEvent event;
        auto status = process::EventChannel::Status::kEvent;
        if (timeout_ && !timed_out_) {
            status = channel_->Next(event, started_ + *timeout_);
        } else if (!channel_->Next(event)) {
            status = process::EventChannel::Status::kClosed;
        }
        switch (status) {
            case process::EventChannel::Status::kEvent:
                Consume(std::move(event));
                break;
            case process::EventChannel::Status::kTimeout:
                utils::Log(utils::LogLevel::kWarn, "stream", "timeout id=" + process_id_);
                timed_out_ = true;
                registry_.KillProcess(process_id_);
                break;
            case process::EventChannel::Status::kClosed:
                FlushStdout();
                done_ = true;
                Release();
                break;
        }
    }
    if (pending_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(pending_.front());
    pending_.pop_front();
    return event;
}

void ProcessEventSource::Cancel() {
    done_ = true;
    pending_.clear();
    Release();
}

void ProcessEventSource::Consume(process::ProcessEvent event) {
    if (auto* started = std::get_if<process::ProcessStartedEvent>(&event)) {
        started->command = display_command_;
        pending_.push_back(std::move(event));
        return;
    }
    if (const auto* output = std::get_if<process::OutputEvent>(&event)) {
        if (mode_ == StreamMode::kCode && output->stream == process::OutputStream::kStdout) {
            RelayStdout(output->data);
        } else {
            pending_.push_back(std::move(event));
        }
        return;
    }
    FlushStdout();
    pending_.push_back(std::move(event));
    done_ = true;
    Release();
}

// Holds back a trailing partial line until it is complete, so a sentinel
// split across chunks is still recognized.
void ProcessEventSource::RelayStdout(const std::string& data) {
    held_stdout_ += data;
    const auto last_newline = held_stdout_.rfind('\n');
    if (last_newline == std::string::npos) {
        return;
    }
    const auto complete = held_stdout_.substr(0, last_newline + 1);
    held_stdout_.erase(0, last_newline + 1);
    PushStdout(StripSentinel(complete));
}

void ProcessEventSource::FlushStdout() {
    if (held_stdout_.empty()) {
        return;
    }
    std::string rest;
    rest.swap(held_stdout_);
    PushStdout(StripSentinel(rest));
}

void ProcessEventSource::PushStdout(const std::string& text) {
    if (!text.empty()) {
        pending_.push_back(process::OutputEvent{process_id_, process::OutputStream::kStdout, text});
    }
}

void ProcessEventSource::Release() {
    if (released_) {
        return;
    }
    released_ = true;
    try {
        registry_.ReleaseProcess(process_id_);
    } catch (const process::ProcessNotFoundError&) {
        utils::Log(utils::LogLevel::kDebug, "stream", "already released id=" + process_id_);
    }
    script_.reset();
}

}  // namespace execbox::execution
