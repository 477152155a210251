#include "execution/process_line_source.hpp"

#include <sstream>

#include "process/process_errors.hpp"
#include "protocol/result_protocol.hpp"
#include "utils/logging.hpp"

namespace execbox::execution {
std::string TimeoutMessage(std::chrono::milliseconds timeout) {
    std::ostringstream oss;
    oss << "Execution timed out after " << static_cast<double>(timeout.count()) / 1000.0 << "s";
    return oss.str();
}

std::optional<std::string> SummaryLine(const protocol::ExecutionResult& result, bool sentinel_found) {
    if (!sentinel_found) {
        return std::nullopt;
    }
    if (result.success) {
        if (result.result.is_null()) {
            return std::nullopt;
        }
        return "Result: " + result.result.ToDisplayString();
    }
    return result.error_type.value_or(protocol::kCommandError) + ": " + result.error.value_or("");
}

ProcessLineSource::ProcessLineSource(process::ProcessRegistry& registry,
                                     std::string process_id,
                                     std::shared_ptr<process::EventChannel> channel,
                                     StreamMode mode,
                                     std::optional<std::chrono::milliseconds> timeout,
                                     std::unique_ptr<TempScript> script)
    : registry_(registry),
      process_id_(std::move(process_id)),
      channel_(std::move(channel)),
      mode_(mode),
      timeout_(timeout),
      started_(std::chrono::steady_clock::now()),
      script_(std::move(script)) {}

ProcessLineSource::~ProcessLineSource() {
    try {
        Release();
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kWarn, "stream", std::string("release failed: ") + ex.what());
    }
}

std::optional<std::string> ProcessLineSource::Next() {
    while (pending_.empty() && !done_) {
        process::ProcessEvent event;
        auto status = process::EventChannel::Status::kEvent;
        if (timeout_) {
            status = channel_->Next(event, started_ + *timeout_);
        } else if (!channel_->Next(event)) {
            status = process::EventChannel::Status::kClosed;
        }
        switch (status) {
            case process::EventChannel::Status::kEvent:
                Consume(event);
                break;
            case process::EventChannel::Status::kTimeout:
                TimeOut();
                break;
            case process::EventChannel::Status::kClosed:
                Finish(registry_.GetProcessInfo(process_id_).exit_code.value_or(-1));
                break;
        }
    }
    if (pending_.empty()) {
        return std::nullopt;
    }
    auto line = std::move(pending_.front());
    pending_.pop_front();
    return line;
}

void ProcessLineSource::Cancel() {
    done_ = true;
    pending_.clear();
    Release();
}

void ProcessLineSource::Consume(const process::ProcessEvent& event) {
    if (const auto* output = std::get_if<process::OutputEvent>(&event)) {
        auto& splitter = output->stream == process::OutputStream::kStdout ? stdout_lines_ : stderr_lines_;
        for (const auto& line : splitter.Feed(output->data)) {
            EmitLine(line);
        }
        return;
    }
    if (const auto* completed = std::get_if<process::ProcessCompletedEvent>(&event)) {
        Finish(completed->exit_code);
    }
}

void ProcessLineSource::EmitLine(const std::string& line) {
    if (mode_ == StreamMode::kCode) {
        const auto pos = line.find(protocol::kResultSentinel);
        if (pos != std::string::npos) {
            if (pos > 0) {
                pending_.push_back(line.substr(0, pos));
            }
            return;
        }
    }
    pending_.push_back(line);
}

void ProcessLineSource::Finish(int exit_code) {
    if (auto line = stdout_lines_.Flush()) {
        EmitLine(*line);
    }
    if (auto line = stderr_lines_.Flush()) {
        EmitLine(*line);
    }
    if (mode_ == StreamMode::kCode) {
        const auto output = registry_.GetOutput(process_id_);
        const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();
        const auto result = protocol::Decode(output.stdout_text, output.stderr_text, exit_code, elapsed);
        const bool sentinel_found = protocol::ExtractSentinel(output.stdout_text).has_value();
        if (auto summary = SummaryLine(result, sentinel_found)) {
            pending_.push_back(std::move(*summary));
        }
    }
    done_ = true;
    Release();
}

void ProcessLineSource::TimeOut() {
    utils::Log(utils::LogLevel::kWarn, "stream", "timeout id=" + process_id_);
    registry_.KillProcess(process_id_);
    if (auto line = stdout_lines_.Flush()) {
        EmitLine(*line);
    }
    if (auto line = stderr_lines_.Flush()) {
        EmitLine(*line);
    }
    pending_.push_back(std::string(protocol::kTimeoutError) + ": " + TimeoutMessage(*timeout_));
    done_ = true;
    Release();
}

void ProcessLineSource::Release() {
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
