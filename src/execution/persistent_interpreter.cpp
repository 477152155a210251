#include "execution/persistent_interpreter.hpp"

#include <deque>

#include "execution/process_line_source.hpp"
#include "process/process_errors.hpp"
#include "protocol/result_protocol.hpp"
#include "utils/logging.hpp"

namespace execbox::execution {
namespace {

constexpr auto kUnboundedWait = std::chrono::hours(24 * 365);

double SecondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

std::string Before(const std::string& text, const std::string& marker) {
    const auto pos = text.find(marker);
    return pos == std::string::npos ? text : text.substr(0, pos);
}

}  // namespace

// Streams the output of one request. Holds the interpreter lock until the
// reply is complete so requests never interleave.
class InterpreterLineSource : public LineSource {
public:
    InterpreterLineSource(PersistentInterpreter& interpreter,
                          std::unique_lock<std::mutex> lock,
                          std::string process_id,
                          std::shared_ptr<process::EventChannel> channel,
                          std::string marker,
                          std::optional<std::chrono::milliseconds> timeout)
        : interpreter_(interpreter),
          lock_(std::move(lock)),
          process_id_(std::move(process_id)),
          channel_(std::move(channel)),
          marker_(std::move(marker)),
          timeout_(timeout),
          started_(std::chrono::steady_clock::now()) {}

    ~InterpreterLineSource() override {
        if (lock_.owns_lock()) {
            Detach();
            lock_.unlock();
        }
    }

    std::optional<std::string> Next() override {
        while (pending_.empty() && !done_) {
            process::ProcessEvent event;
            auto status = process::EventChannel::Status::kEvent;
            if (timeout_) {
                status = channel_->Next(event, started_ + *timeout_);
            } else if (!channel_->Next(event)) {
                status = process::EventChannel::Status::kClosed;
            }
            if (status == process::EventChannel::Status::kTimeout) {
                pending_.push_back(std::string(protocol::kTimeoutError) + ": " + TimeoutMessage(*timeout_));
                Close(false);
            } else if (status == process::EventChannel::Status::kClosed) {
                Finish(false, -1);
            } else {
                Consume(event);
            }
        }
        if (pending_.empty()) {
            return std::nullopt;
        }
        auto line = std::move(pending_.front());
        pending_.pop_front();
        return line;
    }

    void Cancel() override {
        pending_.clear();
        if (!done_) {
            Close(false);
        }
    }

private:
    void Consume(const process::ProcessEvent& event) {
        if (const auto* output = std::get_if<process::OutputEvent>(&event)) {
            const bool is_stdout = output->stream == process::OutputStream::kStdout;
            auto& capture = is_stdout ? stdout_capture_ : stderr_capture_;
            auto& splitter = is_stdout ? stdout_lines_ : stderr_lines_;
            auto& seen_marker = is_stdout ? stdout_done_ : stderr_done_;
            capture += output->data;
            for (const auto& line : splitter.Feed(output->data)) {
                if (seen_marker) {
                    continue;
                }
                const auto marker_pos = line.find(marker_);
                if (marker_pos != std::string::npos) {
                    seen_marker = true;
                    if (marker_pos > 0) {
                        Emit(line.substr(0, marker_pos));
                    }
                    continue;
                }
                Emit(line);
            }
            if (stdout_done_ && stderr_done_) {
                Finish(true, 0);
            }
            return;
        }
        if (const auto* completed = std::get_if<process::ProcessCompletedEvent>(&event)) {
            Finish(false, completed->exit_code);
        }
    }

    void Emit(const std::string& line) {
        const auto pos = line.find(protocol::kResultSentinel);
        if (pos == std::string::npos) {
            pending_.push_back(line);
        } else if (pos > 0) {
            pending_.push_back(line.substr(0, pos));
        }
    }

    void Finish(bool alive, int exit_code) {
        if (!stdout_done_) {
            if (auto line = stdout_lines_.Flush()) {
                Emit(*line);
            }
        }
        if (!stderr_done_) {
            if (auto line = stderr_lines_.Flush()) {
                Emit(*line);
            }
        }
        const auto stdout_text = Before(stdout_capture_, marker_);
        const auto stderr_text = Before(stderr_capture_, marker_);
        const auto result = protocol::Decode(stdout_text, stderr_text, exit_code, SecondsSince(started_));
        if (auto summary = SummaryLine(result, protocol::ExtractSentinel(stdout_text).has_value())) {
            pending_.push_back(std::move(*summary));
        }
        Close(alive);
    }

    void Close(bool alive) {
        done_ = true;
        if (!lock_.owns_lock()) {
            return;
        }
        if (alive) {
            Detach();
        } else {
            interpreter_.DiscardLocked();
        }
        lock_.unlock();
    }

    void Detach() {
        try {
            interpreter_.registry_.Unsubscribe(process_id_, channel_);
        } catch (const process::ProcessNotFoundError&) {
            utils::Log(utils::LogLevel::kDebug, "interpreter", "already released id=" + process_id_);
        }
    }

    PersistentInterpreter& interpreter_;
    std::unique_lock<std::mutex> lock_;
    const std::string process_id_;
    std::shared_ptr<process::EventChannel> channel_;
    const std::string marker_;
    const std::optional<std::chrono::milliseconds> timeout_;
    const std::chrono::steady_clock::time_point started_;

    std::deque<std::string> pending_;
    LineSplitter stdout_lines_;
    LineSplitter stderr_lines_;
    std::string stdout_capture_;
    std::string stderr_capture_;
    bool stdout_done_ = false;
    bool stderr_done_ = false;
    bool done_ = false;
};

PersistentInterpreter::PersistentInterpreter(process::ProcessRegistry& registry,
                                             std::string executable,
                                             std::string cwd,
                                             process::Environment env)
    : registry_(registry),
      executable_(std::move(executable)),
      cwd_(std::move(cwd)),
      env_(std::move(env)) {}

PersistentInterpreter::~PersistentInterpreter() {
    Stop();
}

protocol::ExecutionResult PersistentInterpreter::Execute(const std::string& code,
                                                         std::optional<std::chrono::milliseconds> timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto started = std::chrono::steady_clock::now();

    std::string process_id;
    try {
        process_id = EnsureStartedLocked();
    } catch (const process::LaunchError& ex) {
        return protocol::MakeFailure(ex.what(), protocol::kCommandNotFoundError,
                                     SecondsSince(started), "", "", std::nullopt);
    }

    // Each request starts from empty buffers, so the interpreter's capture
    // never holds more than one reply.
    registry_.TakeOutput(process_id);
    const auto request_id = NextRequestId();
    const auto marker = protocol::DoneMarker(request_id) + "\n";

    try {
        registry_.WriteInput(process_id, protocol::EncodeRequest(request_id, code));
    } catch (const process::ProcessError& ex) {
        DiscardLocked();
        return protocol::MakeFailure(std::string("Interpreter unavailable: ") + ex.what(),
                                     protocol::kCommandError, SecondsSince(started), "", "", std::nullopt);
    }

    const bool replied = registry_.WaitForOutput(
        process_id,
        [&](const std::string& out, const std::string& err) {
            return out.find(marker) != std::string::npos && err.find(marker) != std::string::npos;
        },
        timeout.value_or(std::chrono::duration_cast<std::chrono::milliseconds>(kUnboundedWait)));

    const auto after = registry_.TakeOutput(process_id);
    const auto stdout_text = Before(after.stdout_text, marker);
    const auto stderr_text = Before(after.stderr_text, marker);

    if (!replied) {
        const auto exit_code = after.exit_code;
        DiscardLocked();
        if (!exit_code) {
            utils::Log(utils::LogLevel::kWarn, "interpreter", "timeout, interpreter discarded id=" + process_id);
            return protocol::MakeFailure(timeout ? TimeoutMessage(*timeout) : "Interpreter stopped responding",
                                         protocol::kTimeoutError,
                                         SecondsSince(started), stdout_text, stderr_text, std::nullopt);
        }
        utils::Log(utils::LogLevel::kWarn, "interpreter",
                   "interpreter exited id=" + process_id + " exit_code=" + std::to_string(*exit_code));
        return protocol::Decode(stdout_text, stderr_text, *exit_code, SecondsSince(started));
    }
    return protocol::Decode(stdout_text, stderr_text, 0, SecondsSince(started));
}

LineStream PersistentInterpreter::ExecuteStream(const std::string& code,
                                                std::optional<std::chrono::milliseconds> timeout) {
    std::unique_lock<std::mutex> lock(mutex_);

    std::string process_id;
    try {
        process_id = EnsureStartedLocked();
    } catch (const process::LaunchError& ex) {
        return LineStream::FromLines({std::string(protocol::kCommandNotFoundError) + ": " + ex.what()});
    }

    registry_.TakeOutput(process_id);
    const auto channel = registry_.Subscribe(process_id);
    const auto request_id = NextRequestId();
    try {
        registry_.WriteInput(process_id, protocol::EncodeRequest(request_id, code));
    } catch (const process::ProcessError& ex) {
        DiscardLocked();
        return LineStream::FromLines({std::string(protocol::kCommandError) + ": " + ex.what()});
    }
    return LineStream(std::make_unique<InterpreterLineSource>(
        *this, std::move(lock), process_id, channel, protocol::DoneMarker(request_id), timeout));
}

void PersistentInterpreter::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    EnsureStartedLocked();
}

void PersistentInterpreter::Stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    DiscardLocked();
}

std::optional<std::string> PersistentInterpreter::process_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return process_id_;
}

std::string PersistentInterpreter::EnsureStartedLocked() {
    if (process_id_) {
        try {
            if (registry_.GetProcessInfo(*process_id_).is_running) {
                return *process_id_;
            }
        } catch (const process::ProcessNotFoundError&) {
            process_id_.reset();
        }
        DiscardLocked();
    }
    process::StartOptions options{};
    options.keep_stdin_open = true;
    process_id_ = registry_.StartProcess(executable_,
                                         {"-u", "-c", protocol::InterpreterServerProgram()},
                                         cwd_,
                                         env_,
                                         options);
    utils::Log(utils::LogLevel::kInfo, "interpreter", "started id=" + *process_id_);
    return *process_id_;
}

void PersistentInterpreter::DiscardLocked() {
    if (!process_id_) {
        return;
    }
    const auto process_id = *process_id_;
    process_id_.reset();
    try {
        registry_.ReleaseProcess(process_id);
    } catch (const process::ProcessNotFoundError&) {
        utils::Log(utils::LogLevel::kDebug, "interpreter", "already released id=" + process_id);
    }
}

std::string PersistentInterpreter::NextRequestId() {
    return std::to_string(next_request_++);
}

}  // namespace execbox::execution
