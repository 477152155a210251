#include "process/process_handle.hpp"

#include <algorithm>
#include <cerrno>

#include <signal.h>
#include <sys/wait.h>

#include "utils/common.hpp"

namespace execbox::process {

ProcessHandle::ProcessHandle(std::string process_id,
                             std::string command,
                             std::vector<std::string> args,
                             std::string cwd)
    : process_id_(std::move(process_id)),
      command_(std::move(command)),
      args_(std::move(args)),
      cwd_(std::move(cwd)),
      created_at_(utils::Now()) {}

ProcessHandle::~ProcessHandle() {
    std::lock_guard<std::mutex> lock(pump_mutex_);
    if (pump_.joinable()) {
        if (pump_.get_id() == std::this_thread::get_id()) {
            pump_.detach();
        } else {
            pump_.join();
        }
    }
}

void ProcessHandle::SetPid(pid_t pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    pid_ = pid;
}

pid_t ProcessHandle::pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pid_;
}

void ProcessHandle::AppendOutput(OutputStream stream, const std::string& data) {
    if (data.empty()) {
        return;
    }
    std::vector<std::shared_ptr<EventChannel>> subscribers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stream == OutputStream::kStdout) {
            stdout_ += data;
        } else {
            stderr_ += data;
        }
        combined_ += data;
        subscribers = subscribers_;
    }
    changed_.notify_all();
    const OutputEvent event{process_id_, stream, data};
    for (const auto& channel : subscribers) {
        channel->Push(event);
    }
}

ProcessHandle::ReapStatus ProcessHandle::TryReap(int& wait_status, int& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reaped_) {
        return ReapStatus::kReaped;
    }
    while (true) {
        const pid_t waited = ::waitpid(pid_, &wait_status, WNOHANG);
        if (waited == pid_) {
            reaped_ = true;
            return ReapStatus::kReaped;
        }
        if (waited == 0) {
            return ReapStatus::kRunning;
        }
        if (errno != EINTR) {
            error = errno;
            reaped_ = true;
            return ReapStatus::kFailed;
        }
    }
}

bool ProcessHandle::MarkTerminated(int exit_code) {
    std::vector<std::shared_ptr<EventChannel>> subscribers;
    int recorded = exit_code;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ProcessState::kRunning) {
            return false;
        }
        if (kill_requested_) {
            state_ = ProcessState::kKilled;
            recorded = kInterruptedExitCode;
        } else {
            state_ = ProcessState::kCompleted;
        }
        exit_code_ = recorded;
        reaped_ = true;
        subscribers.swap(subscribers_);
    }
    changed_.notify_all();
    for (const auto& channel : subscribers) {
        channel->Push(ProcessCompletedEvent{process_id_, recorded});
        channel->Close();
    }
    return true;
}

bool ProcessHandle::RequestKill(int signal_number) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ProcessState::kRunning || reaped_ || pid_ <= 0) {
        return false;
    }
    kill_requested_ = true;
    SignalLocked(signal_number);
    return true;
}

bool ProcessHandle::Signal(int signal_number) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reaped_ || pid_ <= 0) {
        return false;
    }
    SignalLocked(signal_number);
    return true;
}

void ProcessHandle::SignalLocked(int signal_number) {
    if (::kill(-pid_, signal_number) != 0) {
        ::kill(pid_, signal_number);
    }
}

ProcessState ProcessHandle::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool ProcessHandle::IsRunning() const {
    return state() == ProcessState::kRunning;
}

std::optional<int> ProcessHandle::exit_code() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exit_code_;
}

ProcessOutput ProcessHandle::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ProcessOutput{stdout_, stderr_, combined_, exit_code_};
}

ProcessOutput ProcessHandle::TakeOutput() {
    std::lock_guard<std::mutex> lock(mutex_);
    ProcessOutput output{std::move(stdout_), std::move(stderr_), std::move(combined_), exit_code_};
    stdout_.clear();
    stderr_.clear();
    combined_.clear();
    return output;
}

ProcessInfo ProcessHandle::Info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ProcessInfo info{};
    info.process_id = process_id_;
    info.command = command_;
    info.args = args_;
    info.cwd = cwd_;
    info.created_at = created_at_;
    info.is_running = state_ == ProcessState::kRunning;
    info.exit_code = exit_code_;
    return info;
}

int ProcessHandle::WaitForExit() const {
    std::unique_lock<std::mutex> lock(mutex_);
    changed_.wait(lock, [this] { return state_ != ProcessState::kRunning; });
    return exit_code_.value_or(-1);
}

std::optional<int> ProcessHandle::WaitForExit(std::chrono::steady_clock::time_point deadline) const {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!changed_.wait_until(lock, deadline, [this] { return state_ != ProcessState::kRunning; })) {
        return std::nullopt;
    }
    return exit_code_;
}

bool ProcessHandle::WaitForOutput(const OutputPredicate& predicate,
                                  std::chrono::steady_clock::time_point deadline) const {
    std::unique_lock<std::mutex> lock(mutex_);
    changed_.wait_until(lock, deadline, [&] {
        return predicate(stdout_, stderr_) || state_ != ProcessState::kRunning;
    });
    return predicate(stdout_, stderr_);
}

void ProcessHandle::Publish(const ProcessEvent& event) {
    std::vector<std::shared_ptr<EventChannel>> subscribers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscribers = subscribers_;
    }
    for (const auto& channel : subscribers) {
        channel->Push(event);
    }
}

void ProcessHandle::Subscribe(std::shared_ptr<EventChannel> channel) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ProcessState::kRunning) {
            subscribers_.push_back(std::move(channel));
            return;
        }
    }
    channel->Push(ProcessCompletedEvent{process_id_, exit_code().value_or(-1)});
    channel->Close();
}

void ProcessHandle::Unsubscribe(const std::shared_ptr<EventChannel>& channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(std::remove(subscribers_.begin(), subscribers_.end(), channel),
                       subscribers_.end());
}

void ProcessHandle::AttachPump(std::thread pump) {
    std::lock_guard<std::mutex> lock(pump_mutex_);
    pump_ = std::move(pump);
}

void ProcessHandle::JoinPump() {
    std::lock_guard<std::mutex> lock(pump_mutex_);
    if (pump_.joinable() && pump_.get_id() != std::this_thread::get_id()) {
        pump_.join();
    }
}

}  // namespace execbox::process
