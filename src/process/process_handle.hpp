#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

#include "process/event_channel.hpp"
#include "process/events.hpp"
#include "process/process_manager.hpp"

namespace execbox::process {

enum class ProcessState {
    kRunning,
    kCompleted,
    kKilled
};

// Shared state of one supervised process. The pump thread writes output and
// the terminal transition; callers read snapshots and wait on it. All members
// are guarded by one mutex so operations on a handle are linearizable.
class ProcessHandle {
public:
    using OutputPredicate = std::function<bool(const std::string& stdout_text,
                                               const std::string& stderr_text)>;

    ProcessHandle(std::string process_id,
                  std::string command,
                  std::vector<std::string> args,
                  std::string cwd);
    ~ProcessHandle();

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    const std::string& process_id() const { return process_id_; }
    const std::string& command() const { return command_; }

    void SetPid(pid_t pid);
    pid_t pid() const;

    enum class ReapStatus {
        kRunning,
        kReaped,
        kFailed
    };

    void AppendOutput(OutputStream stream, const std::string& data);
    // waitpid(WNOHANG) under the handle lock, so Signal never reaches a pid
    // that was already reaped. `error` holds errno on kFailed.
    ReapStatus TryReap(int& wait_status, int& error);
    // Performs the single Running -> terminal transition. Returns false when
    // the handle was already terminal.
    bool MarkTerminated(int exit_code);

    // Marks the kill and signals the process group while the child is still
    // unreaped. Returns false when there was nothing left to kill.
    bool RequestKill(int signal_number);
    // Signals the process group; a no-op once the child is reaped.
    bool Signal(int signal_number);

    ProcessState state() const;
    bool IsRunning() const;
    std::optional<int> exit_code() const;
    ProcessOutput Snapshot() const;
    // Returns the buffered output and empties the buffers.
    ProcessOutput TakeOutput();
    ProcessInfo Info() const;

    int WaitForExit() const;
    std::optional<int> WaitForExit(std::chrono::steady_clock::time_point deadline) const;
    // Returns true once predicate holds; false on deadline or when the
    // process ends without the predicate holding.
    bool WaitForOutput(const OutputPredicate& predicate,
                       std::chrono::steady_clock::time_point deadline) const;

    void Publish(const ProcessEvent& event);
    void Subscribe(std::shared_ptr<EventChannel> channel);
    void Unsubscribe(const std::shared_ptr<EventChannel>& channel);

    void AttachPump(std::thread pump);
    void JoinPump();

private:
    void SignalLocked(int signal_number);

    const std::string process_id_;
    const std::string command_;
    const std::vector<std::string> args_;
    const std::string cwd_;
    const std::chrono::system_clock::time_point created_at_;

    mutable std::mutex mutex_;
    mutable std::condition_variable changed_;
    ProcessState state_ = ProcessState::kRunning;
    std::optional<int> exit_code_;
    pid_t pid_ = -1;
    bool reaped_ = false;
    bool kill_requested_ = false;
    std::string stdout_;
    std::string stderr_;
    std::string combined_;
    std::vector<std::shared_ptr<EventChannel>> subscribers_;

    std::mutex pump_mutex_;
    std::thread pump_;
};

}  // namespace execbox::process
