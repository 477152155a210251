#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/process/pipe.hpp>

#include "process/event_channel.hpp"
#include "process/process_handle.hpp"
#include "process/process_manager.hpp"

namespace execbox::process {

struct StartOptions {
    // Merge stderr into the stdout pipe at spawn time.
    bool combine_stderr = false;
    // Keep the stdin pipe open for WriteInput; otherwise the child sees EOF.
    bool keep_stdin_open = false;
    // Attached before launch so it observes ProcessStartedEvent.
    std::shared_ptr<EventChannel> subscriber;
};

// Process table owned by one execution environment. Safe for concurrent
// callers; operations on the same id serialize on that handle.
class ProcessRegistry : public ProcessManager {
public:
    ProcessRegistry();
    ~ProcessRegistry() override;

    ProcessRegistry(const ProcessRegistry&) = delete;
    ProcessRegistry& operator=(const ProcessRegistry&) = delete;

    std::string StartProcess(const std::string& command,
                             const std::vector<std::string>& args,
                             const std::string& cwd,
                             const Environment& env) override;
    std::string StartProcess(const std::string& command,
                             const std::vector<std::string>& args,
                             const std::string& cwd,
                             const Environment& env,
                             const StartOptions& options);

    ProcessOutput GetOutput(const std::string& process_id) override;
    ProcessInfo GetProcessInfo(const std::string& process_id) override;
    int WaitForExit(const std::string& process_id) override;
    std::optional<int> WaitForExit(const std::string& process_id,
                                   std::chrono::milliseconds timeout) override;
    void KillProcess(const std::string& process_id) override;
    void ReleaseProcess(const std::string& process_id) override;
    std::vector<std::string> ListProcesses() override;

    std::shared_ptr<EventChannel> Subscribe(const std::string& process_id);
    void Unsubscribe(const std::string& process_id, const std::shared_ptr<EventChannel>& channel);
    // Returns the output buffered so far and drops it from the handle.
    ProcessOutput TakeOutput(const std::string& process_id);
    bool WaitForOutput(const std::string& process_id,
                       const ProcessHandle::OutputPredicate& predicate,
                       std::chrono::milliseconds timeout);
    void WriteInput(const std::string& process_id, const std::string& data);
    void CloseInput(const std::string& process_id);

    // Kills and releases every registered process.
    void Shutdown();

private:
    struct Entry {
        std::shared_ptr<ProcessHandle> handle;
        std::mutex input_mutex;
        std::unique_ptr<boost::process::pipe> stdin_pipe;
    };

    std::shared_ptr<Entry> Find(const std::string& process_id) const;
    std::string NextProcessId();
    static void Terminate(ProcessHandle& handle);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> processes_;
    std::mutex spawn_mutex_;
    std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace execbox::process
