#include "process/process_registry.hpp"

#include <boost/process/args.hpp>
#include <boost/process/child.hpp>
#include <boost/process/env.hpp>
#include <boost/process/environment.hpp>
#include <boost/process/exe.hpp>
#include <boost/process/extend.hpp>
#include <boost/process/io.hpp>
#include <boost/process/search_path.hpp>
#include <boost/process/start_dir.hpp>
#include <algorithm>
#include <csignal>
#include <filesystem>
#include <mutex>

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

#include "process/process_errors.hpp"
#include "process/stream_multiplexer.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace execbox::process {
namespace bp = boost::process;

namespace {

constexpr auto kKillGracePeriod = std::chrono::seconds(2);

// Child becomes the leader of a new process group so a kill reaches every
// descendant, e.g. the commands started by /bin/sh -c.
struct NewProcessGroup : bp::extend::handler {
    template <typename Executor>
    void on_exec_setup(Executor&) const {
        ::setpgid(0, 0);
    }
};

void SetCloseOnExec(int fd) {
    if (fd < 0) {
        return;
    }
    const int flags = ::fcntl(fd, F_GETFD);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
    }
}

void IgnoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

}  // namespace

ProcessRegistry::ProcessRegistry() {
    IgnoreSigpipe();
}

ProcessRegistry::~ProcessRegistry() {
    Shutdown();
}

std::string ProcessRegistry::StartProcess(const std::string& command,
                                          const std::vector<std::string>& args,
                                          const std::string& cwd,
                                          const Environment& env) {
    return StartProcess(command, args, cwd, env, StartOptions{});
}

std::string ProcessRegistry::StartProcess(const std::string& command,
                                          const std::vector<std::string>& args,
                                          const std::string& cwd,
                                          const Environment& env,
                                          const StartOptions& options) {
    std::error_code cwd_error;
    const auto effective_cwd = cwd.empty()
        ? std::filesystem::current_path(cwd_error).string()
        : cwd;

    boost::filesystem::path executable = command;
    if (command.find('/') == std::string::npos) {
        executable = bp::search_path(command);
    }
    if (executable.empty()) {
        throw LaunchError(command, "executable not found in PATH");
    }

    bp::environment child_env = boost::this_process::environment();
    for (const auto& [key, value] : env) {
        child_env[key] = value;
    }

    auto handle = std::make_shared<ProcessHandle>(NextProcessId(), command, args, effective_cwd);
    if (options.subscriber) {
        handle->Subscribe(options.subscriber);
    }
    auto entry = std::make_shared<Entry>();
    entry->handle = handle;

    ChildPipes pipes{};
    {
        std::lock_guard<std::mutex> spawn_lock(spawn_mutex_);
        auto stdin_pipe = std::make_unique<bp::pipe>();
        if (!options.combine_stderr) {
            pipes.stderr_pipe = std::make_unique<bp::pipe>();
        }
        try {
            std::unique_ptr<bp::child> child;
            if (options.combine_stderr) {
                child = std::make_unique<bp::child>(
                    bp::exe = executable.string(),
                    bp::args = args,
                    child_env,
                    bp::start_dir = effective_cwd,
                    (bp::std_out & bp::std_err) > pipes.stdout_pipe,
                    bp::std_in < *stdin_pipe,
                    NewProcessGroup{});
            } else {
                child = std::make_unique<bp::child>(
                    bp::exe = executable.string(),
                    bp::args = args,
                    child_env,
                    bp::start_dir = effective_cwd,
                    bp::std_out > pipes.stdout_pipe,
                    bp::std_err > *pipes.stderr_pipe,
                    bp::std_in < *stdin_pipe,
                    NewProcessGroup{});
            }
            handle->SetPid(child->id());
            child->detach();
        } catch (const bp::process_error& ex) {
            utils::Log(utils::LogLevel::kWarn, "process",
                       "launch failed command=" + command + " error=" + ex.what());
            throw LaunchError(command, ex.what());
        }
        SetCloseOnExec(pipes.stdout_pipe.native_source());
        if (pipes.stderr_pipe) {
            SetCloseOnExec(pipes.stderr_pipe->native_source());
        }
        if (options.keep_stdin_open) {
            SetCloseOnExec(stdin_pipe->native_sink());
            entry->stdin_pipe = std::move(stdin_pipe);
        } else {
            stdin_pipe->close();
        }
    }

    handle->Publish(ProcessStartedEvent{handle->process_id(), command});
    {
        std::lock_guard<std::mutex> lock(mutex_);
        processes_[handle->process_id()] = entry;
    }
    StreamMultiplexer::Attach(handle, std::move(pipes));

    utils::Log(utils::LogLevel::kDebug, "process",
               "start id=" + handle->process_id() + " pid=" + std::to_string(handle->pid()) +
               " command=" + command + " args=" + utils::Join(args, " "));
    return handle->process_id();
}

ProcessOutput ProcessRegistry::GetOutput(const std::string& process_id) {
    return Find(process_id)->handle->Snapshot();
}

ProcessOutput ProcessRegistry::TakeOutput(const std::string& process_id) {
    return Find(process_id)->handle->TakeOutput();
}

ProcessInfo ProcessRegistry::GetProcessInfo(const std::string& process_id) {
    return Find(process_id)->handle->Info();
}

int ProcessRegistry::WaitForExit(const std::string& process_id) {
    const auto handle = Find(process_id)->handle;
    return handle->WaitForExit();
}

std::optional<int> ProcessRegistry::WaitForExit(const std::string& process_id,
                                                std::chrono::milliseconds timeout) {
    const auto handle = Find(process_id)->handle;
    return handle->WaitForExit(std::chrono::steady_clock::now() + timeout);
}

void ProcessRegistry::KillProcess(const std::string& process_id) {
    const auto handle = Find(process_id)->handle;
    Terminate(*handle);
}

void ProcessRegistry::ReleaseProcess(const std::string& process_id) {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = processes_.find(process_id);
        if (it == processes_.end()) {
            throw ProcessNotFoundError(process_id);
        }
        entry = std::move(it->second);
        processes_.erase(it);
    }
    Terminate(*entry->handle);
    entry->handle->JoinPump();
    {
        std::lock_guard<std::mutex> input_lock(entry->input_mutex);
        entry->stdin_pipe.reset();
    }
    utils::Log(utils::LogLevel::kDebug, "process", "release id=" + process_id);
}

std::vector<std::string> ProcessRegistry::ListProcesses() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(processes_.size());
    for (const auto& [id, _] : processes_) {
        ids.push_back(id);
    }
    return ids;
}

std::shared_ptr<EventChannel> ProcessRegistry::Subscribe(const std::string& process_id) {
    const auto handle = Find(process_id)->handle;
    auto channel = std::make_shared<EventChannel>();
    handle->Subscribe(channel);
    return channel;
}

void ProcessRegistry::Unsubscribe(const std::string& process_id,
                                  const std::shared_ptr<EventChannel>& channel) {
    Find(process_id)->handle->Unsubscribe(channel);
}

bool ProcessRegistry::WaitForOutput(const std::string& process_id,
                                    const ProcessHandle::OutputPredicate& predicate,
                                    std::chrono::milliseconds timeout) {
    const auto handle = Find(process_id)->handle;
    return handle->WaitForOutput(predicate, std::chrono::steady_clock::now() + timeout);
}

void ProcessRegistry::WriteInput(const std::string& process_id, const std::string& data) {
    const auto entry = Find(process_id);
    std::lock_guard<std::mutex> lock(entry->input_mutex);
    if (!entry->stdin_pipe || !entry->stdin_pipe->is_open()) {
        throw ProcessError("stdin of process " + process_id + " is closed");
    }
    std::size_t written = 0;
    try {
        while (written < data.size()) {
            const auto remaining = static_cast<int>(std::min<std::size_t>(data.size() - written, 1 << 20));
            written += static_cast<std::size_t>(entry->stdin_pipe->write(data.data() + written, remaining));
        }
    } catch (const bp::process_error& ex) {
        throw ProcessError("write to process " + process_id + " failed: " + ex.what());
    }
}

void ProcessRegistry::CloseInput(const std::string& process_id) {
    const auto entry = Find(process_id);
    std::lock_guard<std::mutex> lock(entry->input_mutex);
    if (entry->stdin_pipe) {
        entry->stdin_pipe->close();
    }
}

void ProcessRegistry::Shutdown() {
    std::unordered_map<std::string, std::shared_ptr<Entry>> processes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        processes.swap(processes_);
    }
    for (auto& [id, entry] : processes) {
        Terminate(*entry->handle);
        entry->handle->JoinPump();
    }
}

std::shared_ptr<ProcessRegistry::Entry> ProcessRegistry::Find(const std::string& process_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processes_.find(process_id);
    if (it == processes_.end()) {
        throw ProcessNotFoundError(process_id);
    }
    return it->second;
}

std::string ProcessRegistry::NextProcessId() {
    return "proc_" + std::to_string(next_id_.fetch_add(1));
}

void ProcessRegistry::Terminate(ProcessHandle& handle) {
    if (handle.RequestKill(SIGINT)) {
        if (!handle.WaitForExit(std::chrono::steady_clock::now() + kKillGracePeriod)) {
            utils::Log(utils::LogLevel::kWarn, "process",
                       "escalating to SIGKILL id=" + handle.process_id());
            handle.Signal(SIGKILL);
        }
    }
    handle.WaitForExit();
}

}  // namespace execbox::process
