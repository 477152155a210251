#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace execbox::process {

struct ProcessOutput {
    std::string stdout_text;
    std::string stderr_text;
    std::string combined;
    std::optional<int> exit_code;
};

struct ProcessInfo {
    std::string process_id;
    std::string command;
    std::vector<std::string> args;
    std::string cwd;
    std::chrono::system_clock::time_point created_at;
    bool is_running = false;
    std::optional<int> exit_code;
};

nlohmann::ordered_json ToJson(const ProcessInfo& info);

using Environment = std::map<std::string, std::string>;

// Exit code recorded for processes terminated through KillProcess.
inline constexpr int kInterruptedExitCode = 130;

// Lifecycle contract shared by the local registry and test doubles. Every
// lookup of an unknown or released id throws ProcessNotFoundError.
class ProcessManager {
public:
    virtual ~ProcessManager() = default;

    virtual std::string StartProcess(const std::string& command,
                                     const std::vector<std::string>& args,
                                     const std::string& cwd,
                                     const Environment& env) = 0;
    virtual ProcessOutput GetOutput(const std::string& process_id) = 0;
    virtual ProcessInfo GetProcessInfo(const std::string& process_id) = 0;
    virtual int WaitForExit(const std::string& process_id) = 0;
    virtual std::optional<int> WaitForExit(const std::string& process_id,
                                           std::chrono::milliseconds timeout) = 0;
    virtual void KillProcess(const std::string& process_id) = 0;
    virtual void ReleaseProcess(const std::string& process_id) = 0;
    virtual std::vector<std::string> ListProcesses() = 0;
};

}  // namespace execbox::process
