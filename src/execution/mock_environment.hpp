#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "execution/execution_environment.hpp"
#include "process/process_manager.hpp"

namespace execbox::execution {

// Process manager that never spawns anything. Output is looked up by
// "command args..." first, then by command name, then the default.
class MockProcessManager : public process::ProcessManager {
public:
    MockProcessManager() = default;
    MockProcessManager(process::ProcessOutput default_output,
                       std::map<std::string, process::ProcessOutput> command_outputs);

    void SetCommandOutput(const std::string& command, process::ProcessOutput output);

    std::string StartProcess(const std::string& command,
                             const std::vector<std::string>& args,
                             const std::string& cwd,
                             const process::Environment& env) override;
    process::ProcessOutput GetOutput(const std::string& process_id) override;
    process::ProcessInfo GetProcessInfo(const std::string& process_id) override;
    int WaitForExit(const std::string& process_id) override;
    std::optional<int> WaitForExit(const std::string& process_id,
                                   std::chrono::milliseconds timeout) override;
    void KillProcess(const std::string& process_id) override;
    void ReleaseProcess(const std::string& process_id) override;
    std::vector<std::string> ListProcesses() override;

private:
    struct MockProcess {
        process::ProcessInfo info;
        process::ProcessOutput output;
    };

    MockProcess& FindLocked(const std::string& process_id);
    const process::ProcessOutput& LookupLocked(const std::string& command,
                                               const std::vector<std::string>& args) const;

    std::mutex mutex_;
    process::ProcessOutput default_output_{"", "", "", 0};
    std::map<std::string, process::ProcessOutput> command_outputs_;
    std::map<std::string, MockProcess> processes_;
    int next_id_ = 1;
};

// Environment returning predefined results keyed by the exact code or
// command text. Unknown input gets the default result.
class MockEnvironment : public ExecutionEnvironment {
public:
    MockEnvironment();
    MockEnvironment(std::map<std::string, protocol::ExecutionResult> code_results,
                    std::map<std::string, protocol::ExecutionResult> command_results,
                    std::map<std::string, process::ProcessOutput> process_outputs = {});

    void SetCodeResult(const std::string& code, protocol::ExecutionResult result);
    void SetCommandResult(const std::string& command, protocol::ExecutionResult result);
    void SetDefaultResult(protocol::ExecutionResult result);

    void Start() override;
    void Stop() override;

    protocol::ExecutionResult Execute(const std::string& code) override;
    LineStream ExecuteStream(const std::string& code) override;
    protocol::ExecutionResult ExecuteCommand(const std::string& command) override;
    LineStream ExecuteCommandStream(const std::string& command) override;
    EventStream StreamCode(const std::string& code) override;
    EventStream StreamCommand(const std::string& command) override;

    process::ProcessManager& process_manager() override { return process_manager_; }
    MockProcessManager& mock_process_manager() { return process_manager_; }

    bool started() const;
    std::vector<std::string> executed_code() const;
    std::vector<std::string> executed_commands() const;

private:
    protocol::ExecutionResult Lookup(const std::map<std::string, protocol::ExecutionResult>& results,
                                     const std::string& key) const;

    std::string NextStreamId();

    mutable std::mutex mutex_;
    std::map<std::string, protocol::ExecutionResult> code_results_;
    std::map<std::string, protocol::ExecutionResult> command_results_;
    protocol::ExecutionResult default_result_;
    std::vector<std::string> executed_code_;
    std::vector<std::string> executed_commands_;
    bool started_ = false;
    int next_stream_ = 1;
    MockProcessManager process_manager_;
};

}  // namespace execbox::execution
