#include "execution/mock_environment.hpp"

#include "execution/process_line_source.hpp"
#include "process/process_errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace execbox::execution {
namespace {

constexpr const char* kMockCodeCommand = "python";

std::vector<std::string> SplitLines(const std::string& text) {
    LineSplitter splitter;
    auto lines = splitter.Feed(text);
    if (auto tail = splitter.Flush()) {
        lines.push_back(std::move(*tail));
    }
    return lines;
}

void AppendLines(std::vector<std::string>& lines, const std::string& text) {
    for (auto& line : SplitLines(text)) {
        lines.push_back(std::move(line));
    }
}

}  // namespace

MockProcessManager::MockProcessManager(process::ProcessOutput default_output,
                                       std::map<std::string, process::ProcessOutput> command_outputs)
    : default_output_(std::move(default_output)),
      command_outputs_(std::move(command_outputs)) {}

void MockProcessManager::SetCommandOutput(const std::string& command, process::ProcessOutput output) {
    std::lock_guard<std::mutex> lock(mutex_);
    command_outputs_[command] = std::move(output);
}

std::string MockProcessManager::StartProcess(const std::string& command,
                                             const std::vector<std::string>& args,
                                             const std::string& cwd,
                                             const process::Environment&) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto process_id = "mock_" + std::to_string(next_id_++);
    MockProcess entry{};
    entry.info.process_id = process_id;
    entry.info.command = command;
    entry.info.args = args;
    entry.info.cwd = cwd;
    entry.info.created_at = std::chrono::system_clock::now();
    entry.info.is_running = true;
    entry.output = LookupLocked(command, args);
    processes_.emplace(process_id, std::move(entry));
    utils::Log(utils::LogLevel::kDebug, "mock", "start id=" + process_id + " command=" + command);
    return process_id;
}

process::ProcessOutput MockProcessManager::GetOutput(const std::string& process_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return FindLocked(process_id).output;
}

process::ProcessInfo MockProcessManager::GetProcessInfo(const std::string& process_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return FindLocked(process_id).info;
}

int MockProcessManager::WaitForExit(const std::string& process_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = FindLocked(process_id);
    if (entry.info.is_running) {
        entry.info.is_running = false;
        entry.info.exit_code = entry.output.exit_code.value_or(0);
    }
    return *entry.info.exit_code;
}

std::optional<int> MockProcessManager::WaitForExit(const std::string& process_id,
                                                   std::chrono::milliseconds) {
    return WaitForExit(process_id);
}

void MockProcessManager::KillProcess(const std::string& process_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = FindLocked(process_id);
    if (!entry.info.is_running) {
        return;
    }
    entry.info.is_running = false;
    entry.info.exit_code = process::kInterruptedExitCode;
    entry.output.exit_code = process::kInterruptedExitCode;
}

void MockProcessManager::ReleaseProcess(const std::string& process_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (processes_.erase(process_id) == 0) {
        throw process::ProcessNotFoundError(process_id);
    }
}

std::vector<std::string> MockProcessManager::ListProcesses() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(processes_.size());
    for (const auto& [id, _] : processes_) {
        ids.push_back(id);
    }
    return ids;
}

MockProcessManager::MockProcess& MockProcessManager::FindLocked(const std::string& process_id) {
    auto it = processes_.find(process_id);
    if (it == processes_.end()) {
        throw process::ProcessNotFoundError(process_id);
    }
    return it->second;
}

const process::ProcessOutput& MockProcessManager::LookupLocked(const std::string& command,
                                                               const std::vector<std::string>& args) const {
    if (!args.empty()) {
        auto it = command_outputs_.find(command + " " + utils::Join(args, " "));
        if (it != command_outputs_.end()) {
            return it->second;
        }
    }
    auto it = command_outputs_.find(command);
    return it == command_outputs_.end() ? default_output_ : it->second;
}

MockEnvironment::MockEnvironment()
    : default_result_(protocol::MakeSuccess(protocol::Value(), 0.0, "", "", 0)) {}

MockEnvironment::MockEnvironment(std::map<std::string, protocol::ExecutionResult> code_results,
                                 std::map<std::string, protocol::ExecutionResult> command_results,
                                 std::map<std::string, process::ProcessOutput> process_outputs)
    : code_results_(std::move(code_results)),
      command_results_(std::move(command_results)),
      default_result_(protocol::MakeSuccess(protocol::Value(), 0.0, "", "", 0)),
      process_manager_(process::ProcessOutput{"", "", "", 0}, std::move(process_outputs)) {}

void MockEnvironment::SetCodeResult(const std::string& code, protocol::ExecutionResult result) {
    std::lock_guard<std::mutex> lock(mutex_);
    code_results_[code] = std::move(result);
}

void MockEnvironment::SetCommandResult(const std::string& command, protocol::ExecutionResult result) {
    std::lock_guard<std::mutex> lock(mutex_);
    command_results_[command] = std::move(result);
}

void MockEnvironment::SetDefaultResult(protocol::ExecutionResult result) {
    std::lock_guard<std::mutex> lock(mutex_);
    default_result_ = std::move(result);
}

void MockEnvironment::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    started_ = true;
}

void MockEnvironment::Stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    started_ = false;
}

protocol::ExecutionResult MockEnvironment::Execute(const std::string& code) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        executed_code_.push_back(code);
    }
    return Lookup(code_results_, code);
}

LineStream MockEnvironment::ExecuteStream(const std::string& code) {
    const auto result = Execute(code);
    std::vector<std::string> lines;
    AppendLines(lines, result.stdout_text);
    AppendLines(lines, result.stderr_text);
    if (result.success || result.error) {
        if (auto summary = SummaryLine(result, true)) {
            lines.push_back(std::move(*summary));
        }
    }
    return LineStream::FromLines(std::move(lines));
}

protocol::ExecutionResult MockEnvironment::ExecuteCommand(const std::string& command) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        executed_commands_.push_back(command);
    }
    return Lookup(command_results_, command);
}

LineStream MockEnvironment::ExecuteCommandStream(const std::string& command) {
    const auto result = ExecuteCommand(command);
    std::vector<std::string> lines;
    AppendLines(lines, result.stdout_text);
    AppendLines(lines, result.stderr_text);
    return LineStream::FromLines(std::move(lines));
}

EventStream MockEnvironment::StreamCode(const std::string& code) {
    return EventStream::FromResult(NextStreamId(), kMockCodeCommand, Execute(code));
}

EventStream MockEnvironment::StreamCommand(const std::string& command) {
    return EventStream::FromResult(NextStreamId(), command, ExecuteCommand(command));
}

bool MockEnvironment::started() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_;
}

std::vector<std::string> MockEnvironment::executed_code() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return executed_code_;
}

std::vector<std::string> MockEnvironment::executed_commands() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return executed_commands_;
}

std::string MockEnvironment::NextStreamId() {
    std::lock_guard<std::mutex> lock(mutex_);
    return "mock_stream_" + std::to_string(next_stream_++);
}

protocol::ExecutionResult MockEnvironment::Lookup(
    const std::map<std::string, protocol::ExecutionResult>& results,
    const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = results.find(key);
    return it == results.end() ? default_result_ : it->second;
}

}  // namespace execbox::execution
