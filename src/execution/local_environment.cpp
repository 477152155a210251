#include "execution/local_environment.hpp"

#include <cmath>
#include <stdexcept>

#include "execution/process_event_source.hpp"
#include "execution/process_line_source.hpp"
#include "execution/temp_script.hpp"
#include "process/process_errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace execbox::execution {
namespace {

constexpr const char* kShell = "/bin/sh";
constexpr int kShellNotFoundExitCode = 127;

protocol::Language ResolveLanguage(const std::string& name) {
    const auto language = protocol::ParseLanguage(name);
    if (!language) {
        throw std::invalid_argument("unsupported language: " + name);
    }
    return *language;
}

double SecondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

LineStream FailureStream(const char* error_type, const std::string& message) {
    return LineStream::FromLines({std::string(error_type) + ": " + message});
}

}  // namespace

LocalEnvironment::LocalEnvironment(config::ExecutionConfig config)
    : config_(std::move(config)),
      language_(ResolveLanguage(config_.language)),
      executable_(config_.executable.empty() ? protocol::DefaultExecutable(language_) : config_.executable) {
    if (!config_.isolated && language_ != protocol::Language::kPython) {
        utils::Log(utils::LogLevel::kWarn, "local",
                   std::string("no shared interpreter for ") + protocol::ToString(language_) +
                   ", every call runs isolated");
    }
}

LocalEnvironment::~LocalEnvironment() {
    Stop();
}

void LocalEnvironment::Start() {
    utils::Log(utils::LogLevel::kInfo, "local",
               std::string("start language=") + protocol::ToString(language_) +
               " executable=" + executable_ +
               " isolated=" + (config_.isolated ? "true" : "false"));
    if (!UsesInterpreter()) {
        return;
    }
    try {
        Interpreter().Start();
    } catch (const process::LaunchError& ex) {
        utils::Log(utils::LogLevel::kWarn, "local", std::string("interpreter prewarm failed: ") + ex.what());
    }
}

void LocalEnvironment::Stop() {
    {
        std::lock_guard<std::mutex> lock(interpreter_mutex_);
        if (interpreter_) {
            interpreter_->Stop();
            interpreter_.reset();
        }
    }
    registry_.Shutdown();
}

protocol::ExecutionResult LocalEnvironment::Execute(const std::string& code) {
    if (UsesInterpreter()) {
        return Interpreter().Execute(code, Timeout());
    }
    const auto started = std::chrono::steady_clock::now();
    std::unique_ptr<TempScript> script;
    try {
        script = std::make_unique<TempScript>(protocol::Wrap(code, language_),
                                              protocol::ScriptExtension(language_));
    } catch (const std::exception& ex) {
        return protocol::MakeFailure(ex.what(), protocol::kCommandError,
                                     SecondsSince(started), "", "", std::nullopt);
    }
    std::string process_id;
    try {
        process_id = registry_.StartProcess(executable_,
                                            protocol::InterpreterArgs(language_, script->path().string()),
                                            config_.cwd,
                                            config_.env);
    } catch (const process::LaunchError& ex) {
        return protocol::MakeFailure(ex.what(), protocol::kCommandNotFoundError,
                                     SecondsSince(started), "", "", std::nullopt);
    }
    return Supervise(process_id, started, true);
}

LineStream LocalEnvironment::ExecuteStream(const std::string& code) {
    if (UsesInterpreter()) {
        return Interpreter().ExecuteStream(code, Timeout());
    }
    std::unique_ptr<TempScript> script;
    try {
        script = std::make_unique<TempScript>(protocol::Wrap(code, language_),
                                              protocol::ScriptExtension(language_));
    } catch (const std::exception& ex) {
        return FailureStream(protocol::kCommandError, ex.what());
    }
    auto channel = std::make_shared<process::EventChannel>();
    process::StartOptions options{};
    options.subscriber = channel;
    std::string process_id;
    try {
        process_id = registry_.StartProcess(executable_,
                                            protocol::InterpreterArgs(language_, script->path().string()),
                                            config_.cwd,
                                            config_.env,
                                            options);
    } catch (const process::LaunchError& ex) {
        return FailureStream(protocol::kCommandNotFoundError, ex.what());
    }
    return LineStream(std::make_unique<ProcessLineSource>(
        registry_, process_id, channel, StreamMode::kCode, Timeout(), std::move(script)));
}

protocol::ExecutionResult LocalEnvironment::ExecuteCommand(const std::string& command) {
    const auto started = std::chrono::steady_clock::now();
    std::string process_id;
    try {
        process_id = registry_.StartProcess(kShell, {"-c", command}, config_.cwd, config_.env);
    } catch (const process::LaunchError& ex) {
        return protocol::MakeFailure(ex.what(), protocol::kCommandNotFoundError,
                                     SecondsSince(started), "", "", std::nullopt);
    }
    return Supervise(process_id, started, false);
}

LineStream LocalEnvironment::ExecuteCommandStream(const std::string& command) {
    auto channel = std::make_shared<process::EventChannel>();
    process::StartOptions options{};
    options.subscriber = channel;
    std::string process_id;
    try {
        process_id = registry_.StartProcess(kShell, {"-c", command}, config_.cwd, config_.env, options);
    } catch (const process::LaunchError& ex) {
        return FailureStream(protocol::kCommandNotFoundError, ex.what());
    }
    return LineStream(std::make_unique<ProcessLineSource>(
        registry_, process_id, channel, StreamMode::kCommand, Timeout(), nullptr));
}

EventStream LocalEnvironment::StreamCode(const std::string& code) {
    const std::string display_command = protocol::ToString(language_);
    if (UsesInterpreter()) {
        // The shared interpreter answers whole requests; its reply is replayed.
        auto& interpreter = Interpreter();
        const auto result = interpreter.Execute(code, Timeout());
        return EventStream::FromResult(interpreter.process_id().value_or(""), display_command, result);
    }
    std::unique_ptr<TempScript> script;
    try {
        script = std::make_unique<TempScript>(protocol::Wrap(code, language_),
                                              protocol::ScriptExtension(language_));
    } catch (const std::exception& ex) {
        return EventStream::FromResult("", display_command,
                                       protocol::MakeFailure(ex.what(), protocol::kCommandError,
                                                             0.0, "", "", std::nullopt));
    }
    auto channel = std::make_shared<process::EventChannel>();
    process::StartOptions options{};
    options.subscriber = channel;
    std::string process_id;
    try {
        process_id = registry_.StartProcess(executable_,
                                            protocol::InterpreterArgs(language_, script->path().string()),
                                            config_.cwd,
                                            config_.env,
                                            options);
    } catch (const process::LaunchError& ex) {
        return EventStream::FromResult("", display_command,
                                       protocol::MakeFailure(ex.what(), protocol::kCommandNotFoundError,
                                                             0.0, "", "", std::nullopt));
    }
    return EventStream(std::make_unique<ProcessEventSource>(
        registry_, process_id, channel, StreamMode::kCode, display_command, Timeout(), std::move(script)));
}

EventStream LocalEnvironment::StreamCommand(const std::string& command) {
    auto channel = std::make_shared<process::EventChannel>();
    process::StartOptions options{};
    options.subscriber = channel;
    std::string process_id;
    try {
        process_id = registry_.StartProcess(kShell, {"-c", command}, config_.cwd, config_.env, options);
    } catch (const process::LaunchError& ex) {
        return EventStream::FromResult("", command,
                                       protocol::MakeFailure(ex.what(), protocol::kCommandNotFoundError,
                                                             0.0, "", "", std::nullopt));
    }
    return EventStream(std::make_unique<ProcessEventSource>(
        registry_, process_id, channel, StreamMode::kCommand, command, Timeout(), nullptr));
}

std::optional<std::chrono::milliseconds> LocalEnvironment::Timeout() const {
    if (config_.timeout_s <= 0.0) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(static_cast<long long>(std::llround(config_.timeout_s * 1000.0)));
}

bool LocalEnvironment::UsesInterpreter() const {
    return !config_.isolated && language_ == protocol::Language::kPython;
}

PersistentInterpreter& LocalEnvironment::Interpreter() {
    std::lock_guard<std::mutex> lock(interpreter_mutex_);
    if (!interpreter_) {
        interpreter_ = std::make_unique<PersistentInterpreter>(registry_, executable_, config_.cwd, config_.env);
    }
    return *interpreter_;
}

protocol::ExecutionResult LocalEnvironment::Supervise(const std::string& process_id,
                                                      std::chrono::steady_clock::time_point started,
                                                      bool decode) {
    const auto timeout = Timeout();
    const auto exit_code = timeout
        ? registry_.WaitForExit(process_id, *timeout)
        : std::optional<int>(registry_.WaitForExit(process_id));

    if (!exit_code) {
        utils::Log(utils::LogLevel::kWarn, "local", "timeout id=" + process_id);
        registry_.KillProcess(process_id);
        auto output = registry_.GetOutput(process_id);
        registry_.ReleaseProcess(process_id);
        return protocol::MakeFailure(TimeoutMessage(*timeout),
                                     protocol::kTimeoutError,
                                     SecondsSince(started),
                                     std::move(output.stdout_text),
                                     std::move(output.stderr_text),
                                     output.exit_code);
    }

    auto output = registry_.GetOutput(process_id);
    registry_.ReleaseProcess(process_id);
    const auto duration = SecondsSince(started);
    if (decode) {
        return protocol::Decode(output.stdout_text, output.stderr_text, *exit_code, duration);
    }
    if (*exit_code == 0) {
        protocol::Value stdout_value(output.stdout_text);
        return protocol::MakeSuccess(std::move(stdout_value), duration,
                                     std::move(output.stdout_text), std::move(output.stderr_text),
                                     exit_code);
    }
    auto error = utils::Trim(output.stderr_text);
    const bool not_found = *exit_code == kShellNotFoundExitCode;
    if (error.empty()) {
        error = not_found ? std::string("command not found")
                          : "Command exited with code " + std::to_string(*exit_code);
    }
    return protocol::MakeFailure(std::move(error),
                                 not_found ? protocol::kCommandNotFoundError : protocol::kCommandError,
                                 duration,
                                 std::move(output.stdout_text),
                                 std::move(output.stderr_text),
                                 exit_code);
}

}  // namespace execbox::execution
