#pragma once

#include <string>

#include "execution/event_stream.hpp"
#include "execution/line_stream.hpp"
#include "process/process_manager.hpp"
#include "protocol/execution_result.hpp"

namespace execbox::execution {

// Uniform execution contract. Local, containerized and remote backends all
// report failures through ExecutionResult rather than by throwing.
class ExecutionEnvironment {
public:
    virtual ~ExecutionEnvironment() = default;

    virtual void Start() = 0;
    virtual void Stop() = 0;

    virtual protocol::ExecutionResult Execute(const std::string& code) = 0;
    virtual LineStream ExecuteStream(const std::string& code) = 0;
    virtual protocol::ExecutionResult ExecuteCommand(const std::string& command) = 0;
    virtual LineStream ExecuteCommandStream(const std::string& command) = 0;
    // Same runs as above, observed as process events instead of text lines.
    virtual EventStream StreamCode(const std::string& code) = 0;
    virtual EventStream StreamCommand(const std::string& command) = 0;

    virtual process::ProcessManager& process_manager() = 0;
};

// Starts an environment for the lifetime of a scope.
class EnvironmentSession {
public:
    explicit EnvironmentSession(ExecutionEnvironment& environment)
        : environment_(environment) {
        environment_.Start();
    }
    ~EnvironmentSession() {
        environment_.Stop();
    }

    EnvironmentSession(const EnvironmentSession&) = delete;
    EnvironmentSession& operator=(const EnvironmentSession&) = delete;

    ExecutionEnvironment* operator->() { return &environment_; }
    ExecutionEnvironment& operator*() { return environment_; }

private:
    ExecutionEnvironment& environment_;
};

}  // namespace execbox::execution
