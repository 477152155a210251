#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "config/config_schema.hpp"
#include "execution/execution_environment.hpp"
#include "execution/persistent_interpreter.hpp"
#include "process/process_registry.hpp"
#include "protocol/result_protocol.hpp"

namespace execbox::execution {

// Runs code and commands as local subprocesses supervised by an owned
// ProcessRegistry. With `isolated` unset, Python code shares one long-lived
// interpreter whose globals persist between calls.
class LocalEnvironment : public ExecutionEnvironment {
public:
    explicit LocalEnvironment(config::ExecutionConfig config = {});
    ~LocalEnvironment() override;

    void Start() override;
    void Stop() override;

    protocol::ExecutionResult Execute(const std::string& code) override;
    LineStream ExecuteStream(const std::string& code) override;
    protocol::ExecutionResult ExecuteCommand(const std::string& command) override;
    LineStream ExecuteCommandStream(const std::string& command) override;
    EventStream StreamCode(const std::string& code) override;
    EventStream StreamCommand(const std::string& command) override;

    process::ProcessManager& process_manager() override { return registry_; }
    process::ProcessRegistry& registry() { return registry_; }
    const config::ExecutionConfig& config() const { return config_; }
    protocol::Language language() const { return language_; }

private:
    std::optional<std::chrono::milliseconds> Timeout() const;
    bool UsesInterpreter() const;
    PersistentInterpreter& Interpreter();

    protocol::ExecutionResult Supervise(const std::string& process_id,
                                        std::chrono::steady_clock::time_point started,
                                        bool decode);

    config::ExecutionConfig config_;
    protocol::Language language_;
    std::string executable_;
    process::ProcessRegistry registry_;

    std::mutex interpreter_mutex_;
    std::unique_ptr<PersistentInterpreter> interpreter_;
};

}  // namespace execbox::execution
