#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "execution/line_stream.hpp"
#include "process/process_registry.hpp"
#include "protocol/execution_result.hpp"

namespace execbox::execution {

class InterpreterLineSource;

// One long-lived Python interpreter shared by successive calls. Its global
// namespace survives between calls; calls are serialized. A call that times
// out, is abandoned, or kills the interpreter discards it, and the next call
// starts a fresh one.
class PersistentInterpreter {
public:
    PersistentInterpreter(process::ProcessRegistry& registry,
                          std::string executable,
                          std::string cwd,
                          process::Environment env);
    ~PersistentInterpreter();

    PersistentInterpreter(const PersistentInterpreter&) = delete;
    PersistentInterpreter& operator=(const PersistentInterpreter&) = delete;

    protocol::ExecutionResult Execute(const std::string& code,
                                      std::optional<std::chrono::milliseconds> timeout);
    LineStream ExecuteStream(const std::string& code,
                             std::optional<std::chrono::milliseconds> timeout);

    void Start();
    void Stop();
    std::optional<std::string> process_id() const;

private:
    friend class InterpreterLineSource;

    std::string EnsureStartedLocked();
    void DiscardLocked();
    std::string NextRequestId();

    process::ProcessRegistry& registry_;
    const std::string executable_;
    const std::string cwd_;
    const process::Environment env_;

    mutable std::mutex mutex_;
    std::optional<std::string> process_id_;
    std::uint64_t next_request_ = 1;
};

}  // namespace execbox::execution
