#pragma once

#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <string>

#include "execution/line_stream.hpp"
#include "execution/temp_script.hpp"
#include "process/event_channel.hpp"
#include "process/process_registry.hpp"
#include "protocol/execution_result.hpp"

namespace execbox::execution {

enum class StreamMode {
    // Wrapped code: the sentinel line is hidden and replaced by a summary line.
    kCode,
    // Plain command: lines are relayed untouched.
    kCommand
};

// Lines of one isolated process, relayed from its event channel as they
// arrive. The process is released once the stream ends or is abandoned.
class ProcessLineSource : public LineSource {
public:
    ProcessLineSource(process::ProcessRegistry& registry,
                      std::string process_id,
                      std::shared_ptr<process::EventChannel> channel,
                      StreamMode mode,
                      std::optional<std::chrono::milliseconds> timeout,
                      std::unique_ptr<TempScript> script);
    ~ProcessLineSource() override;

    std::optional<std::string> Next() override;
    void Cancel() override;

private:
    void Consume(const process::ProcessEvent& event);
    void EmitLine(const std::string& line);
    void Finish(int exit_code);
    void TimeOut();
    void Release();

    process::ProcessRegistry& registry_;
    const std::string process_id_;
    std::shared_ptr<process::EventChannel> channel_;
    const StreamMode mode_;
    const std::optional<std::chrono::milliseconds> timeout_;
    const std::chrono::steady_clock::time_point started_;
    std::unique_ptr<TempScript> script_;

    std::deque<std::string> pending_;
    LineSplitter stdout_lines_;
    LineSplitter stderr_lines_;
    bool done_ = false;
    bool released_ = false;
};

std::string TimeoutMessage(std::chrono::milliseconds timeout);

// Trailing line appended to a code stream for its decoded outcome, if any.
std::optional<std::string> SummaryLine(const protocol::ExecutionResult& result, bool sentinel_found);

}  // namespace execbox::execution
