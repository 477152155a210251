#pragma once

#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <string>

#include "execution/event_stream.hpp"
#include "execution/process_line_source.hpp"
#include "execution/temp_script.hpp"
#include "process/event_channel.hpp"
#include "process/process_registry.hpp"

namespace execbox::execution {

// Events of one isolated process, relayed from its channel as they arrive.
// The started event names `display_command`. In code mode the result
// sentinel line is withheld from stdout. A timeout kills the process, so the
// stream ends with its interrupted completion.
class ProcessEventSource : public EventSource {
public:
    ProcessEventSource(process::ProcessRegistry& registry,
                       std::string process_id,
                       std::shared_ptr<process::EventChannel> channel,
                       StreamMode mode,
                       std::string display_command,
                       std::optional<std::chrono::milliseconds> timeout,
                       std::unique_ptr<TempScript> script);
    ~ProcessEventSource() override;

    std::optional<process::ProcessEvent> Next() override;
    void Cancel() override;

private:
    void Consume(process::ProcessEvent event);
    void RelayStdout(const std::string& data);
    void FlushStdout();
    void PushStdout(const std::string& text);
    void Release();

    process::ProcessRegistry& registry_;
    const std::string process_id_;
    std::shared_ptr<process::EventChannel> channel_;
    const StreamMode mode_;
    const std::string display_command_;
    const std::optional<std::chrono::milliseconds> timeout_;
    const std::chrono::steady_clock::time_point started_;
    std::unique_ptr<TempScript> script_;

    std::deque<process::ProcessEvent> pending_;
    std::string held_stdout_;
    bool timed_out_ = false;
    bool done_ = false;
    bool released_ = false;
};

}  // namespace execbox::execution
