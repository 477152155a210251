#pragma once

#include <string>
#include <variant>

namespace execbox::process {

enum class OutputStream {
    kStdout,
    kStderr
};

inline const char* ToString(OutputStream stream) {
    return stream == OutputStream::kStdout ? "stdout" : "stderr";
}

struct ProcessStartedEvent {
    std::string process_id;
    std::string command;
};

struct OutputEvent {
    std::string process_id;
    OutputStream stream = OutputStream::kStdout;
    std::string data;
};

struct ProcessCompletedEvent {
    std::string process_id;
    int exit_code = 0;
};

using ProcessEvent = std::variant<ProcessStartedEvent, OutputEvent, ProcessCompletedEvent>;

}  // namespace execbox::process
