#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "protocol/value.hpp"

namespace execbox::protocol {

// Classification tokens for failures that do not come from a decoded exception.
inline constexpr const char* kTimeoutError = "TimeoutError";
inline constexpr const char* kCommandError = "CommandError";
inline constexpr const char* kCommandNotFoundError = "CommandNotFoundError";
inline constexpr const char* kProtocolError = "ProtocolError";

struct ExecutionResult {
    Value result;
    bool success = false;
    double duration = 0.0;
    std::optional<std::string> error;
    std::optional<std::string> error_type;
    std::string stdout_text;
    std::string stderr_text;
    std::optional<int> exit_code;
};

ExecutionResult MakeSuccess(Value result,
                            double duration,
                            std::string stdout_text,
                            std::string stderr_text,
                            std::optional<int> exit_code);

// Failures never carry a result value and always carry both error fields.
ExecutionResult MakeFailure(std::string error,
                            std::string error_type,
                            double duration,
                            std::string stdout_text,
                            std::string stderr_text,
                            std::optional<int> exit_code);

nlohmann::ordered_json ToJson(const ExecutionResult& result);

}  // namespace execbox::protocol
