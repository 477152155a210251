#include "protocol/execution_result.hpp"

#include <algorithm>

namespace execbox::protocol {

ExecutionResult MakeSuccess(Value result,
                            double duration,
                            std::string stdout_text,
                            std::string stderr_text,
                            std::optional<int> exit_code) {
    ExecutionResult out{};
    out.result = std::move(result);
    out.success = true;
    out.duration = std::max(0.0, duration);
    out.stdout_text = std::move(stdout_text);
    out.stderr_text = std::move(stderr_text);
    out.exit_code = exit_code;
    return out;
}

ExecutionResult MakeFailure(std::string error,
                            std::string error_type,
                            double duration,
                            std::string stdout_text,
                            std::string stderr_text,
                            std::optional<int> exit_code) {
    ExecutionResult out{};
    out.success = false;
    out.duration = std::max(0.0, duration);
    out.error = error.empty() ? std::string("Unknown error") : std::move(error);
    out.error_type = error_type.empty() ? std::string(kCommandError) : std::move(error_type);
    out.stdout_text = std::move(stdout_text);
    out.stderr_text = std::move(stderr_text);
    out.exit_code = exit_code;
    return out;
}

nlohmann::ordered_json ToJson(const ExecutionResult& result) {
    nlohmann::ordered_json json = {
        {"success", result.success},
        {"result", result.result.ToJson()},
        {"duration", result.duration},
        {"error", nullptr},
        {"error_type", nullptr},
        {"stdout", result.stdout_text},
        {"stderr", result.stderr_text},
        {"exit_code", nullptr}
    };
    if (result.error) {
        json["error"] = *result.error;
    }
    if (result.error_type) {
        json["error_type"] = *result.error_type;
    }
    if (result.exit_code) {
        json["exit_code"] = *result.exit_code;
    }
    return json;
}

}  // namespace execbox::protocol
