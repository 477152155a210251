#include "tools/execute_tools.hpp"

#include "utils/logging.hpp"

namespace execbox::tools {
namespace {

std::string Serialize(const protocol::ExecutionResult& result) {
    return protocol::ToJson(result).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void LogOutcome(const std::string& tool, const protocol::ExecutionResult& result) {
    utils::Log(utils::LogLevel::kInfo, tool,
               std::string("success=") + (result.success ? "true" : "false") +
               " duration=" + std::to_string(result.duration) +
               (result.error_type ? " error_type=" + *result.error_type : std::string()));
}

}  // namespace

ExecuteCodeTool::ExecuteCodeTool(execution::ExecutionEnvironment& environment)
    : environment_(environment) {}

std::string ExecuteCodeTool::ParametersJson() const {
    return R"({"type":"object","properties":{"code":{"type":"string"}},"required":["code"]})";
}

std::string ExecuteCodeTool::Execute(const ToolParams& params) {
    auto it = params.find("code");
    if (it == params.end() || it->second.empty()) {
        return "Error: missing code";
    }
    const auto result = environment_.Execute(it->second);
    LogOutcome("execute_code", result);
    return Serialize(result);
}

ExecuteCommandTool::ExecuteCommandTool(execution::ExecutionEnvironment& environment)
    : environment_(environment) {}

std::string ExecuteCommandTool::ParametersJson() const {
    return R"({"type":"object","properties":{"command":{"type":"string"}},"required":["command"]})";
}

std::string ExecuteCommandTool::Execute(const ToolParams& params) {
    auto it = params.find("command");
    if (it == params.end() || it->second.empty()) {
        return "Error: missing command";
    }
    const auto result = environment_.ExecuteCommand(it->second);
    LogOutcome("execute_command", result);
    return Serialize(result);
}

}  // namespace execbox::tools
