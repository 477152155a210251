#pragma once

#include <string>

#include "execution/execution_environment.hpp"
#include "tools/tool.hpp"

namespace execbox::tools {

// Runs the `code` parameter through an environment and answers with the
// ExecutionResult serialized as JSON.
class ExecuteCodeTool : public Tool {
public:
    explicit ExecuteCodeTool(execution::ExecutionEnvironment& environment);

    std::string Name() const override { return "execute_code"; }
    std::string Description() const override {
        return "Execute code and return its result, output and error details.";
    }
    std::string ParametersJson() const override;
    std::string Execute(const ToolParams& params) override;

private:
    execution::ExecutionEnvironment& environment_;
};

class ExecuteCommandTool : public Tool {
public:
    explicit ExecuteCommandTool(execution::ExecutionEnvironment& environment);

    std::string Name() const override { return "execute_command"; }
    std::string Description() const override { return "Execute a shell command."; }
    std::string ParametersJson() const override;
    std::string Execute(const ToolParams& params) override;

private:
    execution::ExecutionEnvironment& environment_;
};

}  // namespace execbox::tools
