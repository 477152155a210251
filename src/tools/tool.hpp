#pragma once

#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace execbox::tools {

using ToolParams = std::unordered_map<std::string, std::string>;

// Function-calling adapter over an execution backend. Replies are plain
// strings so they can be handed to a model verbatim.
class Tool {
public:
    virtual ~Tool() = default;
    virtual std::string Name() const = 0;
    virtual std::string Description() const = 0;
    // JSON schema of the accepted parameters.
    virtual std::string ParametersJson() const = 0;
    virtual std::string Execute(const ToolParams& params) = 0;

    nlohmann::json Definition() const {
        return {
            {"name", Name()},
            {"description", Description()},
            {"parameters", nlohmann::json::parse(ParametersJson())}
        };
    }
};

}  // namespace execbox::tools
