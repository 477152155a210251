#include "tools/tool_registry.hpp"

#include <algorithm>

#include "utils/logging.hpp"

namespace execbox::tools {

void ToolRegistry::Register(std::unique_ptr<Tool> tool) {
    auto name = tool->Name();
    tools_[std::move(name)] = std::move(tool);
}

Tool* ToolRegistry::Get(const std::string& name) {
    auto it = tools_.find(name);
    return it == tools_.end() ? nullptr : it->second.get();
}

bool ToolRegistry::Has(const std::string& name) const {
    return tools_.count(name) > 0;
}

nlohmann::json ToolRegistry::GetDefinitions() const {
    nlohmann::json definitions = nlohmann::json::array();
    for (const auto& name : List()) {
        definitions.push_back(tools_.at(name)->Definition());
    }
    return definitions;
}

std::string ToolRegistry::Execute(const std::string& name,
                                  const ToolParams& params) {
    auto tool = Get(name);
    if (!tool) {
        return "Error: Tool '" + name + "' not found";
    }
    utils::Log(utils::LogLevel::kDebug, "tool", "start name=" + name);
    const auto result = tool->Execute(params);
    utils::Log(utils::LogLevel::kDebug, "tool", "end name=" + name + " size=" + std::to_string(result.size()));
    return result;
}

std::vector<std::string> ToolRegistry::List() const {
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& [name, _] : tools_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

}  // namespace execbox::tools
