#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "tools/tool.hpp"

namespace execbox::tools {

class ToolRegistry {
public:
    void Register(std::unique_ptr<Tool> tool);
    Tool* Get(const std::string& name);
    bool Has(const std::string& name) const;
    // Function-calling schema: [{"name", "description", "parameters"}, ...].
    nlohmann::json GetDefinitions() const;
    std::string Execute(const std::string& name,
                        const ToolParams& params);

    std::vector<std::string> List() const;

private:
    std::unordered_map<std::string, std::unique_ptr<Tool>> tools_;
};

}  // namespace execbox::tools
