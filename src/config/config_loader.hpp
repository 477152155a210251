#pragma once

#include <nlohmann/json.hpp>

#include "config/config_schema.hpp"

namespace execbox::config {

Config LoadConfig();
Config ParseConfig(const nlohmann::json& data);
void ApplyEnvOverrides(Config& config);

}  // namespace execbox::config
