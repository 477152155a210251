#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "utils/logging.hpp"

namespace execbox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetConfigPath() {
    const auto explicit_path = GetEnv("EXECBOX_CONFIG");
    if (!explicit_path.empty()) {
        return std::filesystem::path(explicit_path);
    }
    return GetHomePath() / ".execbox" / "config.json";
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

double ParseDouble(const std::string& value, double fallback) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

void ApplyExecutionConfig(ExecutionConfig& target, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    if (source.contains("timeoutSeconds") && source["timeoutSeconds"].is_number()) {
        target.timeout_s = source["timeoutSeconds"].get<double>();
    }
    if (source.contains("isolated") && source["isolated"].is_boolean()) {
        target.isolated = source["isolated"].get<bool>();
    }
    if (source.contains("language") && source["language"].is_string()) {
        target.language = source["language"].get<std::string>();
    }
    if (source.contains("executable") && source["executable"].is_string()) {
        target.executable = source["executable"].get<std::string>();
    }
    if (source.contains("cwd") && source["cwd"].is_string()) {
        target.cwd = source["cwd"].get<std::string>();
    }
    if (source.contains("cpu") && source["cpu"].is_number()) {
        target.cpu = source["cpu"].get<double>();
    }
    if (source.contains("memoryMb") && source["memoryMb"].is_number_integer()) {
        target.memory_mb = source["memoryMb"].get<int>();
    }
    if (source.contains("keepAliveSeconds") && source["keepAliveSeconds"].is_number_integer()) {
        target.keep_alive_s = source["keepAliveSeconds"].get<int>();
    }
    if (source.contains("env") && source["env"].is_object()) {
        target.env.clear();
        for (const auto& [key, value] : source["env"].items()) {
            if (value.is_string()) {
                target.env[key] = value.get<std::string>();
            }
        }
    }
}

}  // namespace

Config ParseConfig(const nlohmann::json& data) {
    Config config{};
    if (!data.is_object()) {
        return config;
    }
    if (data.contains("execution")) {
        ApplyExecutionConfig(config.execution, data["execution"]);
    }
    if (data.contains("logging") && data["logging"].is_object()) {
        const auto& logging = data["logging"];
        if (logging.contains("level") && logging["level"].is_string()) {
            config.logging.level = logging["level"].get<std::string>();
        }
    }
    return config;
}

void ApplyEnvOverrides(Config& config) {
    const auto timeout = GetEnv("EXECBOX_TIMEOUT");
    if (!timeout.empty()) {
        config.execution.timeout_s = ParseDouble(timeout, config.execution.timeout_s);
    }
    const auto isolated = GetEnv("EXECBOX_ISOLATED");
    if (!isolated.empty()) {
        config.execution.isolated = ParseBool(isolated);
    }
    const auto language = GetEnv("EXECBOX_LANGUAGE");
    if (!language.empty()) {
        config.execution.language = language;
    }
    const auto executable = GetEnv("EXECBOX_EXECUTABLE");
    if (!executable.empty()) {
        config.execution.executable = executable;
    }
    const auto cwd = GetEnv("EXECBOX_CWD");
    if (!cwd.empty()) {
        config.execution.cwd = cwd;
    }
    const auto keep_alive = GetEnv("EXECBOX_KEEP_ALIVE");
    if (!keep_alive.empty()) {
        config.execution.keep_alive_s = ParseInt(keep_alive, config.execution.keep_alive_s);
    }
    const auto log_level = GetEnv("EXECBOX_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

Config LoadConfig() {
    Config config{};
    const auto config_path = GetConfigPath();
    if (std::filesystem::exists(config_path)) {
        try {
            std::ifstream input(config_path);
            nlohmann::json data;
            input >> data;
            config = ParseConfig(data);
        } catch (const nlohmann::json::exception& ex) {
            utils::Log(utils::LogLevel::kWarn, "config",
                       "ignoring " + config_path.string() + ": " + ex.what());
        }
    }
    ApplyEnvOverrides(config);
    utils::SetLogLevel(utils::ParseLogLevel(config.logging.level, utils::GetLogLevel()));
    return config;
}

}  // namespace execbox::config
