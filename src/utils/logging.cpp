#include "utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace execbox::utils {
namespace {

LogLevel InitialLevel() {
    const char* value = std::getenv("EXECBOX_LOG_LEVEL");
    return value ? ParseLogLevel(value, LogConfig{}.min_level) : LogConfig{}.min_level;
}

std::atomic<LogLevel>& MinLevel() {
    static std::atomic<LogLevel> level{InitialLevel()};
    return level;
}

std::mutex& OutputMutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

void SetLogLevel(LogLevel level) {
    MinLevel().store(level);
}

LogLevel GetLogLevel() {
    return MinLevel().load();
}

bool ShouldLog(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(MinLevel().load());
}

void Log(LogLevel level, const std::string& tag, const std::string& message) {
    if (!ShouldLog(level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(OutputMutex());
    std::cerr << "[" << tag << "] ";
    if (level != LogLevel::kInfo) {
        std::cerr << ToString(level) << " ";
    }
    std::cerr << message << std::endl;
}

}  // namespace execbox::utils
