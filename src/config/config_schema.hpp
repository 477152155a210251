#pragma once

#include <map>
#include <string>

namespace execbox::config {

// Pass-through execution hints. The registry and multiplexer never read them;
// only the facade consumes timeout, isolation, language and executable.
struct ExecutionConfig {
    double timeout_s = 60.0;
    bool isolated = true;
    std::string language = "python";
    std::string executable;
    std::string cwd;
    std::map<std::string, std::string> env;
    double cpu = 0.0;
    int memory_mb = 0;
    int keep_alive_s = 0;
};

struct LoggingConfig {
    std::string level = "warn";
};

struct Config {
    ExecutionConfig execution;
    LoggingConfig logging;
};

}  // namespace execbox::config
