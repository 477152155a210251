#pragma once

#include <stdexcept>
#include <string>

namespace execbox::process {

class ProcessError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ProcessNotFoundError : public ProcessError {
public:
    explicit ProcessNotFoundError(const std::string& process_id)
        : ProcessError("Process " + process_id + " not found"),
          process_id_(process_id) {}

    const std::string& process_id() const { return process_id_; }

private:
    std::string process_id_;
};

class LaunchError : public ProcessError {
public:
    LaunchError(const std::string& command, const std::string& reason)
        : ProcessError("Failed to launch " + command + ": " + reason),
          command_(command) {}

    const std::string& command() const { return command_; }

private:
    std::string command_;
};

}  // namespace execbox::process
