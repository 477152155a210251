#pragma once

#include <memory>

#include <boost/process/pipe.hpp>

#include "process/process_handle.hpp"

namespace execbox::process {

// Parent-side read ends of a spawned child. `stderr_pipe` is empty when
// stderr was merged into stdout at spawn time.
struct ChildPipes {
    boost::process::pipe stdout_pipe;
    std::unique_ptr<boost::process::pipe> stderr_pipe;
};

class StreamMultiplexer {
public:
    // Starts the pump thread for `handle` and hands it to the handle.
    static void Attach(const std::shared_ptr<ProcessHandle>& handle, ChildPipes pipes);

    // Runs until the child is reaped and its pipes are drained, then performs
    // the terminal transition on the handle.
    static void Pump(const std::shared_ptr<ProcessHandle>& handle, ChildPipes pipes);
};

}  // namespace execbox::process
