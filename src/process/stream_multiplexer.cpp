#include "process/stream_multiplexer.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "utils/logging.hpp"

namespace execbox::process {
namespace {

constexpr int kPollIntervalMs = 50;
constexpr std::size_t kReadChunkSize = 64 * 1024;

struct StreamSource {
    int fd = -1;
    OutputStream stream = OutputStream::kStdout;
    bool open = false;
};

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Reads one chunk. Returns false once the stream reached EOF or failed.
bool ReadChunk(ProcessHandle& handle, StreamSource& source, std::vector<char>& buffer) {
    while (true) {
        const auto count = ::read(source.fd, buffer.data(), buffer.size());
        if (count > 0) {
            handle.AppendOutput(source.stream, std::string(buffer.data(), static_cast<std::size_t>(count)));
            return true;
        }
        if (count == 0) {
            source.open = false;
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return false;
        }
        utils::Log(utils::LogLevel::kWarn, "mux",
                   "read failed id=" + handle.process_id() + " error=" + std::strerror(errno));
        source.open = false;
        return false;
    }
}

// After the child is gone, pull whatever is still buffered without waiting on
// descendants that may hold the pipe open.
void Drain(ProcessHandle& handle, std::array<StreamSource, 2>& sources, std::vector<char>& buffer) {
    for (auto& source : sources) {
        if (!source.open) {
            continue;
        }
        const int flags = ::fcntl(source.fd, F_GETFL);
        if (flags >= 0) {
            ::fcntl(source.fd, F_SETFL, flags | O_NONBLOCK);
        }
        while (source.open && ReadChunk(handle, source, buffer)) {
        }
    }
}

}  // namespace

void StreamMultiplexer::Attach(const std::shared_ptr<ProcessHandle>& handle, ChildPipes pipes) {
    handle->AttachPump(std::thread([handle, pipes = std::move(pipes)]() mutable {
        Pump(handle, std::move(pipes));
    }));
}

void StreamMultiplexer::Pump(const std::shared_ptr<ProcessHandle>& handle, ChildPipes pipes) {
    std::array<StreamSource, 2> sources{};
    sources[0] = StreamSource{pipes.stdout_pipe.native_source(), OutputStream::kStdout, true};
    if (pipes.stderr_pipe) {
        sources[1] = StreamSource{pipes.stderr_pipe->native_source(), OutputStream::kStderr, true};
    }

    const pid_t pid = handle->pid();
    std::vector<char> buffer(kReadChunkSize);
    int status = 0;
    int exit_code = -1;

    while (true) {
        int error = 0;
        const auto reap = handle->TryReap(status, error);
        if (reap != ProcessHandle::ReapStatus::kRunning) {
            if (reap == ProcessHandle::ReapStatus::kReaped) {
                exit_code = DecodeWaitStatus(status);
            } else {
                utils::Log(utils::LogLevel::kWarn, "mux",
                           "waitpid failed id=" + handle->process_id() + " error=" + std::strerror(error));
            }
            Drain(*handle, sources, buffer);
            break;
        }

        std::array<pollfd, 2> fds{};
        std::array<StreamSource*, 2> polled{};
        nfds_t count = 0;
        for (auto& source : sources) {
            if (source.open) {
                fds[count] = pollfd{source.fd, POLLIN, 0};
                polled[count] = &source;
                ++count;
            }
        }
        if (count == 0) {
            // Both streams closed; block until the child exits but leave it
            // for TryReap to collect.
            siginfo_t info{};
            while (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT) != 0 && errno == EINTR) {
            }
            continue;
        }

        const int ready = ::poll(fds.data(), count, kPollIntervalMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            utils::Log(utils::LogLevel::kError, "mux",
                       "poll failed id=" + handle->process_id() + " error=" + std::strerror(errno));
            std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs));
            continue;
        }
        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                ReadChunk(*handle, *polled[i], buffer);
            }
        }
    }

    handle->MarkTerminated(exit_code);
    utils::Log(utils::LogLevel::kDebug, "mux",
               "completed id=" + handle->process_id() + " exit_code=" + std::to_string(exit_code));
}

}  // namespace execbox::process
