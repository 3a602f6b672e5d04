#include "exec/deadline_supervisor.hpp"

#include <cerrno>
#include <condition_variable>
#include <csignal>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <algorithm>
#include <string>
#include <system_error>
#include <thread>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>
#include "core/logging/logger.hpp"

namespace synx::exec {

using core::errors::ErrorKind;
using core::errors::make_error;
using protocol::ExecutionOutput;

namespace {

enum class Outcome {
    Pending,
    Exited,
    DeadlineElapsed,
    Aborted
};

struct RaceState {
    std::mutex mutex;
    std::condition_variable cv;
    Outcome outcome = Outcome::Pending;
};

// Bounds the sleeper's wait so `now + timeout` cannot overflow the clock.
constexpr std::chrono::milliseconds kLongestWait = std::chrono::hours(24 * 365);

enum class DrainResult {
    Finished,
    Interrupted,
    Failed
};

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void drain_pipe(const int fd, bool& is_open, std::string& out) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            is_open = false;
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        is_open = false;
        return;
    }
}

// Returns -1 when the kernel cannot hand out a pidfd.
int open_pidfd(const pid_t pid) {
#ifdef SYS_pidfd_open
    return static_cast<int>(syscall(SYS_pidfd_open, pid, 0));
#else
    static_cast<void>(pid);
    return -1;
#endif
}

// Reads both streams to EOF, or until `exit_fd` reports the child gone, or
// stops early when the deadline side writes to the wake pipe. A background
// grandchild may keep the pipes open after the child exits; whatever is
// buffered at that point is kept.
DrainResult collect_output(const LaunchedProcess& process, const int wake_fd,
                           const int exit_fd, std::string& stdout_text,
                           std::string& stderr_text, int& error) {
    bool stdout_open = process.stdout_fd() >= 0;
    bool stderr_open = process.stderr_fd() >= 0;
    if (stdout_open) {
        set_nonblocking(process.stdout_fd());
    }
    if (stderr_open) {
        set_nonblocking(process.stderr_fd());
    }

    while (stdout_open || stderr_open) {
        pollfd fds[4];
        nfds_t nfds = 0;
        fds[nfds].fd = wake_fd;
        fds[nfds].events = POLLIN;
        fds[nfds].revents = 0;
        ++nfds;
        const nfds_t exit_slot = nfds;
        if (exit_fd >= 0) {
            fds[nfds].fd = exit_fd;
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            ++nfds;
        }
        if (stdout_open) {
            fds[nfds].fd = process.stdout_fd();
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = process.stderr_fd();
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            ++nfds;
        }

        if (poll(fds, nfds, -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            error = errno;
            return DrainResult::Failed;
        }
        if (fds[0].revents != 0) {
            return DrainResult::Interrupted;
        }

        drain_pipe(process.stdout_fd(), stdout_open, stdout_text);
        drain_pipe(process.stderr_fd(), stderr_open, stderr_text);
        if (exit_fd >= 0 && fds[exit_slot].revents != 0) {
            return DrainResult::Finished;
        }
    }
    return DrainResult::Finished;
}

ExecutionOutput to_output(const int status, std::string stdout_text,
                          std::string stderr_text, const double duration_ms) {
    ExecutionOutput output;
    if (WIFEXITED(status)) {
        output.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        output.term_signal = WTERMSIG(status);
        output.exit_code = -1;
    }
    output.stdout_data = std::move(stdout_text);
    output.stderr_data = std::move(stderr_text);
    output.duration_ms = duration_ms;
    return output;
}

core::errors::ExecError abort_child(LaunchedProcess& process, core::errors::ExecError error) {
    process.signal_group(SIGKILL);
    process.close_output();
    auto reaped = process.reap();
    if (core::errors::is_error(reaped)) {
        SYNX_LOG_WARN(core::errors::get_error(reaped).message);
    }
    return error;
}

}  // namespace

DeadlineSupervisor::DeadlineSupervisor(const std::chrono::milliseconds timeout)
    : timeout_(timeout) {}

core::errors::Result<ExecutionOutput> DeadlineSupervisor::supervise(
    LaunchedProcess& process) const {
    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + std::min(timeout_, kLongestWait);

    int wake[2] = {-1, -1};
    if (pipe2(wake, O_CLOEXEC | O_NONBLOCK) != 0) {
        return abort_child(process,
                           make_error(ErrorKind::IoError,
                                      "Failed to create supervisor pipe: " +
                                          std::generic_category().message(errno)));
    }
    const FileDescriptor wake_read(wake[0]);
    const FileDescriptor wake_write(wake[1]);

    RaceState state;
    std::thread sleeper;
    try {
        sleeper = std::thread([&state, &process, &wake_write, deadline]() {
            std::unique_lock<std::mutex> lock(state.mutex);
            const bool decided = state.cv.wait_until(lock, deadline, [&state]() {
                return state.outcome != Outcome::Pending;
            });
            if (decided) {
                return;
            }
            state.outcome = Outcome::DeadlineElapsed;
            // Still unreaped, so the group id cannot have been recycled.
            process.signal_group(SIGKILL);
            const char token = 'x';
            static_cast<void>(write(wake_write.get(), &token, 1));
        });
    } catch (const std::system_error& e) {
        return abort_child(process, make_error(ErrorKind::IoError,
                                               std::string("Failed to start deadline thread: ") +
                                                   e.what()));
    }

    const FileDescriptor exit_watch(open_pidfd(process.pid()));
    std::string stdout_text;
    std::string stderr_text;
    int io_error = 0;
    const DrainResult drained = collect_output(process, wake_read.get(), exit_watch.get(),
                                               stdout_text, stderr_text, io_error);

    std::string failure;
    if (drained == DrainResult::Failed) {
        failure = "Failed to read child output: " + std::generic_category().message(io_error);
    } else if (drained == DrainResult::Finished) {
        // Observe the exit without reaping; the deadline side may still signal.
        auto exited = process.wait_for_exit();
        if (core::errors::is_error(exited)) {
            failure = core::errors::get_error(exited).message;
        }
    }

    Outcome outcome = Outcome::Pending;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (state.outcome == Outcome::Pending) {
            state.outcome = failure.empty() ? Outcome::Exited : Outcome::Aborted;
        }
        outcome = state.outcome;
    }
    state.cv.notify_all();
    sleeper.join();

    if (outcome == Outcome::Aborted) {
        return abort_child(process, make_error(ErrorKind::IoError, failure));
    }

    if (outcome == Outcome::DeadlineElapsed) {
        process.close_output();
        auto reaped = process.reap();
        if (core::errors::is_error(reaped)) {
            SYNX_LOG_WARN(core::errors::get_error(reaped).message);
        }
        SYNX_LOG_WARN("Child " + std::to_string(process.pid()) + " killed after " +
                      std::to_string(timeout_.count()) + "ms deadline");
        return make_error(ErrorKind::Timeout,
                          "Command execution timed out after " +
                              std::to_string(timeout_.count()) + "ms",
                          "Raise the policy timeout if the tool is expected to run longer.");
    }

    // Anything the child left running in its group dies with it.
    process.signal_group(SIGKILL);
    process.close_output();
    auto reaped = process.reap();
    if (core::errors::is_error(reaped)) {
        return core::errors::get_error(reaped);
    }
    const double duration_ms = std::chrono::duration<double, std::milli>(
                                   std::chrono::steady_clock::now() - started)
                                   .count();
    return to_output(core::errors::get_value(reaped), std::move(stdout_text),
                     std::move(stderr_text), duration_ms);
}

}  // namespace synx::exec
