#pragma once

#include <sys/types.h>
#include "core/errors/exec_errors.hpp"
#include "exec/secure_command.hpp"
#include "protocol/execution_contract.hpp"

namespace synx::exec {

// Owning handle for a descriptor; closes on destruction.
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor();

    FileDescriptor(FileDescriptor&& other) noexcept;
    FileDescriptor& operator=(FileDescriptor&& other) noexcept;
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    void reset();

private:
    int fd_ = -1;
};

// A spawned child that leads its own process group. Until reap() the PID is
// held by the kernel (running or zombie), so signals sent through this handle
// cannot reach a recycled process. Dropping an unreaped handle kills the group
// and reaps it.
class LaunchedProcess {
public:
    LaunchedProcess(pid_t pid, FileDescriptor stdout_fd, FileDescriptor stderr_fd);
    ~LaunchedProcess();

    LaunchedProcess(LaunchedProcess&& other) noexcept;
    LaunchedProcess& operator=(LaunchedProcess&& other) noexcept;
    LaunchedProcess(const LaunchedProcess&) = delete;
    LaunchedProcess& operator=(const LaunchedProcess&) = delete;

    pid_t pid() const { return pid_; }
    int stdout_fd() const { return stdout_.get(); }
    int stderr_fd() const { return stderr_.get(); }
    bool reaped() const { return reaped_; }

    // Signals the whole process group. Safe to call from another thread while
    // the owner is blocked in wait_for_exit().
    void signal_group(int signal_number) const;

    // Blocks until the child has terminated without reaping it.
    core::errors::Result<core::errors::Ok> wait_for_exit() const;

    // Collects the exit status; blocks until the child terminates.
    core::errors::Result<int> reap();

    void close_output();

private:
    void terminate_and_reap() noexcept;

    pid_t pid_ = -1;
    FileDescriptor stdout_;
    FileDescriptor stderr_;
    bool reaped_ = false;
};

class ProcessLauncher {
public:
    // Spawns the command with stdin on /dev/null, stdout/stderr on pipes, the
    // working directory and environment applied, and, between fork and exec,
    // the policy's resource ceilings and syscall filter. Fails closed: a child
    // whose sandbox could not be installed never runs the target.
    core::errors::Result<LaunchedProcess> launch(const SecureCommand& command) const;

    // What this platform enforces at OS level.
    static protocol::SandboxCapabilities capabilities();
};

}  // namespace synx::exec
