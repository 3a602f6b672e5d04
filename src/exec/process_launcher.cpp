#include "exec/process_launcher.hpp"

#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <string>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>
#include "core/logging/logger.hpp"
#include "exec/syscall_filter.hpp"

extern char** environ;

namespace synx::exec {

using core::errors::ErrorKind;
using core::errors::make_error;

namespace {

enum class ChildStage : int {
    ProcessGroup = 1,
    RedirectIo,
    ChangeDirectory,
    ResourceLimits,
    SyscallFilter,
    Exec
};

// Written by the child to the status pipe when a pre-exec step fails.
struct ChildFailure {
    int stage;
    int error;
};

std::string stage_name(const ChildStage stage) {
    switch (stage) {
        case ChildStage::ProcessGroup:
            return "create process group";
        case ChildStage::RedirectIo:
            return "redirect standard streams";
        case ChildStage::ChangeDirectory:
            return "change working directory";
        case ChildStage::ResourceLimits:
            return "install resource limits";
        case ChildStage::SyscallFilter:
            return "install syscall filter";
        case ChildStage::Exec:
            return "execute program";
        default:
            return "unknown stage";
    }
}

std::string os_error_text(const int error) {
    return std::generic_category().message(error);
}

// Keeps pipe ends clear of 0-2 so the child's dup2 calls cannot clobber them.
int above_stdio(const int fd) {
    if (fd > STDERR_FILENO) {
        return fd;
    }
    const int moved = fcntl(fd, F_DUPFD_CLOEXEC, STDERR_FILENO + 1);
    const int saved_errno = errno;
    static_cast<void>(close(fd));
    errno = saved_errno;
    return moved;
}

core::errors::Result<std::pair<FileDescriptor, FileDescriptor>> make_pipe() {
    int fds[2] = {-1, -1};
    if (pipe2(fds, O_CLOEXEC) != 0) {
        return make_error(ErrorKind::LaunchFailed,
                          "Failed to create process pipe: " + os_error_text(errno));
    }
    FileDescriptor read_end(above_stdio(fds[0]));
    FileDescriptor write_end(above_stdio(fds[1]));
    if (!read_end.valid() || !write_end.valid()) {
        return make_error(ErrorKind::LaunchFailed,
                          "Failed to relocate process pipe: " + os_error_text(errno));
    }
    return std::make_pair(std::move(read_end), std::move(write_end));
}

// Parent environment with the overrides applied; a later override of the same
// key wins and keeps the position of the first.
std::vector<std::string> build_environment(
    const std::vector<SecureCommand::EnvOverride>& overrides) {
    std::vector<std::pair<std::string, std::string>> merged;
    std::unordered_map<std::string, std::size_t> position;
    for (const auto& [key, value] : overrides) {
        const auto it = position.find(key);
        if (it != position.end()) {
            merged[it->second].second = value;
            continue;
        }
        position.emplace(key, merged.size());
        merged.emplace_back(key, value);
    }

    std::vector<std::string> entries;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string text(*entry);
        const auto eq = text.find('=');
        const std::string key = text.substr(0, eq);
        if (position.find(key) != position.end()) {
            continue;
        }
        entries.push_back(text);
    }
    for (const auto& [key, value] : merged) {
        entries.push_back(key + "=" + value);
    }
    return entries;
}

std::vector<char*> to_pointer_array(std::vector<std::string>& storage) {
    std::vector<char*> pointers;
    pointers.reserve(storage.size() + 1);
    for (auto& item : storage) {
        pointers.push_back(item.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

bool filter_supported() {
    static const bool supported = SyscallFilter::supported();
    return supported;
}

// Closes every inherited descriptor above stderr except `keep`. Descriptors
// opened by this process are O_CLOEXEC already; this catches ones that are not.
void close_inherited_fds(const int keep) {
#ifdef SYS_close_range
    if (keep > STDERR_FILENO + 1) {
        static_cast<void>(syscall(SYS_close_range, STDERR_FILENO + 1,
                                  static_cast<unsigned>(keep - 1), 0));
    }
    static_cast<void>(syscall(SYS_close_range, static_cast<unsigned>(keep + 1), ~0U, 0));
#else
    static_cast<void>(keep);
#endif
}

[[noreturn]] void report_child_failure(const int status_fd, const ChildStage stage) {
    const ChildFailure failure{static_cast<int>(stage), errno};
    static_cast<void>(write(status_fd, &failure, sizeof(failure)));
    _exit(127);
}

}  // namespace

FileDescriptor::~FileDescriptor() {
    reset();
}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
    if (this != &other) {
        reset();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

void FileDescriptor::reset() {
    if (fd_ >= 0) {
        static_cast<void>(close(fd_));
        fd_ = -1;
    }
}

LaunchedProcess::LaunchedProcess(const pid_t pid, FileDescriptor stdout_fd,
                                 FileDescriptor stderr_fd)
    : pid_(pid), stdout_(std::move(stdout_fd)), stderr_(std::move(stderr_fd)) {}

LaunchedProcess::~LaunchedProcess() {
    terminate_and_reap();
}

LaunchedProcess::LaunchedProcess(LaunchedProcess&& other) noexcept
    : pid_(other.pid_),
      stdout_(std::move(other.stdout_)),
      stderr_(std::move(other.stderr_)),
      reaped_(other.reaped_) {
    other.pid_ = -1;
    other.reaped_ = true;
}

LaunchedProcess& LaunchedProcess::operator=(LaunchedProcess&& other) noexcept {
    if (this != &other) {
        terminate_and_reap();
        pid_ = other.pid_;
        stdout_ = std::move(other.stdout_);
        stderr_ = std::move(other.stderr_);
        reaped_ = other.reaped_;
        other.pid_ = -1;
        other.reaped_ = true;
    }
    return *this;
}

void LaunchedProcess::signal_group(const int signal_number) const {
    if (pid_ <= 0 || reaped_) {
        return;
    }
    if (kill(-pid_, signal_number) != 0) {
        // The group is gone but the leader may linger as a zombie.
        static_cast<void>(kill(pid_, signal_number));
    }
}

core::errors::Result<core::errors::Ok> LaunchedProcess::wait_for_exit() const {
    if (reaped_) {
        return core::errors::Ok{};
    }
    siginfo_t info{};
    while (waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) != 0) {
        if (errno == EINTR) {
            continue;
        }
        return make_error(ErrorKind::IoError,
                          "Failed to wait for child " + std::to_string(pid_) + ": " +
                              os_error_text(errno));
    }
    return core::errors::Ok{};
}

core::errors::Result<int> LaunchedProcess::reap() {
    if (reaped_) {
        return make_error(ErrorKind::IoError, "Child was already reaped.");
    }
    int status = 0;
    while (waitpid(pid_, &status, 0) < 0) {
        if (errno == EINTR) {
            continue;
        }
        reaped_ = true;
        return make_error(ErrorKind::IoError,
                          "Failed to reap child " + std::to_string(pid_) + ": " +
                              os_error_text(errno));
    }
    reaped_ = true;
    return status;
}

void LaunchedProcess::close_output() {
    stdout_.reset();
    stderr_.reset();
}

void LaunchedProcess::terminate_and_reap() noexcept {
    close_output();
    if (pid_ <= 0 || reaped_) {
        return;
    }
    signal_group(SIGKILL);
    int status = 0;
    while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
    reaped_ = true;
}

core::errors::Result<LaunchedProcess> ProcessLauncher::launch(
    const SecureCommand& command) const {
    const auto& execution_policy = command.execution_policy();

    // Everything the child touches is prepared here; after fork it only makes
    // async-signal-safe calls.
    std::vector<std::string> argv_storage;
    argv_storage.reserve(command.arguments().size() + 1);
    argv_storage.push_back(command.program().string());
    for (const auto& argument : command.arguments()) {
        argv_storage.push_back(argument);
    }
    std::vector<char*> argv = to_pointer_array(argv_storage);

    std::vector<std::string> env_storage = build_environment(command.env_overrides());
    std::vector<char*> envp = to_pointer_array(env_storage);

    const std::string program = command.program().string();
    const std::string working_dir =
        command.working_dir().has_value() ? command.working_dir()->string() : "";

    rlimit memory_limit{};
    memory_limit.rlim_cur = static_cast<rlim_t>(execution_policy.memory_limit);
    memory_limit.rlim_max = memory_limit.rlim_cur;
    rlimit cpu_limit{};
    cpu_limit.rlim_cur = static_cast<rlim_t>(execution_policy.cpu_limit);
    cpu_limit.rlim_max = cpu_limit.rlim_cur;

    const bool restricted = !execution_policy.allow_network ||
                            !execution_policy.restrictions.allow_file_writes ||
                            !execution_policy.restrictions.allow_subprocesses;
    SyscallFilter filter;
    if (restricted && filter_supported()) {
        filter = SyscallFilter::for_policy(execution_policy);
    } else if (restricted) {
        SYNX_LOG_WARN("Syscall filtering unavailable; network, write and subprocess "
                      "restrictions are not enforced for " + program);
    }

    const int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull < 0) {
        return make_error(ErrorKind::LaunchFailed,
                          "Failed to open /dev/null: " + os_error_text(errno));
    }
    FileDescriptor stdin_source(above_stdio(devnull));
    if (!stdin_source.valid()) {
        return make_error(ErrorKind::LaunchFailed,
                          "Failed to relocate /dev/null: " + os_error_text(errno));
    }

    auto stdout_pipe = make_pipe();
    if (core::errors::is_error(stdout_pipe)) {
        return core::errors::get_error(stdout_pipe);
    }
    auto stderr_pipe = make_pipe();
    if (core::errors::is_error(stderr_pipe)) {
        return core::errors::get_error(stderr_pipe);
    }
    auto status_pipe = make_pipe();
    if (core::errors::is_error(status_pipe)) {
        return core::errors::get_error(status_pipe);
    }
    auto& [stdout_read, stdout_write] = core::errors::get_value(stdout_pipe);
    auto& [stderr_read, stderr_write] = core::errors::get_value(stderr_pipe);
    auto& [status_read, status_write] = core::errors::get_value(status_pipe);

    const pid_t pid = fork();
    if (pid < 0) {
        return make_error(ErrorKind::LaunchFailed,
                          "Failed to fork process: " + os_error_text(errno));
    }

    if (pid == 0) {
        const int status_fd = status_write.get();
        if (setpgid(0, 0) != 0) {
            report_child_failure(status_fd, ChildStage::ProcessGroup);
        }
        if (dup2(stdin_source.get(), STDIN_FILENO) < 0 ||
            dup2(stdout_write.get(), STDOUT_FILENO) < 0 ||
            dup2(stderr_write.get(), STDERR_FILENO) < 0) {
            report_child_failure(status_fd, ChildStage::RedirectIo);
        }
        close_inherited_fds(status_fd);
        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            report_child_failure(status_fd, ChildStage::ChangeDirectory);
        }
        if (setrlimit(RLIMIT_AS, &memory_limit) != 0 ||
            setrlimit(RLIMIT_CPU, &cpu_limit) != 0) {
            report_child_failure(status_fd, ChildStage::ResourceLimits);
        }
        const int filter_error = filter.install();
        if (filter_error != 0) {
            errno = filter_error;
            report_child_failure(status_fd, ChildStage::SyscallFilter);
        }
        execve(program.c_str(), argv.data(), envp.data());
        report_child_failure(status_fd, ChildStage::Exec);
    }

    // Mirrors the child's own setpgid so the group exists before anyone signals it.
    static_cast<void>(setpgid(pid, pid));
    stdin_source.reset();
    stdout_write.reset();
    stderr_write.reset();
    status_write.reset();

    LaunchedProcess process(pid, std::move(stdout_read), std::move(stderr_read));

    ChildFailure failure{};
    ssize_t received = 0;
    do {
        received = read(status_read.get(), &failure, sizeof(failure));
    } while (received < 0 && errno == EINTR);

    if (received == 0) {
        SYNX_LOG_DEBUG("Launched " + program + " as pid " + std::to_string(pid) +
                       (filter.empty() ? "" : " with syscall filter"));
        return std::move(process);
    }

    if (received != static_cast<ssize_t>(sizeof(failure))) {
        const int read_error = received < 0 ? errno : EPROTO;
        return make_error(ErrorKind::IoError,
                          "Unable to read launch status for " + program + ": " +
                              os_error_text(read_error));
    }

    // The child has already exited; reap it so nothing is left behind.
    auto reaped = process.reap();
    if (core::errors::is_error(reaped)) {
        SYNX_LOG_WARN(core::errors::get_error(reaped).message);
    }

    const auto stage = static_cast<ChildStage>(failure.stage);
    const std::string detail = "Failed to " + stage_name(stage) + " for " + program +
                               ": " + os_error_text(failure.error);
    if (stage == ChildStage::SyscallFilter) {
        return make_error(ErrorKind::PolicyInstallFailed, detail,
                          "The sandbox could not be installed; the program was not run.");
    }
    return make_error(ErrorKind::LaunchFailed, detail);
}

protocol::SandboxCapabilities ProcessLauncher::capabilities() {
    protocol::SandboxCapabilities caps;
    caps.resource_limits = true;
    caps.process_groups = true;
    caps.syscall_filter = filter_supported();
    caps.network_enforced = caps.syscall_filter;
    caps.file_writes_enforced = caps.syscall_filter;
    caps.subprocesses_enforced = caps.syscall_filter;
    return caps;
}

}  // namespace synx::exec
