#include "exec/syscall_filter.hpp"

#include <cerrno>

#if defined(__linux__)
#include <fcntl.h>
#include <linux/audit.h>
#include <linux/seccomp.h>
#include <sched.h>
#include <stddef.h>
#include <sys/prctl.h>
#include <sys/syscall.h>
#endif

namespace synx::exec {

#if defined(__linux__)

namespace {

#if defined(__x86_64__)
constexpr std::uint32_t kAuditArch = AUDIT_ARCH_X86_64;
constexpr bool kArchKnown = true;
#elif defined(__aarch64__)
constexpr std::uint32_t kAuditArch = AUDIT_ARCH_AARCH64;
constexpr bool kArchKnown = true;
#elif defined(__i386__)
constexpr std::uint32_t kAuditArch = AUDIT_ARCH_I386;
constexpr bool kArchKnown = true;
#elif defined(__riscv) && __riscv_xlen == 64
constexpr std::uint32_t kAuditArch = AUDIT_ARCH_RISCV64;
constexpr bool kArchKnown = true;
#else
constexpr std::uint32_t kAuditArch = 0;
constexpr bool kArchKnown = false;
#endif

// open(2)/openat(2) flags that can create, modify or truncate a file.
constexpr std::uint32_t kWriteOpenFlags = O_WRONLY | O_RDWR | O_CREAT | O_TRUNC;

constexpr std::uint32_t kRetAllow = SECCOMP_RET_ALLOW;

std::uint32_t ret_errno(const int error) {
    return SECCOMP_RET_ERRNO | (static_cast<std::uint32_t>(error) & SECCOMP_RET_DATA);
}

// Offset of the low 32 bits of syscall argument `index`.
std::uint32_t arg_low_offset(const unsigned index) {
    const auto base = static_cast<std::uint32_t>(offsetof(struct seccomp_data, args) +
                                                 index * sizeof(std::uint64_t));
#if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
    return base;
#else
    return base + sizeof(std::uint32_t);
#endif
}

}  // namespace

void SyscallFilter::deny(const long syscall_nr, const int error) {
    program_.push_back(BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K,
                                static_cast<std::uint32_t>(syscall_nr), 0, 1));
    program_.push_back(BPF_STMT(BPF_RET | BPF_K, ret_errno(error)));
}

// The accumulator is clobbered by the argument load, so a matched syscall
// always returns from inside its own block.
void SyscallFilter::deny_when_arg_has(const long syscall_nr, const unsigned arg_index,
                                      const std::uint32_t mask, const int error) {
    program_.push_back(BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K,
                                static_cast<std::uint32_t>(syscall_nr), 0, 4));
    program_.push_back(BPF_STMT(BPF_LD | BPF_W | BPF_ABS, arg_low_offset(arg_index)));
    program_.push_back(BPF_JUMP(BPF_JMP | BPF_JSET | BPF_K, mask, 0, 1));
    program_.push_back(BPF_STMT(BPF_RET | BPF_K, ret_errno(error)));
    program_.push_back(BPF_STMT(BPF_RET | BPF_K, kRetAllow));
}

void SyscallFilter::deny_unless_arg_has(const long syscall_nr, const unsigned arg_index,
                                        const std::uint32_t mask, const int error) {
    program_.push_back(BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K,
                                static_cast<std::uint32_t>(syscall_nr), 0, 4));
    program_.push_back(BPF_STMT(BPF_LD | BPF_W | BPF_ABS, arg_low_offset(arg_index)));
    program_.push_back(BPF_JUMP(BPF_JMP | BPF_JSET | BPF_K, mask, 1, 0));
    program_.push_back(BPF_STMT(BPF_RET | BPF_K, ret_errno(error)));
    program_.push_back(BPF_STMT(BPF_RET | BPF_K, kRetAllow));
}

void SyscallFilter::finish() {
    program_.push_back(BPF_STMT(BPF_RET | BPF_K, kRetAllow));
}

SyscallFilter SyscallFilter::for_policy(const policy::ExecutionPolicy& execution_policy) {
    SyscallFilter filter;
    const bool deny_network = !execution_policy.allow_network;
    const bool deny_writes = !execution_policy.restrictions.allow_file_writes;
    const bool deny_subprocesses = !execution_policy.restrictions.allow_subprocesses;
    if (!kArchKnown || (!deny_network && !deny_writes && !deny_subprocesses)) {
        return filter;
    }

    auto& program = filter.program_;
    // Syscalls from a foreign ABI use a different numbering; refuse them all.
    program.push_back(BPF_STMT(BPF_LD | BPF_W | BPF_ABS,
                               static_cast<std::uint32_t>(offsetof(struct seccomp_data, arch))));
    program.push_back(BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, kAuditArch, 1, 0));
    program.push_back(BPF_STMT(BPF_RET | BPF_K, ret_errno(EPERM)));
    program.push_back(BPF_STMT(BPF_LD | BPF_W | BPF_ABS,
                               static_cast<std::uint32_t>(offsetof(struct seccomp_data, nr))));
#if defined(__x86_64__)
    // x32 syscalls share the x86_64 audit arch but set bit 30.
    program.push_back(BPF_JUMP(BPF_JMP | BPF_JGE | BPF_K, 0x40000000U, 0, 1));
    program.push_back(BPF_STMT(BPF_RET | BPF_K, ret_errno(EPERM)));
#endif

    if (deny_network) {
#ifdef __NR_socket
        filter.deny(__NR_socket, EPERM);
#endif
#ifdef __NR_socketpair
        filter.deny(__NR_socketpair, EPERM);
#endif
#ifdef __NR_connect
        filter.deny(__NR_connect, EPERM);
#endif
#ifdef __NR_accept
        filter.deny(__NR_accept, EPERM);
#endif
#ifdef __NR_accept4
        filter.deny(__NR_accept4, EPERM);
#endif
#ifdef __NR_bind
        filter.deny(__NR_bind, EPERM);
#endif
#ifdef __NR_listen
        filter.deny(__NR_listen, EPERM);
#endif
#ifdef __NR_socketcall
        filter.deny(__NR_socketcall, EPERM);
#endif
    }

    if (deny_writes) {
#ifdef __NR_open
        filter.deny_when_arg_has(__NR_open, 1, kWriteOpenFlags, EPERM);
#endif
        filter.deny_when_arg_has(__NR_openat, 2, kWriteOpenFlags, EPERM);
#ifdef __NR_openat2
        // Flags sit behind a pointer; ENOSYS makes libc fall back to openat.
        filter.deny(__NR_openat2, ENOSYS);
#endif
#ifdef __NR_creat
        filter.deny(__NR_creat, EPERM);
#endif
#ifdef __NR_rename
        filter.deny(__NR_rename, EPERM);
#endif
#ifdef __NR_renameat
        filter.deny(__NR_renameat, EPERM);
#endif
#ifdef __NR_renameat2
        filter.deny(__NR_renameat2, EPERM);
#endif
#ifdef __NR_unlink
        filter.deny(__NR_unlink, EPERM);
#endif
        filter.deny(__NR_unlinkat, EPERM);
#ifdef __NR_rmdir
        filter.deny(__NR_rmdir, EPERM);
#endif
#ifdef __NR_mkdir
        filter.deny(__NR_mkdir, EPERM);
#endif
        filter.deny(__NR_mkdirat, EPERM);
#ifdef __NR_mknod
        // mknod creates regular files too when given S_IFREG.
        filter.deny(__NR_mknod, EPERM);
#endif
        filter.deny(__NR_mknodat, EPERM);
#ifdef __NR_link
        filter.deny(__NR_link, EPERM);
#endif
        filter.deny(__NR_linkat, EPERM);
#ifdef __NR_symlink
        filter.deny(__NR_symlink, EPERM);
#endif
        filter.deny(__NR_symlinkat, EPERM);
        filter.deny(__NR_truncate, EPERM);
    }

    if (deny_subprocesses) {
#ifdef __NR_fork
        filter.deny(__NR_fork, EPERM);
#endif
#ifdef __NR_vfork
        filter.deny(__NR_vfork, EPERM);
#endif
        // Threads are not subprocesses: clone with CLONE_THREAD stays allowed.
        filter.deny_unless_arg_has(__NR_clone, 0, CLONE_THREAD, EPERM);
#ifdef __NR_clone3
        // Flags sit behind a pointer; ENOSYS makes libc fall back to clone.
        filter.deny(__NR_clone3, ENOSYS);
#endif
    }

    filter.finish();
    return filter;
}

bool SyscallFilter::supported() {
    if (!kArchKnown) {
        return false;
    }
    // With filter support compiled in, a null program fails with EFAULT;
    // without it the kernel answers EINVAL. Nothing is installed either way.
    const int rc = prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, nullptr, 0, 0);
    return rc == -1 && errno == EFAULT;
}

bool SyscallFilter::empty() const {
    return program_.empty();
}

std::size_t SyscallFilter::instruction_count() const {
    return program_.size();
}

int SyscallFilter::install() const noexcept {
    if (program_.empty()) {
        return 0;
    }
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        return errno;
    }
    sock_fprog prog{};
    prog.len = static_cast<unsigned short>(program_.size());
    prog.filter = const_cast<sock_filter*>(program_.data());
    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog, 0, 0) != 0) {
        return errno;
    }
    return 0;
}

#else  // !__linux__

SyscallFilter SyscallFilter::for_policy(const policy::ExecutionPolicy&) {
    return SyscallFilter{};
}

bool SyscallFilter::supported() {
    return false;
}

bool SyscallFilter::empty() const {
    return true;
}

std::size_t SyscallFilter::instruction_count() const {
    return 0;
}

int SyscallFilter::install() const noexcept {
    return 0;
}

#endif

}  // namespace synx::exec
