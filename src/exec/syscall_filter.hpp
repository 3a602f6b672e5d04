#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include "core/errors/exec_errors.hpp"
#include "policy/execution_policy.hpp"

#if defined(__linux__)
#include <linux/filter.h>
#endif

namespace synx::exec {

// seccomp-BPF program denying the syscall families a policy closes. Denied
// calls fail with EPERM instead of killing the child, so well-behaved tools
// report a readable error. Built in the parent; installed in the child
// between fork and exec.
class SyscallFilter {
public:
    // An empty filter when the policy opens every restricted family or the
    // platform has no syscall filtering.
    static SyscallFilter for_policy(const policy::ExecutionPolicy& execution_policy);

    // True when this build knows how to filter on this architecture and the
    // running kernel accepts seccomp filters.
    static bool supported();

    bool empty() const;
    std::size_t instruction_count() const;

    // Async-signal-safe. Sets no_new_privs and loads the program into the
    // calling thread. Returns 0 or the errno of the failing call.
    int install() const noexcept;

private:
#if defined(__linux__)
    void deny(long syscall_nr, int error);
    void deny_when_arg_has(long syscall_nr, unsigned arg_index, std::uint32_t mask,
                           int error);
    void deny_unless_arg_has(long syscall_nr, unsigned arg_index, std::uint32_t mask,
                             int error);
    void finish();

    std::vector<sock_filter> program_;
#endif
};

}  // namespace synx::exec
