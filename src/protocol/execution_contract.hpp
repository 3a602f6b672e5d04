#pragma once

#include <string>

namespace synx::protocol {

    // What a finished child hands back. Both streams are opaque bytes; parsing
    // tool-specific formats is the calling validator's job.
    struct ExecutionOutput {
        int exit_code = -1;       // -1 when the child was killed by a signal
        int term_signal = 0;      // 0 when the child exited normally
        std::string stdout_data;
        std::string stderr_data;
        double duration_ms = 0.0;

        bool success() const { return term_signal == 0 && exit_code == 0; }
    };

    // Which restrictions the current platform actually enforces at OS level.
    struct SandboxCapabilities {
        bool resource_limits = false;
        bool syscall_filter = false;
        bool network_enforced = false;
        bool file_writes_enforced = false;
        bool subprocesses_enforced = false;
        bool process_groups = false;
    };

} // namespace synx::protocol
