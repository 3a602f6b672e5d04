#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/exec_errors.hpp"
#include "policy/execution_policy.hpp"

namespace synx::session {

enum class AuditEvent {
    ToolExecution,
    SecurityViolation
};

std::string to_string(AuditEvent event);

struct AuditRecord {
    std::string program;
    std::vector<std::string> args;
    std::optional<std::string> working_dir;
    policy::ExecutionPolicy policy;
    // "completed", "timeout", "rejected" or "failed"
    std::string outcome;
    std::optional<int> exit_code;
    int term_signal = 0;
    double duration_ms = 0.0;
    std::string error_code;
    std::string error_message;
};

// Append-only JSONL trail, one object per execution attempt. Appends are
// serialized so one log may be shared by concurrent executions.
class AuditLog {
public:
    explicit AuditLog(std::filesystem::path directory,
                      std::string file_name = "exec-audit.jsonl");

    core::errors::Result<std::filesystem::path> record(
        AuditEvent event, const std::string& exec_id,
        const AuditRecord& record) const;

    core::errors::Result<std::filesystem::path> log_path() const;

private:
    std::filesystem::path directory_;
    std::string file_name_;
    mutable std::mutex mutex_;
};

}  // namespace synx::session
