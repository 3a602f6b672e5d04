#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/exec_errors.hpp"
#include "exec/secure_command.hpp"
#include "policy/execution_policy.hpp"
#include "protocol/execution_contract.hpp"
#include "session/audit_log.hpp"

namespace synx::exec {

// The one operation validators use: sanitize, launch under the policy, race
// against the deadline, and hand back output or a terminal error. Stateless
// apart from the optional audit sink; safe to share across threads.
class SecureExecutor {
public:
    explicit SecureExecutor(std::shared_ptr<const session::AuditLog> audit_log = nullptr);

    core::errors::Result<protocol::ExecutionOutput> execute(
        const std::filesystem::path& program, const std::vector<std::string>& args,
        const std::optional<std::filesystem::path>& working_dir,
        const std::vector<SecureCommand::EnvOverride>& env_overrides,
        const policy::ExecutionPolicy& execution_policy) const;

    // Runs a command built by the caller. The command is consumed.
    core::errors::Result<protocol::ExecutionOutput> run(SecureCommand command) const;

private:
    core::errors::Result<protocol::ExecutionOutput> run_with_id(
        const std::string& exec_id, const SecureCommand& command) const;

    void audit(session::AuditEvent event, const std::string& exec_id,
               const session::AuditRecord& record) const;

    std::shared_ptr<const session::AuditLog> audit_log_;
};

}  // namespace synx::exec
