#include "exec/secure_executor.hpp"

#include <utility>
#include "core/config/exec_id.hpp"
#include "core/logging/logger.hpp"
#include "exec/deadline_supervisor.hpp"
#include "exec/process_launcher.hpp"

namespace synx::exec {

using core::errors::ErrorKind;
using core::errors::ExecError;
using core::errors::get_error;
using core::errors::get_value;
using core::errors::is_error;
using protocol::ExecutionOutput;
using session::AuditEvent;
using session::AuditRecord;

namespace {

AuditRecord request_record(const std::string& program, const std::vector<std::string>& args,
                           const std::optional<std::filesystem::path>& working_dir,
                           const policy::ExecutionPolicy& execution_policy) {
    AuditRecord record;
    record.program = program;
    record.args = args;
    if (working_dir.has_value()) {
        record.working_dir = working_dir->string();
    }
    record.policy = execution_policy;
    return record;
}

void apply_error(AuditRecord& record, const ExecError& error) {
    record.error_code = error.code;
    record.error_message = error.message;
    if (error.kind == ErrorKind::Timeout) {
        record.outcome = "timeout";
    } else if (core::errors::is_validation_error(error)) {
        record.outcome = "rejected";
    } else {
        record.outcome = "failed";
    }
}

}  // namespace

SecureExecutor::SecureExecutor(std::shared_ptr<const session::AuditLog> audit_log)
    : audit_log_(std::move(audit_log)) {}

void SecureExecutor::audit(const AuditEvent event, const std::string& exec_id,
                           const AuditRecord& record) const {
    if (!audit_log_) {
        return;
    }
    auto written = audit_log_->record(event, exec_id, record);
    if (is_error(written)) {
        SYNX_LOG_WARN("[" + exec_id + "] Audit write failed: " +
                      get_error(written).message);
    }
}

core::errors::Result<ExecutionOutput> SecureExecutor::execute(
    const std::filesystem::path& program, const std::vector<std::string>& args,
    const std::optional<std::filesystem::path>& working_dir,
    const std::vector<SecureCommand::EnvOverride>& env_overrides,
    const policy::ExecutionPolicy& execution_policy) const {
    const std::string exec_id = core::config::generate_exec_id();

    // Sanitizing finishes before any OS resource is allocated for the child.
    auto command = SecureCommand::create(program, execution_policy);
    if (!is_error(command)) {
        command = get_value(command).args(args);
    }
    if (!is_error(command) && working_dir.has_value()) {
        command = get_value(command).current_dir(working_dir.value());
    }
    for (const auto& [key, value] : env_overrides) {
        if (is_error(command)) {
            break;
        }
        command = get_value(command).env(key, value);
    }

    if (is_error(command)) {
        const auto& error = get_error(command);
        SYNX_LOG_WARN("[" + exec_id + "] Rejected " + program.string() + " [" +
                      error.code + "]: " + error.message);
        AuditRecord record =
            request_record(program.string(), args, working_dir, execution_policy);
        apply_error(record, error);
        audit(core::errors::is_validation_error(error) ? AuditEvent::SecurityViolation
                                                       : AuditEvent::ToolExecution,
              exec_id, record);
        return error;
    }

    return run_with_id(exec_id, get_value(command));
}

core::errors::Result<ExecutionOutput> SecureExecutor::run(SecureCommand command) const {
    return run_with_id(core::config::generate_exec_id(), command);
}

core::errors::Result<ExecutionOutput> SecureExecutor::run_with_id(
    const std::string& exec_id, const SecureCommand& command) const {
    const auto& execution_policy = command.execution_policy();
    AuditRecord record = request_record(command.program().string(), command.arguments(),
                                        command.working_dir(), execution_policy);

    const bool debug = core::logging::Logger::get().enabled(core::logging::LogLevel::DEBUG);
    if (debug) {
        SYNX_LOG_DEBUG("[" + exec_id + "] Executing " + command.program().string() + " (" +
                       policy::describe(execution_policy) + ")");
    }

    const ProcessLauncher launcher;
    auto launched = launcher.launch(command);
    if (is_error(launched)) {
        const auto& error = get_error(launched);
        SYNX_LOG_ERROR("[" + exec_id + "] Launch failed [" + error.code + "]: " +
                       error.message);
        apply_error(record, error);
        audit(AuditEvent::ToolExecution, exec_id, record);
        return error;
    }

    auto& process = get_value(launched);
    const DeadlineSupervisor supervisor(execution_policy.timeout);
    auto supervised = supervisor.supervise(process);
    if (is_error(supervised)) {
        const auto& error = get_error(supervised);
        apply_error(record, error);
        audit(AuditEvent::ToolExecution, exec_id, record);
        return error;
    }

    const auto& output = get_value(supervised);
    record.outcome = "completed";
    record.exit_code = output.exit_code;
    record.term_signal = output.term_signal;
    record.duration_ms = output.duration_ms;
    audit(AuditEvent::ToolExecution, exec_id, record);

    if (debug) {
        SYNX_LOG_DEBUG("[" + exec_id + "] Finished with exit code " +
                       std::to_string(output.exit_code) +
                       (output.term_signal != 0
                            ? " (signal " + std::to_string(output.term_signal) + ")"
                            : std::string()));
    }
    return supervised;
}

}  // namespace synx::exec
