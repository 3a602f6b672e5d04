#include <iostream>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "core/errors/exec_errors.hpp"
#include "core/logging/logger.hpp"
#include "exec/process_launcher.hpp"
#include "exec/secure_executor.hpp"
#include "session/audit_log.hpp"

namespace {

int exit_code_for(const synx::core::errors::ExecError& err) {
    using synx::core::errors::ErrorKind;
    switch (err.kind) {
        case ErrorKind::InvalidInput:
        case ErrorKind::InvalidPolicy:
            return 2;
        case ErrorKind::ProgramNotFound:
        case ErrorKind::ProgramNotExecutable:
        case ErrorKind::UnsafeArgument:
        case ErrorKind::PathNotAllowed:
        case ErrorKind::EnvModificationDenied:
            return 3;
        case ErrorKind::PolicyInstallFailed:
        case ErrorKind::LaunchFailed:
            return 4;
        case ErrorKind::Timeout:
            return 124;
        case ErrorKind::IoError:
        default:
            return 5;
    }
}

void report(const synx::core::errors::ExecError& err) {
    SYNX_LOG_ERROR("[" + err.code + "] " + err.message);
    if (!err.hint.empty()) {
        SYNX_LOG_INFO("Hint: " + err.hint);
    }
}

int print_capabilities() {
    const auto caps = synx::exec::ProcessLauncher::capabilities();
    nlohmann::json out;
    out["resource_limits"] = caps.resource_limits;
    out["syscall_filter"] = caps.syscall_filter;
    out["network_enforced"] = caps.network_enforced;
    out["file_writes_enforced"] = caps.file_writes_enforced;
    out["subprocesses_enforced"] = caps.subprocesses_enforced;
    out["process_groups"] = caps.process_groups;
    std::cout << out.dump(2) << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    auto parsed = synx::app::cli::parse_and_validate(argc, argv);
    if (synx::core::errors::is_error(parsed)) {
        const auto& err = synx::core::errors::get_error(parsed);
        report(err);
        return exit_code_for(err);
    }

    const auto& req = synx::core::errors::get_value(parsed);
    if (req.verbose) {
        synx::core::logging::Logger::get().set_min_level(
            synx::core::logging::LogLevel::DEBUG);
    }

    if (req.mode == synx::protocol::ExecMode::Capabilities) {
        return print_capabilities();
    }

    auto policy = synx::app::cli::resolve_policy(req);
    if (synx::core::errors::is_error(policy)) {
        const auto& err = synx::core::errors::get_error(policy);
        report(err);
        return exit_code_for(err);
    }

    std::shared_ptr<const synx::session::AuditLog> audit_log;
    if (req.audit_dir) {
        audit_log = std::make_shared<const synx::session::AuditLog>(*req.audit_dir);
    }

    const synx::exec::SecureExecutor executor(audit_log);
    auto result = executor.execute(req.program, req.args, req.working_dir, req.env,
                                   synx::core::errors::get_value(policy));
    if (synx::core::errors::is_error(result)) {
        const auto& err = synx::core::errors::get_error(result);
        report(err);
        return exit_code_for(err);
    }

    const auto& output = synx::core::errors::get_value(result);
    std::cout << output.stdout_data << std::flush;
    std::cerr << output.stderr_data << std::flush;
    if (output.term_signal != 0) {
        SYNX_LOG_WARN("Program terminated by signal " + std::to_string(output.term_signal));
        return 128 + output.term_signal;
    }
    return output.exit_code;
}
