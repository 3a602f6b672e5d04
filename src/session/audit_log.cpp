#include "session/audit_log.hpp"

#include <chrono>
#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace synx::session {

using core::errors::ErrorKind;
using core::errors::make_error;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

json record_to_json(const AuditRecord& record) {
    json payload;
    payload["program"] = record.program;
    payload["args"] = record.args;
    payload["working_dir"] =
        record.working_dir.has_value() ? json(record.working_dir.value()) : json(nullptr);
    payload["policy"] = record.policy;
    payload["outcome"] = record.outcome;
    payload["exit_code"] =
        record.exit_code.has_value() ? json(record.exit_code.value()) : json(nullptr);
    payload["term_signal"] = record.term_signal;
    payload["duration_ms"] = record.duration_ms;
    payload["error_code"] = record.error_code;
    payload["error_message"] = record.error_message;
    return payload;
}

}  // namespace

std::string to_string(const AuditEvent event) {
    switch (event) {
        case AuditEvent::ToolExecution:
            return "tool_execution";
        case AuditEvent::SecurityViolation:
            return "security_violation";
        default:
            return "unknown";
    }
}

AuditLog::AuditLog(std::filesystem::path directory, std::string file_name)
    : directory_(std::move(directory)), file_name_(std::move(file_name)) {}

core::errors::Result<std::filesystem::path> AuditLog::log_path() const {
    if (file_name_.empty()) {
        return make_error(ErrorKind::IoError, "Audit log file name cannot be empty.");
    }

    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        return make_error(ErrorKind::IoError,
                          "Unable to create audit directory: " + directory_.string(),
                          ec.message());
    }
    return directory_ / file_name_;
}

core::errors::Result<std::filesystem::path> AuditLog::record(
    const AuditEvent event, const std::string& exec_id,
    const AuditRecord& record) const {
    json entry;
    entry["ts_unix_ms"] = now_unix_ms();
    entry["event"] = to_string(event);
    entry["exec_id"] = exec_id;
    entry["payload"] = record_to_json(record);
    // Invalid UTF-8 in arguments must not abort the write.
    const std::string line = entry.dump(-1, ' ', false, json::error_handler_t::replace);

    std::lock_guard<std::mutex> lock(mutex_);
    auto path_result = log_path();
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return make_error(ErrorKind::IoError,
                          "Unable to open audit log: " + path.string());
    }

    out << line << "\n";
    out.flush();
    if (!out.good()) {
        return make_error(ErrorKind::IoError,
                          "Unable to write audit event: " + path.string());
    }

    return path;
}

}  // namespace synx::session
