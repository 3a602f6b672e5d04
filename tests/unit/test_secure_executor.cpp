#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>
#include <sys/resource.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/exec_id.hpp"
#include "core/errors/exec_errors.hpp"
#include "exec/process_launcher.hpp"
#include "exec/secure_executor.hpp"
#include "session/audit_log.hpp"

namespace {

using synx::core::errors::ErrorKind;
using synx::core::errors::get_error;
using synx::core::errors::get_value;
using synx::core::errors::is_error;
using synx::exec::ProcessLauncher;
using synx::exec::SecureCommand;
using synx::exec::SecureExecutor;
using synx::policy::ExecutionPolicy;
using synx::session::AuditLog;
using nlohmann::json;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_secure_executor_" + synx::core::config::generate_exec_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

std::vector<std::string> read_lines(const std::filesystem::path& file_path) {
    std::vector<std::string> lines;
    std::ifstream in(file_path);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

bool filters_available() {
    return ProcessLauncher::capabilities().syscall_filter;
}

TEST(SecureExecutorTest, EchoesUnderDefaultPolicy) {
    SecureExecutor executor;
    auto result = executor.execute("/bin/echo", {"hello"}, std::nullopt, {},
                                   ExecutionPolicy{});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).stdout_data, "hello\n");
    EXPECT_EQ(get_value(result).exit_code, 0);
    EXPECT_GE(get_value(result).duration_ms, 0.0);
}

TEST(SecureExecutorTest, RejectsInjectionBeforeLaunch) {
    SecureExecutor executor;
    auto result = executor.execute("/bin/echo", {"hello; rm -rf /"}, std::nullopt, {},
                                   ExecutionPolicy{});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::UnsafeArgument);
}

TEST(SecureExecutorTest, RejectsMissingProgram) {
    SecureExecutor executor;
    auto result = executor.execute("/nonexistent/binary", {}, std::nullopt, {},
                                   ExecutionPolicy{});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::ProgramNotFound);
}

TEST(SecureExecutorTest, RejectsWorkingDirOutsideAllowedPaths) {
    ExecutionPolicy policy;
    policy.allowed_paths = {"/home/user/project"};
    SecureExecutor executor;
    auto result = executor.execute("/bin/ls", {}, std::filesystem::path("/etc"), {}, policy);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::PathNotAllowed);
}

TEST(SecureExecutorTest, RejectsEnvOverrideByDefault) {
    SecureExecutor executor;
    auto result = executor.execute("/bin/echo", {}, std::nullopt, {{"PATH", "/tmp"}},
                                   ExecutionPolicy{});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::EnvModificationDenied);
}

TEST(SecureExecutorTest, RejectsInvalidPolicy) {
    ExecutionPolicy policy;
    policy.timeout = std::chrono::milliseconds(0);
    SecureExecutor executor;
    auto result = executor.execute("/bin/echo", {}, std::nullopt, {}, policy);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::InvalidPolicy);
}

TEST(SecureExecutorTest, AllowedEnvOverrideReachesChild) {
    ExecutionPolicy policy;
    policy.restrictions.allow_env_modifications = true;
    SecureExecutor executor;
    auto result = executor.execute("/usr/bin/env", {}, std::nullopt,
                                   {{"SYNX_PROBE", "first"}, {"SYNX_PROBE", "second"}},
                                   policy);
    ASSERT_FALSE(is_error(result));
    const auto& out = get_value(result).stdout_data;
    EXPECT_NE(out.find("SYNX_PROBE=second\n"), std::string::npos);
    EXPECT_EQ(out.find("SYNX_PROBE=first"), std::string::npos);
}

TEST(SecureExecutorTest, RunsInRequestedWorkingDirectory) {
    TempWorkspace workspace;
    ExecutionPolicy policy;
    policy.allowed_paths = {workspace.root()};
    SecureExecutor executor;
    auto result = executor.execute("/bin/pwd", {}, workspace.root(), {}, policy);
    ASSERT_FALSE(is_error(result));
    const auto expected = std::filesystem::canonical(workspace.root()).string() + "\n";
    EXPECT_EQ(get_value(result).stdout_data, expected);
}

TEST(SecureExecutorTest, TimeoutReturnsNoOutput) {
    ExecutionPolicy policy;
    policy.timeout = std::chrono::milliseconds(1000);
    SecureExecutor executor;
    const auto started = std::chrono::steady_clock::now();
    auto result = executor.execute("/bin/sleep", {"5"}, std::nullopt, {}, policy);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::Timeout);
    EXPECT_LT(elapsed, std::chrono::milliseconds(4000));
}

TEST(SecureExecutorTest, ResourceLimitsApplyToChildOnly) {
    rlimit memory_before{};
    rlimit cpu_before{};
    ASSERT_EQ(getrlimit(RLIMIT_AS, &memory_before), 0);
    ASSERT_EQ(getrlimit(RLIMIT_CPU, &cpu_before), 0);

    ExecutionPolicy policy;
    policy.memory_limit = 256ULL * 1024 * 1024;
    policy.cpu_limit = 7;
    SecureExecutor executor;
    auto result = executor.execute("/bin/sh", {"-c", "ulimit -v\nulimit -t"}, std::nullopt,
                                   {}, policy);
    ASSERT_FALSE(is_error(result)) << get_error(result).message;
    EXPECT_EQ(get_value(result).stdout_data, "262144\n7\n");

    rlimit memory_after{};
    rlimit cpu_after{};
    ASSERT_EQ(getrlimit(RLIMIT_AS, &memory_after), 0);
    ASSERT_EQ(getrlimit(RLIMIT_CPU, &cpu_after), 0);
    EXPECT_EQ(memory_after.rlim_cur, memory_before.rlim_cur);
    EXPECT_EQ(memory_after.rlim_max, memory_before.rlim_max);
    EXPECT_EQ(cpu_after.rlim_cur, cpu_before.rlim_cur);
    EXPECT_EQ(cpu_after.rlim_max, cpu_before.rlim_max);
}

TEST(SecureExecutorTest, FileWritesDeniedByDefault) {
    if (!filters_available()) {
        GTEST_SKIP() << "Syscall filtering is not available on this host.";
    }
    TempWorkspace workspace;
    SecureExecutor executor;
    auto result = executor.execute("/bin/mkdir", {"created"}, workspace.root(), {},
                                   ExecutionPolicy{});
    ASSERT_FALSE(is_error(result));
    EXPECT_NE(get_value(result).exit_code, 0);
    EXPECT_FALSE(std::filesystem::exists(workspace.root() / "created"));
}

TEST(SecureExecutorTest, FileWritesAllowedWhenPolicyOpensThem) {
    TempWorkspace workspace;
    ExecutionPolicy policy;
    policy.restrictions.allow_file_writes = true;
    SecureExecutor executor;
    auto result = executor.execute("/bin/mkdir", {"created"}, workspace.root(), {}, policy);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).exit_code, 0);
    EXPECT_TRUE(std::filesystem::is_directory(workspace.root() / "created"));
}

TEST(SecureExecutorTest, RecursiveRemoveCannotDestroyFiles) {
    if (!filters_available()) {
        GTEST_SKIP() << "Syscall filtering is not available on this host.";
    }
    TempWorkspace workspace;
    const auto victim = workspace.root() / "victim";
    std::filesystem::create_directories(victim / "nested");
    {
        std::ofstream out(victim / "nested/keep.txt");
        out << "still here";
    }

    SecureExecutor executor;
    auto result = executor.execute("/bin/rm", {"-rf", victim.string()}, std::nullopt, {},
                                   ExecutionPolicy{});
    ASSERT_FALSE(is_error(result));
    EXPECT_NE(get_value(result).exit_code, 0);
    EXPECT_TRUE(std::filesystem::exists(victim / "nested/keep.txt"));
}

TEST(SecureExecutorTest, ShellCannotSpawnChildren) {
    if (!filters_available()) {
        GTEST_SKIP() << "Syscall filtering is not available on this host.";
    }
    TempWorkspace workspace;
    const auto victim = workspace.root() / "victim";
    std::filesystem::create_directories(victim);

    ExecutionPolicy policy;
    policy.restrictions.allow_file_writes = true;
    SecureExecutor executor;
    // Two commands, so the shell has to fork for the first one.
    auto result = executor.execute("/bin/sh", {"-c", "rm -rf " + victim.string() + "\ntrue"},
                                   std::nullopt, {}, policy);
    ASSERT_FALSE(is_error(result));
    EXPECT_NE(get_value(result).exit_code, 0);
    EXPECT_TRUE(std::filesystem::exists(victim));
}

TEST(SecureExecutorTest, RunAcceptsPrebuiltCommand) {
    auto command = SecureCommand::create("echo");
    ASSERT_FALSE(is_error(command));
    command = get_value(command).arg("prebuilt");
    ASSERT_FALSE(is_error(command));

    SecureExecutor executor;
    auto result = executor.run(get_value(command));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).stdout_data, "prebuilt\n");
}

TEST(SecureExecutorTest, AuditsExecutionsAndViolations) {
    TempWorkspace workspace;
    auto audit_log = std::make_shared<const AuditLog>(workspace.root());
    SecureExecutor executor(audit_log);

    ASSERT_FALSE(is_error(executor.execute("/bin/echo", {"audited"}, std::nullopt, {},
                                           ExecutionPolicy{})));
    ASSERT_TRUE(is_error(executor.execute("/bin/echo", {"a|b"}, std::nullopt, {},
                                          ExecutionPolicy{})));

    const auto lines = read_lines(workspace.root() / "exec-audit.jsonl");
    ASSERT_EQ(lines.size(), 2u);

    const auto completed = json::parse(lines[0]);
    EXPECT_EQ(completed.at("event").get<std::string>(), "tool_execution");
    EXPECT_EQ(completed.at("payload").at("outcome").get<std::string>(), "completed");
    EXPECT_EQ(completed.at("payload").at("exit_code").get<int>(), 0);

    const auto rejected = json::parse(lines[1]);
    EXPECT_EQ(rejected.at("event").get<std::string>(), "security_violation");
    EXPECT_EQ(rejected.at("payload").at("outcome").get<std::string>(), "rejected");
    EXPECT_EQ(rejected.at("payload").at("error_code").get<std::string>(), "unsafe_argument");
    EXPECT_NE(completed.at("exec_id").get<std::string>(),
              rejected.at("exec_id").get<std::string>());
}

}  // namespace
