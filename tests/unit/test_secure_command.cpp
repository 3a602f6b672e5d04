#include <filesystem>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/exec_errors.hpp"
#include "exec/secure_command.hpp"

namespace {

using synx::core::errors::ErrorKind;
using synx::core::errors::get_error;
using synx::core::errors::get_value;
using synx::core::errors::is_error;
using synx::exec::SecureCommand;
using synx::policy::ExecutionPolicy;

SecureCommand echo_command(const ExecutionPolicy& policy = {}) {
    auto created = SecureCommand::create("/bin/echo", policy);
    EXPECT_FALSE(is_error(created));
    return get_value(created);
}

TEST(SecureCommandTest, CreateResolvesProgram) {
    const auto command = echo_command();
    EXPECT_TRUE(command.program().is_absolute());
    EXPECT_TRUE(command.arguments().empty());
    EXPECT_FALSE(command.working_dir().has_value());
    EXPECT_TRUE(command.env_overrides().empty());
}

TEST(SecureCommandTest, CreateRejectsMissingProgram) {
    auto result = SecureCommand::create("/nonexistent/binary");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::ProgramNotFound);
}

TEST(SecureCommandTest, CreateRejectsInvalidPolicy) {
    ExecutionPolicy policy;
    policy.cpu_limit = 0;
    auto result = SecureCommand::create("/bin/echo", policy);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::InvalidPolicy);
}

TEST(SecureCommandTest, ArgsAppendInOrder) {
    auto result = echo_command().arg("first");
    ASSERT_FALSE(is_error(result));
    result = get_value(result).args({"second", "third"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).arguments(),
              (std::vector<std::string>{"first", "second", "third"}));
}

TEST(SecureCommandTest, OneUnsafeArgumentRejectsTheBatch) {
    auto result = echo_command().args({"ok", "hello; rm -rf /", "never"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::UnsafeArgument);
}

TEST(SecureCommandTest, BuildersLeaveSourceUnchanged) {
    const auto base = echo_command();
    auto first = base.arg("x");
    auto second = base.arg("x");
    ASSERT_FALSE(is_error(first));
    ASSERT_FALSE(is_error(second));
    EXPECT_TRUE(get_value(first) == get_value(second));
    EXPECT_TRUE(base.arguments().empty());
}

TEST(SecureCommandTest, WorkingDirOutsideAllowedPathsIsRejected) {
    ExecutionPolicy policy;
    policy.allowed_paths = {"/home/user/project"};
    auto result = echo_command(policy).current_dir("/etc");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::PathNotAllowed);
}

TEST(SecureCommandTest, WorkingDirIsCanonicalized) {
    auto result = echo_command().current_dir("/tmp/.");
    ASSERT_FALSE(is_error(result));
    ASSERT_TRUE(get_value(result).working_dir().has_value());
    EXPECT_TRUE(get_value(result).working_dir()->is_absolute());
}

TEST(SecureCommandTest, EnvDeniedByDefault) {
    auto result = echo_command().env("PATH", "/tmp");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::EnvModificationDenied);
}

TEST(SecureCommandTest, EnvRecordedWhenAllowed) {
    ExecutionPolicy policy;
    policy.restrictions.allow_env_modifications = true;
    auto result = echo_command(policy).env("LANG", "C");
    ASSERT_FALSE(is_error(result));
    ASSERT_EQ(get_value(result).env_overrides().size(), 1u);
    EXPECT_EQ(get_value(result).env_overrides()[0].first, "LANG");
    EXPECT_EQ(get_value(result).env_overrides()[0].second, "C");
}

TEST(SecureCommandTest, ShellWithPlainScriptPassesSanitizer) {
    // Nothing here is a metacharacter; the OS sandbox is what stops it.
    auto result = SecureCommand::create("/bin/sh");
    ASSERT_FALSE(is_error(result));
    result = get_value(result).args({"-c", "rm -rf /"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).arguments().back(), "rm -rf /");
}

}  // namespace
