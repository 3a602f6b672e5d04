#include <chrono>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/exec_errors.hpp"
#include "policy/execution_policy.hpp"

namespace {

using synx::core::errors::ErrorKind;
using synx::core::errors::get_error;
using synx::core::errors::get_value;
using synx::core::errors::is_error;
using synx::policy::ExecutionPolicy;
using synx::policy::validate_policy;
using nlohmann::json;

TEST(ExecutionPolicyTest, DefaultIsMaximallyRestrictive) {
    const ExecutionPolicy policy;
    EXPECT_EQ(policy.timeout, std::chrono::milliseconds(30000));
    EXPECT_EQ(policy.memory_limit, 512ULL * 1024 * 1024);
    EXPECT_EQ(policy.cpu_limit, 50u);
    EXPECT_FALSE(policy.allow_network);
    EXPECT_TRUE(policy.allowed_paths.empty());
    EXPECT_FALSE(policy.restrictions.allow_shell_expansion);
    EXPECT_FALSE(policy.restrictions.allow_file_writes);
    EXPECT_FALSE(policy.restrictions.allow_subprocesses);
    EXPECT_FALSE(policy.restrictions.allow_env_modifications);
}

TEST(ExecutionPolicyTest, RejectsZeroTimeout) {
    ExecutionPolicy policy;
    policy.timeout = std::chrono::milliseconds(0);
    auto result = validate_policy(policy);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::InvalidPolicy);
}

TEST(ExecutionPolicyTest, TimeoutIsCappedAtOneDay) {
    ExecutionPolicy longest;
    longest.timeout = std::chrono::milliseconds(86400000);
    EXPECT_FALSE(is_error(validate_policy(longest)));

    ExecutionPolicy too_long;
    too_long.timeout = std::chrono::hours(25);
    auto result = validate_policy(too_long);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::InvalidPolicy);
}

TEST(ExecutionPolicyTest, RejectsZeroLimits) {
    ExecutionPolicy no_memory;
    no_memory.memory_limit = 0;
    EXPECT_TRUE(is_error(validate_policy(no_memory)));

    ExecutionPolicy no_cpu;
    no_cpu.cpu_limit = 0;
    EXPECT_TRUE(is_error(validate_policy(no_cpu)));
}

TEST(ExecutionPolicyTest, RejectsRelativeAllowedPath) {
    ExecutionPolicy policy;
    policy.allowed_paths = {"relative/dir"};
    auto result = validate_policy(policy);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_policy");
}

TEST(ExecutionPolicyTest, NormalizesAndDeduplicatesRoots) {
    ExecutionPolicy policy;
    policy.allowed_paths = {"/home/user/project/", "/srv/./data"};
    auto result = validate_policy(policy);
    ASSERT_FALSE(is_error(result));
    const auto& roots = get_value(result).allowed_paths;
    ASSERT_EQ(roots.size(), 2u);
    EXPECT_EQ(roots[0].string(), "/home/user/project");
    EXPECT_EQ(roots[1].string(), "/srv/data");

    policy.allowed_paths = {"/srv/data", "/srv/data/"};
    EXPECT_TRUE(is_error(validate_policy(policy)));
}

TEST(ExecutionPolicyTest, DescribeNamesEveryLimit) {
    ExecutionPolicy policy;
    policy.allow_network = true;
    const std::string text = synx::policy::describe(policy);
    EXPECT_NE(text.find("timeout=30000ms"), std::string::npos);
    EXPECT_NE(text.find("network=yes"), std::string::npos);
    EXPECT_NE(text.find("writes=no"), std::string::npos);
}

TEST(ExecutionPolicyTest, JsonKeepsUnnamedFields) {
    ExecutionPolicy policy;
    policy.cpu_limit = 7;
    const json overrides = {{"timeout_ms", 1500},
                            {"restrictions", {{"allow_file_writes", true}}}};
    synx::policy::from_json(overrides, policy);

    EXPECT_EQ(policy.timeout, std::chrono::milliseconds(1500));
    EXPECT_EQ(policy.cpu_limit, 7u);
    EXPECT_TRUE(policy.restrictions.allow_file_writes);
    EXPECT_FALSE(policy.restrictions.allow_subprocesses);
}

TEST(ExecutionPolicyTest, JsonWritesEveryKey) {
    ExecutionPolicy policy;
    policy.allowed_paths = {"/srv/data"};
    const json out = policy;
    EXPECT_EQ(out.at("timeout_ms").get<long long>(), 30000);
    EXPECT_EQ(out.at("memory_limit_bytes").get<unsigned long long>(), 512ULL * 1024 * 1024);
    EXPECT_EQ(out.at("allowed_paths").at(0).get<std::string>(), "/srv/data");
    EXPECT_FALSE(out.at("restrictions").at("allow_env_modifications").get<bool>());
}

TEST(ExecutionPolicyTest, NegativeValuesFailValidation) {
    ExecutionPolicy policy;
    synx::policy::from_json(json{{"memory_limit_bytes", -1}}, policy);
    EXPECT_EQ(policy.memory_limit, 0u);
    EXPECT_TRUE(is_error(validate_policy(policy)));
}

}  // namespace
