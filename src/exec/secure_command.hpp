#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "core/errors/exec_errors.hpp"
#include "policy/execution_policy.hpp"

namespace synx::exec {

// A fully sanitized request to run one program. Every builder step validates
// its input eagerly and returns either a new command advanced by exactly that
// field or an error; the launcher only ever sees sanitized values.
//
// The policy is fixed at creation so the working directory and environment
// are always checked against the policy that will govern the launch.
class SecureCommand {
public:
    using EnvOverride = std::pair<std::string, std::string>;

    static core::errors::Result<SecureCommand> create(
        const std::filesystem::path& program,
        policy::ExecutionPolicy execution_policy = {});

    core::errors::Result<SecureCommand> arg(const std::string& argument) const;
    // All or nothing: one rejected argument rejects the whole batch.
    core::errors::Result<SecureCommand> args(
        const std::vector<std::string>& arguments) const;
    core::errors::Result<SecureCommand> current_dir(
        const std::filesystem::path& working_dir) const;
    core::errors::Result<SecureCommand> env(const std::string& key,
                                            const std::string& value) const;

    const std::filesystem::path& program() const { return program_; }
    const std::vector<std::string>& arguments() const { return args_; }
    const std::optional<std::filesystem::path>& working_dir() const {
        return working_dir_;
    }
    // In insertion order; a later duplicate key wins at launch.
    const std::vector<EnvOverride>& env_overrides() const { return env_; }
    const policy::ExecutionPolicy& execution_policy() const { return policy_; }

    bool operator==(const SecureCommand& other) const;

private:
    SecureCommand(std::filesystem::path program, policy::ExecutionPolicy execution_policy);

    std::filesystem::path program_;
    std::vector<std::string> args_;
    std::optional<std::filesystem::path> working_dir_;
    std::vector<EnvOverride> env_;
    policy::ExecutionPolicy policy_;
};

}  // namespace synx::exec
