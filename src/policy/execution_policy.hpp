#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>
#include "core/errors/exec_errors.hpp"

namespace synx::policy {

// Every permission is closed unless the caller opts in explicitly.
struct Restrictions {
    bool allow_shell_expansion = false;
    bool allow_file_writes = false;
    bool allow_subprocesses = false;
    bool allow_env_modifications = false;
};

inline constexpr std::uint64_t kDefaultMemoryLimitBytes = 512ULL * 1024 * 1024;
// Longest timeout a policy may carry (24 hours).
inline constexpr std::chrono::milliseconds kMaxTimeout{86400000};

// Declarative description of what a launched child may do. The default value
// is the maximally restrictive policy; it is never mutated once attached to a
// command.
struct ExecutionPolicy {
    std::chrono::milliseconds timeout{30000};
    std::uint64_t memory_limit = kDefaultMemoryLimitBytes;
    // CPU-time ceiling in seconds on POSIX.
    std::uint32_t cpu_limit = 50;
    bool allow_network = false;
    // Empty means the working directory is unrestricted.
    std::vector<std::filesystem::path> allowed_paths;
    Restrictions restrictions;
};

bool operator==(const Restrictions& lhs, const Restrictions& rhs);
bool operator==(const ExecutionPolicy& lhs, const ExecutionPolicy& rhs);

// Checks limits are positive, the timeout is at most kMaxTimeout, and roots
// are absolute and unique; returns the policy with lexically normalized roots.
core::errors::Result<ExecutionPolicy> validate_policy(ExecutionPolicy policy);

std::string describe(const ExecutionPolicy& policy);

void to_json(nlohmann::json& out, const Restrictions& restrictions);
void from_json(const nlohmann::json& in, Restrictions& restrictions);
void to_json(nlohmann::json& out, const ExecutionPolicy& policy);
// Missing keys keep the value already present in `policy`.
void from_json(const nlohmann::json& in, ExecutionPolicy& policy);

}  // namespace synx::policy
