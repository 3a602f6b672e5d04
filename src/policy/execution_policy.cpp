#include "policy/execution_policy.hpp"

#include <algorithm>
#include <limits>
#include <sstream>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

namespace synx::policy {

using core::errors::ErrorKind;
using core::errors::make_error;
using nlohmann::json;

namespace {

std::string yes_no(const bool value) {
    return value ? "yes" : "no";
}

// Negative counts from a config file collapse to zero so validation rejects them.
std::uint64_t non_negative(const std::int64_t value) {
    return value < 0 ? 0 : static_cast<std::uint64_t>(value);
}

}  // namespace

bool operator==(const Restrictions& lhs, const Restrictions& rhs) {
    return lhs.allow_shell_expansion == rhs.allow_shell_expansion &&
           lhs.allow_file_writes == rhs.allow_file_writes &&
           lhs.allow_subprocesses == rhs.allow_subprocesses &&
           lhs.allow_env_modifications == rhs.allow_env_modifications;
}

bool operator==(const ExecutionPolicy& lhs, const ExecutionPolicy& rhs) {
    return lhs.timeout == rhs.timeout && lhs.memory_limit == rhs.memory_limit &&
           lhs.cpu_limit == rhs.cpu_limit &&
           lhs.allow_network == rhs.allow_network &&
           lhs.allowed_paths == rhs.allowed_paths &&
           lhs.restrictions == rhs.restrictions;
}

core::errors::Result<ExecutionPolicy> validate_policy(ExecutionPolicy policy) {
    if (policy.timeout.count() <= 0) {
        return make_error(ErrorKind::InvalidPolicy,
                          "Policy timeout must be positive.",
                          "Set timeout_ms to a value greater than zero.");
    }
    if (policy.timeout > kMaxTimeout) {
        return make_error(ErrorKind::InvalidPolicy,
                          "Policy timeout exceeds " + std::to_string(kMaxTimeout.count()) + "ms.",
                          "Set timeout_ms to at most one day.");
    }
    if (policy.memory_limit == 0) {
        return make_error(ErrorKind::InvalidPolicy,
                          "Policy memory limit must be positive.");
    }
    if (policy.cpu_limit == 0) {
        return make_error(ErrorKind::InvalidPolicy,
                          "Policy CPU limit must be positive.");
    }

    std::vector<std::filesystem::path> normalized;
    normalized.reserve(policy.allowed_paths.size());
    for (const auto& root : policy.allowed_paths) {
        if (root.empty() || !root.is_absolute()) {
            return make_error(ErrorKind::InvalidPolicy,
                              "Allowed path must be absolute: " + root.string());
        }
        auto clean = root.lexically_normal();
        // "/a/b/" normalizes to "/a/b/" with an empty trailing element.
        if (clean.has_parent_path() && clean.filename().empty()) {
            clean = clean.parent_path();
        }
        if (std::find(normalized.begin(), normalized.end(), clean) !=
            normalized.end()) {
            return make_error(ErrorKind::InvalidPolicy,
                              "Allowed path listed twice: " + clean.string());
        }
        normalized.push_back(std::move(clean));
    }
    policy.allowed_paths = std::move(normalized);
    return policy;
}

std::string describe(const ExecutionPolicy& policy) {
    std::ostringstream out;
    out << "timeout=" << policy.timeout.count() << "ms"
        << " memory=" << policy.memory_limit << "B"
        << " cpu=" << policy.cpu_limit
        << " network=" << yes_no(policy.allow_network)
        << " writes=" << yes_no(policy.restrictions.allow_file_writes)
        << " subprocesses=" << yes_no(policy.restrictions.allow_subprocesses)
        << " env=" << yes_no(policy.restrictions.allow_env_modifications)
        << " roots=" << policy.allowed_paths.size();
    return out.str();
}

void to_json(json& out, const Restrictions& restrictions) {
    out = json{{"allow_shell_expansion", restrictions.allow_shell_expansion},
               {"allow_file_writes", restrictions.allow_file_writes},
               {"allow_subprocesses", restrictions.allow_subprocesses},
               {"allow_env_modifications", restrictions.allow_env_modifications}};
}

void from_json(const json& in, Restrictions& restrictions) {
    restrictions.allow_shell_expansion =
        in.value("allow_shell_expansion", restrictions.allow_shell_expansion);
    restrictions.allow_file_writes =
        in.value("allow_file_writes", restrictions.allow_file_writes);
    restrictions.allow_subprocesses =
        in.value("allow_subprocesses", restrictions.allow_subprocesses);
    restrictions.allow_env_modifications =
        in.value("allow_env_modifications", restrictions.allow_env_modifications);
}

void to_json(json& out, const ExecutionPolicy& policy) {
    json roots = json::array();
    for (const auto& root : policy.allowed_paths) {
        roots.push_back(root.string());
    }
    out = json{{"timeout_ms", policy.timeout.count()},
               {"memory_limit_bytes", policy.memory_limit},
               {"cpu_limit", policy.cpu_limit},
               {"allow_network", policy.allow_network},
               {"allowed_paths", roots},
               {"restrictions", policy.restrictions}};
}

void from_json(const json& in, ExecutionPolicy& policy) {
    if (in.contains("timeout_ms")) {
        policy.timeout = std::chrono::milliseconds(in.at("timeout_ms").get<std::int64_t>());
    }
    if (in.contains("memory_limit_bytes")) {
        policy.memory_limit =
            non_negative(in.at("memory_limit_bytes").get<std::int64_t>());
    }
    if (in.contains("cpu_limit")) {
        const auto cpu = non_negative(in.at("cpu_limit").get<std::int64_t>());
        policy.cpu_limit = static_cast<std::uint32_t>(
            std::min<std::uint64_t>(cpu, std::numeric_limits<std::uint32_t>::max()));
    }
    policy.allow_network = in.value("allow_network", policy.allow_network);
    if (in.contains("allowed_paths")) {
        policy.allowed_paths.clear();
        for (const auto& root : in.at("allowed_paths")) {
            policy.allowed_paths.emplace_back(root.get<std::string>());
        }
    }
    if (in.contains("restrictions")) {
        from_json(in.at("restrictions"), policy.restrictions);
    }
}

}  // namespace synx::policy
