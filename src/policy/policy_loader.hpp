#pragma once

#include <filesystem>
#include <map>
#include <string>
#include "core/errors/exec_errors.hpp"
#include "policy/execution_policy.hpp"

namespace synx::policy {

// A default policy plus per-language overrides, as read from a config file.
struct PolicySet {
    ExecutionPolicy default_policy;
    std::map<std::string, ExecutionPolicy> language_policies;

    // The override for `language`, or the default when there is none.
    const ExecutionPolicy& for_language(const std::string& language) const;
};

class PolicyLoader {
public:
    core::errors::Result<PolicySet> load(const std::filesystem::path& path) const;
    core::errors::Result<PolicySet> parse(const std::string& text) const;
};

}  // namespace synx::policy
