#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "core/errors/exec_errors.hpp"
#include "policy/execution_policy.hpp"

namespace synx::policy {

// Characters that carry meaning to a shell. Arguments never reach a shell
// (they are passed as an argv vector), so this is a second layer only.
inline constexpr std::string_view kShellMetacharacters = ";&|`$<>";

class InputSanitizer {
public:
    // Canonical absolute path of an existing regular file with an execute bit.
    // A bare name ("echo") is looked up on PATH first.
    core::errors::Result<std::filesystem::path> validate_program(
        const std::filesystem::path& program) const;

    core::errors::Result<std::string> validate_argument(
        const std::string& argument) const;

    core::errors::Result<std::filesystem::path> validate_working_dir(
        const std::filesystem::path& working_dir,
        const std::vector<std::filesystem::path>& allowed_paths) const;

    core::errors::Result<std::pair<std::string, std::string>> validate_env(
        const std::string& key, const std::string& value,
        const Restrictions& restrictions) const;

    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);

private:
    static std::filesystem::path search_path(const std::filesystem::path& name);
    static bool contains_metacharacter(const std::string& value);
};

}  // namespace synx::policy
