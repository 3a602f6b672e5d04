#include "policy/input_sanitizer.hpp"

#include <cstdlib>
#include <iterator>
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace synx::policy {

using core::errors::ErrorKind;
using core::errors::make_error;

bool InputSanitizer::is_within_root(const std::filesystem::path& root,
                                    const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        // A trailing separator shows up as an empty final element.
        if (root_it->empty() && std::next(root_it) == root.end()) {
            return true;
        }
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

bool InputSanitizer::contains_metacharacter(const std::string& value) {
    return value.find_first_of(kShellMetacharacters.data(), 0,
                               kShellMetacharacters.size()) != std::string::npos;
}

std::filesystem::path InputSanitizer::search_path(const std::filesystem::path& name) {
    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return name;
    }

    std::istringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        const std::filesystem::path candidate = std::filesystem::path(dir) / name;
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec) && !ec &&
            access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return name;
}

core::errors::Result<std::filesystem::path> InputSanitizer::validate_program(
    const std::filesystem::path& program) const {
    if (program.empty()) {
        return make_error(ErrorKind::ProgramNotFound, "Program path cannot be empty.");
    }

    std::filesystem::path candidate = program;
    if (!program.has_parent_path()) {
        candidate = search_path(program);
    }

    std::error_code ec;
    const std::filesystem::path canonical = std::filesystem::canonical(candidate, ec);
    if (ec) {
        return make_error(ErrorKind::ProgramNotFound,
                          "Program does not exist: " + program.string(),
                          ec.message());
    }
    if (!std::filesystem::is_regular_file(canonical, ec) || ec) {
        return make_error(ErrorKind::ProgramNotFound,
                          "Program is not a regular file: " + canonical.string());
    }

    const auto mode = std::filesystem::status(canonical, ec).permissions();
    if (ec) {
        return make_error(ErrorKind::ProgramNotFound,
                          "Unable to stat program: " + canonical.string(),
                          ec.message());
    }
    using std::filesystem::perms;
    const auto exec_bits = perms::owner_exec | perms::group_exec | perms::others_exec;
    if ((mode & exec_bits) == perms::none) {
        return make_error(ErrorKind::ProgramNotExecutable,
                          "Program is not executable: " + canonical.string());
    }

    return canonical;
}

core::errors::Result<std::string> InputSanitizer::validate_argument(
    const std::string& argument) const {
    if (contains_metacharacter(argument)) {
        return make_error(ErrorKind::UnsafeArgument,
                          "Argument contains shell metacharacters: " + argument,
                          "Pass values as separate arguments; none of ; & | ` $ < > "
                          "are accepted.");
    }
    if (argument.find('\0') != std::string::npos) {
        return make_error(ErrorKind::UnsafeArgument,
                          "Argument contains an embedded NUL byte.");
    }
    return argument;
}

core::errors::Result<std::filesystem::path> InputSanitizer::validate_working_dir(
    const std::filesystem::path& working_dir,
    const std::vector<std::filesystem::path>& allowed_paths) const {
    std::error_code ec;
    const std::filesystem::path canonical =
        std::filesystem::canonical(working_dir, ec);
    if (ec) {
        return make_error(ErrorKind::PathNotAllowed,
                          "Unable to resolve working directory: " +
                              working_dir.string(),
                          ec.message());
    }
    if (!std::filesystem::is_directory(canonical, ec) || ec) {
        return make_error(ErrorKind::PathNotAllowed,
                          "Working directory is not a directory: " +
                              canonical.string());
    }

    if (allowed_paths.empty()) {
        return canonical;
    }

    for (const auto& root : allowed_paths) {
        // Roots are compared in canonical form so a symlinked root still matches.
        std::filesystem::path canonical_root = std::filesystem::weakly_canonical(root, ec);
        if (ec) {
            ec.clear();
            canonical_root = root.lexically_normal();
        }
        if (is_within_root(canonical_root, canonical)) {
            return canonical;
        }
    }

    return make_error(ErrorKind::PathNotAllowed,
                      "Working directory is outside the allowed paths: " +
                          canonical.string());
}

core::errors::Result<std::pair<std::string, std::string>> InputSanitizer::validate_env(
    const std::string& key, const std::string& value,
    const Restrictions& restrictions) const {
    if (!restrictions.allow_env_modifications) {
        return make_error(ErrorKind::EnvModificationDenied,
                          "Environment modifications are not allowed: " + key,
                          "Enable restrictions.allow_env_modifications in the policy.");
    }

    if (key.empty()) {
        return make_error(ErrorKind::UnsafeArgument,
                          "Environment variable name cannot be empty.");
    }
    for (const char c : key) {
        const auto byte = static_cast<unsigned char>(c);
        if (byte > 0x7f || c == '=' || c == '\0') {
            return make_error(ErrorKind::UnsafeArgument,
                              "Invalid environment variable name: " + key);
        }
    }

    if (contains_metacharacter(value) || value.find('\0') != std::string::npos) {
        return make_error(ErrorKind::UnsafeArgument,
                          "Environment value contains shell metacharacters: " + key);
    }

    return std::make_pair(key, value);
}

}  // namespace synx::policy
