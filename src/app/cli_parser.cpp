#include "cli_parser.hpp"
#include <algorithm>
#include <charconv>
#include <limits>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>
#include "policy/policy_loader.hpp"

namespace synx::app::cli {

    using namespace synx::core::errors;
    using synx::policy::ExecutionPolicy;
    using synx::protocol::ExecMode;
    using synx::protocol::ExecRequest;

    namespace {

    constexpr const char* kUsage =
        "Usage: synx_exec run [options] -- PROGRAM [ARGS...] | synx_exec capabilities";

    ExecError input_error(const std::string& message, const std::string& code,
                          const std::string& hint = "") {
        return ExecError{ErrorKind::InvalidInput, message, code, hint};
    }

    // Exception-free bounded integer parsing
    template <typename T>
    Result<T> parse_bounded(const std::string& flag, const std::string& text, T min, T max) {
        T value = 0;
        const char* begin = text.data();
        const char* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec != std::errc() || ptr != end) {
            return input_error("Invalid number for " + flag, "invalid_integer",
                               "Provide a positive integer.");
        }
        if (value < min || value > max) {
            return input_error(flag + " out of bounds", "bounds_error",
                               "Must be between " + std::to_string(min) + " and " +
                                   std::to_string(max) + ".");
        }
        return value;
    }

    } // namespace

    Result<ExecRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return input_error("No command provided.", "missing_command", kUsage);
        }

        std::string command = argv[1];
        ExecRequest req;
        if (command == "capabilities") {
            req.mode = ExecMode::Capabilities;
        } else if (command != "run") {
            return input_error("Unknown command: " + command, "unknown_command",
                               "Supported commands are 'run' and 'capabilities'.");
        }

        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and command
            args.push_back(argv[i]);
        }

        auto take_value = [&args](std::size_t& i) -> std::optional<std::string> {
            if (i + 1 < args.size()) {
                return args[++i];
            }
            return std::nullopt;
        };

        std::size_t i = 0;
        for (; i < args.size(); ++i) {
            const std::string& flag = args[i];
            if (flag == "--") {
                ++i;
                break;
            }
            if (flag.rfind("--", 0) != 0) {
                break; // First positional token is the program.
            }

            if (flag == "--verbose") {
                req.verbose = true;
                continue;
            }
            if (req.mode == ExecMode::Capabilities) {
                return input_error("Unknown argument: " + flag, "unknown_argument",
                                   "'capabilities' only accepts --verbose.");
            }

            if (flag == "--allow-network") {
                req.allow_network = true;
            } else if (flag == "--allow-writes") {
                req.allow_writes = true;
            } else if (flag == "--allow-subprocesses") {
                req.allow_subprocesses = true;
            } else if (flag == "--allow-env") {
                req.allow_env = true;
            } else if (flag == "--policy-file" || flag == "--language" ||
                       flag == "--timeout-ms" || flag == "--memory-mb" ||
                       flag == "--cpu" || flag == "--allow-path" || flag == "--cwd" ||
                       flag == "--env" || flag == "--audit-dir") {
                const auto value = take_value(i);
                if (!value) {
                    return input_error("Missing value for " + flag, "missing_value");
                }

                if (flag == "--policy-file") {
                    req.policy_file = std::filesystem::path(*value);
                } else if (flag == "--language") {
                    req.language = *value;
                } else if (flag == "--timeout-ms") {
                    auto parsed = parse_bounded<std::uint32_t>(flag, *value, 1, 86400000);
                    if (is_error(parsed)) return get_error(parsed);
                    req.timeout_ms = get_value(parsed);
                } else if (flag == "--memory-mb") {
                    auto parsed = parse_bounded<std::uint64_t>(flag, *value, 1, 1048576);
                    if (is_error(parsed)) return get_error(parsed);
                    req.memory_mb = get_value(parsed);
                } else if (flag == "--cpu") {
                    auto parsed = parse_bounded<std::uint32_t>(flag, *value, 1, 86400);
                    if (is_error(parsed)) return get_error(parsed);
                    req.cpu_limit = get_value(parsed);
                } else if (flag == "--allow-path") {
                    std::error_code path_ec;
                    auto absolute = std::filesystem::absolute(*value, path_ec);
                    if (path_ec) {
                        return input_error("Unable to resolve --allow-path " + *value,
                                           "invalid_path");
                    }
                    req.allowed_paths.push_back(absolute.lexically_normal());
                } else if (flag == "--cwd") {
                    req.working_dir = std::filesystem::path(*value);
                } else if (flag == "--env") {
                    const auto eq = value->find('=');
                    if (eq == std::string::npos || eq == 0) {
                        return input_error("Invalid --env value: " + *value, "invalid_env",
                                           "Use --env KEY=VALUE.");
                    }
                    req.env.emplace_back(value->substr(0, eq), value->substr(eq + 1));
                } else {
                    req.audit_dir = std::filesystem::path(*value);
                }
            } else {
                return input_error("Unknown argument: " + flag, "unknown_argument");
            }
        }

        if (req.mode == ExecMode::Capabilities) {
            if (i < args.size()) {
                return input_error("Unexpected argument: " + args[i], "unknown_argument");
            }
            return req;
        }

        if (i >= args.size()) {
            return input_error("No program given.", "missing_program", kUsage);
        }
        req.program = std::filesystem::path(args[i]);
        for (++i; i < args.size(); ++i) {
            req.args.push_back(args[i]);
        }
        return req;
    }

    Result<ExecutionPolicy> resolve_policy(const ExecRequest& request) {
        ExecutionPolicy policy;
        if (request.policy_file) {
            const synx::policy::PolicyLoader loader;
            auto loaded = loader.load(*request.policy_file);
            if (is_error(loaded)) {
                return get_error(loaded);
            }
            const auto& policies = get_value(loaded);
            policy = request.language ? policies.for_language(*request.language)
                                      : policies.default_policy;
        }

        // Flags only ever open permissions the caller named explicitly.
        if (request.timeout_ms) {
            policy.timeout = std::chrono::milliseconds(*request.timeout_ms);
        }
        if (request.memory_mb) {
            policy.memory_limit = *request.memory_mb * 1024ULL * 1024ULL;
        }
        if (request.cpu_limit) {
            policy.cpu_limit = *request.cpu_limit;
        }
        policy.allow_network = policy.allow_network || request.allow_network;
        policy.restrictions.allow_file_writes =
            policy.restrictions.allow_file_writes || request.allow_writes;
        policy.restrictions.allow_subprocesses =
            policy.restrictions.allow_subprocesses || request.allow_subprocesses;
        policy.restrictions.allow_env_modifications =
            policy.restrictions.allow_env_modifications || request.allow_env;
        for (const auto& root : request.allowed_paths) {
            if (std::find(policy.allowed_paths.begin(), policy.allowed_paths.end(), root) ==
                policy.allowed_paths.end()) {
                policy.allowed_paths.push_back(root);
            }
        }

        return synx::policy::validate_policy(std::move(policy));
    }

} // namespace synx::app::cli
