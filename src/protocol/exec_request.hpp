#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace synx::protocol {

    enum class ExecMode {
        Run,
        Capabilities
    };

    // Validated command-line input for the synx_exec driver
    struct ExecRequest {
        ExecMode mode = ExecMode::Run;
        std::filesystem::path program;
        std::vector<std::string> args;
        std::optional<std::filesystem::path> working_dir;
        std::vector<std::pair<std::string, std::string>> env;

        // Policy sources, applied in order: file default, language override, flags.
        std::optional<std::filesystem::path> policy_file;
        std::optional<std::string> language;
        std::optional<std::uint32_t> timeout_ms;
        std::optional<std::uint64_t> memory_mb;
        std::optional<std::uint32_t> cpu_limit;
        bool allow_network = false;
        bool allow_writes = false;
        bool allow_subprocesses = false;
        bool allow_env = false;
        std::vector<std::filesystem::path> allowed_paths;

        std::optional<std::filesystem::path> audit_dir;
        bool verbose = false;
    };

} // namespace synx::protocol
