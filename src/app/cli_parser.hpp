#pragma once
#include "protocol/exec_request.hpp"
#include "core/errors/exec_errors.hpp"
#include "policy/execution_policy.hpp"

namespace synx::app::cli {
    synx::core::errors::Result<synx::protocol::ExecRequest> parse_and_validate(int argc, char* argv[]);

    // Policy file default, then the --language override, then explicit flags.
    synx::core::errors::Result<synx::policy::ExecutionPolicy> resolve_policy(
        const synx::protocol::ExecRequest& request);
}
