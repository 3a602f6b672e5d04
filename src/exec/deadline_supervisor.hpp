#pragma once

#include <chrono>
#include "core/errors/exec_errors.hpp"
#include "exec/process_launcher.hpp"
#include "protocol/execution_contract.hpp"

namespace synx::exec {

// Races a child's completion against a deadline. The calling thread drains the
// child's output and waits for it to exit; one auxiliary thread sleeps until
// the deadline. Whichever claims the outcome first decides it:
//  - completion: the child's output and exit status are returned;
//  - deadline: the child's process group is killed, partial output is
//    discarded, and Timeout is returned once the child is dead.
// The child is reaped exactly once, after the race is decided.
class DeadlineSupervisor {
public:
    explicit DeadlineSupervisor(std::chrono::milliseconds timeout);

    core::errors::Result<protocol::ExecutionOutput> supervise(
        LaunchedProcess& process) const;

private:
    std::chrono::milliseconds timeout_;
};

}  // namespace synx::exec
