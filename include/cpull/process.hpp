#pragma once

#include <string>
#include <vector>

namespace cpull {

// ============================================================================
// External Process Execution
// ============================================================================
//
// Child processes inherit stdout/stderr and the parent environment. Calls block
// until the child exits; there is no timeout.

struct ProcessResult {
    bool ok = false;      // Child was spawned and reaped
    int exit_code = -1;   // 128 + signal for signaled children
    std::string error;    // Spawn/wait failure description
};

// Run argv[0] (looked up on PATH) with the given arguments.
// An empty cwd keeps the current working directory.
ProcessResult run_process(const std::vector<std::string>& argv, const std::string& cwd = "");

// Run a command line through /bin/sh -c
ProcessResult run_shell(const std::string& command, const std::string& cwd = "");

// Render argv for log messages, single-quoting arguments the shell would split
std::string format_command_line(const std::vector<std::string>& argv);

} // namespace cpull
