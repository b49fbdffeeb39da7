#pragma once

#include <string>
#include <vector>

namespace wheelsmith {

// ============================================================================
// Subprocess Execution
// ============================================================================

struct ProcessOptions {
    std::string cwd;                // Working directory of the child only
    int timeout_seconds = 0;        // 0 = wait forever
    bool capture_output = false;    // Collect the child's stdout into output
};

struct ProcessResult {
    bool ok = false;                // Child was spawned and reaped
    int exit_code = -1;             // 128 + signal when killed by a signal
    bool timed_out = false;
    std::string error;
    std::string output;             // stdout, when capture_output is set
};

// Run argv[0] (searched on PATH) with the given arguments and wait for it.
// The parent's working directory is never touched: options.cwd is applied
// in the child between fork and exec.
ProcessResult run_process(const std::vector<std::string>& argv,
                          const ProcessOptions& options = {});

} // namespace wheelsmith
