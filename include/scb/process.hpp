#pragma once

#include <optional>
#include <string>
#include <vector>

namespace scb {

// ============================================================================
// Process Execution
// ============================================================================

struct ProcessOptions {
    std::string cwd;              // empty: inherit
    int timeout_seconds = 0;      // 0: wait forever
    bool capture_output = false;  // collect stdout+stderr instead of inheriting
};

struct ProcessResult {
    bool ok = false;         // process was spawned and reaped
    int exit_code = -1;
    bool timed_out = false;
    std::string output;      // only with capture_output
    std::string error;
};

/**
 * Run argv[0] (searched on PATH) with fork/execvp and wait for it.
 *
 * A process still running at the deadline is killed with SIGKILL and
 * reported with timed_out set.
 */
ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& options = {});

// Locate an executable on PATH.
std::optional<std::string> find_executable(const std::string& name);

} // namespace scb
