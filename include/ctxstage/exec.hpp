#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace ctxstage {
namespace exec {

// ============================================================================
// EXECUTION RESULT
// ============================================================================

struct ExecResult {
    bool ok = false;            // process was started and reaped
    int exit_code = -1;         // 128 + signal when killed by a signal
    std::string error;
    bool interrupted = false;   // an interrupt was forwarded to the child
};

// ============================================================================
// COMMAND
// ============================================================================

struct Command {
    std::vector<std::string> argv;                  // argv[0] is looked up in PATH
    std::map<std::string, std::string> environment; // added to / overriding the parent's
    std::string cwd;
};

// Receives one line of output, without its trailing newline
using LineHandler = std::function<void(const std::string& line)>;

// Build the child's environment: parent environment plus overrides, sorted
std::vector<std::string> build_environment(const Command& command);

// Render argv as a single display string
std::string format_command_line(const std::vector<std::string>& argv);

/**
 * Run a command with stdout and stderr merged into one pipe.
 *
 * Every complete line is handed to on_line before the next read. A final
 * line without a newline is delivered after EOF. Returns after the child has
 * been reaped. If an interrupt is requested at any point while the child
 * runs, SIGINT is forwarded to it once.
 */
ExecResult run_streaming(const Command& command, const LineHandler& on_line);

/**
 * Run a command with all output discarded, wait for it, return its status.
 */
ExecResult run_quiet(const Command& command);

} // namespace exec
} // namespace ctxstage
