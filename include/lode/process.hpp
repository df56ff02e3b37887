#pragma once

#include <string>
#include <vector>

namespace lode {

// ============================================================================
// Child Process Execution
// ============================================================================

struct ProcessSpec {
    std::vector<std::string> argv;  // argv[0] is looked up on PATH
    std::string cwd;                // Working directory for the child; empty inherits
};

struct ProcessResult {
    bool ok = false;       // Process was spawned and reaped
    int exit_code = -1;    // 128 + signal when killed by a signal
    std::string output;    // Combined stdout and stderr
    std::string error;     // Spawn failure description when !ok
};

/**
 * Runs external commands and waits for them.
 *
 * The parent's working directory is never changed; the child is started
 * in ProcessSpec::cwd.
 */
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    virtual ProcessResult run(const ProcessSpec& spec) = 0;
};

// fork/exec on POSIX, CreateProcess on Windows
class SystemProcessRunner : public ProcessRunner {
public:
    ProcessResult run(const ProcessSpec& spec) override;
};

// Render argv as a single shell-like line for logs
std::string format_command(const std::vector<std::string>& argv);

} // namespace lode
