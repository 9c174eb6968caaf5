/**
 * Subprocess runner
 *
 * Runs a program directly (fork + execvp, no shell) and captures its
 * stdout and stderr separately. Used to drive the container CLI and curl.
 */
#pragma once
#include <string>
#include <vector>

namespace sandpool::util {

struct ProcessOptions {
    std::string stdin_data;  // Written to the child's stdin, then closed
    int timeout_ms = 0;      // 0 = wait forever
};

struct ProcessResult {
    bool started = false;     // fork/exec succeeded
    bool timed_out = false;   // Child was killed after timeout_ms
    int exit_code = -1;       // 128 + signal when killed by a signal
    std::string stdout_data;
    std::string stderr_data;
    std::string error;        // Why the child could not be started

    bool ok() const { return started && !timed_out && exit_code == 0; }
};

// argv[0] is resolved through PATH. Exit code 127 means exec failed.
ProcessResult run_process(const std::vector<std::string>& argv,
                          const ProcessOptions& options = {});

} // namespace sandpool::util
