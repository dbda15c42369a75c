#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace svcdeck {

struct ProcessOutput {
    bool started = false;    // fork and exec succeeded
    bool timed_out = false;  // child was killed after the deadline
    int exit_code = -1;      // -1 when the child did not exit normally
    std::string stdout_text;
    std::string stderr_text;
    std::string error_message;

    bool ok() const { return started && !timed_out && exit_code == 0; }
};

// Runs argv[0] from PATH without a shell, stdin from /dev/null, capturing
// stdout and stderr. The child is killed with SIGKILL once timeout elapses.
ProcessOutput run_process(const std::vector<std::string>& argv,
                                        std::chrono::milliseconds timeout);

// Trimmed stderr, or a description of why the command did not run
std::string describe_failure(const ProcessOutput& output, const std::string& program);

} // namespace svcdeck
