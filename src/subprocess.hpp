#pragma once
#include <string>
#include <vector>

struct ProcessResult {
    bool timed_out{false};
    int exit_code{-1};      // valid when the child exited normally
    int signal{0};          // non-zero when the child was killed by a signal
    std::string out;
    std::string err;
    double ms{0.0};         // fork to reap

    bool exited_ok() const { return !timed_out && signal == 0 && exit_code == 0; }
};

// Runs argv[0] (an absolute or relative path, no PATH lookup) with stdout and
// stderr captured. The child gets its own process group which is killed with
// SIGKILL once timeout_ms elapses. Throws std::runtime_error when the child
// cannot be started at all.
ProcessResult run_process(const std::vector<std::string>& argv, int timeout_ms);
