#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace noisedet {

struct ProcessResult {
    int exitCode{-1};               // valid when the child exited normally
    std::optional<int> termSignal;  // set when the child was killed by a signal
    std::string stdoutText;
    std::string stderrText;

    bool exitedCleanly() const { return !termSignal && exitCode == 0; }
};

// Runs argv[0] (looked up on PATH when it has no slash) with stdin bound to
// /dev/null and both output streams captured in full.
//
// Throws ExecutionError when the program cannot be launched, or when it is
// still running after `timeout` (the child is killed and reaped first).
// A non-zero exit is NOT an error here; callers inspect the result.
ProcessResult runProcess(const std::vector<std::string>& argv,
                         std::chrono::milliseconds timeout);

// Renders argv for log lines, quoting arguments that contain spaces.
std::string describeCommand(const std::vector<std::string>& argv);

} // namespace noisedet
