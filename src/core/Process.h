#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace arp_sweep {

struct ProcessResult {
    int exit_code = 0;      // WEXITSTATUS, or 128+signo when the child died on a signal
    std::string out;        // stdout
    std::string err;        // stderr
    std::string combined;   // stdout+stderr interleaved in arrival order
};

struct ProcessOptions {
    std::optional<std::chrono::milliseconds> deadline; // wall-clock budget from launch; none = wait forever
    std::chrono::milliseconds kill_grace{2000};        // SIGTERM -> SIGKILL escalation after the deadline
};

// Runs an external program to completion. Throws SpawnError when the program
// cannot be launched and TimeoutError when the deadline elapses (the child is
// terminated and reaped before the exception surfaces).
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;
    virtual ProcessResult run(const std::vector<std::string>& argv, const ProcessOptions& opts) = 0;
};

// fork/execvp with stdout/stderr on pipes, stdin on /dev/null. The child is
// placed in its own process group so the watchdog can terminate helpers it spawns.
class PosixProcessRunner : public ProcessRunner {
public:
    ProcessResult run(const std::vector<std::string>& argv, const ProcessOptions& opts) override;
};

ProcessRunner& default_process_runner();

std::string join_argv(const std::vector<std::string>& argv);

}
