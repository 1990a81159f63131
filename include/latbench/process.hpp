#pragma once

#include "latbench/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace latbench {

// ============================================================================
// Host Processes
// ============================================================================

struct ProcessRequest {
    std::vector<std::string> argv;          // argv[0] is looked up on PATH
    EnvMap env;                             // Complete environment of the child
    std::optional<std::string> cwd;
    std::optional<int> timeout_sec;
};

struct ProcessResult {
    bool ok = false;            // False if the process could not be started
    std::string error;
    int exit_code = -1;         // 128 + signal when killed by a signal
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
};

// poll() timeout for the time left until a deadline, rounded up and clamped
// to the int range poll() accepts
int poll_timeout_ms(std::chrono::milliseconds remaining);

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    virtual ProcessResult run(const ProcessRequest& request) = 0;
};

// fork/exec with captured output. On timeout the process group gets SIGTERM,
// then SIGKILL once the grace period has passed; output read so far is kept.
class SystemProcessRunner : public ProcessRunner {
public:
    explicit SystemProcessRunner(int kill_grace_ms = 2000) : kill_grace_ms_(kill_grace_ms) {}

    ProcessResult run(const ProcessRequest& request) override;

private:
    int kill_grace_ms_;
};

} // namespace latbench
