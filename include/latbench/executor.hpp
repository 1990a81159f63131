#pragma once

#include "latbench/sandbox.hpp"
#include "latbench/warnings.hpp"

#include <optional>
#include <string>
#include <vector>

namespace latbench {

// ============================================================================
// Command Synthesis
// ============================================================================

// POSIX shell quoting: safe strings pass through, everything else is single
// quoted with embedded quotes rewritten as '"'"'
std::string shell_quote(const std::string& s);

// bash /installed-agent/lattice-run.sh <quoted instruction>
std::string build_run_command(const std::string& instruction);

struct ExecInput {
    std::string command;
    std::optional<std::string> cwd;
    EnvMap env;
    std::optional<int> timeout_sec;
};

// The single invocation a run consists of
std::vector<ExecInput> create_run_commands(const std::string& instruction,
                                           const EnvMap& env,
                                           const std::optional<std::string>& cwd = std::nullopt,
                                           const std::optional<int>& timeout_sec = std::nullopt);

// ============================================================================
// Execution Records
// ============================================================================

constexpr const char* TIMEOUT_SENTINEL = "timeout";

struct ExecutionRecord {
    size_t index = 0;
    std::string command;
    EnvMap env;
    std::string stdout_text;
    std::string stderr_text;
    int return_code = -1;
    bool timed_out = false;
    bool exec_failed = false;   // Sandbox could not run the command at all
    std::string log_dir;

    // Contents of return-code.txt
    std::string return_code_text() const;
};

struct ExecuteResult {
    bool ok = false;            // False only if logs could not be persisted
    std::string error;
    std::vector<ExecutionRecord> records;
};

// ============================================================================
// Command Executor
// ============================================================================

// Runs invocations in order. Each invocation's artifacts are durable under
// <logs>/command-<i>/ before the next one starts.
class CommandExecutor {
public:
    CommandExecutor(Sandbox& sandbox, std::string logs_dir, WarningCollector* warnings = nullptr)
        : sandbox_(sandbox), logs_dir_(std::move(logs_dir)), warnings_(warnings) {}

    ExecuteResult execute(const std::vector<ExecInput>& inputs);

private:
    bool run_one(size_t index, const ExecInput& input, ExecutionRecord& record, std::string& error);

    Sandbox& sandbox_;
    std::string logs_dir_;
    WarningCollector* warnings_;
};

} // namespace latbench
