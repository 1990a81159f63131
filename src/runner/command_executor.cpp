#include "latbench/executor.hpp"
#include "latbench/platform.hpp"

#include <algorithm>
#include <cstring>

namespace latbench {

// ============================================================================
// Command Synthesis
// ============================================================================

namespace {

bool is_shell_safe(char c) {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
        return true;
    }
    return std::strchr("@%+=:,./_-", c) != nullptr && c != '\0';
}

} // namespace

std::string shell_quote(const std::string& s) {
    if (s.empty()) {
        return "''";
    }
    if (std::all_of(s.begin(), s.end(), is_shell_safe)) {
        return s;
    }

    std::string quoted = "'";
    for (char c : s) {
        if (c == '\'') {
            quoted += "'\"'\"'";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string build_run_command(const std::string& instruction) {
    return std::string("bash ") + SandboxLayout::RUNNER_PATH + " " + shell_quote(instruction);
}

std::vector<ExecInput> create_run_commands(const std::string& instruction,
                                           const EnvMap& env,
                                           const std::optional<std::string>& cwd,
                                           const std::optional<int>& timeout_sec) {
    ExecInput input;
    input.command = build_run_command(instruction);
    input.cwd = cwd;
    input.env = env;
    input.timeout_sec = timeout_sec;
    return {input};
}

std::string ExecutionRecord::return_code_text() const {
    if (timed_out) {
        return TIMEOUT_SENTINEL;
    }
    return std::to_string(return_code);
}

// ============================================================================
// Command Executor
// ============================================================================

bool CommandExecutor::run_one(size_t index, const ExecInput& input,
                              ExecutionRecord& record, std::string& error) {
    record.index = index;
    record.command = input.command;
    record.env = input.env;
    record.log_dir = join_path(logs_dir_, "command-" + std::to_string(index));

    auto dir_result = atomic_create_directory(record.log_dir);
    if (!dir_result.ok) {
        error = dir_result.error;
        return false;
    }

    // command.txt exists before the command starts
    auto write_result = atomic_write_file(join_path(record.log_dir, "command.txt"), input.command);
    if (!write_result.ok) {
        error = write_result.error;
        return false;
    }

    ExecRequest request;
    request.command = input.command;
    request.cwd = input.cwd;
    request.env = input.env;
    request.timeout_sec = input.timeout_sec;

    ExecResult exec = sandbox_.exec(request);

    if (!exec.ok) {
        record.exec_failed = true;
        record.return_code = -1;
        record.stderr_text = exec.error.empty() ? "sandbox exec failed" : exec.error;
        if (warnings_) {
            warnings_->emit(Warning::exec_unavailable,
                            {{"index", std::to_string(index)}, {"reason", record.stderr_text}});
        }
    } else {
        record.return_code = exec.return_code;
        record.timed_out = exec.timed_out;
        // Partial output of a timed-out command is kept
        record.stdout_text = std::move(exec.stdout_text);
        record.stderr_text = std::move(exec.stderr_text);

        if (warnings_ && record.timed_out) {
            warnings_->emit(Warning::command_timed_out,
                            warnings::command_outcome(index, record.return_code_text()));
        } else if (warnings_ && record.return_code != 0) {
            warnings_->emit(Warning::command_failed,
                            warnings::command_outcome(index, record.return_code_text()));
        }
    }

    write_result = atomic_write_file(join_path(record.log_dir, "return-code.txt"), record.return_code_text());
    if (!write_result.ok) {
        error = write_result.error;
        return false;
    }

    if (!record.stdout_text.empty()) {
        write_result = atomic_write_file(join_path(record.log_dir, "stdout.txt"), record.stdout_text);
        if (!write_result.ok) {
            error = write_result.error;
            return false;
        }
    }

    if (!record.stderr_text.empty()) {
        write_result = atomic_write_file(join_path(record.log_dir, "stderr.txt"), record.stderr_text);
        if (!write_result.ok) {
            error = write_result.error;
            return false;
        }
    }

    return true;
}

ExecuteResult CommandExecutor::execute(const std::vector<ExecInput>& inputs) {
    ExecuteResult result;

    for (size_t i = 0; i < inputs.size(); ++i) {
        ExecutionRecord record;
        if (!run_one(i, inputs[i], record, result.error)) {
            result.error = "failed to persist command-" + std::to_string(i) + " logs: " + result.error;
            return result;
        }
        result.records.push_back(std::move(record));
    }

    result.ok = true;
    return result;
}

} // namespace latbench
