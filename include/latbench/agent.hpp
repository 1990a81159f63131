#pragma once

/**
 * @file agent.hpp
 * @brief Benchmark adapter that stages and runs the agent in a sandbox
 *
 * @example
 * ```cpp
 * latbench::AgentOptions options;
 * options.logs_dir = "/tmp/trial-1/agent";
 *
 * auto created = latbench::BenchAgent::create(options, latbench::snapshot_environment());
 * if (created.isErr()) {
 *     // Configuration or setup error, nothing was run
 * }
 * auto& agent = *created.value();
 *
 * latbench::DockerSandbox sandbox("task-container", runner, env);
 * auto setup = agent.setup(sandbox);
 *
 * latbench::RunContext context;
 * auto run = agent.run("fix the failing test", sandbox, context);
 * ```
 */

#include "latbench/config.hpp"
#include "latbench/executor.hpp"
#include "latbench/harvest.hpp"
#include "latbench/result.hpp"
#include "latbench/sandbox.hpp"
#include "latbench/setup.hpp"
#include "latbench/warnings.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace latbench {

// ============================================================================
// Agent Options
// ============================================================================

struct AgentOptions {
    ConfigOverrides overrides;
    std::string logs_dir;

    // Agent repository to bundle. Empty: LATTICE_AGENT_REPO_ROOT, then the
    // current directory.
    std::string repo_root;

    // Host copy of lattice-run.sh. Empty: the script shipped with latbench.
    std::string runner_script;

    std::vector<std::string> include_paths = default_include_paths();
    std::optional<std::string> mandatory_entry = std::string(DEFAULT_MANDATORY_ENTRY);
};

// Repository root: explicit value > LATTICE_AGENT_REPO_ROOT > current directory
std::string resolve_repo_root(const std::string& explicit_root, const EnvMap& snapshot);

// Runner script: explicit value > LATBENCH_RUNNER_SCRIPT > installed default
std::string resolve_runner_script(const std::string& explicit_path, const EnvMap& snapshot);

struct RunOptions {
    std::optional<std::string> cwd;
    std::optional<int> timeout_sec;
};

struct RunResult {
    bool ok = false;            // The command ran; says nothing about the task outcome
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
    std::vector<ExecutionRecord> records;
    TelemetryOutcome telemetry;
};

// ============================================================================
// Bench Agent
// ============================================================================

/**
 * @brief Adapter instance for one trial
 *
 * Owns the configuration resolved at creation, the payload cache and the
 * logs directory. setup() must succeed before run().
 */
class BenchAgent {
public:
    /**
     * @brief Resolve configuration from the snapshot and validate inputs
     *
     * Fails with ErrorKind::Configuration before any sandbox contact, or
     * ErrorKind::Setup when the repository root does not exist.
     */
    static Result<std::unique_ptr<BenchAgent>> create(AgentOptions options, EnvMap snapshot);

    static const char* name() { return "lattice"; }

    SetupResult setup(Sandbox& sandbox);

    RunResult run(const std::string& instruction, Sandbox& sandbox, RunContext& context,
                  const RunOptions& options = {});

    const EnvironmentConfig& config() const { return config_; }
    const std::optional<std::string>& providers_file() const { return providers_file_; }
    const std::string& logs_dir() const { return options_.logs_dir; }
    const std::string& repo_root() const { return repo_root_; }
    const std::string& runner_script() const { return runner_script_; }

    WarningCollector& warnings() { return warnings_; }
    const PayloadCache& payload() const { return payload_; }
    bool is_setup() const { return setup_done_; }

private:
    BenchAgent(AgentOptions options, EnvironmentConfig config,
               std::optional<std::string> providers_file,
               std::string repo_root, std::string runner_script);

    AgentOptions options_;
    EnvironmentConfig config_;
    std::optional<std::string> providers_file_;
    std::string repo_root_;
    std::string runner_script_;
    PayloadCache payload_;
    WarningCollector warnings_;
    bool setup_done_ = false;
};

} // namespace latbench
