#include "latbench/agent.hpp"
#include "latbench/platform.hpp"

#include <filesystem>

#ifndef LATBENCH_DEFAULT_RUNNER_SCRIPT
#define LATBENCH_DEFAULT_RUNNER_SCRIPT "scripts/lattice-run.sh"
#endif

namespace latbench {

namespace {

std::string lookup(const EnvMap& env, const char* key) {
    auto it = env.find(key);
    return it == env.end() ? std::string() : trim(it->second);
}

} // namespace

std::string resolve_repo_root(const std::string& explicit_root, const EnvMap& snapshot) {
    // 1. Explicit override
    if (!trim(explicit_root).empty()) {
        return expand_user_path(trim(explicit_root));
    }

    // 2. Environment variable
    std::string env_root = lookup(snapshot, ENV_AGENT_REPO_ROOT);
    if (!env_root.empty()) {
        return expand_user_path(env_root);
    }

    // 3. Default: current directory
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    return ec ? std::string(".") : cwd.string();
}

std::string resolve_runner_script(const std::string& explicit_path, const EnvMap& snapshot) {
    if (!trim(explicit_path).empty()) {
        return expand_user_path(trim(explicit_path));
    }

    std::string env_path = lookup(snapshot, "LATBENCH_RUNNER_SCRIPT");
    if (!env_path.empty()) {
        return expand_user_path(env_path);
    }

    return expand_user_path(LATBENCH_DEFAULT_RUNNER_SCRIPT);
}

// ============================================================================
// Bench Agent
// ============================================================================

BenchAgent::BenchAgent(AgentOptions options, EnvironmentConfig config,
                       std::optional<std::string> providers_file,
                       std::string repo_root, std::string runner_script)
    : options_(std::move(options)),
      config_(std::move(config)),
      providers_file_(std::move(providers_file)),
      repo_root_(std::move(repo_root)),
      runner_script_(std::move(runner_script)),
      payload_(PayloadRequest{repo_root_, options_.include_paths, options_.mandatory_entry}) {}

Result<std::unique_ptr<BenchAgent>> BenchAgent::create(AgentOptions options, EnvMap snapshot) {
    using R = Result<std::unique_ptr<BenchAgent>>;

    if (trim(options.logs_dir).empty()) {
        return R::err(Error(ErrorKind::Configuration, "logs directory is required", "logs_dir"));
    }

    std::string repo_root = resolve_repo_root(options.repo_root, snapshot);
    std::string runner_script = resolve_runner_script(options.runner_script, snapshot);

    auto resolved = resolve_config(options.overrides, std::move(snapshot));
    if (!resolved.ok) {
        return R::err(Error(ErrorKind::Configuration, resolved.error, resolved.key));
    }

    if (!is_directory(repo_root)) {
        return R::err(Error(ErrorKind::Setup, "agent repository root not found: " + repo_root,
                            ENV_AGENT_REPO_ROOT));
    }

    std::unique_ptr<BenchAgent> agent(new BenchAgent(std::move(options), std::move(resolved.config),
                                                     std::move(resolved.providers_file),
                                                     std::move(repo_root), std::move(runner_script)));
    return R::ok(std::move(agent));
}

SetupResult BenchAgent::setup(Sandbox& sandbox) {
    SetupRequest request;
    request.logs_dir = options_.logs_dir;
    request.runner_script = runner_script_;
    request.config = config_;
    request.providers_file = providers_file_;

    SandboxRunner runner(sandbox, payload_, &warnings_);
    SetupResult result = runner.setup(request);
    setup_done_ = result.ok;
    return result;
}

RunResult BenchAgent::run(const std::string& instruction, Sandbox& sandbox, RunContext& context,
                          const RunOptions& options) {
    RunResult result;

    if (!setup_done_) {
        result.error_kind = ErrorKind::Setup;
        result.error = "setup has not completed";
        return result;
    }

    auto inputs = create_run_commands(instruction, config_.values(), options.cwd, options.timeout_sec);

    CommandExecutor executor(sandbox, options_.logs_dir, &warnings_);
    ExecuteResult executed = executor.execute(inputs);
    result.records = std::move(executed.records);

    // Harvest regardless of how the command ended
    ResultHarvester harvester(sandbox, options_.logs_dir, &warnings_);
    result.telemetry = harvester.harvest(context);

    if (!executed.ok) {
        result.error_kind = ErrorKind::Setup;
        result.error = executed.error;
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace latbench
