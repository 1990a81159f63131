/**
 * latbench CLI - run command
 *
 * Stage the agent into a running container, execute one instruction and
 * write <logs>/result.json.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>
#include <memory>

namespace latbench::cli::commands {

namespace {

struct RunCommandOptions {
    std::string container;
    std::string logs_dir;
    std::string instruction;
    std::string model;
    std::string experiments;
    std::string timeout;
    int command_timeout = 0;
    std::string cwd;
    std::string runner;
    std::string docker = "docker";
};

nlohmann::json records_to_json(const std::vector<ExecutionRecord>& records) {
    nlohmann::json commands = nlohmann::json::array();
    for (const auto& record : records) {
        nlohmann::json c;
        c["index"] = record.index;
        c["command"] = record.command;
        c["return_code"] = record.return_code_text();
        c["timed_out"] = record.timed_out;
        c["exec_failed"] = record.exec_failed;
        c["log_dir"] = record.log_dir;
        commands.push_back(c);
    }
    return commands;
}

nlohmann::json context_to_json(const RunContext& context) {
    nlohmann::json j;
    j["n_input_tokens"] = context.n_input_tokens ? nlohmann::json(*context.n_input_tokens) : nlohmann::json();
    j["n_output_tokens"] = context.n_output_tokens ? nlohmann::json(*context.n_output_tokens) : nlohmann::json();
    j["cost_usd"] = context.cost_usd ? nlohmann::json(*context.cost_usd) : nlohmann::json();
    return j;
}

int cmd_run(const GlobalOptions& opts, const RunCommandOptions& run_opts) {
    init_message_collector(opts.json, opts.quiet);

    std::string started_at = get_current_timestamp();
    EnvMap snapshot = snapshot_environment();

    AgentOptions agent_opts;
    agent_opts.logs_dir = run_opts.logs_dir;
    agent_opts.repo_root = opts.root;
    agent_opts.runner_script = run_opts.runner;
    if (!run_opts.model.empty()) agent_opts.overrides.model_name = run_opts.model;
    if (!run_opts.experiments.empty()) agent_opts.overrides.experiments = run_opts.experiments;
    if (!run_opts.timeout.empty()) agent_opts.overrides.timeout_sec = run_opts.timeout;

    auto created = BenchAgent::create(agent_opts, snapshot);
    if (created.isErr()) {
        const auto& err = created.error();
        print_error(err.message(), opts.json, err.key());
        return exit_code_for(err.kind());
    }
    auto& agent = *created.value();
    apply_warning_policy(agent.warnings(), opts);

    DockerSandbox sandbox(run_opts.container, std::make_shared<SystemProcessRunner>(), snapshot);
    sandbox.set_docker_binary(run_opts.docker);

    nlohmann::json result;
    result["agent"] = BenchAgent::name();
    result["container"] = run_opts.container;
    result["model"] = agent.config().get_or(ENV_MODEL, "");
    result["started_at"] = started_at;

    auto finish = [&](int code) {
        result["finished_at"] = get_current_timestamp();
        report_warnings(agent.warnings());
        nlohmann::json warnings = nlohmann::json::array();
        for (const auto& w : agent.warnings().get_warnings()) {
            warnings.push_back(warning_to_json(w));
        }
        result["warnings"] = warnings;

        auto written = atomic_write_file(join_path(run_opts.logs_dir, "result.json"), result.dump(2) + "\n");
        if (!written.ok) {
            print_warning("failed to write result.json: " + written.error);
        }
        return code;
    };

    print_verbose("Staging agent into " + run_opts.container + "...", opts);
    auto setup = agent.setup(sandbox);
    result["archive_sha256"] = setup.archive_sha256;
    if (!setup.ok) {
        result["ok"] = false;
        result["error_kind"] = error_kind_to_string(ErrorKind::Setup);
        result["error"] = setup.error;
        result["failed_step"] = setup_step_to_string(setup.failed_step);
        int code = finish(EXIT_SETUP_ERROR);
        print_error("setup failed at " + std::string(setup_step_to_string(setup.failed_step)) + ": " +
                    setup.error, opts.json);
        return code;
    }

    RunOptions exec_opts;
    if (!run_opts.cwd.empty()) exec_opts.cwd = run_opts.cwd;
    if (run_opts.command_timeout > 0) exec_opts.timeout_sec = run_opts.command_timeout;

    print_verbose("Running instruction...", opts);
    RunContext context;
    auto run = agent.run(run_opts.instruction, sandbox, context, exec_opts);

    result["ok"] = run.ok;
    result["error_kind"] = error_kind_to_string(run.error_kind);
    if (!run.ok) {
        result["error"] = run.error;
    }
    result["commands"] = records_to_json(run.records);
    result["telemetry"] = {{"status", telemetry_status_to_string(run.telemetry.status)},
                           {"detail", run.telemetry.detail}};
    result["context"] = context_to_json(context);

    int code = finish(run.ok ? EXIT_OK : exit_code_for(run.error_kind));

    if (!run.ok) {
        print_error(run.error, opts.json);
        return code;
    }

    if (opts.json) {
        output_json(result);
    } else if (!opts.quiet) {
        for (const auto& record : run.records) {
            std::cout << "command-" << record.index << ": return code " << record.return_code_text()
                      << std::endl;
        }
        std::cout << "telemetry: " << telemetry_status_to_string(run.telemetry.status) << std::endl;
        if (context.n_input_tokens) {
            std::cout << "  input tokens:  " << *context.n_input_tokens << std::endl;
            std::cout << "  output tokens: " << context.n_output_tokens.value_or(0) << std::endl;
        }
        if (context.cost_usd) {
            std::cout << "  cost (USD):    " << *context.cost_usd << std::endl;
        }
        std::cout << "Logs: " << run_opts.logs_dir << std::endl;
    }
    return code;
}

} // anonymous namespace

void setup_run(CLI::App* app, GlobalOptions& opts) {
    static RunCommandOptions run_opts;

    app->add_option("instruction", run_opts.instruction, "Task instruction for the agent")->required();
    app->add_option("--container", run_opts.container, "Running container name or id")->required();
    app->add_option("--logs-dir", run_opts.logs_dir, "Host directory for run logs")->required();
    app->add_option("-m,--model", run_opts.model, "Model id (provider:model or provider/model)");
    app->add_option("--experiments", run_opts.experiments, "Comma-separated experiment flags");
    app->add_option("--timeout", run_opts.timeout, "Agent timeout in seconds (LATTICE_TIMEOUT_MS)");
    app->add_option("--command-timeout", run_opts.command_timeout, "Sandbox command timeout in seconds")
        ->check(CLI::NonNegativeNumber);
    app->add_option("--cwd", run_opts.cwd, "Working directory inside the container");
    app->add_option("--runner", run_opts.runner, "Runner script (default: installed lattice-run.sh)");
    app->add_option("--docker", run_opts.docker, "docker client binary");

    app->callback([&opts]() {
        std::exit(cmd_run(opts, run_opts));
    });
}

} // namespace latbench::cli::commands
