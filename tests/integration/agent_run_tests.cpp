#include <doctest/doctest.h>
#include <latbench/latbench.hpp>

#include "test_support.hpp"

using namespace latbench;
using latbench::test::FakeSandbox;
using latbench::test::TempDir;
using latbench::test::read_text;
using latbench::test::write_file;

namespace {

// Agent repository with the files the default payload expects
struct AgentRepo {
    TempDir root;
    TempDir logs;

    AgentRepo() {
        write_file(root.file("package.json"), "{\"name\":\"lattice\"}");
        write_file(root.file("bun.lock"), "");
        write_file(root.file("src/cli/run.ts"), "console.log('run')");
        write_file(root.file("scripts/postinstall.sh"), "#!/bin/sh\n", true);
        write_file(root.file("runner/lattice-run.sh"), "#!/bin/bash\necho run\n", true);
    }

    AgentOptions options() const {
        AgentOptions options;
        options.logs_dir = logs.file("agent");
        options.repo_root = root.path();
        options.runner_script = root.file("runner/lattice-run.sh");
        return options;
    }
};

EnvMap anthropic_env() {
    return {{"ANTHROPIC_API_KEY", "sk-ant"}, {"HOME", "/root"}};
}

} // namespace

TEST_CASE("BenchAgent rejects Google models without credentials") {
    AgentRepo repo;
    auto options = repo.options();
    options.overrides.model_name = "google/gemini-2.5-pro";

    auto created = BenchAgent::create(options, {});
    REQUIRE(created.isErr());
    CHECK(created.error().kind() == ErrorKind::Configuration);
    CHECK(created.error().key() == ENV_GOOGLE_PRIMARY_KEY);
}

TEST_CASE("BenchAgent accepts the legacy Google key") {
    AgentRepo repo;
    auto options = repo.options();
    options.overrides.model_name = "google/gemini-2.5-pro";

    auto created = BenchAgent::create(options, {{ENV_GOOGLE_LEGACY_KEY, "g-key"}});
    REQUIRE(created.isOk());
    CHECK(created.value()->config().get(ENV_MODEL) == std::string("google:gemini-2.5-pro"));
}

TEST_CASE("BenchAgent requires a logs directory") {
    AgentRepo repo;
    auto options = repo.options();
    options.logs_dir = "  ";

    auto created = BenchAgent::create(options, anthropic_env());
    REQUIRE(created.isErr());
    CHECK(created.error().kind() == ErrorKind::Configuration);
}

TEST_CASE("BenchAgent reports a missing repository root as a setup error") {
    AgentRepo repo;
    auto options = repo.options();
    options.repo_root = repo.root.file("missing");

    auto created = BenchAgent::create(options, anthropic_env());
    REQUIRE(created.isErr());
    CHECK(created.error().kind() == ErrorKind::Setup);
    CHECK(created.error().key() == ENV_AGENT_REPO_ROOT);
}

TEST_CASE("BenchAgent resolves the repository root from the environment") {
    AgentRepo repo;
    auto options = repo.options();
    options.repo_root.clear();

    EnvMap env = anthropic_env();
    env[ENV_AGENT_REPO_ROOT] = repo.root.path();

    auto created = BenchAgent::create(options, env);
    REQUIRE(created.isOk());
    CHECK(created.value()->repo_root() == repo.root.path());
    CHECK(std::string(BenchAgent::name()) == "lattice");
}

TEST_CASE("BenchAgent refuses to run before setup") {
    AgentRepo repo;
    auto created = BenchAgent::create(repo.options(), anthropic_env());
    REQUIRE(created.isOk());

    FakeSandbox sandbox;
    RunContext context;
    auto result = created.value()->run("do something", sandbox, context);
    CHECK_FALSE(result.ok);
    CHECK(result.error_kind == ErrorKind::Setup);
    CHECK(sandbox.calls.empty());
}

TEST_CASE("BenchAgent sets up, runs and harvests a trial") {
    AgentRepo repo;
    auto options = repo.options();
    options.overrides.model_name = "openai/gpt-5";
    options.overrides.timeout_sec = "90";

    EnvMap env = anthropic_env();
    env["OPENAI_API_KEY"] = "sk-openai";
    env["UNRELATED_SECRET"] = "do-not-forward";

    auto created = BenchAgent::create(options, env);
    REQUIRE(created.isOk());
    auto& agent = *created.value();

    FakeSandbox sandbox;
    auto setup = agent.setup(sandbox);
    REQUIRE(setup.ok);
    CHECK(agent.is_setup());
    CHECK(agent.payload().built());

    sandbox.responses.push_back(FakeSandbox::completed(0, "{\"type\":\"done\"}\n"));
    sandbox.files[SandboxLayout::TELEMETRY_PATH] = R"({"input":120,"output":45,"cost_usd":0.0032})";

    RunContext context;
    RunOptions run_options;
    run_options.cwd = "/workspace";
    auto result = agent.run("Fix the failing test", sandbox, context, run_options);
    REQUIRE(result.ok);
    REQUIRE(result.records.size() == 1);

    CHECK(sandbox.calls.back() == "download /tmp/lattice-tokens.json");
    const ExecRequest& exec = sandbox.requests.back();
    CHECK(exec.command == "bash /installed-agent/lattice-run.sh 'Fix the failing test'");
    CHECK(exec.cwd == std::string("/workspace"));
    CHECK(exec.env.at(ENV_MODEL) == "openai:gpt-5");
    CHECK(exec.env.at(ENV_TIMEOUT_MS) == "90000");
    CHECK(exec.env.at("OPENAI_API_KEY") == "sk-openai");
    CHECK(exec.env.count("UNRELATED_SECRET") == 0);

    std::string command_dir = options.logs_dir + "/command-0";
    CHECK(read_text(command_dir + "/command.txt") == exec.command);
    CHECK(read_text(command_dir + "/return-code.txt") == "0");
    CHECK(read_text(command_dir + "/stdout.txt") == "{\"type\":\"done\"}\n");

    CHECK(result.telemetry.status == TelemetryStatus::Present);
    CHECK(context.n_input_tokens == 120);
    CHECK(context.n_output_tokens == 45);
    REQUIRE(context.cost_usd.has_value());
    CHECK(*context.cost_usd == doctest::Approx(0.0032));
}

TEST_CASE("BenchAgent run succeeds without telemetry") {
    AgentRepo repo;
    auto created = BenchAgent::create(repo.options(), anthropic_env());
    REQUIRE(created.isOk());
    auto& agent = *created.value();

    FakeSandbox sandbox;
    REQUIRE(agent.setup(sandbox).ok);

    sandbox.responses.push_back(FakeSandbox::completed(2, "", "crashed"));
    RunContext context;
    auto result = agent.run("task", sandbox, context);

    CHECK(result.ok);
    CHECK(result.records[0].return_code == 2);
    CHECK(result.telemetry.status == TelemetryStatus::Absent);
    CHECK_FALSE(context.n_input_tokens.has_value());
    CHECK(agent.warnings().contains(Warning::telemetry_absent));
    CHECK(agent.warnings().contains(Warning::command_failed));
}

TEST_CASE("BenchAgent setup stages the providers file") {
    AgentRepo repo;
    TempDir host;
    write_file(host.file("providers.jsonc"), "{}");

    EnvMap env = anthropic_env();
    env[ENV_PROVIDERS_FILE] = host.file("providers.jsonc");

    auto created = BenchAgent::create(repo.options(), env);
    REQUIRE(created.isOk());
    CHECK(created.value()->config().contains(ENV_PROVIDERS_FILE) == false);

    FakeSandbox sandbox;
    auto setup = created.value()->setup(sandbox);
    REQUIRE(setup.ok);
    CHECK(setup.providers_staged);
    CHECK(sandbox.files.count("/root/.lattice/providers.jsonc") == 1);
}

TEST_CASE("The shipped runner script is accepted by setup") {
    AgentRepo repo;
    auto options = repo.options();
    options.runner_script = LATBENCH_SOURCE_RUNNER_SCRIPT;

    auto created = BenchAgent::create(options, anthropic_env());
    REQUIRE(created.isOk());

    FakeSandbox sandbox;
    REQUIRE(created.value()->setup(sandbox).ok);
    const auto& staged = sandbox.files.at(SandboxLayout::RUNNER_PATH);
    CHECK(staged.find("/tmp/lattice-tokens.json") != std::string::npos);
}
