#include <doctest/doctest.h>
#include <latbench/process.hpp>

#include "test_support.hpp"

#include <cstdlib>

using namespace latbench;
using latbench::test::TempDir;
using latbench::test::write_file;

namespace {

// Sandbox stand-in: a fake bun that echoes its arguments, one per line
struct RunnerEnv {
    TempDir bun_home;
    TempDir app;
    TempDir project;

    RunnerEnv() {
        write_file(bun_home.file("bin/bun"),
                   "#!/bin/sh\nfor a in \"$@\"; do printf '%s\\n' \"$a\"; done\n", true);
    }

    ProcessRequest request(EnvMap extra) const {
        ProcessRequest r;
        r.argv = {"bash", LATBENCH_SOURCE_RUNNER_SCRIPT, "do the task"};
        const char* path = std::getenv("PATH");
        r.env = {
            {"PATH", path ? path : "/usr/bin:/bin"},
            {"BUN_INSTALL", bun_home.path()},
            {"LATTICE_APP_ROOT", app.path()},
            {"LATTICE_PROJECT_PATH", project.path()},
        };
        for (auto& [key, value] : extra) {
            r.env[key] = value;
        }
        r.timeout_sec = 30;
        return r;
    }
};

} // namespace

TEST_CASE("lattice-run.sh passes trimmed experiments verbatim") {
    RunnerEnv env;

    SystemProcessRunner runner;
    auto result = runner.run(env.request({{"LATTICE_EXPERIMENTS", "  alpha , it's ,fast  mode,  "}}));

    REQUIRE(result.ok);
    CHECK(result.exit_code == 0);
    CHECK(result.stdout_text.find("--experiment\nalpha\n") != std::string::npos);
    CHECK(result.stdout_text.find("--experiment\nit's\n") != std::string::npos);
    CHECK(result.stdout_text.find("--experiment\nfast  mode\n") != std::string::npos);
    CHECK(result.stdout_text.find("--experiment\n\n") == std::string::npos);
}

TEST_CASE("lattice-run.sh runs the agent against the project directory") {
    RunnerEnv env;

    SystemProcessRunner runner;
    auto result = runner.run(env.request({{"LATTICE_MODEL", "openai:gpt-5"}}));

    REQUIRE(result.ok);
    CHECK(result.exit_code == 0);
    CHECK(result.stdout_text.find("src/cli/run.ts\n--dir\n" + env.project.path() + "\n") != std::string::npos);
    CHECK(result.stdout_text.find("--model\nopenai:gpt-5\n") != std::string::npos);
    CHECK(result.stdout_text.find("--experiment") == std::string::npos);
}

TEST_CASE("lattice-run.sh rejects a missing instruction") {
    RunnerEnv env;
    auto request = env.request({});
    request.argv.pop_back();

    SystemProcessRunner runner;
    auto result = runner.run(request);
    REQUIRE(result.ok);
    CHECK(result.exit_code == 1);
    CHECK(result.stderr_text.find("instruction argument is required") != std::string::npos);
}
