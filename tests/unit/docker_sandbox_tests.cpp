#include <doctest/doctest.h>
#include <latbench/docker_sandbox.hpp>

#include "test_support.hpp"

#include <algorithm>
#include <deque>

using namespace latbench;
using latbench::test::TempDir;
using latbench::test::write_file;

namespace {

// Records docker invocations and replays scripted results
class RecordingRunner : public ProcessRunner {
public:
    ProcessResult run(const ProcessRequest& request) override {
        requests.push_back(request);
        if (!responses.empty()) {
            ProcessResult next = responses.front();
            responses.pop_front();
            return next;
        }
        return exited(0);
    }

    static ProcessResult exited(int code, const std::string& out = "", const std::string& err = "") {
        ProcessResult result;
        result.ok = true;
        result.exit_code = code;
        result.stdout_text = out;
        result.stderr_text = err;
        return result;
    }

    std::vector<ProcessRequest> requests;
    std::deque<ProcessResult> responses;
};

bool contains(const std::vector<std::string>& args, const std::string& value) {
    return std::find(args.begin(), args.end(), value) != args.end();
}

} // namespace

TEST_CASE("build_docker_exec_args names env keys without values") {
    ExecRequest request;
    request.command = "bash /installed-agent/lattice-run.sh 'go'";
    request.cwd = "/workspace";
    request.env = {{"ANTHROPIC_API_KEY", "sk-secret"}, {"LATTICE_MODEL", "anthropic:claude"}};

    auto args = build_docker_exec_args("bench-1", request);
    std::vector<std::string> expected = {
        "exec", "-w", "/workspace",
        "-e", "ANTHROPIC_API_KEY",
        "-e", "LATTICE_MODEL",
        "bench-1", "bash", "-c", "bash /installed-agent/lattice-run.sh 'go'",
    };
    CHECK(args == expected);
    CHECK_FALSE(contains(args, "sk-secret"));
}

TEST_CASE("build_docker_exec_args enforces the timeout inside the container") {
    ExecRequest request;
    request.command = "bash /installed-agent/lattice-run.sh go";
    request.timeout_sec = 300;

    auto args = build_docker_exec_args("bench-1", request);
    std::vector<std::string> expected = {
        "exec", "bench-1",
        "timeout", "--kill-after=10s", "300s",
        "bash", "-c", "bash /installed-agent/lattice-run.sh go",
    };
    CHECK(args == expected);

    request.timeout_sec.reset();
    auto untimed = build_docker_exec_args("bench-1", request);
    CHECK_FALSE(contains(untimed, "timeout"));
}

TEST_CASE("DockerSandbox exec reports an in-container timeout") {
    auto runner = std::make_shared<RecordingRunner>();
    runner->responses.push_back(RecordingRunner::exited(124, "half way"));
    runner->responses.push_back(RecordingRunner::exited(137));
    runner->responses.push_back(RecordingRunner::exited(124));

    DockerSandbox sandbox("bench-1", runner, {});

    auto term = sandbox.exec(ExecRequest{"sleep 100", std::nullopt, {}, 5});
    REQUIRE(term.ok);
    CHECK(term.timed_out);
    CHECK(term.stdout_text == "half way");

    auto kill = sandbox.exec(ExecRequest{"sleep 100", std::nullopt, {}, 5});
    REQUIRE(kill.ok);
    CHECK(kill.timed_out);

    // Without a timeout, 124 is just the command's own exit code
    auto plain = sandbox.exec(ExecRequest{"exit 124", std::nullopt, {}, std::nullopt});
    REQUIRE(plain.ok);
    CHECK_FALSE(plain.timed_out);
    CHECK(plain.return_code == 124);
}

TEST_CASE("build_install_script extracts and prepares the app") {
    InstallRequest request;
    request.archive_path = "/installed-agent/lattice-app.tar.gz";
    request.runner_path = "/installed-agent/lattice-run.sh";
    request.app_root = "/opt/lattice app";

    auto script = build_install_script(request);
    CHECK(script.find("set -euo pipefail") == 0);
    CHECK(script.find("mkdir -p '/opt/lattice app'") != std::string::npos);
    CHECK(script.find("tar -xzf /installed-agent/lattice-app.tar.gz -C '/opt/lattice app'") != std::string::npos);
    CHECK(script.find("bun install") != std::string::npos);
    CHECK(script.find("chmod +x /installed-agent/lattice-run.sh") != std::string::npos);
}

TEST_CASE("DockerSandbox exec forwards env through the client environment") {
    auto runner = std::make_shared<RecordingRunner>();
    runner->responses.push_back(RecordingRunner::exited(3, "out", "err"));

    DockerSandbox sandbox("bench-1", runner, {{"PATH", "/usr/bin"}});
    ExecRequest request;
    request.command = "echo hi";
    request.env = {{"OPENAI_API_KEY", "sk-openai"}};
    request.timeout_sec = 45;

    auto result = sandbox.exec(request);
    REQUIRE(result.ok);
    CHECK(result.return_code == 3);
    CHECK(result.stdout_text == "out");
    CHECK(result.stderr_text == "err");

    REQUIRE(runner->requests.size() == 1);
    const auto& proc = runner->requests[0];
    CHECK(proc.argv[0] == "docker");
    CHECK(contains(proc.argv, "OPENAI_API_KEY"));
    CHECK_FALSE(contains(proc.argv, "sk-openai"));
    CHECK(proc.env.at("OPENAI_API_KEY") == "sk-openai");
    CHECK(proc.env.at("PATH") == "/usr/bin");
    // Host deadline backs up the in-container one
    CHECK(proc.timeout_sec == 45 + CONTAINER_KILL_GRACE_SEC + HOST_TIMEOUT_SLACK_SEC);
    CHECK(contains(proc.argv, "timeout"));
}

TEST_CASE("DockerSandbox exec maps timeouts and start failures") {
    auto runner = std::make_shared<RecordingRunner>();
    ProcessResult timed_out = RecordingRunner::exited(143, "partial");
    timed_out.timed_out = true;
    runner->responses.push_back(timed_out);

    ProcessResult missing;
    missing.error = "docker: not found";
    runner->responses.push_back(missing);

    DockerSandbox sandbox("bench-1", runner, {});
    sandbox.set_docker_binary("/usr/local/bin/docker");

    auto first = sandbox.exec(ExecRequest{"sleep 100", std::nullopt, {}, 1});
    REQUIRE(first.ok);
    CHECK(first.timed_out);
    CHECK(first.stdout_text == "partial");
    CHECK(runner->requests[0].argv[0] == "/usr/local/bin/docker");

    auto second = sandbox.exec(ExecRequest{"true", std::nullopt, {}, std::nullopt});
    CHECK_FALSE(second.ok);
    CHECK(second.error == "docker: not found");
}

TEST_CASE("DockerSandbox upload creates the parent directory then copies") {
    TempDir dir;
    write_file(dir.file("providers.jsonc"), "{}");

    auto runner = std::make_shared<RecordingRunner>();
    DockerSandbox sandbox("bench-1", runner, {});

    auto result = sandbox.upload_file(dir.file("providers.jsonc"), "/root/.lattice/providers.jsonc");
    REQUIRE(result.ok());
    REQUIRE(runner->requests.size() == 2);

    std::vector<std::string> mkdir = {"docker", "exec", "bench-1", "mkdir", "-p", "/root/.lattice"};
    std::vector<std::string> copy = {"docker", "cp", dir.file("providers.jsonc"),
                                     "bench-1:/root/.lattice/providers.jsonc"};
    CHECK(runner->requests[0].argv == mkdir);
    CHECK(runner->requests[1].argv == copy);
}

TEST_CASE("DockerSandbox upload reports a missing local file") {
    auto runner = std::make_shared<RecordingRunner>();
    DockerSandbox sandbox("bench-1", runner, {});

    auto result = sandbox.upload_file("/nonexistent/latbench/file", "/tmp/file");
    CHECK(result.status == TransferStatus::NotFound);
    CHECK(runner->requests.empty());
}

TEST_CASE("DockerSandbox download distinguishes a missing remote file") {
    TempDir dir;
    auto runner = std::make_shared<RecordingRunner>();
    runner->responses.push_back(RecordingRunner::exited(1));

    DockerSandbox sandbox("bench-1", runner, {});
    auto result = sandbox.download_file("/tmp/lattice-tokens.json", dir.file("tokens.json"));
    CHECK(result.status == TransferStatus::NotFound);
    CHECK(runner->requests.size() == 1);
}

TEST_CASE("DockerSandbox download fails on an unreachable container") {
    TempDir dir;
    auto runner = std::make_shared<RecordingRunner>();
    runner->responses.push_back(RecordingRunner::exited(125, "", "No such container: bench-1"));

    DockerSandbox sandbox("bench-1", runner, {});
    auto result = sandbox.download_file("/tmp/lattice-tokens.json", dir.file("tokens.json"));
    CHECK(result.status == TransferStatus::Failed);
    CHECK(result.error.find("No such container") != std::string::npos);
}

TEST_CASE("DockerSandbox download copies into the local directory") {
    TempDir dir;
    auto runner = std::make_shared<RecordingRunner>();
    DockerSandbox sandbox("bench-1", runner, {});

    auto result = sandbox.download_file("/tmp/lattice-tokens.json", dir.file("nested/tokens.json"));
    REQUIRE(result.ok());
    REQUIRE(runner->requests.size() == 2);
    CHECK(runner->requests[1].argv.back() == dir.file("nested/tokens.json"));
    CHECK(latbench::is_directory(dir.file("nested")));
}

TEST_CASE("DockerSandbox install reports a failing script") {
    auto runner = std::make_shared<RecordingRunner>();
    runner->responses.push_back(RecordingRunner::exited(2, "", "tar: invalid archive"));

    DockerSandbox sandbox("bench-1", runner, {});
    InstallRequest request;
    request.archive_path = "/installed-agent/lattice-app.tar.gz";
    request.runner_path = "/installed-agent/lattice-run.sh";
    request.app_root = "/opt/lattice-app";
    request.env = {{"LATTICE_APP_ROOT", "/opt/lattice-app"}};

    auto result = sandbox.install(request);
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("tar: invalid archive") != std::string::npos);
    CHECK(runner->requests[0].env.at("LATTICE_APP_ROOT") == "/opt/lattice-app");
}
