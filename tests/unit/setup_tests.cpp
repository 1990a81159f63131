#include <doctest/doctest.h>
#include <latbench/payload.hpp>
#include <latbench/setup.hpp>

#include "test_support.hpp"

using namespace latbench;
using latbench::test::FakeSandbox;
using latbench::test::TempDir;
using latbench::test::write_file;

namespace {

struct SetupFixture {
    TempDir repo;
    TempDir logs;
    TempDir host;
    FakeSandbox sandbox;
    PayloadCache payload;

    SetupFixture()
        : payload(PayloadRequest{repo.path(), default_include_paths(), std::string(DEFAULT_MANDATORY_ENTRY)}) {
        write_file(repo.file("package.json"), "{}");
        write_file(repo.file("src/cli/run.ts"), "run");
        write_file(repo.file("scripts/postinstall.sh"), "#!/bin/sh\n", true);
        write_file(host.file("lattice-run.sh"), "#!/bin/bash\necho run\n", true);
    }

    SetupRequest request(EnvMap config = {}) {
        if (!config.count(ENV_APP_ROOT)) config[ENV_APP_ROOT] = "/opt/lattice-app";
        if (!config.count(ENV_CONFIG_ROOT)) config[ENV_CONFIG_ROOT] = "/root/.lattice";
        SetupRequest r;
        r.logs_dir = logs.path();
        r.runner_script = host.file("lattice-run.sh");
        r.config = EnvironmentConfig(std::move(config));
        return r;
    }
};

} // namespace

TEST_CASE("providers_target_path strips trailing slashes") {
    CHECK(providers_target_path("/root/.lattice") == "/root/.lattice/providers.jsonc");
    CHECK(providers_target_path("/custom/root///") == "/custom/root/providers.jsonc");
    CHECK(providers_target_path("") == "/root/.lattice/providers.jsonc");
    CHECK(providers_target_path("/") == "/root/.lattice/providers.jsonc");
}

TEST_CASE("SandboxRunner runs setup steps in order") {
    SetupFixture f;
    SandboxRunner runner(f.sandbox, f.payload);

    auto result = runner.setup(f.request());
    REQUIRE(result.ok);
    CHECK_FALSE(result.providers_staged);
    CHECK(result.archive_sha256.size() == 64);

    std::vector<std::string> expected = {
        "exec mkdir -p /installed-agent",
        "upload /installed-agent/lattice-app.tar.gz",
        "upload /installed-agent/lattice-run.sh",
        "install",
    };
    CHECK(f.sandbox.calls == expected);

    REQUIRE(f.sandbox.installs.size() == 1);
    CHECK(f.sandbox.installs[0].app_root == "/opt/lattice-app");
    CHECK(f.sandbox.installs[0].archive_path == "/installed-agent/lattice-app.tar.gz");
    CHECK(f.sandbox.installs[0].runner_path == "/installed-agent/lattice-run.sh");
}

TEST_CASE("SandboxRunner keeps an audit copy identical to the uploaded archive") {
    SetupFixture f;
    SandboxRunner runner(f.sandbox, f.payload);
    REQUIRE(runner.setup(f.request()).ok);

    auto audit = read_file_bytes(f.logs.file("lattice-app.tar.gz"));
    REQUIRE(audit.has_value());
    const auto& uploaded = f.sandbox.files.at(SandboxLayout::ARCHIVE_PATH);
    CHECK(std::string(audit->begin(), audit->end()) == uploaded);
}

TEST_CASE("SandboxRunner builds the payload once per cache") {
    SetupFixture f;
    SandboxRunner runner(f.sandbox, f.payload);

    REQUIRE(runner.setup(f.request()).ok);
    std::string first = f.sandbox.files.at(SandboxLayout::ARCHIVE_PATH);

    // Later changes on disk do not reach an already built payload
    write_file(f.repo.file("src/new.ts"), "new");
    REQUIRE(runner.setup(f.request()).ok);
    CHECK(f.sandbox.files.at(SandboxLayout::ARCHIVE_PATH) == first);
    CHECK(f.payload.built());
}

TEST_CASE("SandboxRunner stops when the staging directory cannot be created") {
    SetupFixture f;
    f.sandbox.responses.push_back(FakeSandbox::completed(1, "", "read-only file system"));

    SandboxRunner runner(f.sandbox, f.payload);
    auto result = runner.setup(f.request());
    CHECK_FALSE(result.ok);
    CHECK(result.failed_step == SetupStep::StagingDir);
    CHECK(result.error.find("read-only") != std::string::npos);
    CHECK(f.sandbox.calls.size() == 1);
}

TEST_CASE("SandboxRunner reports an unreachable sandbox") {
    SetupFixture f;
    f.sandbox.responses.push_back(FakeSandbox::unavailable("no such container"));

    SandboxRunner runner(f.sandbox, f.payload);
    auto result = runner.setup(f.request());
    CHECK_FALSE(result.ok);
    CHECK(result.failed_step == SetupStep::StagingDir);
}

TEST_CASE("SandboxRunner fails on a missing mandatory payload entry") {
    SetupFixture f;
    std::filesystem::remove(f.repo.file("scripts/postinstall.sh"));

    SandboxRunner runner(f.sandbox, f.payload);
    auto result = runner.setup(f.request());
    CHECK_FALSE(result.ok);
    CHECK(result.failed_step == SetupStep::Payload);
    CHECK(result.missing_input);
    CHECK(f.sandbox.files.count(SandboxLayout::ARCHIVE_PATH) == 0);
}

TEST_CASE("SandboxRunner fails on a missing runner script") {
    SetupFixture f;
    auto request = f.request();
    request.runner_script = f.host.file("missing.sh");

    SandboxRunner runner(f.sandbox, f.payload);
    auto result = runner.setup(request);
    CHECK_FALSE(result.ok);
    CHECK(result.failed_step == SetupStep::Runner);
    CHECK(result.error.find("runner script not found") != std::string::npos);
}

TEST_CASE("SandboxRunner propagates install failures") {
    SetupFixture f;
    f.sandbox.fail_install = true;

    SandboxRunner runner(f.sandbox, f.payload);
    auto result = runner.setup(f.request());
    CHECK_FALSE(result.ok);
    CHECK(result.failed_step == SetupStep::Install);
}

TEST_CASE("SandboxRunner stages the providers file after install") {
    SetupFixture f;
    write_file(f.host.file("providers.jsonc"), "{\"anthropic\":{}}");

    auto request = f.request({{ENV_CONFIG_ROOT, "/custom/root/"}});
    request.providers_file = f.host.file("providers.jsonc");

    SandboxRunner runner(f.sandbox, f.payload);
    auto result = runner.setup(request);
    REQUIRE(result.ok);
    CHECK(result.providers_staged);

    REQUIRE(f.sandbox.calls.size() == 5);
    CHECK(f.sandbox.calls[3] == "install");
    CHECK(f.sandbox.calls[4] == "upload /custom/root/providers.jsonc");
    CHECK(f.sandbox.files.at("/custom/root/providers.jsonc") == "{\"anthropic\":{}}");
}

TEST_CASE("SandboxRunner fails on a configured but missing providers file") {
    SetupFixture f;
    auto request = f.request();
    request.providers_file = f.host.file("absent.jsonc");

    SandboxRunner runner(f.sandbox, f.payload);
    auto result = runner.setup(request);
    CHECK_FALSE(result.ok);
    CHECK(result.failed_step == SetupStep::Providers);
    CHECK(result.error.find(ENV_PROVIDERS_FILE) != std::string::npos);
    // Install already ran; only the providers upload is missing
    CHECK(f.sandbox.calls.back() == "install");
}

TEST_CASE("SandboxRunner rejects a directory as providers file") {
    SetupFixture f;
    auto request = f.request();
    request.providers_file = f.host.path();

    SandboxRunner runner(f.sandbox, f.payload);
    auto result = runner.setup(request);
    CHECK_FALSE(result.ok);
    CHECK(result.failed_step == SetupStep::Providers);
}
