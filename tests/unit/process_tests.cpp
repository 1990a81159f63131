#include <doctest/doctest.h>
#include <latbench/process.hpp>

#include "test_support.hpp"

#include <climits>
#include <limits>

using namespace latbench;
using latbench::test::TempDir;

namespace {

ProcessRequest shell(const std::string& script) {
    ProcessRequest request;
    request.argv = {"/bin/sh", "-c", script};
    request.env = {{"PATH", "/usr/bin:/bin"}};
    return request;
}

} // namespace

TEST_CASE("SystemProcessRunner captures stdout and stderr separately") {
    SystemProcessRunner runner;
    auto result = runner.run(shell("echo out; echo err >&2"));

    REQUIRE(result.ok);
    CHECK(result.exit_code == 0);
    CHECK_FALSE(result.timed_out);
    CHECK(result.stdout_text == "out\n");
    CHECK(result.stderr_text == "err\n");
}

TEST_CASE("SystemProcessRunner reports the exit code") {
    SystemProcessRunner runner;
    auto result = runner.run(shell("exit 7"));
    REQUIRE(result.ok);
    CHECK(result.exit_code == 7);
}

TEST_CASE("SystemProcessRunner passes only the given environment") {
    setenv("LATBENCH_TEST_LEAK", "leaked", 1);

    auto request = shell("printf '%s|%s' \"$LATBENCH_VALUE\" \"$LATBENCH_TEST_LEAK\"");
    request.env["LATBENCH_VALUE"] = "secret value";

    SystemProcessRunner runner;
    auto result = runner.run(request);
    unsetenv("LATBENCH_TEST_LEAK");

    REQUIRE(result.ok);
    CHECK(result.stdout_text == "secret value|");
}

TEST_CASE("SystemProcessRunner runs in the requested directory") {
    TempDir dir;
    auto request = shell("pwd -P");
    request.cwd = dir.path();

    SystemProcessRunner runner;
    auto result = runner.run(request);
    REQUIRE(result.ok);

    std::string expected = std::filesystem::canonical(dir.path()).string() + "\n";
    CHECK(result.stdout_text == expected);
}

TEST_CASE("SystemProcessRunner fails to start a missing binary") {
    ProcessRequest request;
    request.argv = {"/nonexistent/latbench-no-such-binary"};

    SystemProcessRunner runner;
    auto result = runner.run(request);
    CHECK_FALSE(result.ok);
    CHECK_FALSE(result.error.empty());
}

TEST_CASE("SystemProcessRunner rejects an empty command") {
    SystemProcessRunner runner;
    auto result = runner.run(ProcessRequest{});
    CHECK_FALSE(result.ok);
}

TEST_CASE("SystemProcessRunner keeps partial output on timeout") {
    auto request = shell("echo started; sleep 30; echo finished");
    request.timeout_sec = 1;

    SystemProcessRunner runner(200);
    auto result = runner.run(request);

    REQUIRE(result.ok);
    CHECK(result.timed_out);
    CHECK(result.stdout_text == "started\n");
}

TEST_CASE("poll_timeout_ms stays within the poll range") {
    using std::chrono::milliseconds;
    CHECK(poll_timeout_ms(milliseconds(-5)) == 0);
    CHECK(poll_timeout_ms(milliseconds(0)) == 1);
    CHECK(poll_timeout_ms(milliseconds(250)) == 251);
    CHECK(poll_timeout_ms(milliseconds(30LL * 24 * 3600 * 1000)) == INT_MAX);
    CHECK(poll_timeout_ms(milliseconds(std::numeric_limits<int64_t>::max())) == INT_MAX);
}

TEST_CASE("SystemProcessRunner handles a timeout far in the future") {
    auto request = shell("echo quick");
    request.timeout_sec = 60 * 60 * 24 * 365;

    SystemProcessRunner runner;
    auto result = runner.run(request);
    REQUIRE(result.ok);
    CHECK_FALSE(result.timed_out);
    CHECK(result.stdout_text == "quick\n");
}
