#pragma once

#include "latbench/process.hpp"
#include "latbench/sandbox.hpp"

#include <memory>
#include <string>
#include <vector>

namespace latbench {

// ============================================================================
// Docker Sandbox
// ============================================================================

// Drives an already running container through the docker CLI.
// Environment values reach the container through the docker client's own
// environment ("-e KEY" without a value), so they never appear in argv.
class DockerSandbox : public Sandbox {
public:
    DockerSandbox(std::string container,
                  std::shared_ptr<ProcessRunner> runner,
                  EnvMap client_env);

    TransferResult upload_file(const std::string& local_path, const std::string& remote_path) override;

    TransferResult download_file(const std::string& remote_path, const std::string& local_path) override;

    ExecResult exec(const ExecRequest& request) override;

    InstallResult install(const InstallRequest& request) override;

    const std::string& container() const { return container_; }

    void set_docker_binary(const std::string& binary) { docker_binary_ = binary; }

private:
    ProcessResult docker(const std::vector<std::string>& args,
                         const EnvMap& forwarded = {},
                         std::optional<int> timeout_sec = std::nullopt);

    std::string container_;
    std::shared_ptr<ProcessRunner> runner_;
    EnvMap client_env_;
    std::string docker_binary_ = "docker";
};

// Commands with a timeout run under coreutils timeout inside the container:
// SIGTERM at the deadline, SIGKILL after the grace period. Killing the host
// docker client does not stop the exec'd process.
constexpr int CONTAINER_KILL_GRACE_SEC = 10;

// Host-side deadline past the in-container one, in case the client hangs
constexpr int HOST_TIMEOUT_SLACK_SEC = 5;

// Exit codes of timeout(1) when the deadline hit (TERM, then KILL)
constexpr int TIMEOUT_EXIT_TERM = 124;
constexpr int TIMEOUT_EXIT_KILL = 137;

// docker exec arguments (without the binary) for a sandbox command
std::vector<std::string> build_docker_exec_args(const std::string& container, const ExecRequest& request);

// Shell script run by DockerSandbox::install
std::string build_install_script(const InstallRequest& request);

} // namespace latbench
