#include "latbench/docker_sandbox.hpp"
#include "latbench/executor.hpp"
#include "latbench/platform.hpp"

namespace latbench {

namespace {

std::string describe_failure(const ProcessResult& result) {
    if (!result.ok) {
        return result.error;
    }
    if (result.timed_out) {
        return "docker command timed out";
    }
    std::string message = "docker exited with code " + std::to_string(result.exit_code);
    std::string detail = trim(result.stderr_text);
    if (!detail.empty()) {
        message += ": " + detail;
    }
    return message;
}

} // namespace

std::vector<std::string> build_docker_exec_args(const std::string& container, const ExecRequest& request) {
    std::vector<std::string> args = {"exec"};

    if (request.cwd && !request.cwd->empty()) {
        args.push_back("-w");
        args.push_back(*request.cwd);
    }

    for (const auto& [key, value] : request.env) {
        args.push_back("-e");
        args.push_back(key);
    }

    args.push_back(container);
    if (request.timeout_sec) {
        args.push_back("timeout");
        args.push_back("--kill-after=" + std::to_string(CONTAINER_KILL_GRACE_SEC) + "s");
        args.push_back(std::to_string(*request.timeout_sec) + "s");
    }
    args.push_back("bash");
    args.push_back("-c");
    args.push_back(request.command);
    return args;
}

std::string build_install_script(const InstallRequest& request) {
    std::string app_root = shell_quote(request.app_root);
    std::string archive = shell_quote(request.archive_path);
    std::string runner = shell_quote(request.runner_path);

    std::string script;
    script += "set -euo pipefail\n";
    script += "mkdir -p " + app_root + "\n";
    script += "tar -xzf " + archive + " -C " + app_root + "\n";
    script += "export BUN_INSTALL=\"${BUN_INSTALL:-/root/.bun}\"\n";
    script += "export PATH=\"${BUN_INSTALL}/bin:${PATH}\"\n";
    script += "if command -v bun >/dev/null 2>&1 && [ -f " + app_root + "/package.json ]; then\n";
    script += "  (cd " + app_root + " && bun install)\n";
    script += "fi\n";
    script += "chmod +x " + runner + "\n";
    return script;
}

DockerSandbox::DockerSandbox(std::string container,
                             std::shared_ptr<ProcessRunner> runner,
                             EnvMap client_env)
    : container_(std::move(container)),
      runner_(std::move(runner)),
      client_env_(std::move(client_env)) {}

ProcessResult DockerSandbox::docker(const std::vector<std::string>& args,
                                    const EnvMap& forwarded,
                                    std::optional<int> timeout_sec) {
    ProcessRequest request;
    request.argv.push_back(docker_binary_);
    request.argv.insert(request.argv.end(), args.begin(), args.end());

    request.env = client_env_;
    for (const auto& [key, value] : forwarded) {
        request.env[key] = value;
    }
    request.timeout_sec = timeout_sec;

    return runner_->run(request);
}

TransferResult DockerSandbox::upload_file(const std::string& local_path, const std::string& remote_path) {
    TransferResult result;

    if (!is_regular_file(local_path)) {
        result.status = TransferStatus::NotFound;
        result.error = "local file not found: " + local_path;
        return result;
    }

    std::string remote_dir = get_parent_directory(remote_path);
    if (!remote_dir.empty()) {
        auto mkdir = docker({"exec", container_, "mkdir", "-p", remote_dir});
        if (!mkdir.ok || mkdir.exit_code != 0) {
            result.error = "failed to create " + remote_dir + ": " + describe_failure(mkdir);
            return result;
        }
    }

    auto copy = docker({"cp", local_path, container_ + ":" + remote_path});
    if (!copy.ok || copy.exit_code != 0) {
        result.error = "failed to upload " + local_path + ": " + describe_failure(copy);
        return result;
    }

    result.status = TransferStatus::Ok;
    return result;
}

TransferResult DockerSandbox::download_file(const std::string& remote_path, const std::string& local_path) {
    TransferResult result;

    auto probe = docker({"exec", container_, "test", "-e", remote_path});
    if (!probe.ok) {
        result.error = describe_failure(probe);
        return result;
    }
    if (probe.exit_code == 1) {
        result.status = TransferStatus::NotFound;
        result.error = "remote path not found: " + remote_path;
        return result;
    }
    if (probe.exit_code != 0) {
        result.error = "failed to probe " + remote_path + ": " + describe_failure(probe);
        return result;
    }

    std::string local_dir = get_parent_directory(local_path);
    if (!local_dir.empty() && !create_directories(local_dir)) {
        result.error = "failed to create directory: " + local_dir;
        return result;
    }

    auto copy = docker({"cp", container_ + ":" + remote_path, local_path});
    if (!copy.ok || copy.exit_code != 0) {
        result.error = "failed to download " + remote_path + ": " + describe_failure(copy);
        return result;
    }

    result.status = TransferStatus::Ok;
    return result;
}

ExecResult DockerSandbox::exec(const ExecRequest& request) {
    ExecResult result;

    std::optional<int> host_timeout;
    if (request.timeout_sec) {
        host_timeout = *request.timeout_sec + CONTAINER_KILL_GRACE_SEC + HOST_TIMEOUT_SLACK_SEC;
    }

    auto proc = docker(build_docker_exec_args(container_, request), request.env, host_timeout);
    if (!proc.ok) {
        result.error = proc.error;
        return result;
    }

    result.ok = true;
    result.return_code = proc.exit_code;
    result.timed_out = proc.timed_out;
    if (request.timeout_sec &&
        (proc.exit_code == TIMEOUT_EXIT_TERM || proc.exit_code == TIMEOUT_EXIT_KILL)) {
        result.timed_out = true;
    }
    result.stdout_text = std::move(proc.stdout_text);
    result.stderr_text = std::move(proc.stderr_text);
    return result;
}

InstallResult DockerSandbox::install(const InstallRequest& request) {
    InstallResult result;

    ExecRequest exec_request;
    exec_request.command = build_install_script(request);
    exec_request.env = request.env;

    auto proc = exec(exec_request);
    result.log = proc.stdout_text + proc.stderr_text;

    if (!proc.ok) {
        result.error = "install could not run: " + proc.error;
        return result;
    }
    if (proc.return_code != 0) {
        result.error = "install failed with exit code " + std::to_string(proc.return_code);
        std::string detail = trim(proc.stderr_text);
        if (!detail.empty()) {
            result.error += ": " + detail;
        }
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace latbench
