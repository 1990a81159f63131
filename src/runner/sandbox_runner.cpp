#include "latbench/setup.hpp"
#include "latbench/executor.hpp"
#include "latbench/platform.hpp"

namespace latbench {

// ============================================================================
// Payload Cache
// ============================================================================

const PayloadResult& PayloadCache::get(WarningCollector* warnings) {
    if (cached_) {
        return *cached_;
    }

    PayloadResult result = build_payload(request_, warnings);
    if (!result.ok) {
        last_failure_ = std::move(result);
        return last_failure_;
    }

    cached_ = std::move(result);
    return *cached_;
}

// ============================================================================
// Sandbox Runner
// ============================================================================

std::string providers_target_path(const std::string& config_root) {
    std::string root = trim(config_root);
    while (!root.empty() && root.back() == '/') {
        root.pop_back();
    }
    if (root.empty()) {
        root = DEFAULT_CONFIG_ROOT;
    }
    return root + "/" + SandboxLayout::PROVIDERS_FILE_NAME;
}

namespace {

bool fail(SetupResult& result, SetupStep step, const std::string& message) {
    result.failed_step = step;
    result.error = message;
    return false;
}

} // namespace

bool SandboxRunner::ensure_staging_dir(const SetupRequest& request, SetupResult& result) {
    ExecRequest exec;
    exec.command = std::string("mkdir -p ") + shell_quote(SandboxLayout::STAGING_DIR);
    exec.env = request.config.values();

    auto outcome = sandbox_.exec(exec);
    if (!outcome.ok) {
        return fail(result, SetupStep::StagingDir, "sandbox unreachable: " + outcome.error);
    }
    if (outcome.timed_out || outcome.return_code != 0) {
        std::string message = std::string("failed to create ") + SandboxLayout::STAGING_DIR +
                              " (exit " + std::to_string(outcome.return_code) + ")";
        std::string detail = trim(outcome.stderr_text);
        if (!detail.empty()) {
            message += ": " + detail;
        }
        return fail(result, SetupStep::StagingDir, message);
    }
    return true;
}

bool SandboxRunner::stage_payload(const SetupRequest& request, SetupResult& result) {
    const PayloadResult& payload = payload_.get(warnings_);
    if (!payload.ok) {
        result.missing_input = payload.missing_input;
        return fail(result, SetupStep::Payload, payload.error);
    }
    result.archive_sha256 = payload.sha256;

    // The audit copy doubles as the upload source
    std::string audit_path = join_path(request.logs_dir, SandboxLayout::ARCHIVE_NAME);
    auto written = atomic_write_file(audit_path, payload.archive_data);
    if (!written.ok) {
        return fail(result, SetupStep::Payload, written.error);
    }

    auto transfer = sandbox_.upload_file(audit_path, SandboxLayout::ARCHIVE_PATH);
    if (!transfer.ok()) {
        return fail(result, SetupStep::Payload, "failed to upload payload: " + transfer.error);
    }
    return true;
}

bool SandboxRunner::stage_runner(const SetupRequest& request, SetupResult& result) {
    if (!is_regular_file(request.runner_script)) {
        return fail(result, SetupStep::Runner, "runner script not found: " + request.runner_script);
    }

    auto transfer = sandbox_.upload_file(request.runner_script, SandboxLayout::RUNNER_PATH);
    if (!transfer.ok()) {
        return fail(result, SetupStep::Runner, "failed to upload runner script: " + transfer.error);
    }
    return true;
}

bool SandboxRunner::run_install(const SetupRequest& request, SetupResult& result) {
    InstallRequest install;
    install.archive_path = SandboxLayout::ARCHIVE_PATH;
    install.runner_path = SandboxLayout::RUNNER_PATH;
    install.app_root = request.config.get_or(ENV_APP_ROOT, DEFAULT_APP_ROOT);
    install.env = request.config.values();

    auto outcome = sandbox_.install(install);
    if (!outcome.ok) {
        return fail(result, SetupStep::Install, outcome.error);
    }
    return true;
}

bool SandboxRunner::stage_providers(const SetupRequest& request, SetupResult& result) {
    if (!request.providers_file || trim(*request.providers_file).empty()) {
        return true;
    }

    std::string source = expand_user_path(trim(*request.providers_file));
    if (!is_regular_file(source)) {
        return fail(result, SetupStep::Providers,
                    std::string(ENV_PROVIDERS_FILE) + " is not a readable file: " + source);
    }

    std::string target = providers_target_path(request.config.get_or(ENV_CONFIG_ROOT, ""));
    auto transfer = sandbox_.upload_file(source, target);
    if (!transfer.ok()) {
        return fail(result, SetupStep::Providers, "failed to upload providers file: " + transfer.error);
    }

    result.providers_staged = true;
    return true;
}

SetupResult SandboxRunner::setup(const SetupRequest& request) {
    SetupResult result;

    auto logs = atomic_create_directory(request.logs_dir);
    if (!logs.ok) {
        fail(result, SetupStep::StagingDir, logs.error);
        return result;
    }

    if (!ensure_staging_dir(request, result) ||
        !stage_payload(request, result) ||
        !stage_runner(request, result) ||
        !run_install(request, result) ||
        !stage_providers(request, result)) {
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace latbench
