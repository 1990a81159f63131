#pragma once

#include "latbench/config.hpp"
#include "latbench/payload.hpp"
#include "latbench/sandbox.hpp"
#include "latbench/warnings.hpp"

#include <optional>
#include <string>

namespace latbench {

// ============================================================================
// Payload Cache
// ============================================================================

// Builds the payload at most once; failures are not cached
class PayloadCache {
public:
    explicit PayloadCache(PayloadRequest request) : request_(std::move(request)) {}

    const PayloadResult& get(WarningCollector* warnings = nullptr);

    bool built() const { return cached_.has_value(); }

    const PayloadRequest& request() const { return request_; }

private:
    PayloadRequest request_;
    std::optional<PayloadResult> cached_;
    PayloadResult last_failure_;
};

// ============================================================================
// Sandbox Runner
// ============================================================================

enum class SetupStep {
    StagingDir,
    Payload,
    Runner,
    Install,
    Providers,
};

inline const char* setup_step_to_string(SetupStep s) {
    switch (s) {
        case SetupStep::StagingDir: return "staging_dir";
        case SetupStep::Payload: return "payload";
        case SetupStep::Runner: return "runner";
        case SetupStep::Install: return "install";
        case SetupStep::Providers: return "providers";
        default: return "unknown";
    }
}

struct SetupRequest {
    std::string logs_dir;
    std::string runner_script;                  // Host path of lattice-run.sh
    EnvironmentConfig config;
    std::optional<std::string> providers_file;  // Host path, only when configured
};

struct SetupResult {
    bool ok = false;
    std::string error;
    SetupStep failed_step = SetupStep::StagingDir;
    bool missing_input = false;
    bool providers_staged = false;
    std::string archive_sha256;
};

// <config_root>/providers.jsonc with trailing slashes removed; blank roots
// fall back to the default config root
std::string providers_target_path(const std::string& config_root);

// Stages the agent into the sandbox. Steps run strictly in order and any
// failure stops the sequence.
class SandboxRunner {
public:
    SandboxRunner(Sandbox& sandbox, PayloadCache& payload, WarningCollector* warnings = nullptr)
        : sandbox_(sandbox), payload_(payload), warnings_(warnings) {}

    SetupResult setup(const SetupRequest& request);

private:
    bool ensure_staging_dir(const SetupRequest& request, SetupResult& result);
    bool stage_payload(const SetupRequest& request, SetupResult& result);
    bool stage_runner(const SetupRequest& request, SetupResult& result);
    bool run_install(const SetupRequest& request, SetupResult& result);
    bool stage_providers(const SetupRequest& request, SetupResult& result);

    Sandbox& sandbox_;
    PayloadCache& payload_;
    WarningCollector* warnings_;
};

} // namespace latbench
