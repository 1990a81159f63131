#pragma once

#include "latbench/types.hpp"

#include <optional>
#include <string>

namespace latbench {

// ============================================================================
// Sandbox Layout
// ============================================================================

// Fixed in-sandbox paths shared with the install step and the runner script
struct SandboxLayout {
    static constexpr const char* STAGING_DIR = "/installed-agent";
    static constexpr const char* ARCHIVE_NAME = "lattice-app.tar.gz";
    static constexpr const char* ARCHIVE_PATH = "/installed-agent/lattice-app.tar.gz";
    static constexpr const char* RUNNER_NAME = "lattice-run.sh";
    static constexpr const char* RUNNER_PATH = "/installed-agent/lattice-run.sh";
    static constexpr const char* TELEMETRY_PATH = "/tmp/lattice-tokens.json";
    static constexpr const char* TELEMETRY_NAME = "lattice-tokens.json";
    static constexpr const char* PROVIDERS_FILE_NAME = "providers.jsonc";
};

// ============================================================================
// Sandbox Operations
// ============================================================================

struct ExecRequest {
    std::string command;                // Passed to bash -c
    std::optional<std::string> cwd;
    EnvMap env;
    std::optional<int> timeout_sec;
};

struct ExecResult {
    bool ok = false;            // False only when the command could not be run at all
    std::string error;
    int return_code = -1;
    bool timed_out = false;
    std::string stdout_text;    // Partial when timed_out
    std::string stderr_text;
};

enum class TransferStatus {
    Ok,
    NotFound,   // Source path does not exist
    Failed,
};

inline const char* transfer_status_to_string(TransferStatus s) {
    switch (s) {
        case TransferStatus::Ok: return "ok";
        case TransferStatus::NotFound: return "not_found";
        case TransferStatus::Failed: return "failed";
        default: return "failed";
    }
}

struct TransferResult {
    TransferStatus status = TransferStatus::Failed;
    std::string error;

    bool ok() const { return status == TransferStatus::Ok; }
};

// What the install step needs to know; the procedure itself belongs to the backend
struct InstallRequest {
    std::string archive_path = SandboxLayout::ARCHIVE_PATH;
    std::string runner_path = SandboxLayout::RUNNER_PATH;
    std::string app_root;
    EnvMap env;
};

struct InstallResult {
    bool ok = false;
    std::string error;
    std::string log;            // Combined install output, for the logs directory
};

// ============================================================================
// Sandbox Interface
// ============================================================================

// Isolated execution environment owned by the harness. One outstanding call
// per instance.
class Sandbox {
public:
    virtual ~Sandbox() = default;

    virtual TransferResult upload_file(const std::string& local_path, const std::string& remote_path) = 0;

    virtual TransferResult download_file(const std::string& remote_path, const std::string& local_path) = 0;

    virtual ExecResult exec(const ExecRequest& request) = 0;

    virtual InstallResult install(const InstallRequest& request) = 0;
};

} // namespace latbench
