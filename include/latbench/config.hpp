#pragma once

#include "latbench/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace latbench {

// ============================================================================
// Configuration Keys
// ============================================================================

constexpr const char* ENV_MODEL = "LATTICE_MODEL";
constexpr const char* ENV_TIMEOUT_MS = "LATTICE_TIMEOUT_MS";
constexpr const char* ENV_CONFIG_ROOT = "LATTICE_CONFIG_ROOT";
constexpr const char* ENV_APP_ROOT = "LATTICE_APP_ROOT";
constexpr const char* ENV_WORKSPACE_ID = "LATTICE_WORKSPACE_ID";
constexpr const char* ENV_PROJECT_PATH = "LATTICE_PROJECT_PATH";
constexpr const char* ENV_PROJECT_CANDIDATES = "LATTICE_PROJECT_CANDIDATES";
constexpr const char* ENV_EXPERIMENTS = "LATTICE_EXPERIMENTS";
constexpr const char* ENV_RUN_ARGS = "LATTICE_RUN_ARGS";

// Host-side only; read from the snapshot but never forwarded into the sandbox
constexpr const char* ENV_PROVIDERS_FILE = "LATTICE_PROVIDERS_FILE";
constexpr const char* ENV_AGENT_REPO_ROOT = "LATTICE_AGENT_REPO_ROOT";

// Google accepts either key; the first one is preferred
constexpr const char* ENV_GOOGLE_PRIMARY_KEY = "GOOGLE_GENERATIVE_AI_API_KEY";
constexpr const char* ENV_GOOGLE_LEGACY_KEY = "GOOGLE_API_KEY";

constexpr const char* DEFAULT_MODEL = "anthropic:claude-sonnet-4-5";
constexpr const char* DEFAULT_CONFIG_ROOT = "/root/.lattice";
constexpr const char* DEFAULT_APP_ROOT = "/opt/lattice-app";
constexpr const char* DEFAULT_WORKSPACE_ID = "lattice-bench";
constexpr const char* DEFAULT_PROJECT_CANDIDATES = "/workspace:/app:/workspaces:/root/project";

// Provider credential keys forwarded opaquely into the sandbox
const std::vector<std::string>& provider_env_keys();

// Adapter configuration keys forwarded into the sandbox
const std::vector<std::string>& config_env_keys();

// Built-in defaults, the lowest precedence source
EnvMap default_config_values();

// ============================================================================
// Environment Config
// ============================================================================

// Finalized mapping handed to the sandbox. Only const access once built.
class EnvironmentConfig {
public:
    EnvironmentConfig() = default;
    explicit EnvironmentConfig(EnvMap values) : values_(std::move(values)) {}

    std::optional<std::string> get(const std::string& key) const;
    std::string get_or(const std::string& key, const std::string& fallback) const;
    bool contains(const std::string& key) const;

    const EnvMap& values() const { return values_; }
    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

private:
    EnvMap values_;
};

// ============================================================================
// Resolution
// ============================================================================

// Explicit per-run overrides (agent constructor arguments)
struct ConfigOverrides {
    std::optional<std::string> model_name;
    std::optional<std::string> experiments;
    std::optional<std::string> timeout_sec;   // Converted to LATTICE_TIMEOUT_MS
};

// Sources in precedence order, passed by value into the resolver
struct ConfigSources {
    EnvMap overrides;
    EnvMap snapshot;
    EnvMap defaults;
};

struct ConfigResolveResult {
    bool ok = false;
    std::string error;
    std::string key;                            // Offending key on failure
    EnvironmentConfig config;
    std::optional<std::string> providers_file;  // Host path, when configured
};

// "provider/model" -> "provider:model"; colon form is returned unchanged
std::string normalize_model_id(const std::string& model);

// Provider segment of a normalized model id ("google:gemini" -> "google")
std::string model_provider(const std::string& model);

// Digits only, at least one
bool is_non_negative_integer(const std::string& value);

// Turn explicit overrides into an override source. The seconds timeout is
// converted here, into this run's own set.
ConfigResolveResult build_override_set(const ConfigOverrides& overrides, EnvMap& out);

// Merge sources (overrides > snapshot > defaults) and validate
ConfigResolveResult resolve_sources(const ConfigSources& sources);

// Convenience: overrides + snapshot + built-in defaults
ConfigResolveResult resolve_config(const ConfigOverrides& overrides, EnvMap snapshot);

// Value suitable for display (credentials masked)
std::string display_value(const std::string& key, const std::string& value);

} // namespace latbench
