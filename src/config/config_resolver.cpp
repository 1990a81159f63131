#include "latbench/config.hpp"
#include "latbench/platform.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace latbench {

const std::vector<std::string>& provider_env_keys() {
    static const std::vector<std::string> keys = {
        "ANTHROPIC_API_KEY",
        "ANTHROPIC_BASE_URL",
        "OPENAI_API_KEY",
        "OPENAI_BASE_URL",
        "OPENAI_API_BASE",
        "OPENAI_ORG_ID",
        "AZURE_OPENAI_API_KEY",
        "AZURE_OPENAI_ENDPOINT",
        "AZURE_OPENAI_DEPLOYMENT",
        "AZURE_OPENAI_API_VERSION",
        // Both Google key names are forwarded, along with the base URL override
        ENV_GOOGLE_PRIMARY_KEY,
        ENV_GOOGLE_LEGACY_KEY,
        "GOOGLE_BASE_URL",
    };
    return keys;
}

const std::vector<std::string>& config_env_keys() {
    static const std::vector<std::string> keys = {
        "LATTICE_AGENT_GIT_URL",
        "LATTICE_BUN_INSTALL_URL",
        ENV_PROJECT_PATH,
        ENV_PROJECT_CANDIDATES,
        ENV_MODEL,
        ENV_TIMEOUT_MS,
        ENV_CONFIG_ROOT,
        ENV_APP_ROOT,
        ENV_WORKSPACE_ID,
        ENV_EXPERIMENTS,
        // Free-form run flags (e.g. "--thinking high --budget 5.00")
        ENV_RUN_ARGS,
        "LATTICE_THINKING_LEVEL",
        "LATTICE_MODE",
        "LATTICE_RUNTIME",
    };
    return keys;
}

EnvMap default_config_values() {
    return {
        {ENV_MODEL, DEFAULT_MODEL},
        {ENV_CONFIG_ROOT, DEFAULT_CONFIG_ROOT},
        {ENV_APP_ROOT, DEFAULT_APP_ROOT},
        {ENV_WORKSPACE_ID, DEFAULT_WORKSPACE_ID},
        {ENV_PROJECT_CANDIDATES, DEFAULT_PROJECT_CANDIDATES},
    };
}

// ============================================================================
// EnvironmentConfig
// ============================================================================

std::optional<std::string> EnvironmentConfig::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string EnvironmentConfig::get_or(const std::string& key, const std::string& fallback) const {
    auto it = values_.find(key);
    return it == values_.end() ? fallback : it->second;
}

bool EnvironmentConfig::contains(const std::string& key) const {
    return values_.count(key) > 0;
}

// ============================================================================
// Helpers
// ============================================================================

std::string normalize_model_id(const std::string& model) {
    if (model.find('/') != std::string::npos && model.find(':') == std::string::npos) {
        std::string normalized = model;
        normalized[normalized.find('/')] = ':';
        return normalized;
    }
    return model;
}

std::string model_provider(const std::string& model) {
    auto colon = model.find(':');
    if (colon == std::string::npos) {
        return "";
    }
    return model.substr(0, colon);
}

bool is_non_negative_integer(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    return std::all_of(value.begin(), value.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::string display_value(const std::string& key, const std::string& value) {
    bool secret = key.find("_KEY") != std::string::npos;
    if (!secret || value.empty()) {
        return value;
    }
    return "<redacted:" + std::to_string(value.size()) + " chars>";
}

namespace {

ConfigResolveResult config_error(const std::string& key, const std::string& message) {
    ConfigResolveResult result;
    result.key = key;
    result.error = message;
    return result;
}

bool has_non_empty(const EnvMap& env, const std::string& key) {
    auto it = env.find(key);
    return it != env.end() && !it->second.empty();
}

} // namespace

// ============================================================================
// Resolution
// ============================================================================

ConfigResolveResult build_override_set(const ConfigOverrides& overrides, EnvMap& out) {
    if (overrides.model_name) {
        std::string model = trim(*overrides.model_name);
        if (!model.empty()) {
            out[ENV_MODEL] = model;
        }
    }

    if (overrides.experiments) {
        std::string experiments = trim(*overrides.experiments);
        if (!experiments.empty()) {
            out[ENV_EXPERIMENTS] = experiments;
        }
    }

    if (overrides.timeout_sec) {
        std::string seconds = trim(*overrides.timeout_sec);
        if (!is_non_negative_integer(seconds)) {
            return config_error("timeout", "timeout must be a non-negative integer number of seconds, got '" +
                                               *overrides.timeout_sec + "'");
        }
        unsigned long long value = 0;
        try {
            value = std::stoull(seconds);
        } catch (const std::out_of_range&) {
            return config_error("timeout", "timeout is out of range: " + seconds);
        }
        if (value > std::numeric_limits<unsigned long long>::max() / 1000ULL) {
            return config_error("timeout", "timeout is out of range: " + seconds);
        }
        out[ENV_TIMEOUT_MS] = std::to_string(value * 1000ULL);
    }

    ConfigResolveResult result;
    result.ok = true;
    return result;
}

ConfigResolveResult resolve_sources(const ConfigSources& sources) {
    EnvMap env;

    auto pick = [&](const std::string& key) {
        if (has_non_empty(sources.overrides, key)) {
            env[key] = sources.overrides.at(key);
        } else if (has_non_empty(sources.snapshot, key)) {
            env[key] = sources.snapshot.at(key);
        } else if (has_non_empty(sources.defaults, key)) {
            env[key] = sources.defaults.at(key);
        }
    };

    for (const auto& key : provider_env_keys()) {
        pick(key);
    }
    for (const auto& key : config_env_keys()) {
        pick(key);
    }

    // Model id: trimmed, non-empty, normalized to provider:model
    std::string model = trim(env.count(ENV_MODEL) ? env[ENV_MODEL] : std::string());
    if (model.empty()) {
        return config_error(ENV_MODEL, std::string(ENV_MODEL) + " must be a non-empty string");
    }
    model = normalize_model_id(model);

    // Catch missing Google credentials here rather than as an opaque
    // api_key_not_found from inside the sandbox
    if (model_provider(model) == "google" &&
        !has_non_empty(env, ENV_GOOGLE_PRIMARY_KEY) &&
        !has_non_empty(env, ENV_GOOGLE_LEGACY_KEY)) {
        return config_error(ENV_GOOGLE_PRIMARY_KEY,
                            std::string("Google models require ") + ENV_GOOGLE_PRIMARY_KEY +
                            " (preferred) or " + ENV_GOOGLE_LEGACY_KEY);
    }
    env[ENV_MODEL] = model;

    for (const char* key : {ENV_CONFIG_ROOT, ENV_APP_ROOT, ENV_WORKSPACE_ID, ENV_PROJECT_CANDIDATES}) {
        env[key] = trim(env.count(key) ? env[key] : std::string());
    }

    auto timeout = env.find(ENV_TIMEOUT_MS);
    if (timeout != env.end()) {
        std::string value = trim(timeout->second);
        if (!is_non_negative_integer(value)) {
            return config_error(ENV_TIMEOUT_MS, std::string(ENV_TIMEOUT_MS) + " must be an integer, got '" +
                                                    timeout->second + "'");
        }
        timeout->second = value;
    }

    auto project_path = env.find(ENV_PROJECT_PATH);
    if (project_path != env.end() && trim(project_path->second).empty()) {
        return config_error(ENV_PROJECT_PATH, std::string(ENV_PROJECT_PATH) + " must be non-empty when provided");
    }

    ConfigResolveResult result;
    result.ok = true;
    result.config = EnvironmentConfig(std::move(env));

    if (has_non_empty(sources.snapshot, ENV_PROVIDERS_FILE)) {
        result.providers_file = sources.snapshot.at(ENV_PROVIDERS_FILE);
    }

    return result;
}

ConfigResolveResult resolve_config(const ConfigOverrides& overrides, EnvMap snapshot) {
    ConfigSources sources;

    auto built = build_override_set(overrides, sources.overrides);
    if (!built.ok) {
        return built;
    }

    sources.snapshot = std::move(snapshot);
    sources.defaults = default_config_values();
    return resolve_sources(sources);
}

} // namespace latbench
