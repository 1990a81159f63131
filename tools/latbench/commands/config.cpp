/**
 * latbench CLI - config command
 *
 * Resolve the environment handed to the sandbox and print it.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace latbench::cli::commands {

namespace {

struct ConfigOptions {
    std::string model;
    std::string experiments;
    std::string timeout;
    bool show_secrets = false;
};

ConfigOverrides to_overrides(const ConfigOptions& config_opts) {
    ConfigOverrides overrides;
    if (!config_opts.model.empty()) overrides.model_name = config_opts.model;
    if (!config_opts.experiments.empty()) overrides.experiments = config_opts.experiments;
    if (!config_opts.timeout.empty()) overrides.timeout_sec = config_opts.timeout;
    return overrides;
}

int cmd_config(const GlobalOptions& opts, const ConfigOptions& config_opts) {
    init_message_collector(opts.json, opts.quiet);

    auto resolved = resolve_config(to_overrides(config_opts), snapshot_environment());
    if (!resolved.ok) {
        print_error(resolved.error, opts.json, resolved.key);
        return EXIT_CONFIG_ERROR;
    }

    auto shown = [&config_opts](const std::string& key, const std::string& value) {
        return config_opts.show_secrets ? value : display_value(key, value);
    };

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["config"] = nlohmann::json::object();
        for (const auto& [key, value] : resolved.config.values()) {
            j["config"][key] = shown(key, value);
        }
        if (resolved.providers_file) {
            j["providers_file"] = *resolved.providers_file;
            j["providers_target"] = providers_target_path(resolved.config.get_or(ENV_CONFIG_ROOT, ""));
        }
        output_json(j);
        return EXIT_OK;
    }

    for (const auto& [key, value] : resolved.config.values()) {
        std::cout << key << "=" << shown(key, value) << std::endl;
    }
    if (resolved.providers_file && !opts.quiet) {
        std::cout << std::endl;
        std::cout << "Providers file: " << *resolved.providers_file << std::endl;
        std::cout << "  -> " << providers_target_path(resolved.config.get_or(ENV_CONFIG_ROOT, ""))
                  << std::endl;
    }
    return EXIT_OK;
}

} // anonymous namespace

void setup_config(CLI::App* app, GlobalOptions& opts) {
    static ConfigOptions config_opts;

    app->add_option("-m,--model", config_opts.model, "Model id (provider:model or provider/model)");
    app->add_option("--experiments", config_opts.experiments, "Comma-separated experiment flags");
    app->add_option("--timeout", config_opts.timeout, "Agent timeout in seconds");
    app->add_flag("--show-secrets", config_opts.show_secrets, "Print credential values unmasked");

    app->callback([&opts]() {
        std::exit(cmd_config(opts, config_opts));
    });
}

} // namespace latbench::cli::commands
