/**
 * latbench CLI - pack command
 *
 * Build the deterministic payload archive from the agent repository.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace latbench::cli::commands {

namespace {

struct PackOptions {
    std::string output;
    std::vector<std::string> includes;
    bool no_mandatory = false;
};

int cmd_pack(const GlobalOptions& opts, const PackOptions& pack_opts) {
    init_message_collector(opts.json, opts.quiet);

    EnvMap snapshot = snapshot_environment();
    std::string root = resolve_repo_root(opts.root, snapshot);
    if (!is_directory(root)) {
        print_error("agent repository root not found: " + root, opts.json, ENV_AGENT_REPO_ROOT);
        return EXIT_SETUP_ERROR;
    }

    PayloadRequest request;
    request.root = root;
    request.include_paths = pack_opts.includes.empty() ? default_include_paths() : pack_opts.includes;
    if (!pack_opts.no_mandatory) {
        request.mandatory_entry = std::string(DEFAULT_MANDATORY_ENTRY);
    }

    WarningCollector warnings;
    apply_warning_policy(warnings, opts);

    print_verbose("Packing " + root, opts);
    auto payload = build_payload(request, &warnings);
    report_warnings(warnings);

    if (!payload.ok) {
        print_error(payload.error, opts.json);
        return EXIT_SETUP_ERROR;
    }

    if (!pack_opts.output.empty()) {
        auto written = atomic_write_file(pack_opts.output, payload.archive_data);
        if (!written.ok) {
            print_error(written.error, opts.json);
            return EXIT_FAILED;
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["root"] = root;
        j["entries"] = payload.entries;
        j["sha256"] = payload.sha256;
        j["size"] = payload.archive_data.size();
        if (!pack_opts.output.empty()) {
            j["archive"] = pack_opts.output;
        }
        output_json(j);
        return EXIT_OK;
    }

    if (!opts.quiet) {
        for (const auto& entry : payload.entries) {
            std::cout << "  " << entry << std::endl;
        }
    }
    std::cout << payload.entries.size() << " entries, " << payload.archive_data.size()
              << " bytes, sha256 " << payload.sha256 << std::endl;
    if (!pack_opts.output.empty()) {
        std::cout << "Wrote " << pack_opts.output << std::endl;
    }
    return EXIT_OK;
}

} // anonymous namespace

void setup_pack(CLI::App* app, GlobalOptions& opts) {
    static PackOptions pack_opts;

    app->add_option("-o,--output", pack_opts.output, "Write the archive to this file");
    app->add_option("--include", pack_opts.includes, "Include path (repeatable, replaces the defaults)");
    app->add_flag("--no-mandatory", pack_opts.no_mandatory, "Do not require scripts/postinstall.sh");

    app->callback([&opts]() {
        std::exit(cmd_pack(opts, pack_opts));
    });
}

} // namespace latbench::cli::commands
