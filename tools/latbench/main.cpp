/**
 * latbench CLI - Entry Point
 *
 * Runs the lattice agent inside a benchmark sandbox.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace latbench::cli::commands {
    void setup_config(CLI::App* app, GlobalOptions& opts);
    void setup_pack(CLI::App* app, GlobalOptions& opts);
    void setup_check(CLI::App* app, GlobalOptions& opts);
    void setup_run(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace latbench::cli;

    CLI::App app{"latbench - lattice agent benchmark adapter"};
    app.set_version_flag("-V,--version", LATBENCH_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--root", opts.root, "Agent repository root");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");
    app.add_option("--ignore-warning", opts.ignore_warnings, "Suppress a warning key");

    // Commands
    auto* config_cmd = app.add_subcommand("config", "Resolve and print the sandbox configuration");
    commands::setup_config(config_cmd, opts);

    auto* pack_cmd = app.add_subcommand("pack", "Build the agent payload archive");
    commands::setup_pack(pack_cmd, opts);

    auto* check_cmd = app.add_subcommand("check", "Verify the agent repository and runner script");
    commands::setup_check(check_cmd, opts);

    auto* run_cmd = app.add_subcommand("run", "Stage the agent into a container and run an instruction");
    commands::setup_run(run_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
