/**
 * latbench CLI - check command
 *
 * Verify that the agent repository can be staged: runner script present,
 * the agent entry point it launches exists, mandatory payload inputs exist.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>
#include <regex>

namespace latbench::cli::commands {

namespace {

struct CheckOptions {
    std::string runner;
};

struct CheckItem {
    std::string name;
    bool ok = false;
    std::string detail;
};

// Entry point launched by the runner script ("bun src/cli/run.ts")
std::optional<std::string> find_entry_point(const std::string& script) {
    static const std::regex pattern(R"(bun\s+(src/[^\s"']+\.ts))");
    std::smatch match;
    if (std::regex_search(script, match, pattern)) {
        return match[1].str();
    }
    return std::nullopt;
}

int cmd_check(const GlobalOptions& opts, const CheckOptions& check_opts) {
    init_message_collector(opts.json, opts.quiet);

    EnvMap snapshot = snapshot_environment();
    std::string root = resolve_repo_root(opts.root, snapshot);
    std::string runner = resolve_runner_script(check_opts.runner, snapshot);

    std::vector<CheckItem> items;

    bool root_ok = is_directory(root);
    items.push_back({"repo_root", root_ok, root});

    auto script = read_file_text(runner);
    items.push_back({"runner_script", script.has_value(), runner});

    if (script) {
        auto entry = find_entry_point(*script);
        if (!entry) {
            items.push_back({"entry_point", false, "no 'bun src/...ts' invocation in " + runner});
        } else {
            std::string full = join_path(root, *entry);
            items.push_back({"entry_point", root_ok && is_regular_file(full), full});
        }
    }

    if (root_ok) {
        std::string mandatory = join_path(root, DEFAULT_MANDATORY_ENTRY);
        items.push_back({"mandatory_entry", is_regular_file(mandatory), mandatory});

        for (const auto& pattern : default_include_paths()) {
            if (!path_exists(join_path(root, pattern))) {
                print_warning("include path missing: " + pattern);
            }
        }
    }

    bool all_ok = std::all_of(items.begin(), items.end(), [](const CheckItem& i) { return i.ok; });

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = all_ok;
        j["checks"] = nlohmann::json::array();
        for (const auto& item : items) {
            j["checks"].push_back({{"name", item.name}, {"ok", item.ok}, {"detail", item.detail}});
        }
        output_json(j);
    } else {
        for (const auto& item : items) {
            if (!item.ok || !opts.quiet) {
                std::cout << (item.ok ? "ok    " : "FAIL  ") << item.name << "  " << item.detail << std::endl;
            }
        }
        if (all_ok && !opts.quiet) {
            std::cout << "Agent check passed." << std::endl;
        }
    }

    return all_ok ? EXIT_OK : EXIT_SETUP_ERROR;
}

} // anonymous namespace

void setup_check(CLI::App* app, GlobalOptions& opts) {
    static CheckOptions check_opts;

    app->add_option("--runner", check_opts.runner, "Runner script (default: installed lattice-run.sh)");

    app->callback([&opts]() {
        std::exit(cmd_check(opts, check_opts));
    });
}

} // namespace latbench::cli::commands
