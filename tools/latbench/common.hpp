/**
 * latbench CLI - Common utilities and types
 */

#pragma once

#include <latbench/latbench.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace latbench::cli {

// Process exit codes shared by all commands
constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_CONFIG_ERROR = 2;
constexpr int EXIT_SETUP_ERROR = 3;

inline int exit_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return EXIT_OK;
        case ErrorKind::Configuration: return EXIT_CONFIG_ERROR;
        case ErrorKind::Setup: return EXIT_SETUP_ERROR;
        default: return EXIT_FAILED;
    }
}

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string root;                           // --root (agent repository)
    bool json = false;                          // --json
    bool verbose = false;                       // -v, --verbose
    bool quiet = false;                         // -q, --quiet
    std::vector<std::string> ignore_warnings;   // --ignore-warning
};

/**
 * Collects messages for the current command.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct MessageCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline MessageCollector& get_message_collector() {
    static thread_local MessageCollector collector;
    return collector;
}

inline void init_message_collector(bool json_mode, bool quiet) {
    auto& collector = get_message_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode, const std::string& key = "") {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        if (!key.empty()) {
            j["key"] = key;
        }
        auto& collector = get_message_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_warning(const std::string& msg) {
    get_message_collector().add(msg);
}

inline void print_verbose(const std::string& msg, const GlobalOptions& opts) {
    if (opts.verbose && !opts.json && !opts.quiet) {
        std::cerr << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_message_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

// "key: a=1 b=2" with fields in name order
inline std::string format_warning(const WarningObject& warning) {
    std::map<std::string, std::string> sorted(warning.fields.begin(), warning.fields.end());
    std::string msg = warning.key;
    if (!sorted.empty()) {
        msg += ":";
        for (const auto& [field, value] : sorted) {
            msg += " " + field + "=" + value;
        }
    }
    return msg;
}

inline nlohmann::json warning_to_json(const WarningObject& warning) {
    nlohmann::json j;
    j["key"] = warning.key;
    j["action"] = warning.action;
    j["fields"] = nlohmann::json::object();
    for (const auto& [field, value] : warning.fields) {
        j["fields"][field] = value;
    }
    return j;
}

// Apply --ignore-warning policy to a library collector
inline void apply_warning_policy(WarningCollector& warnings, const GlobalOptions& opts) {
    for (const auto& key : opts.ignore_warnings) {
        if (!parse_warning_key(key)) {
            print_warning("unknown warning key '" + key + "' ignored");
            continue;
        }
        warnings.apply_override(key, WarningAction::Ignore);
    }
}

// Forward library warnings to the CLI output
inline void report_warnings(const WarningCollector& warnings) {
    for (const auto& warning : warnings.get_warnings()) {
        print_warning(format_warning(warning));
    }
}

} // namespace latbench::cli
