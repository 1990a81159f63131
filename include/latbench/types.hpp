#pragma once

#include <map>
#include <optional>
#include <string>
#include <unordered_map>

namespace latbench {

// Ordered so that every mapping handed to a sandbox iterates deterministically
using EnvMap = std::map<std::string, std::string>;

// ============================================================================
// Error Kinds
// ============================================================================

// Errors that abort a run ("could not run"). Task failures are not errors;
// they are recorded in ExecutionRecord.
enum class ErrorKind {
    None,
    Configuration,   // Fail-fast, before any sandbox contact
    Setup,           // Sandbox unreachable, install failure, missing payload input
};

inline const char* error_kind_to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::None: return "none";
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::Setup: return "setup";
        default: return "unknown";
    }
}

// ============================================================================
// Warning System
// ============================================================================

enum class Warning {
    include_path_missing,
    telemetry_absent,
    telemetry_malformed,
    command_timed_out,
    command_failed,
    exec_unavailable,
};

// Convert warning enum to canonical lowercase snake_case string
inline const char* warning_to_string(Warning w) {
    switch (w) {
        case Warning::include_path_missing: return "include_path_missing";
        case Warning::telemetry_absent: return "telemetry_absent";
        case Warning::telemetry_malformed: return "telemetry_malformed";
        case Warning::command_timed_out: return "command_timed_out";
        case Warning::command_failed: return "command_failed";
        case Warning::exec_unavailable: return "exec_unavailable";
        default: return "unknown";
    }
}

// Parse warning key string to enum (case-insensitive)
std::optional<Warning> parse_warning_key(const std::string& key);

enum class WarningAction {
    Warn,
    Ignore,
};

inline const char* action_to_string(WarningAction a) {
    switch (a) {
        case WarningAction::Warn: return "warn";
        case WarningAction::Ignore: return "ignore";
        default: return "warn";
    }
}

std::optional<WarningAction> parse_warning_action(const std::string& s);

struct WarningObject {
    std::string key;                                      // lowercase snake_case
    std::string action;                                   // "warn"
    std::unordered_map<std::string, std::string> fields;  // warning-specific
};

// ============================================================================
// Telemetry Status
// ============================================================================

// Outcome of post-run telemetry extraction. Never an error.
enum class TelemetryStatus {
    Present,
    Absent,      // Artifact could not be downloaded
    Malformed,   // Artifact downloaded but unusable
};

inline const char* telemetry_status_to_string(TelemetryStatus s) {
    switch (s) {
        case TelemetryStatus::Present: return "present";
        case TelemetryStatus::Absent: return "absent";
        case TelemetryStatus::Malformed: return "malformed";
        default: return "absent";
    }
}

} // namespace latbench
