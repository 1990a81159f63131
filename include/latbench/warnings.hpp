#pragma once

#include "latbench/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace latbench {

// ============================================================================
// Warning Collector
// ============================================================================

// Collects degradations that a run absorbs instead of failing on
// (missing include paths, missing telemetry, failed or timed-out commands).
class WarningCollector {
public:
    void emit(Warning warning, const std::unordered_map<std::string, std::string>& fields);
    void emit(Warning warning);

    // Emit a warning by key string (for dynamic warning keys)
    void emit(const std::string& warning_key, std::unordered_map<std::string, std::string> fields = {});

    // Every key warns unless overridden; the last override for a key wins
    void apply_override(const std::string& warning_key, WarningAction action);

    // Warnings with action "ignore" are excluded
    std::vector<WarningObject> get_warnings() const;

    bool has_effective_warnings() const;

    // True if a warning with this key was emitted, even when ignored
    bool contains(Warning warning) const;

    void clear();

private:
    struct CollectedWarning {
        std::string key;
        std::unordered_map<std::string, std::string> fields;
        WarningAction effective_action;
    };

    std::vector<CollectedWarning> warnings_;
    std::unordered_map<std::string, WarningAction> overrides_;

    WarningAction get_effective_action(const std::string& key) const;
};

// ============================================================================
// Convenience field builders
// ============================================================================

namespace warnings {

inline std::unordered_map<std::string, std::string> include_path_missing(
    const std::string& pattern,
    const std::string& root) {
    return {{"pattern", pattern}, {"root", root}};
}

inline std::unordered_map<std::string, std::string> telemetry_absent(
    const std::string& remote_path,
    const std::string& reason) {
    return {{"remote_path", remote_path}, {"reason", reason}};
}

inline std::unordered_map<std::string, std::string> telemetry_malformed(
    const std::string& local_path,
    const std::string& reason) {
    return {{"local_path", local_path}, {"reason", reason}};
}

inline std::unordered_map<std::string, std::string> command_outcome(
    size_t index,
    const std::string& return_code) {
    return {{"index", std::to_string(index)}, {"return_code", return_code}};
}

} // namespace warnings

} // namespace latbench
