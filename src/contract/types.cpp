#include "latbench/types.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace latbench {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<Warning> parse_warning_key(const std::string& key) {
    std::string lower = to_lower(key);

    if (lower == "include_path_missing") return Warning::include_path_missing;
    if (lower == "telemetry_absent") return Warning::telemetry_absent;
    if (lower == "telemetry_malformed") return Warning::telemetry_malformed;
    if (lower == "command_timed_out") return Warning::command_timed_out;
    if (lower == "command_failed") return Warning::command_failed;
    if (lower == "exec_unavailable") return Warning::exec_unavailable;

    return std::nullopt;
}

std::optional<WarningAction> parse_warning_action(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "warn") return WarningAction::Warn;
    if (lower == "ignore") return WarningAction::Ignore;
    return std::nullopt;
}

} // namespace latbench
