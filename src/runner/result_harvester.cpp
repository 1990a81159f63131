#include "latbench/harvest.hpp"
#include "latbench/platform.hpp"

#include <cmath>
#include <limits>
#include <nlohmann/json.hpp>

namespace latbench {

namespace {

// Token counts: non-negative whole numbers
bool read_count(const nlohmann::json& obj, const char* key, int64_t& out, std::string& error) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        out = 0;
        return true;
    }
    if (it->is_number_unsigned()) {
        uint64_t value = it->get<uint64_t>();
        if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            error = std::string(key) + " is out of range";
            return false;
        }
        out = static_cast<int64_t>(value);
        return true;
    }
    if (it->is_number_integer()) {
        out = it->get<int64_t>();
        if (out < 0) {
            error = std::string(key) + " must not be negative";
            return false;
        }
        return true;
    }
    if (it->is_number_float()) {
        double value = it->get<double>();
        if (!std::isfinite(value) || value < 0 || std::floor(value) != value) {
            error = std::string(key) + " must be a whole number";
            return false;
        }
        // 2^63 is the first double past INT64_MAX
        if (value >= 9223372036854775808.0) {
            error = std::string(key) + " is out of range";
            return false;
        }
        out = static_cast<int64_t>(value);
        return true;
    }
    error = std::string(key) + " must be a number";
    return false;
}

} // namespace

TelemetryOutcome parse_telemetry(const std::string& text) {
    TelemetryOutcome outcome;
    outcome.status = TelemetryStatus::Malformed;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        outcome.detail = std::string("invalid JSON: ") + e.what();
        return outcome;
    }

    if (!j.is_object()) {
        outcome.detail = "telemetry is not a JSON object";
        return outcome;
    }

    if (!read_count(j, "input", outcome.data.input_tokens, outcome.detail) ||
        !read_count(j, "output", outcome.data.output_tokens, outcome.detail)) {
        return outcome;
    }

    auto cost = j.find("cost_usd");
    if (cost != j.end() && !cost->is_null()) {
        if (!cost->is_number()) {
            outcome.detail = "cost_usd must be a number";
            return outcome;
        }
        outcome.data.cost_usd = cost->get<double>();
    }

    outcome.status = TelemetryStatus::Present;
    return outcome;
}

void merge_telemetry(const TelemetryData& data, RunContext& context) {
    if (!context.n_input_tokens) {
        context.n_input_tokens = data.input_tokens;
    }
    if (!context.n_output_tokens) {
        context.n_output_tokens = data.output_tokens;
    }
    if (!context.cost_usd && data.cost_usd) {
        context.cost_usd = data.cost_usd;
    }
}

std::string ResultHarvester::local_path() const {
    return join_path(logs_dir_, SandboxLayout::TELEMETRY_NAME);
}

TelemetryOutcome ResultHarvester::harvest(RunContext& context) {
    TelemetryOutcome outcome;
    std::string local = local_path();

    // A copy left over from an earlier run must never be read as this run's
    remove_file(local);

    auto transfer = sandbox_.download_file(SandboxLayout::TELEMETRY_PATH, local);
    if (!transfer.ok()) {
        outcome.status = TelemetryStatus::Absent;
        outcome.detail = transfer.error.empty() ? transfer_status_to_string(transfer.status) : transfer.error;
        if (warnings_) {
            warnings_->emit(Warning::telemetry_absent,
                            warnings::telemetry_absent(SandboxLayout::TELEMETRY_PATH, outcome.detail));
        }
        return outcome;
    }

    auto text = read_file_text(local);
    if (!text) {
        outcome.status = TelemetryStatus::Absent;
        outcome.detail = "downloaded telemetry is unreadable: " + local;
        if (warnings_) {
            warnings_->emit(Warning::telemetry_absent,
                            warnings::telemetry_absent(SandboxLayout::TELEMETRY_PATH, outcome.detail));
        }
        return outcome;
    }

    outcome = parse_telemetry(*text);
    if (outcome.status != TelemetryStatus::Present) {
        if (warnings_) {
            warnings_->emit(Warning::telemetry_malformed,
                            warnings::telemetry_malformed(local, outcome.detail));
        }
        return outcome;
    }

    merge_telemetry(outcome.data, context);
    return outcome;
}

} // namespace latbench
