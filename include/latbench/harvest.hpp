#pragma once

#include "latbench/sandbox.hpp"
#include "latbench/warnings.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace latbench {

// ============================================================================
// Run Context
// ============================================================================

// Harness-owned metrics for one trial. Fields are only written while unset.
struct RunContext {
    std::optional<int64_t> n_input_tokens;
    std::optional<int64_t> n_output_tokens;
    std::optional<double> cost_usd;
};

// ============================================================================
// Telemetry
// ============================================================================

struct TelemetryData {
    int64_t input_tokens = 0;
    int64_t output_tokens = 0;
    std::optional<double> cost_usd;
};

struct TelemetryOutcome {
    TelemetryStatus status = TelemetryStatus::Absent;
    TelemetryData data;         // Meaningful only when Present
    std::string detail;         // Why Absent or Malformed
};

// Parse {"input": int, "output": int, "cost_usd": number|null}.
// Missing counts default to zero; a missing or null cost is left unset.
TelemetryOutcome parse_telemetry(const std::string& text);

// Copy each value into the context unless that field is already set
void merge_telemetry(const TelemetryData& data, RunContext& context);

// ============================================================================
// Result Harvester
// ============================================================================

// Best-effort post-run extraction. Never fails the run.
class ResultHarvester {
public:
    ResultHarvester(Sandbox& sandbox, std::string logs_dir, WarningCollector* warnings = nullptr)
        : sandbox_(sandbox), logs_dir_(std::move(logs_dir)), warnings_(warnings) {}

    TelemetryOutcome harvest(RunContext& context);

    std::string local_path() const;

private:
    Sandbox& sandbox_;
    std::string logs_dir_;
    WarningCollector* warnings_;
};

} // namespace latbench
