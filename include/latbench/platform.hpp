#pragma once

#include "latbench/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace latbench {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir).
// Used for every run log artifact so each is durable before the next step.
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);
AtomicWriteResult atomic_write_file(const std::string& path, const std::vector<uint8_t>& content);

// Create a directory (and parents) with fsync on the parent
AtomicWriteResult atomic_create_directory(const std::string& path);

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes (tar entries and sandbox paths)
std::string to_portable_path(const std::string& path);

std::string get_parent_directory(const std::string& path);

std::string join_path(const std::string& base, const std::string& rel);

bool path_exists(const std::string& path);

bool is_directory(const std::string& path);

bool is_regular_file(const std::string& path);

bool create_directories(const std::string& path);

bool remove_file(const std::string& path);

// Expand a leading "~" using HOME and make the path absolute
std::string expand_user_path(const std::string& path);

// Read a whole file as bytes; nullopt if it cannot be opened
std::optional<std::vector<uint8_t>> read_file_bytes(const std::string& path);

std::optional<std::string> read_file_text(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

// Copy the whole process environment once. Each run resolves against its own
// snapshot, never against the live environment.
EnvMap snapshot_environment();

// ============================================================================
// Strings and time
// ============================================================================

std::string trim(const std::string& s);

std::string get_current_timestamp();

std::string generate_uuid();

} // namespace latbench
