#pragma once

#include "latbench/warnings.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace latbench {

// ============================================================================
// Deterministic Packaging
// ============================================================================

enum class TarEntryType {
    RegularFile,
    Directory,
    Symlink,    // NOT permitted - detection only
    Other       // NOT permitted - detection only
};

struct TarEntry {
    std::string path;           // Relative path within archive, forward slashes
    TarEntryType type = TarEntryType::RegularFile;
    std::vector<uint8_t> data;  // File content (empty for directories)
    bool executable = false;    // True if file should be 0755
};

struct PackResult {
    bool ok = false;
    std::string error;
    std::vector<uint8_t> archive_data;  // The complete .tar.gz archive
};

// Create a deterministic gzip-compressed tar archive from entries
//   - Entry ordering: by path component, directories before files at each level
//   - Metadata: uid=0, gid=0, uname="", gname="", mtime=0
//   - Permissions: dirs=0755, files=0644 (or 0755 if executable)
//   - Gzip: mtime=0, no filename, OS=255
PackResult create_deterministic_archive(const std::vector<TarEntry>& entries);

struct CollectResult {
    bool ok = false;
    std::string error;
    std::vector<TarEntry> entries;
    std::vector<std::string> skipped_patterns;  // Matched nothing on disk
};

// Collect entries for an ordered list of include patterns under root.
// Directories are walked recursively; patterns that match nothing are skipped.
// Absolute patterns, ".." components and symlinks are rejected.
CollectResult collect_include_entries(const std::string& root,
                                      const std::vector<std::string>& patterns);

// ============================================================================
// Payload
// ============================================================================

// Paths bundled from the agent repository by default
const std::vector<std::string>& default_include_paths();

// Entry that must be present for the install step to work
constexpr const char* DEFAULT_MANDATORY_ENTRY = "scripts/postinstall.sh";

struct PayloadRequest {
    std::string root;
    std::vector<std::string> include_paths;
    std::optional<std::string> mandatory_entry;
};

struct PayloadResult {
    bool ok = false;
    std::string error;
    bool missing_input = false;         // MissingArchiveInput: mandatory entry absent
    std::vector<uint8_t> archive_data;
    std::vector<std::string> entries;   // Archive order
    std::string sha256;
};

// Build the archive payload. Skipped patterns are reported to warnings when
// a collector is given.
PayloadResult build_payload(const PayloadRequest& request, WarningCollector* warnings = nullptr);

// ============================================================================
// Inspection
// ============================================================================

struct ListResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> entries;   // Archive order, no trailing slashes
};

// List entry paths of a gzip tar archive without extracting it
ListResult list_archive_entries(const std::vector<uint8_t>& archive_data);

// Read one regular file's content out of a gzip tar archive
std::optional<std::vector<uint8_t>> read_archive_file(const std::vector<uint8_t>& archive_data,
                                                      const std::string& entry_path);

} // namespace latbench
