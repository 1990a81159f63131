#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace latbench {

// ============================================================================
// SHA-256 Hashing
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;     // Lowercase hex string (64 chars)
};

HashResult compute_sha256(const std::vector<uint8_t>& data);
HashResult compute_sha256_file(const std::string& file_path);

} // namespace latbench
