#include "latbench/payload.hpp"
#include "latbench/digest.hpp"
#include "latbench/platform.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <utility>
#include <zlib.h>

namespace fs = std::filesystem;

namespace latbench {

// ============================================================================
// Tar Format Constants (POSIX ustar)
// ============================================================================

static constexpr size_t TAR_BLOCK_SIZE = 512;
static constexpr size_t TAR_NAME_SIZE = 100;
static constexpr size_t TAR_MODE_SIZE = 8;
static constexpr size_t TAR_UID_SIZE = 8;
static constexpr size_t TAR_GID_SIZE = 8;
static constexpr size_t TAR_SIZE_SIZE = 12;
static constexpr size_t TAR_MTIME_SIZE = 12;
static constexpr size_t TAR_CHKSUM_SIZE = 8;
static constexpr size_t TAR_LINKNAME_SIZE = 100;
static constexpr size_t TAR_MAGIC_SIZE = 6;
static constexpr size_t TAR_VERSION_SIZE = 2;
static constexpr size_t TAR_UNAME_SIZE = 32;
static constexpr size_t TAR_GNAME_SIZE = 32;
static constexpr size_t TAR_PREFIX_SIZE = 155;

static constexpr char TAR_REGTYPE = '0';
static constexpr char TAR_DIRTYPE = '5';

#pragma pack(push, 1)
struct TarHeader {
    char name[TAR_NAME_SIZE];       // 0
    char mode[TAR_MODE_SIZE];       // 100
    char uid[TAR_UID_SIZE];         // 108
    char gid[TAR_GID_SIZE];         // 116
    char size[TAR_SIZE_SIZE];       // 124
    char mtime[TAR_MTIME_SIZE];     // 136
    char chksum[TAR_CHKSUM_SIZE];   // 148
    char typeflag;                   // 156
    char linkname[TAR_LINKNAME_SIZE]; // 157
    char magic[TAR_MAGIC_SIZE];     // 257
    char version[TAR_VERSION_SIZE]; // 263
    char uname[TAR_UNAME_SIZE];     // 265
    char gname[TAR_GNAME_SIZE];     // 297
    char devmajor[8];               // 329
    char devminor[8];               // 337
    char prefix[TAR_PREFIX_SIZE];   // 345
    char padding[12];               // 500
};
#pragma pack(pop)

static_assert(sizeof(TarHeader) == TAR_BLOCK_SIZE, "TarHeader must be 512 bytes");

const std::vector<std::string>& default_include_paths() {
    static const std::vector<std::string> paths = {
        "package.json",
        "bun.lock",
        "bunfig.toml",
        "tsconfig.json",
        "tsconfig.main.json",
        "src",
        "dist",
        DEFAULT_MANDATORY_ENTRY,
    };
    return paths;
}

// ============================================================================
// Header Helpers
// ============================================================================

// Octal value with leading zeros, NUL terminated
static void write_octal(char* dest, size_t size, uint64_t value) {
    size_t digits = size - 1;
    dest[digits] = '\0';
    for (size_t i = digits; i > 0; --i) {
        dest[i - 1] = static_cast<char>('0' + (value & 7));
        value >>= 3;
    }
}

static uint64_t parse_octal(const char* data, size_t size) {
    uint64_t result = 0;
    for (size_t i = 0; i < size && data[i] != '\0' && data[i] != ' '; ++i) {
        if (data[i] >= '0' && data[i] <= '7') {
            result = (result << 3) | static_cast<uint64_t>(data[i] - '0');
        }
    }
    return result;
}

// Checksum field counts as spaces during calculation
static uint32_t calculate_checksum(const TarHeader& header) {
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(&header);
    uint32_t sum = 0;

    for (size_t i = 0; i < sizeof(TarHeader); ++i) {
        if (i >= 148 && i < 156) {
            sum += ' ';
        } else {
            sum += bytes[i];
        }
    }

    return sum;
}

static bool fill_tar_header(const TarEntry& entry, TarHeader& header, std::string& error) {
    std::memset(&header, 0, sizeof(header));

    std::string path = entry.path;
    if (entry.type == TarEntryType::Directory && !path.empty() && path.back() != '/') {
        path += '/';
    }

    if (path.size() <= TAR_NAME_SIZE - 1) {
        std::memcpy(header.name, path.data(), path.size());
    } else {
        // Split into prefix/name at a slash that makes both halves fit
        size_t split = path.rfind('/', TAR_PREFIX_SIZE - 1);
        while (split != std::string::npos && path.size() - split - 1 > TAR_NAME_SIZE - 1) {
            split = split == 0 ? std::string::npos : path.rfind('/', split - 1);
        }
        if (split == std::string::npos || split > TAR_PREFIX_SIZE - 1 || split == 0) {
            error = "path too long for ustar archive: " + entry.path;
            return false;
        }
        std::memcpy(header.prefix, path.data(), split);
        std::memcpy(header.name, path.data() + split + 1, path.size() - split - 1);
    }

    uint32_t mode;
    if (entry.type == TarEntryType::Directory) {
        mode = 0755;
    } else {
        mode = entry.executable ? 0755 : 0644;
    }
    write_octal(header.mode, TAR_MODE_SIZE, mode);

    write_octal(header.uid, TAR_UID_SIZE, 0);
    write_octal(header.gid, TAR_GID_SIZE, 0);

    if (entry.type == TarEntryType::Directory) {
        write_octal(header.size, TAR_SIZE_SIZE, 0);
    } else {
        write_octal(header.size, TAR_SIZE_SIZE, entry.data.size());
    }

    write_octal(header.mtime, TAR_MTIME_SIZE, 0);

    header.typeflag = entry.type == TarEntryType::Directory ? TAR_DIRTYPE : TAR_REGTYPE;

    std::memcpy(header.magic, "ustar", 5);
    header.magic[5] = '\0';
    header.version[0] = '0';
    header.version[1] = '0';

    // 6 octal digits + NUL + space
    uint32_t checksum = calculate_checksum(header);
    char chksum_str[8];
    std::snprintf(chksum_str, sizeof(chksum_str), "%06o", checksum);
    std::memcpy(header.chksum, chksum_str, 6);
    header.chksum[6] = '\0';
    header.chksum[7] = ' ';

    return true;
}

// ============================================================================
// Gzip
// ============================================================================

// Header written by hand so that no mtime or filename leaks into the stream
static std::vector<uint8_t> gzip_compress(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> result = {
        0x1f, 0x8b,             // Magic
        0x08,                   // Deflate
        0x00,                   // Flags: none
        0x00, 0x00, 0x00, 0x00, // mtime = 0
        0x00,                   // Extra flags
        0xff,                   // OS = 255 (unknown)
    };

    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));

    // Raw deflate (negative window bits)
    if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return {};
    }

    strm.next_in = const_cast<Bytef*>(data.data());
    strm.avail_in = static_cast<uInt>(data.size());

    std::vector<uint8_t> compressed;
    compressed.resize(deflateBound(&strm, static_cast<uLong>(data.size())));

    strm.next_out = compressed.data();
    strm.avail_out = static_cast<uInt>(compressed.size());

    int ret = deflate(&strm, Z_FINISH);
    deflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        return {};
    }

    compressed.resize(strm.total_out);
    result.insert(result.end(), compressed.begin(), compressed.end());

    // Trailer: CRC32 + original size, little-endian
    uint32_t crc = static_cast<uint32_t>(crc32(0, data.data(), static_cast<uInt>(data.size())));
    uint32_t size = static_cast<uint32_t>(data.size());
    for (uint32_t word : {crc, size}) {
        result.push_back(word & 0xff);
        result.push_back((word >> 8) & 0xff);
        result.push_back((word >> 16) & 0xff);
        result.push_back((word >> 24) & 0xff);
    }

    return result;
}

static std::vector<uint8_t> gzip_decompress(const std::vector<uint8_t>& data) {
    if (data.size() < 18 || data[0] != 0x1f || data[1] != 0x8b) {
        return {};
    }

    size_t offset = 10;
    uint8_t flags = data[3];

    if (flags & 0x04) {
        if (offset + 2 > data.size()) return {};
        uint16_t xlen = static_cast<uint16_t>(data[offset] | (data[offset + 1] << 8));
        offset += 2 + xlen;
    }
    if (flags & 0x08) {
        while (offset < data.size() && data[offset] != 0) offset++;
        offset++;
    }
    if (flags & 0x10) {
        while (offset < data.size() && data[offset] != 0) offset++;
        offset++;
    }
    if (flags & 0x02) {
        offset += 2;
    }

    if (offset + 8 > data.size()) {
        return {};
    }

    uint32_t orig_size = static_cast<uint32_t>(data[data.size() - 4]) |
                         (static_cast<uint32_t>(data[data.size() - 3]) << 8) |
                         (static_cast<uint32_t>(data[data.size() - 2]) << 16) |
                         (static_cast<uint32_t>(data[data.size() - 1]) << 24);

    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));

    if (inflateInit2(&strm, -15) != Z_OK) {
        return {};
    }

    strm.next_in = const_cast<Bytef*>(data.data() + offset);
    strm.avail_in = static_cast<uInt>(data.size() - offset - 8);

    std::vector<uint8_t> result(orig_size);
    strm.next_out = result.data();
    strm.avail_out = static_cast<uInt>(result.size());

    int ret = inflate(&strm, Z_FINISH);
    inflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        return {};
    }

    return result;
}

// ============================================================================
// Entry Sorting
// ============================================================================

// Component by component; at each level directories sort before files and
// names compare bytewise. A parent directory sorts before its contents.
static bool compare_entries(const TarEntry& a, const TarEntry& b) {
    auto components = [](const TarEntry& e) {
        std::vector<std::pair<bool, std::string>> parts;  // (is_file, name)
        size_t start = 0;
        while (start <= e.path.size()) {
            size_t slash = e.path.find('/', start);
            size_t end = slash == std::string::npos ? e.path.size() : slash;
            if (end > start) {
                parts.emplace_back(false, e.path.substr(start, end - start));
            }
            if (slash == std::string::npos) break;
            start = slash + 1;
        }
        if (!parts.empty() && e.type != TarEntryType::Directory) {
            parts.back().first = true;
        }
        return parts;
    };

    return components(a) < components(b);
}

// ============================================================================
// Tar Walking
// ============================================================================

namespace {

struct RawTarEntry {
    std::string path;
    char typeflag = TAR_REGTYPE;
    const uint8_t* data = nullptr;
    uint64_t size = 0;
};

bool walk_tar(const std::vector<uint8_t>& tar_data, std::vector<RawTarEntry>& out, std::string& error) {
    size_t offset = 0;

    while (offset + TAR_BLOCK_SIZE <= tar_data.size()) {
        const TarHeader* header = reinterpret_cast<const TarHeader*>(tar_data.data() + offset);

        bool empty = std::all_of(tar_data.begin() + static_cast<std::ptrdiff_t>(offset),
                                 tar_data.begin() + static_cast<std::ptrdiff_t>(offset + TAR_BLOCK_SIZE),
                                 [](uint8_t b) { return b == 0; });
        if (empty) break;

        RawTarEntry entry;
        if (header->prefix[0] != '\0') {
            entry.path = std::string(header->prefix, strnlen(header->prefix, TAR_PREFIX_SIZE));
            entry.path += '/';
        }
        entry.path += std::string(header->name, strnlen(header->name, TAR_NAME_SIZE));
        while (!entry.path.empty() && entry.path.back() == '/') {
            entry.path.pop_back();
        }

        entry.typeflag = header->typeflag == '\0' ? TAR_REGTYPE : header->typeflag;
        entry.size = entry.typeflag == TAR_REGTYPE ? parse_octal(header->size, TAR_SIZE_SIZE) : 0;

        offset += TAR_BLOCK_SIZE;
        if (offset + entry.size > tar_data.size()) {
            error = "truncated archive: " + entry.path;
            return false;
        }
        entry.data = tar_data.data() + offset;

        size_t blocks = static_cast<size_t>((entry.size + TAR_BLOCK_SIZE - 1) / TAR_BLOCK_SIZE);
        offset += blocks * TAR_BLOCK_SIZE;

        out.push_back(std::move(entry));
    }

    return true;
}

bool is_safe_pattern(const std::string& pattern, std::string& error) {
    if (pattern.empty()) {
        error = "empty include path";
        return false;
    }
    if (pattern[0] == '/' || pattern[0] == '\\') {
        error = "absolute include path not allowed: " + pattern;
        return false;
    }
    for (const auto& component : fs::path(pattern)) {
        if (component == "..") {
            error = "path traversal not allowed in include path: " + pattern;
            return false;
        }
    }
    return true;
}

std::string normalize_pattern(const std::string& pattern) {
    std::string normalized = fs::path(to_portable_path(pattern)).lexically_normal().generic_string();
    while (!normalized.empty() && normalized.back() == '/') {
        normalized.pop_back();
    }
    return normalized;
}

bool has_exec_bit(const fs::path& path) {
    std::error_code ec;
    auto perms = fs::status(path, ec).permissions();
    if (ec) {
        return false;
    }
    return (perms & fs::perms::owner_exec) != fs::perms::none ||
           (perms & fs::perms::group_exec) != fs::perms::none ||
           (perms & fs::perms::others_exec) != fs::perms::none;
}

// Add one on-disk path as an entry; directories are not descended here
bool add_entry(const fs::path& full_path, const std::string& rel_path,
               std::map<std::string, TarEntry>& entries, std::string& error) {
    std::error_code ec;
    auto status = fs::symlink_status(full_path, ec);
    if (ec) {
        error = "failed to stat " + rel_path + ": " + ec.message();
        return false;
    }

    TarEntry entry;
    entry.path = rel_path;

    if (fs::is_symlink(status)) {
        error = "symlinks are not permitted: " + rel_path;
        return false;
    } else if (fs::is_directory(status)) {
        entry.type = TarEntryType::Directory;
    } else if (fs::is_regular_file(status)) {
        auto content = read_file_bytes(full_path.string());
        if (!content) {
            error = "failed to read file: " + rel_path;
            return false;
        }
        entry.data = std::move(*content);
        entry.executable = has_exec_bit(full_path);
    } else {
        error = "unsupported file type: " + rel_path;
        return false;
    }

    entries[rel_path] = std::move(entry);
    return true;
}

} // namespace

// ============================================================================
// Public API Implementation
// ============================================================================

PackResult create_deterministic_archive(const std::vector<TarEntry>& entries) {
    PackResult result;

    for (const auto& entry : entries) {
        if (entry.type == TarEntryType::Symlink) {
            result.error = "symlinks are not permitted: " + entry.path;
            return result;
        }
        if (entry.type == TarEntryType::Other) {
            result.error = "unsupported entry type: " + entry.path;
            return result;
        }
    }

    std::vector<TarEntry> sorted_entries = entries;
    std::sort(sorted_entries.begin(), sorted_entries.end(), compare_entries);

    std::vector<uint8_t> tar_data;

    for (const auto& entry : sorted_entries) {
        TarHeader header;
        if (!fill_tar_header(entry, header, result.error)) {
            return result;
        }
        const uint8_t* header_bytes = reinterpret_cast<const uint8_t*>(&header);
        tar_data.insert(tar_data.end(), header_bytes, header_bytes + TAR_BLOCK_SIZE);

        if (entry.type == TarEntryType::RegularFile && !entry.data.empty()) {
            tar_data.insert(tar_data.end(), entry.data.begin(), entry.data.end());

            size_t padding = (TAR_BLOCK_SIZE - (entry.data.size() % TAR_BLOCK_SIZE)) % TAR_BLOCK_SIZE;
            tar_data.insert(tar_data.end(), padding, 0);
        }
    }

    // Two empty blocks mark the end of the archive
    tar_data.insert(tar_data.end(), TAR_BLOCK_SIZE * 2, 0);

    result.archive_data = gzip_compress(tar_data);
    if (result.archive_data.empty()) {
        result.error = "gzip compression failed";
        return result;
    }

    result.ok = true;
    return result;
}

CollectResult collect_include_entries(const std::string& root,
                                      const std::vector<std::string>& patterns) {
    CollectResult result;

    if (!is_directory(root)) {
        result.error = "payload root not found: " + root;
        return result;
    }

    fs::path base_path(root);
    std::map<std::string, TarEntry> entries;

    for (const auto& raw_pattern : patterns) {
        if (!is_safe_pattern(raw_pattern, result.error)) {
            return result;
        }

        std::string pattern = normalize_pattern(raw_pattern);
        fs::path full_path = base_path / pattern;

        std::error_code ec;
        auto status = fs::symlink_status(full_path, ec);
        if (ec || !fs::exists(status)) {
            result.skipped_patterns.push_back(raw_pattern);
            continue;
        }

        if (!add_entry(full_path, pattern, entries, result.error)) {
            return result;
        }

        if (!fs::is_directory(status)) {
            continue;
        }

        fs::recursive_directory_iterator it(full_path, ec);
        if (ec) {
            result.error = "failed to walk " + pattern + ": " + ec.message();
            return result;
        }
        for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
            if (ec) {
                result.error = "failed to walk " + pattern + ": " + ec.message();
                return result;
            }
            std::string rel = to_portable_path(fs::relative(it->path(), base_path).generic_string());
            if (!add_entry(it->path(), rel, entries, result.error)) {
                return result;
            }
        }
        if (ec) {
            result.error = "failed to walk " + pattern + ": " + ec.message();
            return result;
        }
    }

    result.entries.reserve(entries.size());
    for (auto& [path, entry] : entries) {
        result.entries.push_back(std::move(entry));
    }

    result.ok = true;
    return result;
}

PayloadResult build_payload(const PayloadRequest& request, WarningCollector* warnings) {
    PayloadResult result;

    auto collected = collect_include_entries(request.root, request.include_paths);
    if (!collected.ok) {
        result.error = collected.error;
        return result;
    }

    if (warnings) {
        for (const auto& pattern : collected.skipped_patterns) {
            warnings->emit(Warning::include_path_missing,
                           warnings::include_path_missing(pattern, request.root));
        }
    }

    if (request.mandatory_entry) {
        std::string mandatory = normalize_pattern(*request.mandatory_entry);
        bool present = std::any_of(collected.entries.begin(), collected.entries.end(),
                                   [&mandatory](const TarEntry& e) {
                                       return e.path == mandatory && e.type == TarEntryType::RegularFile;
                                   });
        if (!present) {
            result.missing_input = true;
            result.error = "missing archive input: " + mandatory + " not found under " + request.root;
            return result;
        }
    }

    auto packed = create_deterministic_archive(collected.entries);
    if (!packed.ok) {
        result.error = packed.error;
        return result;
    }

    std::sort(collected.entries.begin(), collected.entries.end(), compare_entries);
    for (const auto& entry : collected.entries) {
        result.entries.push_back(entry.path);
    }

    auto digest = compute_sha256(packed.archive_data);
    if (!digest.ok) {
        result.error = "failed to digest payload: " + digest.error;
        return result;
    }

    result.archive_data = std::move(packed.archive_data);
    result.sha256 = digest.hex_digest;
    result.ok = true;
    return result;
}

ListResult list_archive_entries(const std::vector<uint8_t>& archive_data) {
    ListResult result;

    std::vector<uint8_t> tar_data = gzip_decompress(archive_data);
    if (tar_data.empty()) {
        result.error = "failed to decompress archive";
        return result;
    }

    std::vector<RawTarEntry> raw;
    if (!walk_tar(tar_data, raw, result.error)) {
        return result;
    }

    for (const auto& entry : raw) {
        result.entries.push_back(entry.path);
    }

    result.ok = true;
    return result;
}

std::optional<std::vector<uint8_t>> read_archive_file(const std::vector<uint8_t>& archive_data,
                                                      const std::string& entry_path) {
    std::vector<uint8_t> tar_data = gzip_decompress(archive_data);
    if (tar_data.empty()) {
        return std::nullopt;
    }

    std::vector<RawTarEntry> raw;
    std::string error;
    if (!walk_tar(tar_data, raw, error)) {
        return std::nullopt;
    }

    for (const auto& entry : raw) {
        if (entry.path == entry_path && entry.typeflag == TAR_REGTYPE) {
            return std::vector<uint8_t>(entry.data, entry.data + entry.size);
        }
    }

    return std::nullopt;
}

} // namespace latbench
