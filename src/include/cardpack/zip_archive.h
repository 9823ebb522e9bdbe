#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file zip_archive.h
 * \brief Read-only ZIP central-directory reader for CharX card bundles.
 *
 * Supports stored (0) and deflate (8) entries. ZIP64 and encrypted entries
 * are rejected. Every extracted entry is verified against its CRC-32.
 */

namespace cardpack {

enum class ZipStatus : uint8_t {
    Ok,
    /// No end-of-central-directory record.
    NotZip,
    /// Central directory or local header is truncated or inconsistent.
    Malformed,
    /// ZIP64, encryption, or a compression method other than 0/8.
    Unsupported,
    /// Entry count or extracted size exceeds \ref ZipLimits.
    LimitExceeded,
    /// Extracted bytes do not match the stored CRC-32.
    CrcMismatch,
    NotFound,
};

struct ZipLimits final {
    uint32_t max_entries     = 10000;
    uint64_t max_entry_bytes = 64ULL * 1024ULL * 1024ULL;
};

struct ZipEntry final {
    std::string name;
    uint16_t flags              = 0;
    uint16_t method             = 0;
    uint32_t crc                = 0;
    uint64_t compressed_size    = 0;
    uint64_t size               = 0;
    uint64_t local_header_offset = 0;
};

/// View over a ZIP held in memory. The buffer must outlive the archive.
class ZipArchive final {
public:
    ZipArchive() = default;

    /// Parses the central directory of \p bytes.
    static ZipStatus open(std::span<const std::byte> bytes,
                          const ZipLimits& limits, ZipArchive* out);

    const std::vector<ZipEntry>& entries() const noexcept { return entries_; }

    /// Looks up an entry by name; a leading `/` or `./` is ignored.
    const ZipEntry* find(std::string_view name) const noexcept;

    ZipStatus read(const ZipEntry& entry, std::vector<std::byte>* out) const;
    ZipStatus read(std::string_view name, std::vector<std::byte>* out) const;

private:
    std::span<const std::byte> bytes_;
    std::vector<ZipEntry> entries_;
    ZipLimits limits_;
};

/// True if \p bytes starts with a local file header or an empty-archive EOCD.
bool
looks_like_zip(std::span<const std::byte> bytes) noexcept;

const char*
zip_status_name(ZipStatus status) noexcept;

}  // namespace cardpack
