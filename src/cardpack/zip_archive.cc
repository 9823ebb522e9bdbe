#include "cardpack/zip_archive.h"

#include "cardpack/crc32.h"
#include "cardpack/inflate.h"

namespace cardpack {
namespace {

    static constexpr uint32_t kLocalHeaderSig = 0x04034B50U;
    static constexpr uint32_t kCentralSig     = 0x02014B50U;
    static constexpr uint32_t kEocdSig        = 0x06054B50U;

    static constexpr uint64_t kEocdSize       = 22;
    static constexpr uint64_t kMaxCommentSize = 0xFFFF;
    static constexpr uint64_t kCentralSize    = 46;
    static constexpr uint64_t kLocalSize      = 30;

    static constexpr uint16_t kFlagEncrypted = 0x0001;

    static uint8_t u8(std::byte b) noexcept { return static_cast<uint8_t>(b); }


    static bool read_u16le(std::span<const std::byte> bytes, uint64_t offset,
                           uint16_t* out) noexcept
    {
        if (offset + 2 > bytes.size()) {
            return false;
        }
        *out = static_cast<uint16_t>(
            (static_cast<uint16_t>(u8(bytes[offset + 0])) << 0)
            | (static_cast<uint16_t>(u8(bytes[offset + 1])) << 8));
        return true;
    }


    static bool read_u32le(std::span<const std::byte> bytes, uint64_t offset,
                           uint32_t* out) noexcept
    {
        if (offset + 4 > bytes.size()) {
            return false;
        }
        *out = (static_cast<uint32_t>(u8(bytes[offset + 0])) << 0)
               | (static_cast<uint32_t>(u8(bytes[offset + 1])) << 8)
               | (static_cast<uint32_t>(u8(bytes[offset + 2])) << 16)
               | (static_cast<uint32_t>(u8(bytes[offset + 3])) << 24);
        return true;
    }


    static bool find_eocd(std::span<const std::byte> bytes,
                          uint64_t* out) noexcept
    {
        if (bytes.size() < kEocdSize) {
            return false;
        }
        const uint64_t last  = bytes.size() - kEocdSize;
        const uint64_t floor = (last > kMaxCommentSize) ? last - kMaxCommentSize
                                                        : 0;
        for (uint64_t pos = last + 1; pos-- > floor;) {
            uint32_t sig = 0;
            if (read_u32le(bytes, pos, &sig) && sig == kEocdSig) {
                *out = pos;
                return true;
            }
        }
        return false;
    }


    static std::string_view normalize_name(std::string_view name) noexcept
    {
        while (!name.empty()) {
            if (name.front() == '/') {
                name.remove_prefix(1);
            } else if (name.substr(0, 2) == "./") {
                name.remove_prefix(2);
            } else {
                break;
            }
        }
        return name;
    }

}  // namespace

ZipStatus
ZipArchive::open(std::span<const std::byte> bytes, const ZipLimits& limits,
                 ZipArchive* out)
{
    if (!out) {
        return ZipStatus::Malformed;
    }
    uint64_t eocd = 0;
    if (!find_eocd(bytes, &eocd)) {
        return ZipStatus::NotZip;
    }

    uint16_t disk       = 0;
    uint16_t cd_disk    = 0;
    uint16_t total      = 0;
    uint32_t cd_size    = 0;
    uint32_t cd_offset  = 0;
    if (!read_u16le(bytes, eocd + 4, &disk)
        || !read_u16le(bytes, eocd + 6, &cd_disk)
        || !read_u16le(bytes, eocd + 10, &total)
        || !read_u32le(bytes, eocd + 12, &cd_size)
        || !read_u32le(bytes, eocd + 16, &cd_offset)) {
        return ZipStatus::Malformed;
    }
    if (disk != 0 || cd_disk != 0) {
        return ZipStatus::Unsupported;
    }
    if (total == 0xFFFFU || cd_offset == 0xFFFFFFFFU) {
        return ZipStatus::Unsupported;
    }
    if (total > limits.max_entries) {
        return ZipStatus::LimitExceeded;
    }
    if (static_cast<uint64_t>(cd_offset) + cd_size > eocd) {
        return ZipStatus::Malformed;
    }

    ZipArchive archive;
    archive.bytes_  = bytes;
    archive.limits_ = limits;
    archive.entries_.reserve(total);

    uint64_t pos = cd_offset;
    for (uint32_t i = 0; i < total; ++i) {
        uint32_t sig = 0;
        if (!read_u32le(bytes, pos, &sig) || sig != kCentralSig
            || pos + kCentralSize > eocd) {
            return ZipStatus::Malformed;
        }
        ZipEntry e;
        uint32_t csize       = 0;
        uint32_t usize       = 0;
        uint32_t local       = 0;
        uint16_t name_len    = 0;
        uint16_t extra_len   = 0;
        uint16_t comment_len = 0;
        (void)read_u16le(bytes, pos + 8, &e.flags);
        (void)read_u16le(bytes, pos + 10, &e.method);
        (void)read_u32le(bytes, pos + 16, &e.crc);
        (void)read_u32le(bytes, pos + 20, &csize);
        (void)read_u32le(bytes, pos + 24, &usize);
        (void)read_u16le(bytes, pos + 28, &name_len);
        (void)read_u16le(bytes, pos + 30, &extra_len);
        (void)read_u16le(bytes, pos + 32, &comment_len);
        (void)read_u32le(bytes, pos + 42, &local);

        const uint64_t name_off = pos + kCentralSize;
        const uint64_t next     = name_off + name_len + extra_len + comment_len;
        if (next > eocd) {
            return ZipStatus::Malformed;
        }
        if (csize == 0xFFFFFFFFU || usize == 0xFFFFFFFFU
            || local == 0xFFFFFFFFU) {
            return ZipStatus::Unsupported;
        }
        e.name.assign(reinterpret_cast<const char*>(bytes.data() + name_off),
                      name_len);
        e.compressed_size     = csize;
        e.size                = usize;
        e.local_header_offset = local;
        archive.entries_.push_back(std::move(e));
        pos = next;
    }

    *out = std::move(archive);
    return ZipStatus::Ok;
}


const ZipEntry*
ZipArchive::find(std::string_view name) const noexcept
{
    const std::string_view want = normalize_name(name);
    for (const ZipEntry& e : entries_) {
        if (normalize_name(e.name) == want) {
            return &e;
        }
    }
    return nullptr;
}


ZipStatus
ZipArchive::read(const ZipEntry& entry, std::vector<std::byte>* out) const
{
    if (!out) {
        return ZipStatus::Malformed;
    }
    if ((entry.flags & kFlagEncrypted) != 0) {
        return ZipStatus::Unsupported;
    }
    if (entry.method != 0 && entry.method != 8) {
        return ZipStatus::Unsupported;
    }
    if (entry.size > limits_.max_entry_bytes) {
        return ZipStatus::LimitExceeded;
    }

    const uint64_t lh = entry.local_header_offset;
    uint32_t sig       = 0;
    uint16_t name_len  = 0;
    uint16_t extra_len = 0;
    if (!read_u32le(bytes_, lh, &sig) || sig != kLocalHeaderSig
        || !read_u16le(bytes_, lh + 26, &name_len)
        || !read_u16le(bytes_, lh + 28, &extra_len)) {
        return ZipStatus::Malformed;
    }
    const uint64_t data_off = lh + kLocalSize + name_len + extra_len;
    if (data_off + entry.compressed_size > bytes_.size()) {
        return ZipStatus::Malformed;
    }
    const std::span<const std::byte> data
        = bytes_.subspan(static_cast<size_t>(data_off),
                         static_cast<size_t>(entry.compressed_size));

    std::vector<std::byte> result;
    if (entry.method == 0) {
        if (entry.compressed_size != entry.size) {
            return ZipStatus::Malformed;
        }
        result.assign(data.begin(), data.end());
    } else {
        const InflateStatus st = inflate_bytes(data, InflateFormat::Raw,
                                               limits_.max_entry_bytes,
                                               &result);
        if (st == InflateStatus::LimitExceeded) {
            return ZipStatus::LimitExceeded;
        }
        if (st != InflateStatus::Ok || result.size() != entry.size) {
            return ZipStatus::Malformed;
        }
    }
    if (crc32(result) != entry.crc) {
        return ZipStatus::CrcMismatch;
    }
    *out = std::move(result);
    return ZipStatus::Ok;
}


ZipStatus
ZipArchive::read(std::string_view name, std::vector<std::byte>* out) const
{
    const ZipEntry* e = find(name);
    if (!e) {
        return ZipStatus::NotFound;
    }
    return read(*e, out);
}


bool
looks_like_zip(std::span<const std::byte> bytes) noexcept
{
    uint32_t sig = 0;
    if (!read_u32le(bytes, 0, &sig)) {
        return false;
    }
    return sig == kLocalHeaderSig || sig == kEocdSig;
}


const char*
zip_status_name(ZipStatus status) noexcept
{
    switch (status) {
    case ZipStatus::Ok: return "ok";
    case ZipStatus::NotZip: return "not_zip";
    case ZipStatus::Malformed: return "malformed";
    case ZipStatus::Unsupported: return "unsupported";
    case ZipStatus::LimitExceeded: return "limit_exceeded";
    case ZipStatus::CrcMismatch: return "crc_mismatch";
    case ZipStatus::NotFound: return "not_found";
    }
    return "unknown";
}

}  // namespace cardpack
