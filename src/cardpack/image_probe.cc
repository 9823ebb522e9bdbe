#include "cardpack/image_probe.h"

#include <array>
#include <cstring>

namespace cardpack {
namespace {

    static constexpr std::array<std::byte, 8> kPngSignature = {
        std::byte { 0x89 }, std::byte { 0x50 }, std::byte { 0x4E },
        std::byte { 0x47 }, std::byte { 0x0D }, std::byte { 0x0A },
        std::byte { 0x1A }, std::byte { 0x0A },
    };

    static constexpr uint8_t u8(std::byte b) noexcept
    {
        return static_cast<uint8_t>(b);
    }


    static bool match(std::span<const std::byte> bytes, uint64_t offset,
                      const char* s, uint32_t s_len) noexcept
    {
        if (offset + s_len > bytes.size()) {
            return false;
        }
        return std::memcmp(bytes.data() + static_cast<size_t>(offset), s,
                           static_cast<size_t>(s_len))
               == 0;
    }


    static bool read_u16be(std::span<const std::byte> bytes, uint64_t offset,
                           uint16_t* out) noexcept
    {
        if (offset + 2 > bytes.size()) {
            return false;
        }
        *out = static_cast<uint16_t>((u8(bytes[offset + 0]) << 8)
                                     | u8(bytes[offset + 1]));
        return true;
    }


    static bool read_u16le(std::span<const std::byte> bytes, uint64_t offset,
                           uint16_t* out) noexcept
    {
        if (offset + 2 > bytes.size()) {
            return false;
        }
        *out = static_cast<uint16_t>(u8(bytes[offset + 0])
                                     | (u8(bytes[offset + 1]) << 8));
        return true;
    }


    static bool read_u32be(std::span<const std::byte> bytes, uint64_t offset,
                           uint32_t* out) noexcept
    {
        if (offset + 4 > bytes.size()) {
            return false;
        }
        *out = (static_cast<uint32_t>(u8(bytes[offset + 0])) << 24)
               | (static_cast<uint32_t>(u8(bytes[offset + 1])) << 16)
               | (static_cast<uint32_t>(u8(bytes[offset + 2])) << 8)
               | (static_cast<uint32_t>(u8(bytes[offset + 3])) << 0);
        return true;
    }


    static uint32_t read_u24le(std::span<const std::byte> bytes,
                               uint64_t offset) noexcept
    {
        return static_cast<uint32_t>(u8(bytes[offset + 0]))
               | (static_cast<uint32_t>(u8(bytes[offset + 1])) << 8)
               | (static_cast<uint32_t>(u8(bytes[offset + 2])) << 16);
    }


    static void probe_jpeg(std::span<const std::byte> bytes,
                           ImageInfo* info) noexcept
    {
        // Walk segments until a start-of-frame marker.
        uint64_t p = 2;
        while (p + 4 <= bytes.size()) {
            if (u8(bytes[p]) != 0xFF) {
                return;
            }
            const uint8_t marker = u8(bytes[p + 1]);
            if (marker == 0xFF) {
                p += 1;
                continue;
            }
            if (marker == 0xD8 || marker == 0x01
                || (marker >= 0xD0 && marker <= 0xD7)) {
                p += 2;
                continue;
            }
            uint16_t seg_len = 0;
            if (!read_u16be(bytes, p + 2, &seg_len) || seg_len < 2) {
                return;
            }
            const bool is_sof = marker >= 0xC0 && marker <= 0xCF
                                && marker != 0xC4 && marker != 0xC8
                                && marker != 0xCC;
            if (is_sof) {
                uint16_t h = 0;
                uint16_t w = 0;
                if (read_u16be(bytes, p + 5, &h)
                    && read_u16be(bytes, p + 7, &w)) {
                    info->width  = w;
                    info->height = h;
                }
                return;
            }
            p += 2 + static_cast<uint64_t>(seg_len);
        }
    }


    static void probe_webp(std::span<const std::byte> bytes,
                           ImageInfo* info) noexcept
    {
        if (bytes.size() < 30) {
            return;
        }
        if (match(bytes, 12, "VP8X", 4)) {
            info->width  = read_u24le(bytes, 24) + 1;
            info->height = read_u24le(bytes, 27) + 1;
        } else if (match(bytes, 12, "VP8 ", 4)) {
            uint16_t w = 0;
            uint16_t h = 0;
            if (read_u16le(bytes, 26, &w) && read_u16le(bytes, 28, &h)) {
                info->width  = w & 0x3FFFU;
                info->height = h & 0x3FFFU;
            }
        } else if (match(bytes, 12, "VP8L", 4) && bytes.size() >= 25) {
            const uint32_t b0 = u8(bytes[21]);
            const uint32_t b1 = u8(bytes[22]);
            const uint32_t b2 = u8(bytes[23]);
            const uint32_t b3 = u8(bytes[24]);
            info->width  = 1U + (((b1 & 0x3FU) << 8) | b0);
            info->height = 1U + (((b3 & 0x0FU) << 10) | (b2 << 2)
                                 | ((b1 & 0xC0U) >> 6));
        }
    }

}  // namespace

ImageInfo
probe_image(std::span<const std::byte> bytes) noexcept
{
    ImageInfo info;
    if (bytes.size() >= kPngSignature.size()
        && std::memcmp(bytes.data(), kPngSignature.data(),
                       kPngSignature.size())
               == 0) {
        info.format = ImageFormat::Png;
        // IHDR is required to be the first chunk.
        if (match(bytes, 12, "IHDR", 4)) {
            (void)read_u32be(bytes, 16, &info.width);
            (void)read_u32be(bytes, 20, &info.height);
        }
        return info;
    }
    if (bytes.size() >= 3 && u8(bytes[0]) == 0xFF && u8(bytes[1]) == 0xD8
        && u8(bytes[2]) == 0xFF) {
        info.format = ImageFormat::Jpeg;
        probe_jpeg(bytes, &info);
        return info;
    }
    if (match(bytes, 0, "GIF87a", 6) || match(bytes, 0, "GIF89a", 6)) {
        info.format = ImageFormat::Gif;
        uint16_t w  = 0;
        uint16_t h  = 0;
        if (read_u16le(bytes, 6, &w) && read_u16le(bytes, 8, &h)) {
            info.width  = w;
            info.height = h;
        }
        return info;
    }
    if (match(bytes, 0, "RIFF", 4) && match(bytes, 8, "WEBP", 4)) {
        info.format = ImageFormat::Webp;
        probe_webp(bytes, &info);
        return info;
    }
    return info;
}


std::string_view
image_extension(ImageFormat format) noexcept
{
    switch (format) {
    case ImageFormat::Png: return "png";
    case ImageFormat::Jpeg: return "jpg";
    case ImageFormat::Gif: return "gif";
    case ImageFormat::Webp: return "webp";
    case ImageFormat::Unknown: break;
    }
    return "bin";
}


std::string_view
image_content_type(ImageFormat format) noexcept
{
    switch (format) {
    case ImageFormat::Png: return "image/png";
    case ImageFormat::Jpeg: return "image/jpeg";
    case ImageFormat::Gif: return "image/gif";
    case ImageFormat::Webp: return "image/webp";
    case ImageFormat::Unknown: break;
    }
    return "application/octet-stream";
}


bool
is_image_extension(std::string_view ext) noexcept
{
    static constexpr std::string_view kImageExtensions[] = {
        "png", "jpg", "jpeg", "gif", "webp", "avif", "bmp",
    };
    for (std::string_view known : kImageExtensions) {
        if (known.size() != ext.size()) {
            continue;
        }
        bool same = true;
        for (size_t i = 0; i < ext.size(); ++i) {
            char c = ext[i];
            if (c >= 'A' && c <= 'Z') {
                c = static_cast<char>(c - 'A' + 'a');
            }
            if (c != known[i]) {
                same = false;
                break;
            }
        }
        if (same) {
            return true;
        }
    }
    return false;
}

}  // namespace cardpack
