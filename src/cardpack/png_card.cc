#include "cardpack/png_card.h"

#include "cardpack/base64.h"
#include "cardpack/card_json.h"
#include "cardpack/crc32.h"
#include "cardpack/inflate.h"

#include <algorithm>
#include <array>
#include <cstring>

namespace cardpack {
namespace {

    static constexpr std::array<std::byte, 8> kPngSig = {
        std::byte { 0x89 }, std::byte { 0x50 }, std::byte { 0x4E },
        std::byte { 0x47 }, std::byte { 0x0D }, std::byte { 0x0A },
        std::byte { 0x1A }, std::byte { 0x0A },
    };

    static constexpr uint32_t kMaxChunkLength = 0x7FFFFFFFU;
    static constexpr size_t kMaxKeywordLength = 79;

    static uint8_t u8(std::byte b) noexcept { return static_cast<uint8_t>(b); }


    static bool read_u32be(std::span<const std::byte> bytes, uint64_t offset,
                           uint32_t* out) noexcept
    {
        if (offset + 4 > bytes.size()) {
            return false;
        }
        const uint32_t v
            = (static_cast<uint32_t>(u8(bytes[offset + 0])) << 24)
              | (static_cast<uint32_t>(u8(bytes[offset + 1])) << 16)
              | (static_cast<uint32_t>(u8(bytes[offset + 2])) << 8)
              | (static_cast<uint32_t>(u8(bytes[offset + 3])) << 0);
        *out = v;
        return true;
    }


    static void append_u32be(std::vector<std::byte>* out, uint32_t v)
    {
        out->push_back(std::byte { static_cast<uint8_t>((v >> 24) & 0xFFU) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 16) & 0xFFU) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFFU) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFFU) });
    }


    static void append_text(std::vector<std::byte>* out, std::string_view s)
    {
        const std::byte* p = reinterpret_cast<const std::byte*>(s.data());
        out->insert(out->end(), p, p + s.size());
    }


    static std::string_view as_chars(std::span<const std::byte> bytes) noexcept
    {
        return std::string_view(reinterpret_cast<const char*>(bytes.data()),
                                bytes.size());
    }


    static bool is_text_chunk(uint32_t type) noexcept
    {
        return type == kPngText || type == kPngZtxt || type == kPngItxt;
    }


    static bool key_in(std::span<const std::string_view> keys,
                       std::string_view key) noexcept
    {
        return std::find(keys.begin(), keys.end(), key) != keys.end();
    }


    static std::string_view trim(std::string_view s) noexcept
    {
        size_t b = 0;
        size_t e = s.size();
        while (b < e
               && (s[b] == ' ' || s[b] == '\t' || s[b] == '\r'
                   || s[b] == '\n')) {
            ++b;
        }
        while (e > b
               && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r'
                   || s[e - 1] == '\n' || s[e - 1] == '\0')) {
            --e;
        }
        return s.substr(b, e - b);
    }


    static bool inflate_text(std::span<const std::byte> in,
                             const PngCardLimits& limits, std::string* out)
    {
        std::vector<std::byte> tmp;
        if (inflate_bytes(in, InflateFormat::Zlib, limits.max_text_bytes, &tmp)
            != InflateStatus::Ok) {
            return false;
        }
        out->assign(reinterpret_cast<const char*>(tmp.data()), tmp.size());
        return true;
    }


    // Splits a text chunk into keyword and (decompressed) value. Returns false
    // for malformed or undecodable chunks, which are then ignored.
    static bool decode_text_chunk(std::span<const std::byte> data,
                                  uint32_t type, const PngCardLimits& limits,
                                  std::string* key, std::string* value)
    {
        const std::string_view raw = as_chars(data);
        const size_t nul           = raw.find('\0');
        if (nul == std::string_view::npos || nul == 0
            || nul > kMaxKeywordLength) {
            return false;
        }
        key->assign(raw.substr(0, nul));
        size_t p = nul + 1;

        if (type == kPngText) {
            value->assign(raw.substr(p));
            return true;
        }
        if (type == kPngZtxt) {
            if (p >= raw.size() || raw[p] != 0) {
                return false;
            }
            return inflate_text(data.subspan(p + 1), limits, value);
        }

        // iTXt: compression flag, method, language\0, translated keyword\0.
        if (p + 2 > raw.size()) {
            return false;
        }
        const uint8_t compressed = static_cast<uint8_t>(raw[p]);
        const uint8_t method     = static_cast<uint8_t>(raw[p + 1]);
        p += 2;
        const size_t lang_end = raw.find('\0', p);
        if (lang_end == std::string_view::npos) {
            return false;
        }
        const size_t trans_end = raw.find('\0', lang_end + 1);
        if (trans_end == std::string_view::npos) {
            return false;
        }
        p = trans_end + 1;
        if (compressed == 0) {
            value->assign(raw.substr(p));
            return true;
        }
        if (compressed != 1 || method != 0) {
            return false;
        }
        return inflate_text(data.subspan(p), limits, value);
    }


    // tEXt and zTXt values are base64-wrapped or raw; iTXt is always
    // literal UTF-8. The returned text is never trimmed.
    static void decode_card_value(std::string_view value, uint32_t type,
                                  PngCardPayload* payload)
    {
        payload->base64 = false;
        if (type != kPngItxt) {
            const std::string_view t = trim(value);
            std::vector<std::byte> decoded;
            if (!t.empty() && base64_decode(t, &decoded)) {
                payload->text.assign(
                    reinterpret_cast<const char*>(decoded.data()),
                    decoded.size());
                payload->base64 = true;
                return;
            }
        }
        payload->text.assign(value);
    }


    static bool valid_keyword(std::string_view key) noexcept
    {
        if (key.empty() || key.size() > kMaxKeywordLength) {
            return false;
        }
        return key.find('\0') == std::string_view::npos;
    }


    static uint64_t chunk_total_size(const PngChunkRef& c) noexcept
    {
        return 12ULL + static_cast<uint64_t>(c.data_size);
    }


    // Shared by embed and strip: copies every chunk except dropped text
    // chunks and optionally inserts \p extra right before IEND.
    static PngCardStatus rebuild(std::span<const std::byte> bytes,
                                 const PngCardFile& file,
                                 std::span<const std::string_view> drop_keys,
                                 std::string_view drop_key,
                                 std::span<const std::byte> extra,
                                 uint64_t max_output_bytes,
                                 std::vector<std::byte>* out)
    {
        std::vector<bool> keep(file.chunks.size(), true);
        uint64_t total = kPngSig.size() + extra.size();
        for (size_t i = 0; i < file.chunks.size(); ++i) {
            const PngChunkRef& c = file.chunks[i];
            if (is_text_chunk(c.type)) {
                const std::string_view kw = png_text_keyword(bytes, c);
                if (key_in(drop_keys, kw)
                    || (!drop_key.empty() && kw == drop_key)) {
                    keep[i] = false;
                    continue;
                }
            }
            total += chunk_total_size(c);
        }
        if (max_output_bytes != 0U && total > max_output_bytes) {
            return PngCardStatus::PayloadTooLarge;
        }

        std::vector<std::byte> result;
        result.reserve(static_cast<size_t>(total));
        result.insert(result.end(), kPngSig.begin(), kPngSig.end());
        for (size_t i = 0; i < file.chunks.size(); ++i) {
            if (!keep[i]) {
                continue;
            }
            const PngChunkRef& c = file.chunks[i];
            if (c.type == kPngIend) {
                result.insert(result.end(), extra.begin(), extra.end());
            }
            const auto first = bytes.begin()
                               + static_cast<std::ptrdiff_t>(c.offset);
            result.insert(result.end(), first,
                          first
                              + static_cast<std::ptrdiff_t>(
                                  chunk_total_size(c)));
        }
        *out = std::move(result);
        return PngCardStatus::Ok;
    }

}  // namespace

PngCardStatus
parse_png_card(std::span<const std::byte> bytes,
               const PngCardReadOptions& options, PngCardFile* out)
{
    if (!out) {
        return PngCardStatus::FormatError;
    }
    if (bytes.size() < kPngSig.size()
        || std::memcmp(bytes.data(), kPngSig.data(), kPngSig.size()) != 0) {
        return PngCardStatus::FormatError;
    }

    PngCardFile file;
    uint64_t offset = kPngSig.size();
    bool saw_iend   = false;
    while (offset < bytes.size()) {
        uint32_t len  = 0;
        uint32_t type = 0;
        if (!read_u32be(bytes, offset + 0, &len)
            || !read_u32be(bytes, offset + 4, &type)) {
            return PngCardStatus::CorruptChunk;
        }
        if (len > kMaxChunkLength) {
            return PngCardStatus::CorruptChunk;
        }
        const uint64_t data_off = offset + 8;
        const uint64_t crc_off  = data_off + len;
        uint32_t stored_crc     = 0;
        if (!read_u32be(bytes, crc_off, &stored_crc)) {
            return PngCardStatus::CorruptChunk;
        }
        const std::span<const std::byte> type_bytes
            = bytes.subspan(static_cast<size_t>(offset + 4), 4);
        const std::span<const std::byte> data
            = bytes.subspan(static_cast<size_t>(data_off), len);
        if (crc32_concat(type_bytes, data) != stored_crc) {
            return PngCardStatus::CorruptChunk;
        }
        if (file.chunks.empty() && type != kPngIhdr) {
            return PngCardStatus::FormatError;
        }

        PngChunkRef ref;
        ref.type        = type;
        ref.offset      = offset;
        ref.data_offset = data_off;
        ref.data_size   = len;
        ref.crc         = stored_crc;
        file.chunks.push_back(ref);

        if (type == kPngIhdr && len >= 8) {
            (void)read_u32be(bytes, data_off + 0, &file.width);
            (void)read_u32be(bytes, data_off + 4, &file.height);
        } else if (is_text_chunk(type)) {
            std::string key;
            std::string value;
            if (decode_text_chunk(data, type, options.limits, &key, &value)
                && key_in(options.keys, key)) {
                file.has_payload         = true;
                file.payload.key         = std::move(key);
                file.payload.chunk_type  = type;
                file.payload.chunk_index = static_cast<uint32_t>(
                    file.chunks.size() - 1);
                decode_card_value(value, type, &file.payload);
            }
        }

        offset = crc_off + 4;
        if (type == kPngIend) {
            saw_iend = true;
            break;
        }
    }
    if (!saw_iend) {
        return PngCardStatus::FormatError;
    }

    *out = std::move(file);
    return PngCardStatus::Ok;
}


PngCardStatus
embed_png_card(std::span<const std::byte> bytes, std::string_view payload,
               const PngCardEmbedOptions& options, std::vector<std::byte>* out)
{
    if (!out) {
        return PngCardStatus::FormatError;
    }
    if (!valid_keyword(options.key)) {
        return PngCardStatus::InvalidKeyword;
    }

    PngCardReadOptions read_opts;
    read_opts.keys   = options.strip_keys;
    read_opts.limits = options.limits;
    PngCardFile file;
    const PngCardStatus st = parse_png_card(bytes, read_opts, &file);
    if (st != PngCardStatus::Ok) {
        return st;
    }

    const std::string text = options.minify ? minify_json(payload)
                                            : std::string(payload);

    std::vector<std::byte> data;
    append_text(&data, options.key);
    data.push_back(std::byte { 0 });
    uint32_t type = kPngText;
    if (options.base64) {
        std::string encoded;
        base64_encode(std::span<const std::byte>(
                          reinterpret_cast<const std::byte*>(text.data()),
                          text.size()),
                      &encoded);
        append_text(&data, encoded);
    } else {
        // Uncompressed iTXt with empty language and translated keyword.
        type = kPngItxt;
        data.push_back(std::byte { 0 });
        data.push_back(std::byte { 0 });
        data.push_back(std::byte { 0 });
        data.push_back(std::byte { 0 });
        append_text(&data, text);
    }
    if (data.size() > kMaxChunkLength) {
        return PngCardStatus::PayloadTooLarge;
    }

    std::vector<std::byte> chunk;
    chunk.reserve(data.size() + 12);
    append_u32be(&chunk, static_cast<uint32_t>(data.size()));
    append_u32be(&chunk, type);
    chunk.insert(chunk.end(), data.begin(), data.end());
    const uint32_t crc = crc32(std::span<const std::byte>(chunk).subspan(4));
    append_u32be(&chunk, crc);

    return rebuild(bytes, file, options.strip_keys, options.key, chunk,
                   options.limits.max_output_bytes, out);
}


PngCardStatus
strip_png_card(std::span<const std::byte> bytes,
               std::span<const std::string_view> keys,
               std::vector<std::byte>* out)
{
    if (!out) {
        return PngCardStatus::FormatError;
    }
    PngCardReadOptions read_opts;
    read_opts.keys = keys;
    PngCardFile file;
    const PngCardStatus st = parse_png_card(bytes, read_opts, &file);
    if (st != PngCardStatus::Ok) {
        return st;
    }
    return rebuild(bytes, file, keys, std::string_view(), {}, 0, out);
}


std::string_view
png_text_keyword(std::span<const std::byte> bytes,
                 const PngChunkRef& chunk) noexcept
{
    if (!is_text_chunk(chunk.type)
        || chunk.data_offset + chunk.data_size > bytes.size()) {
        return {};
    }
    const std::string_view data = as_chars(
        bytes.subspan(static_cast<size_t>(chunk.data_offset), chunk.data_size));
    const size_t nul = data.find('\0');
    if (nul == std::string_view::npos) {
        return {};
    }
    return data.substr(0, nul);
}


const char*
png_card_status_name(PngCardStatus status) noexcept
{
    switch (status) {
    case PngCardStatus::Ok: return "ok";
    case PngCardStatus::FormatError: return "format_error";
    case PngCardStatus::CorruptChunk: return "corrupt_chunk";
    case PngCardStatus::PayloadTooLarge: return "payload_too_large";
    case PngCardStatus::InvalidKeyword: return "invalid_keyword";
    }
    return "unknown";
}

}  // namespace cardpack
