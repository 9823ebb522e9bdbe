#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file png_card.h
 * \brief Reads and writes character card payloads stored in PNG text chunks.
 */

namespace cardpack {

/// Codec result status.
enum class PngCardStatus : uint8_t {
    Ok,
    /// Missing PNG signature, IHDR not first, or IEND missing.
    FormatError,
    /// A chunk overruns the buffer or its CRC does not match.
    CorruptChunk,
    /// The rebuilt image would exceed \ref PngCardLimits::max_output_bytes.
    PayloadTooLarge,
    /// Embed keyword is empty, longer than 79 bytes, or contains NUL.
    InvalidKeyword,
};

static constexpr uint32_t
png_fourcc(char a, char b, char c, char d) noexcept
{
    return (static_cast<uint32_t>(static_cast<uint8_t>(a)) << 24)
           | (static_cast<uint32_t>(static_cast<uint8_t>(b)) << 16)
           | (static_cast<uint32_t>(static_cast<uint8_t>(c)) << 8)
           | (static_cast<uint32_t>(static_cast<uint8_t>(d)) << 0);
}

inline constexpr uint32_t kPngIhdr = png_fourcc('I', 'H', 'D', 'R');
inline constexpr uint32_t kPngIend = png_fourcc('I', 'E', 'N', 'D');
inline constexpr uint32_t kPngText = png_fourcc('t', 'E', 'X', 't');
inline constexpr uint32_t kPngZtxt = png_fourcc('z', 'T', 'X', 't');
inline constexpr uint32_t kPngItxt = png_fourcc('i', 'T', 'X', 't');

/// Text-chunk keywords that carry card data.
inline constexpr std::array<std::string_view, 4> kCardTextKeys = {
    "chara",
    "ccv3",
    "character",
    "card",
};

/// Resource limits for hostile inputs.
struct PngCardLimits final {
    /// Cap on an inflated zTXt/iTXt value.
    uint64_t max_text_bytes = 64ULL * 1024ULL * 1024ULL;
    /// Cap on the image produced by \ref embed_png_card.
    uint64_t max_output_bytes = 50ULL * 1024ULL * 1024ULL;
};

/// A chunk located inside the parsed buffer (offsets are absolute).
struct PngChunkRef final {
    uint32_t type        = 0;
    uint64_t offset      = 0;  // start of the length field
    uint64_t data_offset = 0;
    uint32_t data_size   = 0;
    uint32_t crc         = 0;
};

struct PngCardPayload final {
    std::string key;
    std::string text;
    uint32_t chunk_type  = 0;
    uint32_t chunk_index = 0;
    /// True if the stored value was base64 and has been decoded.
    bool base64 = false;
};

struct PngCardFile final {
    std::vector<PngChunkRef> chunks;
    uint32_t width  = 0;
    uint32_t height = 0;
    bool has_payload = false;
    PngCardPayload payload;
};

struct PngCardReadOptions final {
    std::span<const std::string_view> keys = kCardTextKeys;
    PngCardLimits limits;
};

struct PngCardEmbedOptions final {
    /// Keyword of the new chunk.
    std::string key = "chara";
    /// Store the value as base64 in a tEXt chunk; otherwise UTF-8 in iTXt.
    bool base64 = true;
    /// Drop insignificant JSON whitespace before encoding.
    bool minify = true;
    /// Existing text chunks with these keywords (and \ref key) are removed.
    std::span<const std::string_view> strip_keys = kCardTextKeys;
    PngCardLimits limits;
};

/**
 * \brief Parses the chunk list of a PNG and extracts the card payload.
 *
 * Every chunk CRC is verified. Among tEXt/zTXt/iTXt chunks whose keyword is
 * in \ref PngCardReadOptions::keys, the last one wins. tEXt and zTXt values
 * that decode as base64 are decoded; iTXt values are taken verbatim.
 */
PngCardStatus
parse_png_card(std::span<const std::byte> bytes,
               const PngCardReadOptions& options, PngCardFile* out);

/**
 * \brief Returns a new PNG with \p payload embedded as the card text chunk.
 *
 * Previous card chunks are removed; the new chunk is inserted immediately
 * before IEND and all other chunks keep their order. \p bytes is not
 * modified. \p out is only written on success.
 */
PngCardStatus
embed_png_card(std::span<const std::byte> bytes, std::string_view payload,
               const PngCardEmbedOptions& options,
               std::vector<std::byte>* out);

/// Returns a copy of the PNG without text chunks whose keyword is in \p keys.
PngCardStatus
strip_png_card(std::span<const std::byte> bytes,
               std::span<const std::string_view> keys,
               std::vector<std::byte>* out);

/// Returns the keyword of a tEXt/zTXt/iTXt chunk (empty for other chunks).
std::string_view
png_text_keyword(std::span<const std::byte> bytes,
                 const PngChunkRef& chunk) noexcept;

const char*
png_card_status_name(PngCardStatus status) noexcept;

}  // namespace cardpack
