#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file image_transcode.h
 * \brief Image re-encoding interface for WebP copies and thumbnails.
 *
 * `webp_transcoder.h` provides the libwebp backend. Components built
 * without a transcoder store images as uploaded and make no thumbnails.
 */

namespace cardpack {

enum class TranscodeStatus : uint8_t {
    Ok,
    /// The input is not a format the backend decodes (e.g. GIF).
    UnsupportedFormat,
    /// The input is damaged or exceeds the pixel limit.
    DecodeFailed,
    EncodeFailed,
};

/// Width targets by orientation; the height keeps the aspect ratio.
struct ThumbnailSpec final {
    uint32_t portrait_width  = 500;
    uint32_t landscape_width = 1024;
    /// WebP quality, 0 to 100.
    int quality              = 80;
};

inline constexpr ThumbnailSpec kPortraitThumbnail { 500, 1024, 80 };
inline constexpr ThumbnailSpec kAssetThumbnail { 300, 600, 70 };

/// Quality used when a fetched image is re-encoded at its own size.
inline constexpr int kWebpCopyQuality = 80;

struct EncodedImage final {
    std::vector<std::byte> bytes;
    uint32_t width         = 0;
    uint32_t height        = 0;
    uint32_t source_width  = 0;
    uint32_t source_height = 0;
};

/**
 * \brief Size of the thumbnail of a \p width x \p height source.
 *
 * Landscape sources (wider than tall) get the landscape width, all others
 * the portrait width. Sources are scaled up as well as down. The height
 * is rounded and never below 1. A zero-sized source yields 0 x 0.
 */
void
thumbnail_size(uint32_t width, uint32_t height, const ThumbnailSpec& spec,
               uint32_t* out_width, uint32_t* out_height) noexcept;

/// Implementations must be safe to call from multiple threads.
class ImageTranscoder {
public:
    virtual ~ImageTranscoder() = default;

    /// Re-encodes \p bytes as WebP at the source size.
    virtual TranscodeStatus to_webp(std::span<const std::byte> bytes,
                                    int quality, EncodedImage* out)
        = 0;

    /// Scales \p bytes to \ref thumbnail_size and encodes WebP.
    virtual TranscodeStatus thumbnail(std::span<const std::byte> bytes,
                                      const ThumbnailSpec& spec,
                                      EncodedImage* out)
        = 0;
};

const char*
transcode_status_name(TranscodeStatus status) noexcept;

}  // namespace cardpack
