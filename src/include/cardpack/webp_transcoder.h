#pragma once

#include "cardpack/image_transcode.h"

/**
 * \file webp_transcoder.h
 * \brief \ref ImageTranscoder backed by libwebp, libpng and libjpeg.
 *
 * PNG, JPEG and WebP inputs are decoded to RGBA; GIF is reported as
 * `UnsupportedFormat`. Scaling uses libwebp's picture rescaler.
 */

namespace cardpack {

struct WebpTranscoderOptions final {
    /// Decoded sources larger than this many pixels are refused.
    uint64_t max_pixels = 40ull * 1000 * 1000;
};

/// Stateless; safe to share across threads.
class WebpTranscoder final : public ImageTranscoder {
public:
    explicit WebpTranscoder(WebpTranscoderOptions options = {})
        : options_(options)
    {
    }

    TranscodeStatus to_webp(std::span<const std::byte> bytes, int quality,
                            EncodedImage* out) override;
    TranscodeStatus thumbnail(std::span<const std::byte> bytes,
                              const ThumbnailSpec& spec,
                              EncodedImage* out) override;

private:
    WebpTranscoderOptions options_;
};

}  // namespace cardpack
