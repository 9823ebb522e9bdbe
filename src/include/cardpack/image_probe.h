#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

/**
 * \file image_probe.h
 * \brief Signature sniffing and dimension lookup for common web image formats.
 */

namespace cardpack {

enum class ImageFormat : uint8_t {
    Unknown,
    Png,
    Jpeg,
    Gif,
    Webp,
};

struct ImageInfo final {
    ImageFormat format = ImageFormat::Unknown;
    /// 0 when the header does not carry (or we could not locate) dimensions.
    uint32_t width  = 0;
    uint32_t height = 0;
};

/// Identifies \p bytes by signature and reads width/height where cheap.
ImageInfo
probe_image(std::span<const std::byte> bytes) noexcept;

/// Lowercase file extension for \p format ("png", "jpg", ...), or "bin".
std::string_view
image_extension(ImageFormat format) noexcept;

/// MIME type for \p format, or "application/octet-stream".
std::string_view
image_content_type(ImageFormat format) noexcept;

/// True for extensions the platform treats as images (png, jpg, webp, ...).
bool
is_image_extension(std::string_view ext) noexcept;

}  // namespace cardpack
