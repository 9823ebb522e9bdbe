#include "cardpack/image_transcode.h"

namespace cardpack {

void
thumbnail_size(uint32_t width, uint32_t height, const ThumbnailSpec& spec,
               uint32_t* out_width, uint32_t* out_height) noexcept
{
    if (width == 0 || height == 0) {
        *out_width  = 0;
        *out_height = 0;
        return;
    }
    const uint32_t target = width > height ? spec.landscape_width
                                           : spec.portrait_width;
    const uint64_t scaled = (static_cast<uint64_t>(height) * target
                             + width / 2)
                            / width;
    *out_width  = target;
    *out_height = scaled == 0 ? 1U : static_cast<uint32_t>(scaled);
}


const char*
transcode_status_name(TranscodeStatus status) noexcept
{
    switch (status) {
    case TranscodeStatus::Ok: return "ok";
    case TranscodeStatus::UnsupportedFormat: return "unsupported_format";
    case TranscodeStatus::DecodeFailed: return "decode_failed";
    case TranscodeStatus::EncodeFailed: return "encode_failed";
    }
    return "unknown";
}

}  // namespace cardpack
