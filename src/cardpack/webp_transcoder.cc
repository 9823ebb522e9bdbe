#include "cardpack/webp_transcoder.h"

#include "cardpack/image_probe.h"

#include <png.h>
#include <webp/decode.h>
#include <webp/encode.h>

#include <algorithm>
#include <csetjmp>
#include <cstdio>
#include <cstring>
#include <utility>

#include <jpeglib.h>

namespace cardpack {
namespace {

    // Decoded 8-bit pixels; rows are packed RGB or RGBA.
    struct Pixels final {
        uint32_t width  = 0;
        uint32_t height = 0;
        int channels    = 4;
        std::vector<uint8_t> data;
    };

    static bool within_limit(uint64_t width, uint64_t height,
                             uint64_t max_pixels) noexcept
    {
        return width != 0 && height != 0 && width * height <= max_pixels;
    }


    static TranscodeStatus decode_png(std::span<const std::byte> bytes,
                                      uint64_t max_pixels, Pixels* out)
    {
        png_image image;
        std::memset(&image, 0, sizeof(image));
        image.version = PNG_IMAGE_VERSION;
        if (!png_image_begin_read_from_memory(&image, bytes.data(),
                                              bytes.size())) {
            return TranscodeStatus::DecodeFailed;
        }
        if (!within_limit(image.width, image.height, max_pixels)) {
            png_image_free(&image);
            return TranscodeStatus::DecodeFailed;
        }
        image.format  = PNG_FORMAT_RGBA;
        out->width    = image.width;
        out->height   = image.height;
        out->channels = 4;
        out->data.resize(PNG_IMAGE_SIZE(image));
        if (!png_image_finish_read(&image, nullptr, out->data.data(), 0,
                                   nullptr)) {
            png_image_free(&image);
            return TranscodeStatus::DecodeFailed;
        }
        return TranscodeStatus::Ok;
    }


    struct JpegErrorManager final {
        jpeg_error_mgr pub;
        std::jmp_buf jump;
    };

    static void jpeg_error_exit(j_common_ptr cinfo)
    {
        auto* err = reinterpret_cast<JpegErrorManager*>(cinfo->err);
        std::longjmp(err->jump, 1);
    }


    static void jpeg_quiet(j_common_ptr) { }


    static TranscodeStatus decode_jpeg(std::span<const std::byte> bytes,
                                       uint64_t max_pixels, Pixels* out)
    {
        jpeg_decompress_struct cinfo {};
        JpegErrorManager jerr {};
        cinfo.err               = jpeg_std_error(&jerr.pub);
        jerr.pub.error_exit     = jpeg_error_exit;
        jerr.pub.output_message = jpeg_quiet;
        if (setjmp(jerr.jump)) {
            jpeg_destroy_decompress(&cinfo);
            return TranscodeStatus::DecodeFailed;
        }

        jpeg_create_decompress(&cinfo);
        jpeg_mem_src(&cinfo,
                     const_cast<unsigned char*>(
                         reinterpret_cast<const unsigned char*>(bytes.data())),
                     static_cast<unsigned long>(bytes.size()));
        if (jpeg_read_header(&cinfo, TRUE) != JPEG_HEADER_OK) {
            jpeg_destroy_decompress(&cinfo);
            return TranscodeStatus::DecodeFailed;
        }
        if (cinfo.jpeg_color_space == JCS_CMYK
            || cinfo.jpeg_color_space == JCS_YCCK) {
            jpeg_destroy_decompress(&cinfo);
            return TranscodeStatus::UnsupportedFormat;
        }
        if (!within_limit(cinfo.image_width, cinfo.image_height, max_pixels)) {
            jpeg_destroy_decompress(&cinfo);
            return TranscodeStatus::DecodeFailed;
        }
        cinfo.out_color_space = JCS_RGB;
        jpeg_start_decompress(&cinfo);
        if (cinfo.output_components != 3) {
            jpeg_destroy_decompress(&cinfo);
            return TranscodeStatus::DecodeFailed;
        }

        out->width          = cinfo.output_width;
        out->height         = cinfo.output_height;
        out->channels       = 3;
        const size_t stride = static_cast<size_t>(out->width) * 3;
        out->data.resize(stride * out->height);
        while (cinfo.output_scanline < cinfo.output_height) {
            JSAMPROW row = out->data.data()
                           + static_cast<size_t>(cinfo.output_scanline)
                                 * stride;
            jpeg_read_scanlines(&cinfo, &row, 1);
        }
        jpeg_finish_decompress(&cinfo);
        jpeg_destroy_decompress(&cinfo);
        return TranscodeStatus::Ok;
    }


    static TranscodeStatus decode_webp(std::span<const std::byte> bytes,
                                       uint64_t max_pixels, Pixels* out)
    {
        const auto* data = reinterpret_cast<const uint8_t*>(bytes.data());
        int width        = 0;
        int height       = 0;
        if (!WebPGetInfo(data, bytes.size(), &width, &height)
            || !within_limit(static_cast<uint64_t>(width),
                             static_cast<uint64_t>(height), max_pixels)) {
            return TranscodeStatus::DecodeFailed;
        }
        out->width          = static_cast<uint32_t>(width);
        out->height         = static_cast<uint32_t>(height);
        out->channels       = 4;
        const size_t stride = static_cast<size_t>(width) * 4;
        out->data.resize(stride * out->height);
        if (!WebPDecodeRGBAInto(data, bytes.size(), out->data.data(),
                                out->data.size(), static_cast<int>(stride))) {
            return TranscodeStatus::DecodeFailed;
        }
        return TranscodeStatus::Ok;
    }


    static TranscodeStatus decode(std::span<const std::byte> bytes,
                                  uint64_t max_pixels, Pixels* out)
    {
        switch (probe_image(bytes).format) {
        case ImageFormat::Png: return decode_png(bytes, max_pixels, out);
        case ImageFormat::Jpeg: return decode_jpeg(bytes, max_pixels, out);
        case ImageFormat::Webp: return decode_webp(bytes, max_pixels, out);
        case ImageFormat::Gif:
        case ImageFormat::Unknown: break;
        }
        return TranscodeStatus::UnsupportedFormat;
    }


    // Owns a WebPPicture and its pixel buffers.
    class Picture final {
    public:
        Picture() { ok_ = WebPPictureInit(&pic_) != 0; }
        ~Picture() { WebPPictureFree(&pic_); }

        Picture(const Picture&)            = delete;
        Picture& operator=(const Picture&) = delete;

        bool ok() const noexcept { return ok_; }
        WebPPicture* get() noexcept { return &pic_; }

    private:
        WebPPicture pic_;
        bool ok_ = false;
    };


    static TranscodeStatus encode(const Pixels& px, uint32_t width,
                                  uint32_t height, int quality,
                                  EncodedImage* out)
    {
        Picture picture;
        WebPConfig config;
        if (!picture.ok() || !WebPConfigInit(&config)) {
            return TranscodeStatus::EncodeFailed;
        }
        config.quality = static_cast<float>(std::clamp(quality, 0, 100));

        WebPPicture* pic = picture.get();
        pic->use_argb    = 1;
        pic->width       = static_cast<int>(px.width);
        pic->height      = static_cast<int>(px.height);
        const int stride = static_cast<int>(px.width) * px.channels;
        const int imported
            = px.channels == 4
                  ? WebPPictureImportRGBA(pic, px.data.data(), stride)
                  : WebPPictureImportRGB(pic, px.data.data(), stride);
        if (!imported) {
            return TranscodeStatus::EncodeFailed;
        }
        if ((width != px.width || height != px.height)
            && !WebPPictureRescale(pic, static_cast<int>(width),
                                   static_cast<int>(height))) {
            return TranscodeStatus::EncodeFailed;
        }

        WebPMemoryWriter writer;
        WebPMemoryWriterInit(&writer);
        pic->writer     = WebPMemoryWrite;
        pic->custom_ptr = &writer;
        const int encoded = WebPEncode(&config, pic);
        if (encoded) {
            const auto* begin = reinterpret_cast<const std::byte*>(writer.mem);
            out->bytes.assign(begin, begin + writer.size);
        }
        WebPMemoryWriterClear(&writer);
        if (!encoded) {
            return TranscodeStatus::EncodeFailed;
        }
        out->width         = width;
        out->height        = height;
        out->source_width  = px.width;
        out->source_height = px.height;
        return TranscodeStatus::Ok;
    }

}  // namespace

TranscodeStatus
WebpTranscoder::to_webp(std::span<const std::byte> bytes, int quality,
                        EncodedImage* out)
{
    Pixels px;
    const TranscodeStatus ds = decode(bytes, options_.max_pixels, &px);
    if (ds != TranscodeStatus::Ok) {
        return ds;
    }
    EncodedImage image;
    const TranscodeStatus es = encode(px, px.width, px.height, quality,
                                      &image);
    if (es == TranscodeStatus::Ok) {
        *out = std::move(image);
    }
    return es;
}


TranscodeStatus
WebpTranscoder::thumbnail(std::span<const std::byte> bytes,
                          const ThumbnailSpec& spec, EncodedImage* out)
{
    Pixels px;
    const TranscodeStatus ds = decode(bytes, options_.max_pixels, &px);
    if (ds != TranscodeStatus::Ok) {
        return ds;
    }
    uint32_t width  = 0;
    uint32_t height = 0;
    thumbnail_size(px.width, px.height, spec, &width, &height);
    EncodedImage image;
    const TranscodeStatus es = encode(px, width, height, spec.quality, &image);
    if (es == TranscodeStatus::Ok) {
        *out = std::move(image);
    }
    return es;
}

}  // namespace cardpack
