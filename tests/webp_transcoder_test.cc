#include "cardpack/webp_transcoder.h"

#include "cardpack/image_probe.h"

#include "test_util.h"

#include <gtest/gtest.h>

namespace cardpack {
namespace {

    using testing::bytes_of;
    using testing::pixel_png;

    TEST(WebpTranscoder, PngThumbnailIsScaledWebp)
    {
        WebpTranscoder codec;
        EncodedImage out;
        ASSERT_EQ(codec.thumbnail(pixel_png(40, 60), kAssetThumbnail, &out),
                  TranscodeStatus::Ok);
        EXPECT_EQ(out.width, 300U);
        EXPECT_EQ(out.height, 450U);
        EXPECT_EQ(out.source_width, 40U);
        EXPECT_EQ(out.source_height, 60U);

        const ImageInfo info = probe_image(out.bytes);
        EXPECT_EQ(info.format, ImageFormat::Webp);
        EXPECT_EQ(info.width, 300U);
        EXPECT_EQ(info.height, 450U);
    }


    TEST(WebpTranscoder, LandscapeThumbnailUsesLandscapeWidth)
    {
        WebpTranscoder codec;
        EncodedImage out;
        ASSERT_EQ(codec.thumbnail(pixel_png(200, 100), kPortraitThumbnail,
                                  &out),
                  TranscodeStatus::Ok);
        const ImageInfo info = probe_image(out.bytes);
        EXPECT_EQ(info.width, 1024U);
        EXPECT_EQ(info.height, 512U);
    }


    TEST(WebpTranscoder, CopyKeepsSourceSizeAndReadsWebp)
    {
        WebpTranscoder codec;
        EncodedImage first;
        ASSERT_EQ(codec.to_webp(pixel_png(64, 32), kWebpCopyQuality, &first),
                  TranscodeStatus::Ok);
        EXPECT_EQ(first.width, 64U);
        EXPECT_EQ(first.height, 32U);
        EXPECT_EQ(probe_image(first.bytes).format, ImageFormat::Webp);

        EncodedImage second;
        ASSERT_EQ(codec.to_webp(first.bytes, 50, &second), TranscodeStatus::Ok);
        EXPECT_EQ(second.source_width, 64U);
        EXPECT_EQ(second.source_height, 32U);
    }


    TEST(WebpTranscoder, RejectsUnreadableInput)
    {
        WebpTranscoder codec;
        EncodedImage out;
        EXPECT_EQ(codec.to_webp(testing::gif_bytes(8, 8), 80, &out),
                  TranscodeStatus::UnsupportedFormat);
        EXPECT_EQ(codec.to_webp(bytes_of("plain text"), 80, &out),
                  TranscodeStatus::UnsupportedFormat);
        // Valid header, IDAT that does not inflate to pixels.
        EXPECT_EQ(codec.to_webp(testing::make_png(4, 4), 80, &out),
                  TranscodeStatus::DecodeFailed);
        EXPECT_EQ(codec.to_webp(bytes_of("\xFF\xD8\xFF\xE0junk"), 80, &out),
                  TranscodeStatus::DecodeFailed);
        EXPECT_TRUE(out.bytes.empty());
    }


    TEST(WebpTranscoder, PixelLimit)
    {
        WebpTranscoderOptions options;
        options.max_pixels = 100;
        WebpTranscoder codec(options);
        EncodedImage out;
        EXPECT_EQ(codec.thumbnail(pixel_png(20, 20), kAssetThumbnail, &out),
                  TranscodeStatus::DecodeFailed);
        EXPECT_EQ(codec.thumbnail(pixel_png(10, 10), kAssetThumbnail, &out),
                  TranscodeStatus::Ok);
    }

}  // namespace
}  // namespace cardpack
