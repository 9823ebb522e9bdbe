#include "cardpack/image_transcode.h"

#include <gtest/gtest.h>

#include <string>

namespace cardpack {
namespace {

    static std::string size_of(uint32_t w, uint32_t h, const ThumbnailSpec& s)
    {
        uint32_t tw = 0;
        uint32_t th = 0;
        thumbnail_size(w, h, s, &tw, &th);
        return std::to_string(tw) + "x" + std::to_string(th);
    }


    TEST(ThumbnailSize, WidthFollowsOrientation)
    {
        EXPECT_EQ(size_of(1000, 1500, kPortraitThumbnail), "500x750");
        EXPECT_EQ(size_of(2048, 1024, kPortraitThumbnail), "1024x512");
        // Square sources count as portrait.
        EXPECT_EQ(size_of(800, 800, kPortraitThumbnail), "500x500");
        EXPECT_EQ(size_of(1200, 900, kAssetThumbnail), "600x450");
        EXPECT_EQ(size_of(90, 120, kAssetThumbnail), "300x400");
    }


    TEST(ThumbnailSize, RoundsAndClampsHeight)
    {
        EXPECT_EQ(size_of(3, 2, kAssetThumbnail), "600x400");
        EXPECT_EQ(size_of(1000, 333, kAssetThumbnail), "600x200");
        EXPECT_EQ(size_of(1000, 335, kAssetThumbnail), "600x201");
        EXPECT_EQ(size_of(100000, 1, kAssetThumbnail), "600x1");
        EXPECT_EQ(size_of(0, 10, kAssetThumbnail), "0x0");
        EXPECT_EQ(size_of(10, 0, kAssetThumbnail), "0x0");
    }


    TEST(TranscodeStatus, Names)
    {
        EXPECT_STREQ(transcode_status_name(TranscodeStatus::Ok), "ok");
        EXPECT_STREQ(transcode_status_name(TranscodeStatus::UnsupportedFormat),
                     "unsupported_format");
        EXPECT_STREQ(transcode_status_name(TranscodeStatus::DecodeFailed),
                     "decode_failed");
        EXPECT_STREQ(transcode_status_name(TranscodeStatus::EncodeFailed),
                     "encode_failed");
    }

}  // namespace
}  // namespace cardpack
