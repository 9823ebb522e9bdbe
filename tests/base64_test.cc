#include "cardpack/base64.h"

#include "test_util.h"

#include <gtest/gtest.h>

namespace cardpack {
namespace {

    TEST(Base64, EncodesRfc4648Vectors)
    {
        EXPECT_EQ(base64_encode(""), "");
        EXPECT_EQ(base64_encode("f"), "Zg==");
        EXPECT_EQ(base64_encode("fo"), "Zm8=");
        EXPECT_EQ(base64_encode("foo"), "Zm9v");
        EXPECT_EQ(base64_encode("foobar"), "Zm9vYmFy");
    }


    TEST(Base64, DecodesWithOrWithoutPadding)
    {
        std::vector<std::byte> out;
        ASSERT_TRUE(base64_decode("Zm9vYg==", &out));
        EXPECT_EQ(testing::string_of(out), "foob");
        ASSERT_TRUE(base64_decode("Zm9vYg", &out));
        EXPECT_EQ(testing::string_of(out), "foob");
        ASSERT_TRUE(base64_decode("Zm9v\r\nYmFy", &out));
        EXPECT_EQ(testing::string_of(out), "foobar");
    }


    TEST(Base64, RejectsNonAlphabetAndMisplacedPadding)
    {
        std::vector<std::byte> out;
        EXPECT_FALSE(base64_decode("{\"a\":1}", &out));
        EXPECT_TRUE(out.empty());
        EXPECT_FALSE(base64_decode("Zm=9v", &out));
        EXPECT_FALSE(base64_decode("Z", &out));
        EXPECT_FALSE(looks_like_base64(""));
        EXPECT_TRUE(looks_like_base64("eyJhIjoxfQ=="));
    }

}  // namespace
}  // namespace cardpack
