#include "cardpack/crc32.h"

#include "test_util.h"

#include <gtest/gtest.h>

namespace cardpack {
namespace {

    using testing::bytes_of;

    TEST(Crc32, KnownVectors)
    {
        EXPECT_EQ(crc32({}), 0x00000000U);
        EXPECT_EQ(crc32(bytes_of("123456789")), 0xCBF43926U);
        EXPECT_EQ(crc32(bytes_of("The quick brown fox jumps over the lazy dog")),
                  0x414FA339U);
        // CRC of the fixed PNG IEND chunk type.
        EXPECT_EQ(crc32(bytes_of("IEND")), 0xAE426082U);
    }


    TEST(Crc32, ConcatMatchesContiguous)
    {
        const auto a = bytes_of("tEXt");
        const auto b = bytes_of(std::string_view("chara\0eyJ9", 10));
        std::vector<std::byte> joined = a;
        joined.insert(joined.end(), b.begin(), b.end());
        EXPECT_EQ(crc32_concat(a, b), crc32(joined));
        EXPECT_EQ(crc32_concat({}, b), crc32(b));
        EXPECT_EQ(crc32_concat(a, {}), crc32(a));
    }


    TEST(Crc32, StreamingMatchesOneShot)
    {
        const auto data = bytes_of("streamed in three uneven pieces");
        const std::span<const std::byte> s(data);
        uint32_t state = crc32_init();
        state          = crc32_update(state, s.subspan(0, 3));
        state          = crc32_update(state, s.subspan(3, 11));
        state          = crc32_update(state, s.subspan(14));
        EXPECT_EQ(crc32_final(state), crc32(data));
    }


    TEST(Crc32, EverySingleBitFlipChangesChecksum)
    {
        auto data = bytes_of("chara eyJuYW1lIjoiQWxpY2UifQ==");
        const uint32_t clean = crc32(data);
        for (size_t i = 0; i < data.size() * 8; ++i) {
            const std::byte mask { static_cast<uint8_t>(1U << (i % 8)) };
            data[i / 8] ^= mask;
            EXPECT_NE(crc32(data), clean) << "bit " << i;
            data[i / 8] ^= mask;
        }
        EXPECT_EQ(crc32(data), clean);
    }


    TEST(Crc32, ChunkTypeAndDataFlipsAreDetected)
    {
        auto tag  = bytes_of("tEXt");
        auto data = bytes_of(std::string_view("chara\0eyJ9", 10));
        const uint32_t clean = crc32_concat(tag, data);

        for (auto* region : { &tag, &data }) {
            for (size_t i = 0; i < region->size() * 8; ++i) {
                const std::byte mask { static_cast<uint8_t>(1U << (i % 8)) };
                (*region)[i / 8] ^= mask;
                std::vector<std::byte> joined = tag;
                joined.insert(joined.end(), data.begin(), data.end());
                const uint32_t flipped = crc32_concat(tag, data);
                EXPECT_NE(flipped, clean) << "bit " << i;
                EXPECT_EQ(flipped, crc32(joined)) << "bit " << i;
                (*region)[i / 8] ^= mask;
            }
        }
    }

}  // namespace
}  // namespace cardpack
