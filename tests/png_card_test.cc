#include "cardpack/png_card.h"

#include "cardpack/base64.h"
#include "cardpack/crc32.h"

#include "test_util.h"

#include <gtest/gtest.h>

#include <algorithm>

namespace cardpack {
namespace {

    using testing::append_bytes;
    using testing::bytes_of;
    using testing::make_png;
    using testing::text_chunk;

    static std::vector<uint32_t> chunk_types(const PngCardFile& file)
    {
        std::vector<uint32_t> types;
        for (const PngChunkRef& c : file.chunks) {
            types.push_back(c.type);
        }
        return types;
    }


    TEST(PngCard, ReadsBase64TextChunk)
    {
        const std::string json = R"({"spec":"chara_card_v2","data":{}})";
        const auto png = make_png(4, 3, text_chunk("chara",
                                                   base64_encode(json)));
        PngCardFile file;
        ASSERT_EQ(parse_png_card(png, PngCardReadOptions(), &file),
                  PngCardStatus::Ok);
        EXPECT_EQ(file.width, 4U);
        EXPECT_EQ(file.height, 3U);
        ASSERT_TRUE(file.has_payload);
        EXPECT_EQ(file.payload.key, "chara");
        EXPECT_EQ(file.payload.text, json);
        EXPECT_TRUE(file.payload.base64);
        EXPECT_EQ(file.payload.chunk_type, kPngText);
        EXPECT_EQ(file.chunks.size(), 4U);
    }


    TEST(PngCard, RawJsonIsTakenVerbatim)
    {
        const std::string json = R"({"name":"raw"})";
        const auto png         = make_png(1, 1, text_chunk("chara", json));
        PngCardFile file;
        ASSERT_EQ(parse_png_card(png, PngCardReadOptions(), &file),
                  PngCardStatus::Ok);
        EXPECT_EQ(file.payload.text, json);
        EXPECT_FALSE(file.payload.base64);
    }


    TEST(PngCard, InflatesZtxtAndLastMatchWins)
    {
        std::vector<std::byte> middle = text_chunk("chara",
                                                   base64_encode("{\"v\":1}"));
        append_bytes(&middle, testing::ztxt_chunk("ccv3", "{\"v\":2}"));
        append_bytes(&middle, text_chunk("Comment", "not a card"));
        const auto png = make_png(1, 1, middle);

        PngCardFile file;
        ASSERT_EQ(parse_png_card(png, PngCardReadOptions(), &file),
                  PngCardStatus::Ok);
        EXPECT_EQ(file.payload.key, "ccv3");
        EXPECT_EQ(file.payload.text, "{\"v\":2}");
        EXPECT_EQ(file.payload.chunk_type, kPngZtxt);
    }


    TEST(PngCard, NoCardChunkIsNotAnError)
    {
        const auto png = make_png(2, 2, text_chunk("Software", "paint"));
        PngCardFile file;
        ASSERT_EQ(parse_png_card(png, PngCardReadOptions(), &file),
                  PngCardStatus::Ok);
        EXPECT_FALSE(file.has_payload);
    }


    TEST(PngCard, RejectsBadStructure)
    {
        PngCardFile file;
        EXPECT_EQ(parse_png_card(bytes_of("GIF89a...."), PngCardReadOptions(),
                                 &file),
                  PngCardStatus::FormatError);

        // IEND missing.
        auto png = make_png(1, 1);
        png.resize(png.size() - 12);
        EXPECT_EQ(parse_png_card(png, PngCardReadOptions(), &file),
                  PngCardStatus::FormatError);

        // First chunk is not IHDR.
        std::vector<std::byte> no_ihdr = testing::png_signature();
        testing::append_png_chunk(&no_ihdr, "IDAT", bytes_of("x"));
        testing::append_png_chunk(&no_ihdr, "IEND", {});
        EXPECT_EQ(parse_png_card(no_ihdr, PngCardReadOptions(), &file),
                  PngCardStatus::FormatError);
    }


    TEST(PngCard, RejectsCorruptChunks)
    {
        PngCardFile file;
        auto png = make_png(1, 1);
        // Flip a byte inside the IDAT payload; its CRC no longer matches.
        png[8 + 25 + 8] ^= std::byte { 0x01 };
        EXPECT_EQ(parse_png_card(png, PngCardReadOptions(), &file),
                  PngCardStatus::CorruptChunk);

        // Length field pointing past the end of the buffer.
        auto truncated = make_png(1, 1);
        truncated[8 + 25 + 3] = std::byte { 0xFF };
        EXPECT_EQ(parse_png_card(truncated, PngCardReadOptions(), &file),
                  PngCardStatus::CorruptChunk);
    }


    TEST(PngCard, AnyBitFlipInCardChunkIsCorrupt)
    {
        const auto chunk = text_chunk("chara", "eyJhIjoxfQ==");
        const auto png   = make_png(2, 2, chunk);
        // The text chunk sits right before the 12-byte IEND chunk.
        const size_t start = png.size() - 12 - chunk.size() + 4;
        const size_t end   = png.size() - 12 - 4;

        PngCardFile file;
        ASSERT_EQ(parse_png_card(png, PngCardReadOptions(), &file),
                  PngCardStatus::Ok);
        for (size_t at = start; at < end; ++at) {
            for (int bit = 0; bit < 8; ++bit) {
                auto damaged = png;
                damaged[at] ^= std::byte { static_cast<uint8_t>(1U << bit) };
                EXPECT_EQ(parse_png_card(damaged, PngCardReadOptions(), &file),
                          PngCardStatus::CorruptChunk)
                    << "byte " << at << " bit " << bit;
            }
        }
    }


    TEST(PngCard, EmbedReplacesCardChunksBeforeIend)
    {
        std::vector<std::byte> middle = text_chunk("chara", "b2xk");
        append_bytes(&middle, text_chunk("Software", "paint"));
        append_bytes(&middle, text_chunk("ccv3", "b2xk"));
        const auto png      = make_png(5, 6, middle);
        const auto original = png;

        PngCardEmbedOptions opts;
        std::vector<std::byte> out;
        ASSERT_EQ(embed_png_card(png, "{ \"name\" : \"Ada\" }", opts, &out),
                  PngCardStatus::Ok);
        EXPECT_EQ(png, original);

        PngCardFile file;
        ASSERT_EQ(parse_png_card(out, PngCardReadOptions(), &file),
                  PngCardStatus::Ok);
        EXPECT_EQ(chunk_types(file),
                  (std::vector<uint32_t> { kPngIhdr,
                                           png_fourcc('I', 'D', 'A', 'T'),
                                           kPngText, kPngText, kPngIend }));
        EXPECT_EQ(png_text_keyword(out, file.chunks[2]), "Software");
        EXPECT_EQ(png_text_keyword(out, file.chunks[3]), "chara");
        EXPECT_EQ(file.payload.text, "{\"name\":\"Ada\"}");
        EXPECT_TRUE(file.payload.base64);
        for (const PngChunkRef& c : file.chunks) {
            const std::span<const std::byte> all(out);
            EXPECT_EQ(c.crc, crc32_concat(all.subspan(c.offset + 4, 4),
                                          all.subspan(c.data_offset,
                                                      c.data_size)));
        }
    }


    TEST(PngCard, EmbedAsItxtWithoutMinify)
    {
        const auto png = make_png(1, 1);
        PngCardEmbedOptions opts;
        opts.key    = "ccv3";
        opts.base64 = false;
        opts.minify = false;
        const std::string text = "{ \"name\": \"Ünïcode\" }";
        std::vector<std::byte> out;
        ASSERT_EQ(embed_png_card(png, text, opts, &out), PngCardStatus::Ok);

        PngCardFile file;
        ASSERT_EQ(parse_png_card(out, PngCardReadOptions(), &file),
                  PngCardStatus::Ok);
        EXPECT_EQ(file.payload.chunk_type, kPngItxt);
        EXPECT_EQ(file.payload.text, text);
        EXPECT_FALSE(file.payload.base64);
    }


    TEST(PngCard, EmbedIsIdempotentAndAcceptsEmptyPayload)
    {
        const auto png = make_png(1, 1);
        PngCardEmbedOptions opts;
        std::vector<std::byte> once;
        std::vector<std::byte> twice;
        ASSERT_EQ(embed_png_card(png, "{\"a\":1}", opts, &once),
                  PngCardStatus::Ok);
        ASSERT_EQ(embed_png_card(once, "{\"a\":1}", opts, &twice),
                  PngCardStatus::Ok);
        EXPECT_EQ(once, twice);

        std::vector<std::byte> empty;
        ASSERT_EQ(embed_png_card(png, "", opts, &empty), PngCardStatus::Ok);
        PngCardFile file;
        ASSERT_EQ(parse_png_card(empty, PngCardReadOptions(), &file),
                  PngCardStatus::Ok);
        EXPECT_EQ(file.chunks.size(), 4U);
    }


    TEST(PngCard, EmbedEnforcesLimitsAndKeyword)
    {
        const auto png = make_png(1, 1);
        std::vector<std::byte> out;

        PngCardEmbedOptions small;
        small.limits.max_output_bytes = png.size() + 16;
        EXPECT_EQ(embed_png_card(png, std::string(64, 'x'), small, &out),
                  PngCardStatus::PayloadTooLarge);
        EXPECT_TRUE(out.empty());

        PngCardEmbedOptions bad;
        bad.key = "";
        EXPECT_EQ(embed_png_card(png, "{}", bad, &out),
                  PngCardStatus::InvalidKeyword);
        bad.key = std::string(80, 'k');
        EXPECT_EQ(embed_png_card(png, "{}", bad, &out),
                  PngCardStatus::InvalidKeyword);
    }


    TEST(PngCard, StripRemovesOnlyCardChunks)
    {
        std::vector<std::byte> middle = text_chunk("chara", "b2xk");
        append_bytes(&middle, text_chunk("Software", "paint"));
        const auto png = make_png(1, 1, middle);
        std::vector<std::byte> out;
        ASSERT_EQ(strip_png_card(png, kCardTextKeys, &out), PngCardStatus::Ok);

        PngCardFile file;
        ASSERT_EQ(parse_png_card(out, PngCardReadOptions(), &file),
                  PngCardStatus::Ok);
        EXPECT_FALSE(file.has_payload);
        EXPECT_EQ(file.chunks.size(), 4U);
        EXPECT_EQ(out.size(), png.size() - (12 + 10));
    }


    TEST(PngCard, EmbedThenParseRecoversPayloadExactly)
    {
        const auto png                   = make_png(1, 1);
        const std::string payloads[] = {
            "Alice", "abcd", "SGVsbG8=", "  {\"a\":1}\n", "", "\t[1, 2]  ",
        };
        for (const bool b64 : { false, true }) {
            for (const std::string& payload : payloads) {
                PngCardEmbedOptions opts;
                opts.base64 = b64;
                opts.minify = false;
                std::vector<std::byte> out;
                ASSERT_EQ(embed_png_card(png, payload, opts, &out),
                          PngCardStatus::Ok);
                PngCardFile file;
                ASSERT_EQ(parse_png_card(out, PngCardReadOptions(), &file),
                          PngCardStatus::Ok);
                ASSERT_TRUE(file.has_payload) << payload;
                EXPECT_EQ(file.payload.text, payload)
                    << "base64=" << b64 << " payload=[" << payload << "]";
                EXPECT_EQ(file.payload.chunk_type, b64 ? kPngText : kPngItxt);
            }
        }
    }


    TEST(PngCard, ItxtValueIsNeverBase64Decoded)
    {
        std::vector<std::byte> data = bytes_of("chara");
        append_bytes(&data, std::string_view("\0\0\0\0\0", 5));
        append_bytes(&data, std::string_view("SGVsbG8="));
        std::vector<std::byte> chunk;
        testing::append_png_chunk(&chunk, "iTXt", data);
        const auto png = make_png(1, 1, chunk);

        PngCardFile file;
        ASSERT_EQ(parse_png_card(png, PngCardReadOptions(), &file),
                  PngCardStatus::Ok);
        EXPECT_EQ(file.payload.text, "SGVsbG8=");
        EXPECT_FALSE(file.payload.base64);
    }

}  // namespace
}  // namespace cardpack
