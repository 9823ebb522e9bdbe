#include "cardpack/zip_archive.h"

#include "test_util.h"

#include <gtest/gtest.h>

namespace cardpack {
namespace {

    using testing::string_of;
    using testing::ZipBuilder;

    TEST(ZipArchive, ReadsStoredAndDeflatedEntries)
    {
        ZipBuilder zb;
        zb.add("card.json", "{\"spec\":\"chara_card_v3\"}");
        zb.add("assets/icon/main.txt", std::string(4000, 'z'), true);
        const auto bytes = zb.finish();
        EXPECT_TRUE(looks_like_zip(bytes));

        ZipArchive zip;
        ASSERT_EQ(ZipArchive::open(bytes, ZipLimits(), &zip), ZipStatus::Ok);
        ASSERT_EQ(zip.entries().size(), 2U);
        EXPECT_EQ(zip.entries()[1].method, 8);

        std::vector<std::byte> out;
        ASSERT_EQ(zip.read("card.json", &out), ZipStatus::Ok);
        EXPECT_EQ(string_of(out), "{\"spec\":\"chara_card_v3\"}");
        ASSERT_EQ(zip.read("./assets/icon/main.txt", &out), ZipStatus::Ok);
        EXPECT_EQ(string_of(out), std::string(4000, 'z'));
        EXPECT_EQ(zip.read("missing.bin", &out), ZipStatus::NotFound);
    }


    TEST(ZipArchive, DetectsCrcMismatch)
    {
        ZipBuilder zb;
        zb.add("a.txt", "hello");
        auto bytes = zb.finish();
        // Local header (30) + name (5) puts the payload at 35.
        bytes[35] = std::byte { 'j' };

        ZipArchive zip;
        ASSERT_EQ(ZipArchive::open(bytes, ZipLimits(), &zip), ZipStatus::Ok);
        std::vector<std::byte> out;
        EXPECT_EQ(zip.read("a.txt", &out), ZipStatus::CrcMismatch);
    }


    TEST(ZipArchive, EnforcesLimits)
    {
        ZipBuilder zb;
        zb.add("a", "1");
        zb.add("b", "2");
        zb.add("big", std::string(2048, 'x'), true);
        const auto bytes = zb.finish();

        ZipLimits few;
        few.max_entries = 2;
        ZipArchive zip;
        EXPECT_EQ(ZipArchive::open(bytes, few, &zip),
                  ZipStatus::LimitExceeded);

        ZipLimits small;
        small.max_entry_bytes = 1024;
        ASSERT_EQ(ZipArchive::open(bytes, small, &zip), ZipStatus::Ok);
        std::vector<std::byte> out;
        EXPECT_EQ(zip.read("big", &out), ZipStatus::LimitExceeded);
        EXPECT_EQ(zip.read("a", &out), ZipStatus::Ok);
    }


    TEST(ZipArchive, RejectsNonZip)
    {
        ZipArchive zip;
        EXPECT_EQ(ZipArchive::open(testing::bytes_of("plain text"),
                                   ZipLimits(), &zip),
                  ZipStatus::NotZip);
        EXPECT_FALSE(looks_like_zip(testing::bytes_of("{}")));
    }

}  // namespace
}  // namespace cardpack
