#include "cardpack/card_bundle.h"

#include "cardpack/base64.h"

#include "test_util.h"

#include <gtest/gtest.h>

namespace cardpack {
namespace {

    using testing::bytes_of;
    using testing::make_png;
    using testing::string_of;
    using testing::text_chunk;
    using testing::ZipBuilder;

    static constexpr std::string_view kCharxCard = R"({
        "spec": "chara_card_v3",
        "data": {
            "name": "Ada",
            "assets": [
                {"type": "icon", "uri": "embeded://assets/icon/main.png",
                 "name": "main", "ext": "png"},
                {"type": "emotion", "uri": "embeded://assets/emotion/Happy.WEBP",
                 "name": "happy", "ext": ""},
                {"type": "background", "uri": "https://cdn.example/bg.png",
                 "name": "bg", "ext": "png"},
                {"type": "x", "uri": "embeded://assets/missing.bin",
                 "name": "gone", "ext": "bin"}
            ]
        }
    })";

    TEST(CardBundle, DetectsFormats)
    {
        EXPECT_EQ(detect_bundle_format(make_png(1, 1)), BundleFormat::Png);
        EXPECT_EQ(detect_bundle_format(bytes_of("\xEF\xBB\xBF  {\"a\":1}")),
                  BundleFormat::Json);
        ZipBuilder zb;
        zb.add("card.json", "{}");
        EXPECT_EQ(detect_bundle_format(zb.finish()), BundleFormat::CharX);
        EXPECT_EQ(detect_bundle_format(bytes_of("[1,2]")),
                  BundleFormat::Unknown);
    }


    TEST(CardBundle, ReadsJsonCard)
    {
        CardBundle bundle;
        ASSERT_EQ(read_card_bundle(bytes_of(R"({"spec":"chara_card_v3","data":{}})"),
                                   BundleReadOptions(), &bundle),
                  BundleStatus::Ok);
        EXPECT_EQ(bundle.format, BundleFormat::Json);
        EXPECT_EQ(bundle.spec_version, "v3");
        EXPECT_TRUE(bundle.assets.empty());
        EXPECT_EQ(main_asset(bundle), nullptr);
    }


    TEST(CardBundle, ReadsPngCardAndStripsPortrait)
    {
        const auto png = make_png(
            8, 8, text_chunk("chara", base64_encode(R"({"name":"Ada"})")));
        CardBundle bundle;
        ASSERT_EQ(read_card_bundle(png, BundleReadOptions(), &bundle),
                  BundleStatus::Ok);
        EXPECT_EQ(bundle.format, BundleFormat::Png);
        EXPECT_EQ(bundle.spec_version, "v2");
        EXPECT_EQ(bundle.card_data["name"], "Ada");

        const Asset* main = main_asset(bundle);
        ASSERT_NE(main, nullptr);
        EXPECT_EQ(main->name, "main");
        EXPECT_EQ(main->type, "icon");
        EXPECT_EQ(main->ext, "png");
        EXPECT_TRUE(main->path.empty());
        EXPECT_EQ(main->bytes, make_png(8, 8));
    }


    TEST(CardBundle, ReadsCharxAssets)
    {
        ZipBuilder zb;
        zb.add("card.json", kCharxCard, true);
        zb.add("assets/icon/main.png", make_png(2, 2));
        zb.add("assets/emotion/Happy.WEBP", "webp-ish");
        const auto bytes = zb.finish();

        CardBundle bundle;
        ASSERT_EQ(read_card_bundle(bytes, BundleReadOptions(), &bundle),
                  BundleStatus::Ok);
        EXPECT_EQ(bundle.format, BundleFormat::CharX);
        EXPECT_EQ(bundle.spec_version, "v3");
        ASSERT_EQ(bundle.assets.size(), 2U);

        EXPECT_EQ(bundle.assets[0].path, "assets/icon/main.png");
        EXPECT_TRUE(bundle.assets[0].is_main);
        EXPECT_EQ(bundle.assets[1].name, "happy");
        EXPECT_EQ(bundle.assets[1].ext, "webp");
        EXPECT_FALSE(bundle.assets[1].is_main);
        EXPECT_EQ(string_of(bundle.assets[1].bytes), "webp-ish");
        EXPECT_EQ(main_asset(bundle), &bundle.assets[0]);
    }


    TEST(CardBundle, ReportsMissingOrInvalidCardData)
    {
        CardBundle bundle;
        EXPECT_EQ(read_card_bundle(make_png(1, 1), BundleReadOptions(),
                                   &bundle),
                  BundleStatus::NoCardData);
        EXPECT_EQ(read_card_bundle(make_png(1, 1, text_chunk("chara", "[1]")),
                                   BundleReadOptions(), &bundle),
                  BundleStatus::InvalidCardData);
        EXPECT_EQ(read_card_bundle(bytes_of("{not json"), BundleReadOptions(),
                                   &bundle),
                  BundleStatus::InvalidCardData);

        ZipBuilder zb;
        zb.add("readme.txt", "no card here");
        EXPECT_EQ(read_card_bundle(zb.finish(), BundleReadOptions(), &bundle),
                  BundleStatus::NoCardData);
        EXPECT_EQ(read_card_bundle(bytes_of("GIF89a"), BundleReadOptions(),
                                   &bundle),
                  BundleStatus::UnknownFormat);
    }

}  // namespace
}  // namespace cardpack
