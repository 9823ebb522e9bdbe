#include "cardpack/card_json.h"

#include <gtest/gtest.h>

namespace cardpack {
namespace {

    TEST(CardJson, KeepsMemberOrder)
    {
        CardJson doc;
        ASSERT_TRUE(parse_card_json(R"({"z":1,"a":{"y":true,"b":null}})",
                                    &doc));
        EXPECT_EQ(dump_card_json(doc), R"({"z":1,"a":{"y":true,"b":null}})");
    }


    TEST(CardJson, ParseFailureLeavesOutputUntouched)
    {
        CardJson doc = CardJson::array();
        EXPECT_FALSE(parse_card_json("{\"a\":", &doc));
        EXPECT_TRUE(doc.is_array());
        EXPECT_FALSE(parse_card_json("", &doc));
    }


    TEST(CardJson, MinifyRemovesWhitespaceOnly)
    {
        EXPECT_EQ(minify_json("{ \"a\" : [ 1, 2 ],\n \"t\": \"x y\" }"),
                  "{\"a\":[1,2],\"t\":\"x y\"}");
        EXPECT_EQ(minify_json("not json"), "not json");
    }

}  // namespace
}  // namespace cardpack
