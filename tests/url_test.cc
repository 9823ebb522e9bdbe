#include "cardpack/url.h"

#include <gtest/gtest.h>

namespace cardpack {
namespace {

    TEST(Url, EncodeUnreservedOnly)
    {
        EXPECT_EQ(url_encode("a b/c~d"), "a%20b%2Fc~d");
        EXPECT_EQ(url_encode("a b/c", true), "a%20b/c");
        EXPECT_EQ(url_encode("image/png"), "image%2Fpng");
    }


    TEST(Url, Decode)
    {
        std::string out;
        ASSERT_TRUE(url_decode("a%20b%2fc", &out));
        EXPECT_EQ(out, "a b/c");
        ASSERT_TRUE(url_decode("a+b", &out));
        EXPECT_EQ(out, "a+b");
        ASSERT_TRUE(url_decode("a+b", &out, true));
        EXPECT_EQ(out, "a b");
        EXPECT_FALSE(url_decode("bad%2", &out));
        EXPECT_FALSE(url_decode("bad%zz", &out));
    }


    TEST(Url, QueryParams)
    {
        const QueryParams params = parse_query("a=1&&b=x%2Fy&flag&a=2&c=%");
        ASSERT_EQ(params.size(), 5U);
        EXPECT_EQ(query_value(params, "a"), "1");
        EXPECT_EQ(query_value(params, "b"), "x/y");
        EXPECT_EQ(query_value(params, "flag"), "");
        EXPECT_EQ(query_value(params, "c"), "%");
        EXPECT_EQ(query_value(params, "missing"), "");
    }


    TEST(Url, ParseHttpUrl)
    {
        ParsedUrl u;
        ASSERT_TRUE(parse_http_url("https://host:8443/a/b?x=1#frag", &u));
        EXPECT_EQ(u.scheme, "https");
        EXPECT_EQ(u.host, "host:8443");
        EXPECT_EQ(u.path, "/a/b");
        EXPECT_EQ(u.query, "x=1");

        ASSERT_TRUE(parse_http_url("http://example.com", &u));
        EXPECT_EQ(u.path, "/");
        EXPECT_TRUE(u.query.empty());

        EXPECT_FALSE(parse_http_url("ftp://example.com/x", &u));
        EXPECT_FALSE(parse_http_url("https:///nohost", &u));
        EXPECT_FALSE(parse_http_url("not a url", &u));
    }

}  // namespace
}  // namespace cardpack
