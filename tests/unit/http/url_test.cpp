#include <gtest/gtest.h>
#include <authfetch/http/url.h>

using namespace authfetch;
using namespace authfetch::http;

TEST(UrlTest, ParseUrlLowercasesSchemeAndHost) {
    auto parsed = parseUrl("HTTPS://Data.Example.COM:8443/a/b.nc?x=1");
    ASSERT_TRUE(parsed) << parsed.error().message;
    EXPECT_EQ(parsed.value().scheme, "https");
    EXPECT_EQ(parsed.value().host, "data.example.com");
    EXPECT_EQ(parsed.value().port, "8443");
    EXPECT_EQ(parsed.value().path, "/a/b.nc");
    EXPECT_EQ(parsed.value().query, "x=1");
}

TEST(UrlTest, UrlHostRejectsRelativeReferences) {
    EXPECT_FALSE(urlHost("/just/a/path").has_value());
    EXPECT_EQ(urlHost("https://urs.earthdata.nasa.gov/oauth").value_or(""),
              "urs.earthdata.nasa.gov");
}

TEST(UrlTest, IsHttpUrl) {
    EXPECT_TRUE(isHttpUrl("http://example.com"));
    EXPECT_TRUE(isHttpUrl("HTTPS://example.com/x"));
    EXPECT_FALSE(isHttpUrl("s3://bucket/key"));
    EXPECT_FALSE(isHttpUrl("file:///tmp/x"));
}

TEST(UrlTest, LocalhostUrlRewritesOnlyLocalhost) {
    EXPECT_EQ(localhostUrl("http://localhost:4572/bucket/key", "localstack"),
              "http://localstack:4572/bucket/key");
    EXPECT_EQ(localhostUrl("https://example.com/a", "localstack"), "https://example.com/a");
}

TEST(UrlTest, ResolveReferenceHandlesRelativeAndAbsoluteLocations) {
    auto rel = resolveReference("https://a.example.com/dir/file?x=1", "/other/path?y=2");
    ASSERT_TRUE(rel);
    EXPECT_EQ(rel.value(), "https://a.example.com/other/path?y=2");

    auto sibling = resolveReference("https://a.example.com/dir/file", "next");
    ASSERT_TRUE(sibling);
    EXPECT_EQ(sibling.value(), "https://a.example.com/dir/next");

    auto abs = resolveReference("https://a.example.com/dir/file", "https://b.example.org/z");
    ASSERT_TRUE(abs);
    EXPECT_EQ(abs.value(), "https://b.example.org/z");
}

TEST(UrlTest, PercentEncodingEncodesOnce) {
    EXPECT_EQ(percentEncode("https://app.example.com/cb?a=b"),
              "https%3A%2F%2Fapp.example.com%2Fcb%3Fa%3Db");
    EXPECT_EQ(percentEncode("a b", true), "a+b");
    EXPECT_EQ(percentEncode("a b"), "a%20b");
    EXPECT_EQ(percentDecode("a%2Fb+c", true), "a/b c");
    EXPECT_EQ(percentDecode("100%"), "100%");
}

TEST(UrlTest, FormEncodeAndParseQueryAgree) {
    QueryParams params{{"grant_type", "authorization_code"},
                       {"redirect_uri", "https://x.example/cb"}};
    const auto encoded = formEncode(params);
    EXPECT_EQ(encoded, "grant_type=authorization_code&redirect_uri=https%3A%2F%2Fx.example%2Fcb");
    EXPECT_EQ(parseQuery(encoded), params);
}

TEST(UrlTest, WithQueryParameterKeepsFragmentLast) {
    EXPECT_EQ(withQueryParameter("https://h/p", "A-api-request-uuid", "abc"),
              "https://h/p?A-api-request-uuid=abc");
    EXPECT_EQ(withQueryParameter("https://h/p?x=1#frag", "id", "a b"),
              "https://h/p?x=1&id=a+b#frag");
    EXPECT_EQ(withQueryParameter("https://h/p?", "id", "1"), "https://h/p?id=1");
}

TEST(UrlTest, WithQueryParameterReplacesExistingValue) {
    EXPECT_EQ(withQueryParameter("https://h/p?A-api-request-uuid=old&x=1", "A-api-request-uuid",
                                 "new"),
              "https://h/p?x=1&A-api-request-uuid=new");
    EXPECT_EQ(withQueryParameter("https://h/p?id=1&id=2&y=3#f", "id", "9"),
              "https://h/p?y=3&id=9#f");
    EXPECT_EQ(withQueryParameter("https://h/p?id=1", "id", "2"), "https://h/p?id=2");
}

TEST(UrlTest, SplitQuery) {
    auto [base, query] = splitQuery("https://h:1/p/q?a=1&b=2#f");
    EXPECT_EQ(base, "https://h:1/p/q");
    EXPECT_EQ(query, "a=1&b=2");
    EXPECT_EQ(splitQuery("https://h/p").second, "");
}
