#include <shelter/url/url.h>
#include <gtest/gtest.h>

using namespace shelter::url;

TEST(UrlTest, ParsesAbsoluteUrl) {
    auto url = parse("HTTP://User:pw@Example.COM:8080/a/b?q=1#top");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->scheme, "http");
    EXPECT_EQ(url->username, "User");
    EXPECT_EQ(url->password, "pw");
    EXPECT_EQ(url->host, "example.com");
    EXPECT_EQ(url->port, 8080);
    EXPECT_EQ(url->path, "/a/b");
    EXPECT_EQ(url->query, "q=1");
    EXPECT_EQ(url->fragment, "top");
}

TEST(UrlTest, DefaultPortIsDropped) {
    auto url = parse("https://example.com:443/");
    ASSERT_TRUE(url.has_value());
    EXPECT_FALSE(url->port.has_value());
    EXPECT_EQ(url->effective_port(), 443);
    EXPECT_EQ(url->serialize(), "https://example.com/");
}

TEST(UrlTest, EmptyPathBecomesSlash) {
    auto url = parse("http://127.0.0.1:5000");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->path, "/");
    EXPECT_EQ(url->serialize(), "http://127.0.0.1:5000/");
}

TEST(UrlTest, RelativeResolution) {
    auto base = parse("http://127.0.0.1:5000/static/css/app.css");
    ASSERT_TRUE(base.has_value());

    EXPECT_EQ(parse("/manifest.json", &*base)->serialize(), "http://127.0.0.1:5000/manifest.json");
    EXPECT_EQ(parse("../icon-192.png", &*base)->serialize(),
              "http://127.0.0.1:5000/static/icon-192.png");
    EXPECT_EQ(parse("?v=2", &*base)->serialize(), "http://127.0.0.1:5000/static/css/app.css?v=2");
    EXPECT_EQ(parse("//cdn.example/x.js", &*base)->serialize(), "http://cdn.example/x.js");
}

TEST(UrlTest, RelativeWithoutBaseFails) {
    EXPECT_FALSE(parse("/api/checkin").has_value());
    EXPECT_FALSE(parse("http:no-slashes").has_value());
    EXPECT_FALSE(parse("http://host:99999/").has_value());
}

TEST(UrlTest, DotSegmentsAreRemoved) {
    auto url = parse("http://a.example/x/./y/../z");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->path, "/x/z");
}

TEST(UrlTest, SameOrigin) {
    auto a = parse("http://127.0.0.1:5000/");
    auto b = parse("http://127.0.0.1:5000/api/status");
    auto c = parse("http://127.0.0.1:5001/");
    auto d = parse("https://cdnjs.cloudflare.com/ajax/libs/socket.io/4.7.2/socket.io.js");
    EXPECT_TRUE(urls_same_origin(*a, *b));
    EXPECT_FALSE(urls_same_origin(*a, *c));
    EXPECT_FALSE(urls_same_origin(*a, *d));
    EXPECT_EQ(a->origin(), "http://127.0.0.1:5000");
}

TEST(UrlTest, CanonicalizeDropsFragmentKeepsQuery) {
    EXPECT_EQ(canonicalize("HTTP://Example.com:80/page?id=3#section"),
              "http://example.com/page?id=3");
    EXPECT_EQ(canonicalize("not a url"), "");
}
