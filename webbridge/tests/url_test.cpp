#include <gtest/gtest.h>

#include "bridge/url.hpp"

using webbridge::parse_url;

TEST(Url, ParsesHttpsWithPortPathQueryAndFragment) {
    auto url = parse_url("HTTPS://User@WWW.Apple.com:8443/path/to?q=1#frag");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->scheme, "https");
    EXPECT_EQ(url->host.value_or(""), "www.apple.com");
    EXPECT_EQ(url->port.value_or(0), 8443);
    EXPECT_EQ(url->path, "/path/to");
    EXPECT_EQ(url->query.value_or(""), "q=1");
    EXPECT_EQ(url->fragment.value_or(""), "frag");
    EXPECT_EQ(url->spec, "HTTPS://User@WWW.Apple.com:8443/path/to?q=1#frag");
}

TEST(Url, FileUrlHasNoHost) {
    auto url = parse_url("file:///var/app/index.html");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->scheme, "file");
    EXPECT_FALSE(url->host.has_value());
    EXPECT_EQ(url->path, "/var/app/index.html");
}

TEST(Url, OpaqueSchemesParse) {
    auto url = parse_url("mailto:someone@example.com");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->scheme, "mailto");
    EXPECT_FALSE(url->host.has_value());
    EXPECT_EQ(url->path, "someone@example.com");
}

TEST(Url, BracketedIpv6Host) {
    auto url = parse_url("http://[::1]:8080/");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host.value_or(""), "[::1]");
    EXPECT_EQ(url->port.value_or(0), 8080);
}

TEST(Url, RejectsInvalidInput) {
    EXPECT_FALSE(parse_url("").has_value());
    EXPECT_FALSE(parse_url("www.apple.com").has_value());
    EXPECT_FALSE(parse_url("not a url").has_value());
    EXPECT_FALSE(parse_url("https://www.apple.com/a b").has_value());
    EXPECT_FALSE(parse_url("://missing-scheme").has_value());
    EXPECT_FALSE(parse_url("1http://example.com").has_value());
    EXPECT_FALSE(parse_url("https://").has_value());
    EXPECT_FALSE(parse_url("https://example.com:99999/").has_value());
    EXPECT_FALSE(parse_url("https://example.com:80a/").has_value());
    EXPECT_FALSE(parse_url("https://exa<mple.com/").has_value());
}
