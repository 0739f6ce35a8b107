#include <coro_request/errors.hpp>
#include <coro_request/url_parser.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace coro_request;

TEST(UrlParserTest, DefaultsPortAndPath) {
    auto info = parse_url("http://example.com");
    EXPECT_EQ(info.scheme, "http");
    EXPECT_EQ(info.host, "example.com");
    EXPECT_EQ(info.port, "80");
    EXPECT_EQ(info.path, "/");
    EXPECT_FALSE(info.is_https);
}

TEST(UrlParserTest, HttpsWithPortPathAndQuery) {
    auto info = parse_url("HTTPS://api.example.com:8443/v1/items?page=2#top");
    EXPECT_EQ(info.scheme, "https");
    EXPECT_EQ(info.host, "api.example.com");
    EXPECT_EQ(info.port, "8443");
    EXPECT_EQ(info.path, "/v1/items?page=2");
    EXPECT_TRUE(info.is_https);
}

TEST(UrlParserTest, QueryWithoutPathGetsLeadingSlash) {
    auto info = parse_url("http://example.com?x=1");
    EXPECT_EQ(info.path, "/?x=1");
}

TEST(UrlParserTest, NonHttpSchemesStillParse) {
    auto info = parse_url("ftp://files.example.com/pub");
    EXPECT_EQ(info.scheme, "ftp");
    EXPECT_EQ(info.port, "");
    EXPECT_EQ(info.path, "/pub");
}

TEST(UrlParserTest, RejectsMissingSchemeOrHost) {
    for (const std::string url : {"://", "", "example.com/path", "http://", "http:///path", "not a url"}) {
        try {
            parse_url(url);
            FAIL() << "expected BuildError for '" << url << "'";
        } catch (const BuildError& e) {
            EXPECT_EQ(e.kind(), BuildError::Kind::InvalidURL) << url;
        }
    }
}
