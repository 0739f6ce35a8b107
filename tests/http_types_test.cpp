#include <coro_request/auth.hpp>
#include <coro_request/http_types.hpp>

#include <gtest/gtest.h>

#include <string>
#include <unordered_set>
#include <vector>

using namespace coro_request;

// ===========================================================================
// HttpMethod
// ===========================================================================

TEST(HttpMethodTest, NamedMethodsCarryStandardTokens) {
    std::vector<std::string> tokens = {
        HttpMethod::CONNECT.raw_value(),
        HttpMethod::DEL.raw_value(),
        HttpMethod::GET.raw_value(),
        HttpMethod::HEAD.raw_value(),
        HttpMethod::OPTIONS.raw_value(),
        HttpMethod::PATCH.raw_value(),
        HttpMethod::POST.raw_value(),
        HttpMethod::PUT.raw_value(),
        HttpMethod::TRACE.raw_value(),
    };
    std::vector<std::string> expected = {
        "CONNECT", "DELETE", "GET", "HEAD", "OPTIONS", "PATCH", "POST", "PUT", "TRACE"};
    EXPECT_EQ(tokens, expected);
}

TEST(HttpMethodTest, EqualityIsByToken) {
    EXPECT_EQ(HttpMethod::GET, HttpMethod("GET"));
    EXPECT_NE(HttpMethod::GET, HttpMethod::PUT);
    // Tokens are case-sensitive
    EXPECT_NE(HttpMethod::GET, HttpMethod("get"));
}

TEST(HttpMethodTest, ArbitraryTokensPassThrough) {
    HttpMethod custom("CUSTOM METHOD\t");
    EXPECT_EQ(custom.raw_value(), "CUSTOM METHOD\t");
    EXPECT_NE(custom, HttpMethod::GET);
}

TEST(HttpMethodTest, DefaultIsGet) {
    EXPECT_EQ(HttpMethod(), HttpMethod::GET);
}

TEST(HttpMethodTest, HashFollowsEquality) {
    std::unordered_set<HttpMethod> methods = {HttpMethod::POST, HttpMethod("POST"), HttpMethod::PUT};
    EXPECT_EQ(methods.size(), 2u);
}

// ===========================================================================
// HttpHeader
// ===========================================================================

TEST(HttpHeaderTest, NamedConstructors) {
    struct Case {
        HttpHeader header;
        std::string key;
        std::string value;
    };
    std::vector<Case> cases = {
        {HttpHeader::accept("application/json"), "Accept", "application/json"},
        {HttpHeader::accept_encoding("gzip"), "Accept-Encoding", "gzip"},
        {HttpHeader::accept_language("en-US"), "Accept-Language", "en-US"},
        {HttpHeader::authorization("Basic 123"), "Authorization", "Basic 123"},
        {HttpHeader::authorization_bearer("someToken"), "Authorization", "Bearer someToken"},
        {HttpHeader::authorization_basic("user", "pass"), "Authorization", "Basic dXNlcjpwYXNz"},
        {HttpHeader::cache_control("no-cache"), "Cache-Control", "no-cache"},
        {HttpHeader::content_length(256), "Content-Length", "256"},
        {HttpHeader::content_type("text/plain"), "Content-Type", "text/plain"},
        {HttpHeader::cookie("sessionid=abc123"), "Cookie", "sessionid=abc123"},
        {HttpHeader::host("example.com"), "Host", "example.com"},
        {HttpHeader::if_match("W/\"123abc\""), "If-Match", "W/\"123abc\""},
        {HttpHeader::if_modified_since("Sat, 29 Oct 1994 19:43:31 GMT"), "If-Modified-Since", "Sat, 29 Oct 1994 19:43:31 GMT"},
        {HttpHeader::if_none_match("W/\"xyz789\""), "If-None-Match", "W/\"xyz789\""},
        {HttpHeader::if_unmodified_since("Sat, 29 Oct 1994 19:43:31 GMT"), "If-Unmodified-Since", "Sat, 29 Oct 1994 19:43:31 GMT"},
        {HttpHeader::origin("https://example.com"), "Origin", "https://example.com"},
        {HttpHeader::referer("https://google.com"), "Referer", "https://google.com"},
        {HttpHeader::user_agent("MyTestAgent/1.0"), "User-Agent", "MyTestAgent/1.0"},
    };

    for (const auto& c : cases) {
        EXPECT_EQ(c.header.key, c.key);
        EXPECT_EQ(c.header.value, c.value) << c.key;
    }
}

TEST(HttpHeaderTest, EqualityIsByPair) {
    HttpHeader direct("Content-Type", "application/json");
    EXPECT_EQ(direct, HttpHeader::content_type("application/json"));
    EXPECT_NE(direct, HttpHeader::content_type("text/plain"));
}

TEST(HttpHeaderTest, AuthHelpers) {
    EXPECT_EQ(Auth::basic("user", "pass").value, "Basic dXNlcjpwYXNz");
    EXPECT_EQ(Auth::bearer("t0k").value, "Bearer t0k");
    auto key = Auth::api_key("secret");
    EXPECT_EQ(key.key, "X-API-Key");
    EXPECT_EQ(key.value, "secret");
    EXPECT_EQ(Auth::api_key("secret", "X-Token").key, "X-Token");
}

TEST(HttpHeaderTest, Base64Padding) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
}

// ===========================================================================
// Headers collection
// ===========================================================================

TEST(HeadersTest, InsertingSamePairTwiceIsIdempotent) {
    Headers headers;
    headers.insert(HttpHeader::user_agent("MyApp/1.0"));
    headers.insert(HttpHeader::user_agent("MyApp/1.0"));
    EXPECT_EQ(headers.size(), 1u);
}

TEST(HeadersTest, SameKeyDifferentValuesCoexist) {
    Headers headers = {
        HttpHeader::user_agent("MyApp/1.0"),
        HttpHeader::user_agent("MyApp/1.0"),
        HttpHeader::user_agent("MyApp/2.0"),
    };
    EXPECT_EQ(headers.size(), 2u);
    EXPECT_TRUE(headers.count(HttpHeader::user_agent("MyApp/1.0")));
    EXPECT_TRUE(headers.count(HttpHeader::user_agent("MyApp/2.0")));
}

TEST(HeadersTest, UnorderedSetUsesPairHash) {
    std::unordered_set<HttpHeader> headers = {
        HttpHeader::accept("a"), HttpHeader::accept("a"), HttpHeader::accept("b")};
    EXPECT_EQ(headers.size(), 2u);
}

TEST(HeadersTest, ReplaceHeaderDropsAllValuesForKey) {
    Headers headers = {
        HttpHeader("x-trace", "1"),
        HttpHeader("X-Trace", "2"),
        HttpHeader::accept("text/html"),
    };
    replace_header(headers, HttpHeader("X-Trace", "3"));

    EXPECT_EQ(headers.size(), 2u);
    EXPECT_TRUE(headers.count(HttpHeader("X-Trace", "3")));
    EXPECT_TRUE(headers.count(HttpHeader::accept("text/html")));
}

TEST(HeadersTest, ContainsHeaderKeyIsCaseInsensitive) {
    Headers headers = {HttpHeader("content-TYPE", "text/plain")};
    EXPECT_TRUE(contains_header_key(headers, "Content-Type"));
    EXPECT_FALSE(contains_header_key(headers, "Accept"));
}

// ===========================================================================
// ParameterEncoding
// ===========================================================================

TEST(ParameterEncodingTest, BuiltInTokens) {
    EXPECT_EQ(ParameterEncoding::JSON.raw_value(), "application/json");
    EXPECT_EQ(ParameterEncoding::URL.raw_value(), "application/x-www-form-urlencoded");
}

TEST(ParameterEncodingTest, EqualityIsByToken) {
    ParameterEncoding custom("application/custom-encoding");
    EXPECT_EQ(custom.raw_value(), "application/custom-encoding");
    EXPECT_NE(custom, ParameterEncoding::JSON);
    EXPECT_NE(custom, ParameterEncoding::URL);
    EXPECT_EQ(ParameterEncoding("application/json"), ParameterEncoding::JSON);
}
