#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <functional>
#include <set>
#include <string>
#include <utility>

namespace coro_request {

// Case-insensitive ASCII comparison used for header keys
inline bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(),
        [](char ca, char cb) {
            return std::tolower(static_cast<unsigned char>(ca)) ==
                   std::tolower(static_cast<unsigned char>(cb));
        });
}

inline std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

inline std::string base64_encode(const std::string& input) {
    static const char* alphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz"
        "0123456789+/";

    std::string result;
    result.reserve(((input.size() + 2) / 3) * 4);
    int val = 0;
    int valb = -6;

    for (unsigned char c : input) {
        val = (val << 8) + c;
        valb += 8;
        while (valb >= 0) {
            result.push_back(alphabet[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }

    if (valb > -6) {
        result.push_back(alphabet[((val << 8) >> (valb + 8)) & 0x3F]);
    }

    while (result.size() % 4) {
        result.push_back('=');
    }

    return result;
}

// HTTP request method. Any token is accepted as-is.
class HttpMethod {
public:
    static const HttpMethod CONNECT;
    static const HttpMethod DEL;
    static const HttpMethod GET;
    static const HttpMethod HEAD;
    static const HttpMethod OPTIONS;
    static const HttpMethod PATCH;
    static const HttpMethod POST;
    static const HttpMethod PUT;
    static const HttpMethod TRACE;

    HttpMethod() : raw_value_("GET") {}
    explicit HttpMethod(std::string raw_value) : raw_value_(std::move(raw_value)) {}

    const std::string& raw_value() const { return raw_value_; }

    bool operator==(const HttpMethod& other) const { return raw_value_ == other.raw_value_; }
    bool operator!=(const HttpMethod& other) const { return !(*this == other); }

private:
    std::string raw_value_;
};

inline const HttpMethod HttpMethod::CONNECT{"CONNECT"};
inline const HttpMethod HttpMethod::DEL{"DELETE"};
inline const HttpMethod HttpMethod::GET{"GET"};
inline const HttpMethod HttpMethod::HEAD{"HEAD"};
inline const HttpMethod HttpMethod::OPTIONS{"OPTIONS"};
inline const HttpMethod HttpMethod::PATCH{"PATCH"};
inline const HttpMethod HttpMethod::POST{"POST"};
inline const HttpMethod HttpMethod::PUT{"PUT"};
inline const HttpMethod HttpMethod::TRACE{"TRACE"};

// A single header line. Two headers are the same only if both key and value match.
struct HttpHeader {
    std::string key;
    std::string value;

    HttpHeader(std::string k, std::string v) : key(std::move(k)), value(std::move(v)) {}

    static HttpHeader accept(const std::string& value) { return {"Accept", value}; }
    static HttpHeader accept_encoding(const std::string& value) { return {"Accept-Encoding", value}; }
    static HttpHeader accept_language(const std::string& value) { return {"Accept-Language", value}; }
    static HttpHeader authorization(const std::string& value) { return {"Authorization", value}; }
    static HttpHeader authorization_bearer(const std::string& token) { return {"Authorization", "Bearer " + token}; }
    static HttpHeader authorization_basic(const std::string& username, const std::string& password) {
        return {"Authorization", "Basic " + base64_encode(username + ":" + password)};
    }
    static HttpHeader cache_control(const std::string& value) { return {"Cache-Control", value}; }
    static HttpHeader content_length(long long value) { return {"Content-Length", std::to_string(value)}; }
    static HttpHeader content_type(const std::string& value) { return {"Content-Type", value}; }
    static HttpHeader cookie(const std::string& value) { return {"Cookie", value}; }
    static HttpHeader host(const std::string& value) { return {"Host", value}; }
    static HttpHeader if_match(const std::string& etag) { return {"If-Match", etag}; }
    static HttpHeader if_modified_since(const std::string& date) { return {"If-Modified-Since", date}; }
    static HttpHeader if_none_match(const std::string& etag) { return {"If-None-Match", etag}; }
    static HttpHeader if_unmodified_since(const std::string& date) { return {"If-Unmodified-Since", date}; }
    static HttpHeader origin(const std::string& value) { return {"Origin", value}; }
    static HttpHeader referer(const std::string& value) { return {"Referer", value}; }
    static HttpHeader user_agent(const std::string& value) { return {"User-Agent", value}; }

    bool operator==(const HttpHeader& other) const {
        return key == other.key && value == other.value;
    }
    bool operator!=(const HttpHeader& other) const { return !(*this == other); }
    bool operator<(const HttpHeader& other) const {
        return key != other.key ? key < other.key : value < other.value;
    }
};

// Set of headers with pair semantics: same key with different values may coexist.
using Headers = std::set<HttpHeader>;

// Drop every header sharing the key (case-insensitive) and insert the new one
inline void replace_header(Headers& headers, const HttpHeader& header) {
    for (auto it = headers.begin(); it != headers.end(); ) {
        if (iequals(it->key, header.key)) {
            it = headers.erase(it);
        } else {
            ++it;
        }
    }
    headers.insert(header);
}

inline bool contains_header_key(const Headers& headers, const std::string& key) {
    return std::any_of(headers.begin(), headers.end(),
                       [&key](const HttpHeader& h) { return iequals(h.key, key); });
}

// How a parameter map is turned into a request body, identified by its MIME type
class ParameterEncoding {
public:
    static const ParameterEncoding JSON;
    static const ParameterEncoding URL;

    explicit ParameterEncoding(std::string raw_value) : raw_value_(std::move(raw_value)) {}

    const std::string& raw_value() const { return raw_value_; }

    bool operator==(const ParameterEncoding& other) const { return raw_value_ == other.raw_value_; }
    bool operator!=(const ParameterEncoding& other) const { return !(*this == other); }

private:
    std::string raw_value_;
};

inline const ParameterEncoding ParameterEncoding::JSON{"application/json"};
inline const ParameterEncoding ParameterEncoding::URL{"application/x-www-form-urlencoded"};

}  // namespace coro_request

namespace std {

template <>
struct hash<coro_request::HttpMethod> {
    std::size_t operator()(const coro_request::HttpMethod& method) const noexcept {
        return std::hash<std::string>{}(method.raw_value());
    }
};

template <>
struct hash<coro_request::HttpHeader> {
    std::size_t operator()(const coro_request::HttpHeader& header) const noexcept {
        std::size_t seed = std::hash<std::string>{}(header.key);
        seed ^= std::hash<std::string>{}(header.value) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        return seed;
    }
};

template <>
struct hash<coro_request::ParameterEncoding> {
    std::size_t operator()(const coro_request::ParameterEncoding& encoding) const noexcept {
        return std::hash<std::string>{}(encoding.raw_value());
    }
};

}  // namespace std
