#pragma once

#include "errors.hpp"
#include "http_types.hpp"
#include <regex>
#include <string>

namespace coro_request {

struct UrlInfo {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;  // includes the query string, never the fragment
    bool is_https;
};

inline std::string default_port(const std::string& scheme) {
    if (scheme == "https") return "443";
    if (scheme == "http") return "80";
    return "";
}

// Split an absolute URL. Throws BuildError(InvalidURL) when scheme or host is missing.
inline UrlInfo parse_url(const std::string& url) {
    static const std::regex url_regex(
        R"(^([A-Za-z][A-Za-z0-9+.\-]*):\/\/([^:\/\s?#]+)(?::(\d+))?([\/?#][^\s]*)?$)");
    std::smatch matches;

    if (!std::regex_match(url, matches, url_regex)) {
        throw BuildError::invalid_url(url);
    }

    UrlInfo info;
    info.scheme = to_lower(matches[1].str());
    info.host = matches[2].str();
    info.port = matches[3].matched ? matches[3].str() : default_port(info.scheme);
    info.path = matches[4].matched ? matches[4].str() : "/";
    auto fragment = info.path.find('#');
    if (fragment != std::string::npos) {
        info.path.erase(fragment);
    }
    if (info.path.empty() || info.path[0] != '/') {
        info.path = "/" + info.path;
    }
    info.is_https = info.scheme == "https";
    return info;
}

}  // namespace coro_request
