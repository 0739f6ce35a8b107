#pragma once

#include "http_types.hpp"
#include <map>
#include <string>

namespace coro_request {

// Transport-ready request: everything resolved, headers flattened to one value per key.
class HttpRequest {
public:
    HttpRequest() = default;

    HttpRequest(HttpMethod method, const std::string& url)
        : method_(std::move(method)), url_(url) {}

    // Overwrites any previous value for the key
    HttpRequest& add_header(const std::string& key, const std::string& value) {
        headers_[key] = value;
        return *this;
    }

    HttpRequest& set_body(const std::string& body) {
        body_ = body;
        return *this;
    }

    HttpRequest& set_method(HttpMethod method) {
        method_ = std::move(method);
        return *this;
    }

    HttpRequest& set_url(const std::string& url) {
        url_ = url;
        return *this;
    }

    const HttpMethod& method() const { return method_; }
    const std::string& url() const { return url_; }
    const std::map<std::string, std::string>& headers() const { return headers_; }
    const std::string& body() const { return body_; }

    bool operator==(const HttpRequest& other) const {
        return method_ == other.method_ && url_ == other.url_ &&
               headers_ == other.headers_ && body_ == other.body_;
    }
    bool operator!=(const HttpRequest& other) const { return !(*this == other); }

private:
    HttpMethod method_;
    std::string url_;
    std::map<std::string, std::string> headers_;
    std::string body_;
};

}  // namespace coro_request
