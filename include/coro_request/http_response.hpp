#pragma once

#include "http_types.hpp"
#include <string>
#include <utility>
#include <vector>

namespace coro_request {

// Transport-level response metadata as read off the wire
class HttpResponse {
public:
    HttpResponse() = default;

    void set_status_code(int status_code) { status_code_ = status_code; }
    void set_reason(const std::string& reason) { reason_ = reason; }
    void set_url(const std::string& url) { url_ = url; }
    void set_body(std::string body) { body_ = std::move(body); }

    // Repeated header lines are all kept, in arrival order
    void add_header(const std::string& key, const std::string& value) {
        headers_.emplace_back(key, value);
    }

    int status_code() const { return status_code_; }
    const std::string& reason() const { return reason_; }
    const std::string& url() const { return url_; }
    const std::string& body() const { return body_; }
    const std::vector<std::pair<std::string, std::string>>& headers() const { return headers_; }

    // First value for the key (case-insensitive), empty if absent
    std::string get_header(const std::string& key) const {
        for (const auto& [k, v] : headers_) {
            if (iequals(k, key)) {
                return v;
            }
        }
        return "";
    }

    std::string take_body() {
        return std::exchange(body_, std::string());
    }

    bool operator==(const HttpResponse& other) const {
        return status_code_ == other.status_code_ && reason_ == other.reason_ &&
               url_ == other.url_ && headers_ == other.headers_ && body_ == other.body_;
    }
    bool operator!=(const HttpResponse& other) const { return !(*this == other); }

private:
    int status_code_{0};
    std::string reason_;
    std::string url_;
    std::vector<std::pair<std::string, std::string>> headers_;
    std::string body_;
};

}  // namespace coro_request
