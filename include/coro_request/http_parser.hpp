#pragma once

#include "chunked_decoder.hpp"
#include "compression.hpp"
#include "http_request.hpp"
#include "http_response.hpp"
#include "url_parser.hpp"
#include <sstream>
#include <stdexcept>
#include <string>

namespace coro_request {

inline std::string trim(const std::string& value) {
    auto first = value.find_first_not_of(" \t");
    if (first == std::string::npos) return "";
    auto last = value.find_last_not_of(" \t");
    return value.substr(first, last - first + 1);
}

// Parse a complete HTTP/1.x response: status line, headers, then the body with
// transfer coding removed and, if requested, content coding undone.
inline HttpResponse parse_response(const std::string& response_data, bool decode_content = true) {
    auto header_end = response_data.find("\r\n\r\n");
    if (header_end == std::string::npos) {
        throw std::runtime_error("Incomplete HTTP response header");
    }

    HttpResponse response;
    std::istringstream stream(response_data.substr(0, header_end + 2));
    std::string line;

    if (!std::getline(stream, line) || line.compare(0, 5, "HTTP/") != 0) {
        throw std::runtime_error("Malformed HTTP status line");
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();

    std::istringstream status_line(line);
    std::string http_version;
    int status_code = 0;
    std::string reason;

    if (!(status_line >> http_version >> status_code)) {
        throw std::runtime_error("Malformed HTTP status line: " + line);
    }
    std::getline(status_line, reason);
    response.set_status_code(status_code);
    response.set_reason(trim(reason));

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        auto colon_pos = line.find(':');
        if (colon_pos != std::string::npos) {
            response.add_header(trim(line.substr(0, colon_pos)), trim(line.substr(colon_pos + 1)));
        }
    }

    std::string body = response_data.substr(header_end + 4);

    if (to_lower(response.get_header("Transfer-Encoding")).find("chunked") != std::string::npos) {
        body = decode_chunked(body);
    }

    if (decode_content) {
        std::string content_encoding = to_lower(response.get_header("Content-Encoding"));
        if (content_encoding == "gzip") {
            body = decompress_gzip(body);
        } else if (content_encoding == "deflate") {
            body = decompress_deflate(body);
        }
    }

    response.set_body(std::move(body));
    return response;
}

// Serialize a request for the wire. The connection is always closed after one exchange.
inline std::string build_request(const HttpRequest& request, const UrlInfo& url_info, bool enable_compression = true) {
    std::ostringstream req;

    req << request.method().raw_value() << " " << url_info.path << " HTTP/1.1\r\n";

    bool has_host = false;
    bool has_accept_encoding = false;
    for (const auto& [key, value] : request.headers()) {
        if (iequals(key, "Host")) has_host = true;
        if (iequals(key, "Accept-Encoding")) has_accept_encoding = true;
    }

    if (!has_host) {
        req << "Host: " << url_info.host;
        if (url_info.port != default_port(url_info.scheme)) {
            req << ":" << url_info.port;
        }
        req << "\r\n";
    }

    for (const auto& [key, value] : request.headers()) {
        if (iequals(key, "Content-Length") || iequals(key, "Connection")) continue;
        req << key << ": " << value << "\r\n";
    }

    if (enable_compression && !has_accept_encoding) {
        req << "Accept-Encoding: gzip, deflate\r\n";
    }

    if (!request.body().empty()) {
        req << "Content-Length: " << request.body().size() << "\r\n";
    }

    req << "Connection: close\r\n";
    req << "\r\n";
    req << request.body();

    return req.str();
}

}  // namespace coro_request
