#pragma once

#include "http_types.hpp"
#include <string>

namespace coro_request {

// Credential headers
class Auth {
public:
    // Authorization: Basic base64(username:password)
    static HttpHeader basic(const std::string& username, const std::string& password) {
        return HttpHeader::authorization_basic(username, password);
    }

    static HttpHeader bearer(const std::string& token) {
        return HttpHeader::authorization_bearer(token);
    }

    // API key under a custom header name
    static HttpHeader api_key(const std::string& key_value,
                              const std::string& header_name = "X-API-Key") {
        return {header_name, key_value};
    }
};

}  // namespace coro_request
