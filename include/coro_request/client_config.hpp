#pragma once

#include "http_types.hpp"
#include <chrono>
#include <string>

namespace coro_request {

// Per-description defaults used by MutableRequest
struct RequestConfig {
    std::string fallback_base_url{"http://localhost/"};  // used when no base URL is set
    ParameterEncoding encoding{ParameterEncoding::JSON};
};

// Settings for AsioRequestLoader
struct ClientConfig {
    std::chrono::milliseconds request_timeout{60000};  // connect + write + read

    bool enable_compression{true};  // advertise and decode gzip/deflate

    bool verify_ssl{false};
    std::string ca_cert_file;
    std::string ca_cert_path;
};

}  // namespace coro_request
