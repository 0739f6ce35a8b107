#pragma once

#include "http_request.hpp"
#include "http_types.hpp"
#include "parameters.hpp"
#include <memory>
#include <optional>
#include <string>

namespace coro_request {

// Declarative description of a request before it is sent.
class Requestable {
public:
    virtual ~Requestable() = default;

    virtual Headers headers() const = 0;
    virtual HttpMethod method() const = 0;
    virtual Parameters parameters() const = 0;

    virtual ParameterEncoding parameter_encoding() const {
        return ParameterEncoding::JSON;
    }

    // Resolve into a transport-ready request. Throws BuildError; never returns a partial request.
    virtual HttpRequest build() const = 0;
};

// A description whose fields, including the base URL, can be rewritten by request builders.
class MutableRequestable : public Requestable {
public:
    virtual const std::optional<std::string>& base_url() const = 0;
    virtual void set_base_url(std::optional<std::string> base_url) = 0;
    virtual void set_headers(Headers headers) = 0;
    virtual void set_method(HttpMethod method) = 0;
    virtual void set_parameters(Parameters parameters) = 0;
    virtual void set_parameter_encoding(ParameterEncoding encoding) = 0;

    virtual std::unique_ptr<MutableRequestable> clone() const = 0;
};

// True if a Content-Type header announces multipart/form-data (both compared case-insensitively)
inline bool is_multipart_request(const Requestable& request) {
    for (const auto& header : request.headers()) {
        if (iequals(header.key, "Content-Type") &&
            to_lower(header.value).find("multipart/form-data") != std::string::npos) {
            return true;
        }
    }
    return false;
}

inline std::string raw_method(const Requestable& request) {
    return request.method().raw_value();
}

}  // namespace coro_request
