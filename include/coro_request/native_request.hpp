#pragma once

#include "http_request.hpp"
#include "parameter_encoder.hpp"
#include "requestable.hpp"
#include <stdexcept>
#include <utility>

namespace coro_request {

// Lets an already-resolved HttpRequest travel through the pipeline as a Requestable.
// Building it is the identity.
class NativeRequest : public Requestable {
public:
    explicit NativeRequest(HttpRequest request) : request_(std::move(request)) {}

    Headers headers() const override {
        Headers headers;
        for (const auto& [key, value] : request_.headers()) {
            headers.emplace(key, value);
        }
        return headers;
    }

    HttpMethod method() const override {
        return request_.method();
    }

    // Body decoded as a JSON object; empty when there is no body or it is not one
    Parameters parameters() const override {
        if (request_.body().empty()) {
            return {};
        }
        try {
            return decode_json(request_.body());
        } catch (const std::runtime_error&) {
            return {};
        }
    }

    HttpRequest build() const override {
        return request_;
    }

    const HttpRequest& request() const { return request_; }

    bool operator==(const NativeRequest& other) const { return request_ == other.request_; }
    bool operator!=(const NativeRequest& other) const { return !(*this == other); }

private:
    HttpRequest request_;
};

}  // namespace coro_request
