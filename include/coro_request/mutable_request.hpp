#pragma once

#include "client_config.hpp"
#include "errors.hpp"
#include "http_request.hpp"
#include "parameter_encoder.hpp"
#include "requestable.hpp"
#include "url_parser.hpp"
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace coro_request {

// The standard mutable description.
//
// build() resolves the target from base_url() (or the configured fallback),
// flattens headers onto the request in Headers order so that the last entry
// for a repeated key wins, and encodes non-empty parameters as the body.
class MutableRequest : public MutableRequestable {
public:
    MutableRequest() : MutableRequest(RequestConfig{}) {}

    explicit MutableRequest(RequestConfig config)
        : config_(std::move(config)), encoding_(config_.encoding) {}

    MutableRequest(HttpMethod method, std::string base_url, RequestConfig config = RequestConfig{})
        : config_(std::move(config)),
          base_url_(std::move(base_url)),
          method_(std::move(method)),
          encoding_(config_.encoding) {}

    Headers headers() const override { return headers_; }
    HttpMethod method() const override { return method_; }
    Parameters parameters() const override { return parameters_; }
    ParameterEncoding parameter_encoding() const override { return encoding_; }
    const std::optional<std::string>& base_url() const override { return base_url_; }

    void set_base_url(std::optional<std::string> base_url) override {
        base_url_ = std::move(base_url);
    }

    void set_headers(Headers headers) override {
        headers_ = std::move(headers);
    }

    void set_method(HttpMethod method) override {
        method_ = std::move(method);
    }

    void set_parameters(Parameters parameters) override {
        parameters_ = std::move(parameters);
    }

    // Switches to the built-in encoder of the new encoding
    void set_parameter_encoding(ParameterEncoding encoding) override {
        encoding_ = std::move(encoding);
        encoder_ = nullptr;
    }

    // Use a caller-supplied encoder, e.g. for a multipart or custom body format
    void set_parameter_encoder(ParameterEncoding encoding, ParameterEncoder encoder) {
        encoding_ = std::move(encoding);
        encoder_ = std::move(encoder);
    }

    MutableRequest& add_header(const HttpHeader& header) {
        headers_.insert(header);
        return *this;
    }

    MutableRequest& set_parameter(const std::string& key, ParameterValue value) {
        parameters_[key] = std::move(value);
        return *this;
    }

    HttpRequest build() const override {
        const std::string& url = base_url_ ? *base_url_ : config_.fallback_base_url;
        parse_url(url);

        HttpRequest request(method_, url);
        for (const auto& header : headers_) {
            request.add_header(header.key, header.value);
        }

        if (!parameters_.empty()) {
            std::string body = encode_parameters();
            if (!body.empty() && !contains_header_key(headers_, "Content-Type")) {
                request.add_header("Content-Type", encoding_.raw_value());
            }
            request.set_body(body);
        }

        return request;
    }

    std::unique_ptr<MutableRequestable> clone() const override {
        return std::make_unique<MutableRequest>(*this);
    }

    bool operator==(const MutableRequest& other) const {
        return base_url_ == other.base_url_ && headers_ == other.headers_ &&
               method_ == other.method_ && parameters_ == other.parameters_ &&
               encoding_ == other.encoding_;
    }
    bool operator!=(const MutableRequest& other) const { return !(*this == other); }

private:
    std::string encode_parameters() const {
        ParameterEncoder encoder = encoder_ ? encoder_ : encoder_for(encoding_);
        try {
            return encoder(parameters_);
        } catch (const BuildError&) {
            throw;
        } catch (const std::exception& e) {
            throw BuildError::encoding_failure(e.what());
        } catch (...) {
            throw BuildError::encoding_failure("unknown error");
        }
    }

    RequestConfig config_;
    std::optional<std::string> base_url_;
    Headers headers_;
    HttpMethod method_;
    Parameters parameters_;
    ParameterEncoding encoding_;
    ParameterEncoder encoder_;
};

}  // namespace coro_request
