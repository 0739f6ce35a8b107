#pragma once

#include "errors.hpp"
#include "form_data.hpp"
#include "http_types.hpp"
#include "parameters.hpp"
#include <cmath>
#include <functional>
#include <stdexcept>
#include <string>

namespace coro_request {

// Serializes a parameter map into a request body. May throw.
using ParameterEncoder = std::function<std::string(const Parameters&)>;

namespace detail {

inline void require_finite_numbers(const ParameterValue& value) {
    if (value.is_number() && !std::isfinite(value.number_value())) {
        throw std::invalid_argument("JSON cannot represent non-finite numbers");
    }
    if (value.is_array()) {
        for (const auto& item : value.array_items()) {
            require_finite_numbers(item);
        }
    } else if (value.is_object()) {
        for (const auto& [key, item] : value.object_items()) {
            require_finite_numbers(item);
        }
    }
}

}  // namespace detail

inline std::string encode_json(const Parameters& parameters) {
    ParameterValue document(parameters);
    detail::require_finite_numbers(document);
    return document.dump();
}

// Parse a JSON body whose top level is an object
inline Parameters decode_json(const std::string& body) {
    std::string err;
    auto document = json11::Json::parse(body, err);
    if (!err.empty()) {
        throw std::runtime_error("Invalid JSON: " + err);
    }
    if (!document.is_object()) {
        throw std::runtime_error("JSON document is not an object");
    }
    return document.object_items();
}

inline std::string encode_form(const Parameters& parameters) {
    return FormData::from_parameters(parameters).encode();
}

inline Parameters decode_form(const std::string& body) {
    return FormData::decode(body);
}

// Built-in encoder for an encoding strategy
inline ParameterEncoder encoder_for(const ParameterEncoding& encoding) {
    if (encoding == ParameterEncoding::JSON) {
        return encode_json;
    }
    if (encoding == ParameterEncoding::URL) {
        return encode_form;
    }
    throw BuildError::encoding_failure("no encoder registered for '" + encoding.raw_value() + "'");
}

}  // namespace coro_request
