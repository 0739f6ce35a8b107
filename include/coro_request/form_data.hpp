#pragma once

#include "parameters.hpp"
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace coro_request {

// Percent-encode everything except RFC 3986 unreserved characters
inline std::string url_encode(const std::string& value) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex << std::uppercase;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << int(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

inline std::string url_decode(const std::string& value) {
    std::string result;
    result.reserve(value.size());

    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            result.push_back(' ');
        } else if (c == '%') {
            if (i + 2 >= value.size() ||
                !std::isxdigit(static_cast<unsigned char>(value[i + 1])) ||
                !std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
                throw std::invalid_argument("Malformed percent escape in '" + value + "'");
            }
            result.push_back(static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else {
            result.push_back(c);
        }
    }

    return result;
}

// Field list for application/x-www-form-urlencoded bodies.
// Nested objects flatten to key[sub], arrays to repeated key[] entries.
class FormData {
public:
    FormData() = default;

    static FormData from_parameters(const Parameters& parameters) {
        FormData form;
        for (const auto& [key, value] : parameters) {
            form.append(key, value);
        }
        return form;
    }

    // Parse an encoded body. Values come back as strings; the last duplicate key wins.
    static Parameters decode(const std::string& body) {
        Parameters parameters;
        std::istringstream stream(body);
        std::string pair;

        while (std::getline(stream, pair, '&')) {
            if (pair.empty()) continue;
            auto eq_pos = pair.find('=');
            std::string key = url_decode(pair.substr(0, eq_pos));
            std::string value = eq_pos != std::string::npos ? url_decode(pair.substr(eq_pos + 1)) : "";
            parameters[key] = value;
        }

        return parameters;
    }

    FormData& add(const std::string& key, const std::string& value) {
        fields_.emplace_back(key, value);
        return *this;
    }

    std::string encode() const {
        std::ostringstream result;
        bool first = true;

        for (const auto& [key, value] : fields_) {
            if (!first) {
                result << '&';
            }
            result << url_encode(key) << '=' << url_encode(value);
            first = false;
        }

        return result.str();
    }

    static const std::string& content_type() {
        static const std::string type = "application/x-www-form-urlencoded";
        return type;
    }

    const std::vector<std::pair<std::string, std::string>>& fields() const {
        return fields_;
    }

    bool empty() const {
        return fields_.empty();
    }

private:
    void append(const std::string& key, const ParameterValue& value) {
        switch (value.type()) {
            case json11::Json::OBJECT:
                for (const auto& [sub_key, sub_value] : value.object_items()) {
                    append(key + "[" + sub_key + "]", sub_value);
                }
                break;
            case json11::Json::ARRAY:
                for (const auto& item : value.array_items()) {
                    append(key + "[]", item);
                }
                break;
            case json11::Json::BOOL:
                add(key, value.bool_value() ? "true" : "false");
                break;
            case json11::Json::NUMBER:
                if (!std::isfinite(value.number_value())) {
                    throw std::invalid_argument("Non-finite number for form field '" + key + "'");
                }
                add(key, value.dump());
                break;
            case json11::Json::STRING:
                add(key, value.string_value());
                break;
            case json11::Json::NUL:
                add(key, "");
                break;
        }
    }

    std::vector<std::pair<std::string, std::string>> fields_;
};

}  // namespace coro_request
