#pragma once

#include <stdexcept>
#include <string>

namespace coro_request {

// Raised by build() when a description cannot become a transport-ready request.
// Transport failures are never wrapped in this type.
class BuildError : public std::runtime_error {
public:
    enum class Kind {
        InvalidURL,
        EncodingFailure
    };

    BuildError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    static BuildError invalid_url(const std::string& url) {
        return BuildError(Kind::InvalidURL, "Invalid URL: '" + url + "'");
    }

    static BuildError encoding_failure(const std::string& reason) {
        return BuildError(Kind::EncodingFailure, "Parameter encoding failed: " + reason);
    }

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

}  // namespace coro_request
