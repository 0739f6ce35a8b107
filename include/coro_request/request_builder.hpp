#pragma once

#include "auth.hpp"
#include "http_types.hpp"
#include "requestable.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace coro_request {

// Pre-flight transformation of a mutable description.
// Implementations must leave the input untouched and return a changed copy.
class RequestBuilder {
public:
    virtual ~RequestBuilder() = default;

    virtual std::unique_ptr<MutableRequestable> mutate(const MutableRequestable& request) const = 0;
};

// Builder from a callable that edits a private copy of the request
class FunctionBuilder : public RequestBuilder {
public:
    using Mutation = std::function<void(MutableRequestable&)>;

    explicit FunctionBuilder(Mutation mutation) : mutation_(std::move(mutation)) {}

    std::unique_ptr<MutableRequestable> mutate(const MutableRequestable& request) const override {
        auto copy = request.clone();
        mutation_(*copy);
        return copy;
    }

private:
    Mutation mutation_;
};

// Applies builders in the order they were added
class BuilderChain {
public:
    BuilderChain() = default;

    BuilderChain& add(std::shared_ptr<const RequestBuilder> builder) {
        builders_.push_back(std::move(builder));
        return *this;
    }

    // An empty chain yields an unchanged copy
    std::unique_ptr<MutableRequestable> apply(const MutableRequestable& initial) const {
        auto current = initial.clone();
        for (const auto& builder : builders_) {
            current = builder->mutate(*current);
        }
        return current;
    }

    size_t size() const { return builders_.size(); }
    bool empty() const { return builders_.empty(); }
    void clear() { builders_.clear(); }

private:
    std::vector<std::shared_ptr<const RequestBuilder>> builders_;
};

namespace builders {

inline std::shared_ptr<const RequestBuilder> from_function(FunctionBuilder::Mutation mutation) {
    return std::make_shared<FunctionBuilder>(std::move(mutation));
}

// Set a header, replacing any existing value for the same key
inline std::shared_ptr<const RequestBuilder> header(const HttpHeader& header) {
    return from_function([header](MutableRequestable& req) {
        auto headers = req.headers();
        replace_header(headers, header);
        req.set_headers(std::move(headers));
    });
}

// Insert a header alongside any existing values for the key
inline std::shared_ptr<const RequestBuilder> add_header(const HttpHeader& header) {
    return from_function([header](MutableRequestable& req) {
        auto headers = req.headers();
        headers.insert(header);
        req.set_headers(std::move(headers));
    });
}

inline std::shared_ptr<const RequestBuilder> user_agent(const std::string& ua) {
    return header(HttpHeader::user_agent(ua));
}

inline std::shared_ptr<const RequestBuilder> authorization(const std::string& value) {
    return header(HttpHeader::authorization(value));
}

inline std::shared_ptr<const RequestBuilder> bearer_token(const std::string& token) {
    return header(Auth::bearer(token));
}

inline std::shared_ptr<const RequestBuilder> basic_auth(const std::string& username,
                                                        const std::string& password) {
    return header(Auth::basic(username, password));
}

inline std::shared_ptr<const RequestBuilder> api_key(const std::string& key_value,
                                                     const std::string& header_name = "X-API-Key") {
    return header(Auth::api_key(key_value, header_name));
}

inline std::shared_ptr<const RequestBuilder> base_url(const std::string& url) {
    return from_function([url](MutableRequestable& req) {
        req.set_base_url(url);
    });
}

// Hand each request to a logger; the request passes through unchanged
inline std::shared_ptr<const RequestBuilder> log_request(
    std::function<void(const MutableRequestable&)> logger) {
    return from_function([logger = std::move(logger)](MutableRequestable& req) {
        logger(req);
    });
}

}  // namespace builders

}  // namespace coro_request
