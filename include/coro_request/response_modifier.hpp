#pragma once

#include "response.hpp"
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace coro_request {

// Post-flight transformation of a response envelope. Returns a new envelope.
template <typename Request, typename Result = DataResponse>
class ResponseModifier {
public:
    using response_type = Response<Request, Result>;

    virtual ~ResponseModifier() = default;

    virtual response_type mutate(response_type response) const = 0;
};

template <typename Request, typename Result = DataResponse>
class FunctionModifier : public ResponseModifier<Request, Result> {
public:
    using response_type = Response<Request, Result>;
    using Transform = std::function<response_type(response_type)>;

    explicit FunctionModifier(Transform transform) : transform_(std::move(transform)) {}

    response_type mutate(response_type response) const override {
        return transform_(std::move(response));
    }

private:
    Transform transform_;
};

// Wraps any object with a (possibly templated) mutate() so it can sit in a ModifierChain
template <typename Request, typename Result, typename Modifier>
class ModifierAdapter : public ResponseModifier<Request, Result> {
public:
    using response_type = Response<Request, Result>;

    explicit ModifierAdapter(Modifier modifier) : modifier_(std::move(modifier)) {}

    response_type mutate(response_type response) const override {
        return modifier_.mutate(std::move(response));
    }

private:
    Modifier modifier_;
};

// Applies modifiers in the order they were added; an empty chain is the identity
template <typename Request, typename Result = DataResponse>
class ModifierChain {
public:
    using response_type = Response<Request, Result>;

    ModifierChain() = default;

    ModifierChain& add(std::shared_ptr<const ResponseModifier<Request, Result>> modifier) {
        modifiers_.push_back(std::move(modifier));
        return *this;
    }

    template <typename Modifier>
    ModifierChain& add_generic(Modifier modifier) {
        return add(std::make_shared<ModifierAdapter<Request, Result, Modifier>>(std::move(modifier)));
    }

    response_type apply(response_type response) const {
        for (const auto& modifier : modifiers_) {
            response = modifier->mutate(std::move(response));
        }
        return response;
    }

    size_t size() const { return modifiers_.size(); }
    bool empty() const { return modifiers_.empty(); }
    void clear() { modifiers_.clear(); }

private:
    std::vector<std::shared_ptr<const ResponseModifier<Request, Result>>> modifiers_;
};

// Static composition: modifier(s) applied left to right
template <typename ResponseT>
ResponseT apply_modifiers(ResponseT response) {
    return response;
}

template <typename ResponseT, typename Modifier, typename... Rest>
ResponseT apply_modifiers(ResponseT response, const Modifier& modifier, const Rest&... rest) {
    return apply_modifiers(modifier.mutate(std::move(response)), rest...);
}

namespace modifiers {

template <typename Request, typename Result = DataResponse>
std::shared_ptr<const ResponseModifier<Request, Result>> from_function(
    typename FunctionModifier<Request, Result>::Transform transform) {
    return std::make_shared<FunctionModifier<Request, Result>>(std::move(transform));
}

// Hands the raw result and metrics to a logger, for any request type
class LogResponse {
public:
    using Logger = std::function<void(const DataResponse&, const Metrics&)>;

    explicit LogResponse(Logger logger) : logger_(std::move(logger)) {}

    template <typename Request>
    Response<Request, DataResponse> mutate(Response<Request, DataResponse> response) const {
        logger_(response.result(), response.metrics());
        return response;
    }

private:
    Logger logger_;
};

// Turns 4xx/5xx responses into std::runtime_error
class ThrowOnError {
public:
    template <typename Request>
    Response<Request, DataResponse> mutate(Response<Request, DataResponse> response) const {
        const auto& meta = response.result().response;
        if (meta.status_code() >= 400) {
            throw std::runtime_error("HTTP Error " + std::to_string(meta.status_code()) +
                                     ": " + meta.reason());
        }
        return response;
    }
};

inline LogResponse log_response(LogResponse::Logger logger) {
    return LogResponse(std::move(logger));
}

inline ThrowOnError throw_on_error() {
    return ThrowOnError{};
}

}  // namespace modifiers

}  // namespace coro_request
