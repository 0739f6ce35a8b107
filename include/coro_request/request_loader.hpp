#pragma once

#include "requestable.hpp"
#include "response.hpp"
#include <asio/awaitable.hpp>
#include <chrono>
#include <memory>
#include <type_traits>
#include <utility>

namespace coro_request {

// The execution primitive: performs the I/O for one request.
// The request must stay alive until the returned awaitable completes.
// Implementations must tolerate concurrent calls with distinct requests.
class RequestLoader {
public:
    virtual ~RequestLoader() = default;

    virtual asio::awaitable<DataResponse> data(const Requestable& request) = 0;
};

namespace detail {

template <typename Request>
const Requestable& as_requestable(const Request& request) {
    if constexpr (std::is_base_of_v<Requestable, Request>) {
        return request;
    } else {
        return *request;
    }
}

}  // namespace detail

// Run the loader once and wrap its result with timing metrics.
// Failures from data() propagate unchanged and produce no envelope.
// Request is a Requestable held by value, or a unique_ptr/shared_ptr to one.
template <typename Request>
asio::awaitable<Response<Request>> response(RequestLoader& loader, Request request) {
    auto start_date = Metrics::Clock::now();
    auto start = std::chrono::steady_clock::now();

    DataResponse result = co_await loader.data(detail::as_requestable(request));

    Metrics metrics(start_date, std::chrono::steady_clock::now() - start);
    co_return Response<Request>(std::move(request), std::move(result), metrics);
}

}  // namespace coro_request
