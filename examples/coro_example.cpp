#include <coro_request/coro_request.hpp>
#include <iostream>
#include <asio.hpp>

using namespace coro_request;

asio::awaitable<void> async_main(AsioRequestLoader& loader) {
    try {
        std::cout << "=== Coroutine HTTP GET ===" << "\n";
        auto get_resp = co_await response(loader, MutableRequest(HttpMethod::GET, "http://httpbin.org/get"));
        std::cout << "Status: " << get_resp.result().response.status_code() << "\n";
        std::cout << "Took: " << get_resp.metrics().duration().count() << "s\n";
        std::cout << "Body: " << get_resp.result().data.substr(0, 100) << "...\n\n";

        std::cout << "=== Coroutine HTTPS POST (JSON) ===" << "\n";
        MutableRequest post(HttpMethod::POST, "https://httpbin.org/post");
        post.set_parameter("name", "async_test").set_parameter("value", 456);
        auto post_resp = co_await response(loader, post);
        std::cout << "Status: " << post_resp.result().response.status_code() << "\n\n";

        std::cout << "=== Coroutine PUT (form) ===" << "\n";
        MutableRequest put(HttpMethod::PUT, "https://httpbin.org/put");
        put.set_parameter_encoding(ParameterEncoding::URL);
        put.set_parameter("updated", true);
        auto put_resp = co_await response(loader, put);
        std::cout << "Status: " << put_resp.result().response.status_code() << "\n\n";

        std::cout << "=== Coroutine DELETE ===" << "\n";
        auto del_resp = co_await response(loader, MutableRequest(HttpMethod::DEL, "https://httpbin.org/delete"));
        std::cout << "Status: " << del_resp.result().response.status_code() << "\n\n";

        std::cout << "=== Coroutine HEAD ===" << "\n";
        auto head_resp = co_await response(loader, MutableRequest(HttpMethod::HEAD, "https://httpbin.org/get"));
        std::cout << "Status: " << head_resp.result().response.status_code() << "\n\n";

        std::cout << "=== Native Request ===" << "\n";
        HttpRequest custom_req(HttpMethod::GET, "https://httpbin.org/headers");
        custom_req.add_header("X-Async-Header", "AsyncValue")
                  .add_header("User-Agent", "coro_request/1.0");
        auto custom_resp = co_await response(loader, NativeRequest(custom_req));
        std::cout << "Status: " << custom_resp.result().response.status_code() << "\n";
        std::cout << "Body: " << custom_resp.result().data.substr(0, 150) << "...\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
    }
}

int main() {
    asio::io_context io_ctx;
    AsioRequestLoader loader(io_ctx);
    asio::co_spawn(io_ctx, async_main(loader), asio::detached);
    io_ctx.run();
    return 0;
}
