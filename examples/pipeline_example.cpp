#include <coro_request/coro_request.hpp>
#include <iostream>
#include <asio.hpp>

using namespace coro_request;

asio::awaitable<void> async_main(AsioRequestLoader& loader) {
    // Pre-flight: every request gets auth, a user agent and a log line
    BuilderChain request_chain;
    request_chain.add(builders::base_url("https://httpbin.org/anything"))
                 .add(builders::basic_auth("user", "passwd"))
                 .add(builders::user_agent("coro_request-pipeline/1.0"))
                 .add(builders::log_request([](const MutableRequestable& req) {
                     std::cout << "[Request] " << raw_method(req) << " "
                               << req.base_url().value_or("<fallback>") << std::endl;
                 }));

    // Post-flight: log timing, then turn HTTP errors into exceptions
    ModifierChain<std::unique_ptr<MutableRequestable>> response_chain;
    response_chain.add_generic(modifiers::log_response([](const DataResponse& result, const Metrics& metrics) {
                      std::cout << "[Response] " << result.response.status_code()
                                << " in " << metrics.duration().count() << "s" << std::endl;
                  }))
                  .add_generic(modifiers::throw_on_error());

    try {
        MutableRequest request(HttpMethod::POST, "http://localhost/");
        request.set_parameter("message", "Hello World!")
               .set_parameter("tags", json11::Json::array{"a", "b"});

        auto envelope = response_chain.apply(co_await response(loader, request_chain.apply(request)));
        std::cout << "Body: " << envelope.result().data.substr(0, 200) << "...\n\n";
    } catch (const BuildError& e) {
        std::cerr << "Build error: " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
    }

    try {
        BuilderChain failing;
        failing.add(builders::base_url("https://httpbin.org/status/404"));
        response_chain.apply(co_await response(loader, failing.apply(MutableRequest())));
    } catch (const std::exception& e) {
        std::cerr << "Expected failure: " << e.what() << "\n";
    }
}

int main() {
    asio::io_context io_ctx;
    ClientConfig config;
    config.request_timeout = std::chrono::seconds(10);
    AsioRequestLoader loader(io_ctx, config);
    asio::co_spawn(io_ctx, async_main(loader), asio::detached);
    io_ctx.run();
    return 0;
}
