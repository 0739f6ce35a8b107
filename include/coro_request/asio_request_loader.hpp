#pragma once

#include "client_config.hpp"
#include "http_parser.hpp"
#include "http_request.hpp"
#include "http_response.hpp"
#include "request_loader.hpp"
#include "url_parser.hpp"
#include <asio.hpp>
#include <asio/ssl.hpp>
#include <asio/experimental/awaitable_operators.hpp>
#include <array>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <variant>

namespace coro_request {

// RequestLoader over plain TCP or TLS sockets, one connection per request.
// Each call builds the description, performs a single HTTP/1.1 exchange and
// returns the decoded body with the response metadata. No retries, no pooling.
class AsioRequestLoader : public RequestLoader {
public:
    explicit AsioRequestLoader(asio::io_context& io_context)
        : AsioRequestLoader(io_context, ClientConfig{}) {}

    AsioRequestLoader(asio::io_context& io_context, const ClientConfig& config)
        : io_context_(io_context),
          ssl_context_(asio::ssl::context::tlsv12_client),
          config_(config) {
        ssl_context_.set_default_verify_paths();

        if (config_.verify_ssl) {
            ssl_context_.set_verify_mode(asio::ssl::verify_peer);
            if (!config_.ca_cert_file.empty()) {
                ssl_context_.load_verify_file(config_.ca_cert_file);
            }
            if (!config_.ca_cert_path.empty()) {
                ssl_context_.add_verify_path(config_.ca_cert_path);
            }
        } else {
            ssl_context_.set_verify_mode(asio::ssl::verify_none);
        }
    }

    asio::awaitable<DataResponse> data(const Requestable& request) override {
        using namespace asio::experimental::awaitable_operators;

        HttpRequest http_request = request.build();
        UrlInfo url_info = parse_url(http_request.url());
        if (url_info.scheme != "http" && url_info.scheme != "https") {
            throw std::runtime_error("Unsupported URL scheme: " + url_info.scheme);
        }

        asio::steady_timer deadline(io_context_, config_.request_timeout);
        auto outcome = co_await (co_try_fetch(http_request, url_info) ||
                                 deadline.async_wait(asio::use_awaitable));
        if (outcome.index() == 1) {
            throw std::system_error(asio::error::make_error_code(asio::error::timed_out));
        }

        auto fetched = std::get<0>(std::move(outcome));
        if (auto* error = std::get_if<std::exception_ptr>(&fetched)) {
            std::rethrow_exception(*error);
        }

        HttpResponse response = std::get<HttpResponse>(std::move(fetched));
        response.set_url(http_request.url());
        std::string body = response.take_body();
        co_return DataResponse{std::move(body), std::move(response)};
    }

    const ClientConfig& get_config() const {
        return config_;
    }

private:
    // A failed exchange completes with its exception so the deadline race ends at once
    asio::awaitable<std::variant<HttpResponse, std::exception_ptr>> co_try_fetch(
        const HttpRequest& request, const UrlInfo& url_info) {
        try {
            co_return co_await co_fetch(request, url_info);
        } catch (...) {
            co_return std::current_exception();
        }
    }

    asio::awaitable<HttpResponse> co_fetch(const HttpRequest& request, const UrlInfo& url_info) {
        std::string request_str = build_request(request, url_info, config_.enable_compression);

        asio::ip::tcp::resolver resolver(io_context_);
        auto endpoints = co_await resolver.async_resolve(
            url_info.host, url_info.port, asio::use_awaitable);

        std::string response_data;
        if (url_info.is_https) {
            asio::ssl::stream<asio::ip::tcp::socket> ssl_socket(io_context_, ssl_context_);
            co_await asio::async_connect(ssl_socket.next_layer(), endpoints, asio::use_awaitable);

            if (!SSL_set_tlsext_host_name(ssl_socket.native_handle(), url_info.host.c_str())) {
                throw std::system_error(
                    asio::error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()));
            }
            if (config_.verify_ssl) {
                ssl_socket.set_verify_callback(asio::ssl::host_name_verification(url_info.host));
            }

            co_await ssl_socket.async_handshake(asio::ssl::stream_base::client, asio::use_awaitable);
            co_await asio::async_write(ssl_socket, asio::buffer(request_str), asio::use_awaitable);
            response_data = co_await co_read_response(ssl_socket, request.method());
        } else {
            asio::ip::tcp::socket socket(io_context_);
            co_await asio::async_connect(socket, endpoints, asio::use_awaitable);
            co_await asio::async_write(socket, asio::buffer(request_str), asio::use_awaitable);
            response_data = co_await co_read_response(socket, request.method());
        }

        co_return parse_response(response_data, config_.enable_compression);
    }

    // Read until Content-Length is satisfied, the last chunk arrives, or the peer closes
    template <typename AsyncReadStream>
    asio::awaitable<std::string> co_read_response(AsyncReadStream& stream, const HttpMethod& request_method) {
        std::string response_data;
        std::array<char, 8192> buffer;

        bool headers_complete = false;
        size_t headers_end_pos = 0;
        std::optional<ChunkedBodyTracker> chunks;
        std::optional<size_t> content_length;

        while (true) {
            auto [ec, len] = co_await stream.async_read_some(
                asio::buffer(buffer),
                asio::as_tuple(asio::use_awaitable)
            );
            response_data.append(buffer.data(), len);

            if (!headers_complete) {
                size_t header_end = response_data.find("\r\n\r\n");
                if (header_end != std::string::npos) {
                    headers_complete = true;
                    headers_end_pos = header_end + 4;

                    HttpResponse head = parse_response(response_data.substr(0, headers_end_pos), false);
                    bool is_chunked = to_lower(head.get_header("Transfer-Encoding")).find("chunked") != std::string::npos;
                    if (is_chunked) {
                        chunks.emplace(headers_end_pos);
                    }

                    std::string length = head.get_header("Content-Length");
                    if (!is_chunked && !length.empty()) {
                        try {
                            content_length = std::stoull(length);
                        } catch (const std::logic_error&) {
                            throw std::runtime_error("Invalid Content-Length: " + length);
                        }
                    }

                    // No body for HEAD, 1xx, 204 and 304
                    int status = head.status_code();
                    if (request_method == HttpMethod::HEAD || status / 100 == 1 ||
                        status == 204 || status == 304) {
                        break;
                    }
                }
            }

            if (headers_complete) {
                size_t body_size = response_data.size() - headers_end_pos;
                if (chunks && chunks->complete(response_data)) {
                    break;
                }
                if (content_length && body_size >= *content_length) {
                    break;
                }
            }

            if (ec == asio::error::eof || ec == asio::ssl::error::stream_truncated) {
                break;
            } else if (ec) {
                throw std::system_error(ec);
            }
        }

        if (!headers_complete) {
            throw std::runtime_error("Connection closed before the response header was complete");
        }

        co_return response_data;
    }

    asio::io_context& io_context_;
    asio::ssl::context ssl_context_;
    ClientConfig config_;
};

}  // namespace coro_request
