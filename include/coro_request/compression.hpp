#pragma once

#include <zlib.h>
#include <stdexcept>
#include <string>

namespace coro_request {

namespace detail {

inline std::string inflate_with(const std::string& input, int window_bits) {
    z_stream stream{};
    if (inflateInit2(&stream, window_bits) != Z_OK) {
        throw std::runtime_error("inflateInit2 failed");
    }

    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());

    std::string output;
    char buffer[16384];
    int ret = Z_OK;

    while (ret != Z_STREAM_END) {
        stream.next_out = reinterpret_cast<Bytef*>(buffer);
        stream.avail_out = sizeof(buffer);

        ret = inflate(&stream, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            std::string message = stream.msg ? stream.msg : "inflate failed";
            inflateEnd(&stream);
            throw std::runtime_error("Decompression error: " + message);
        }

        output.append(buffer, sizeof(buffer) - stream.avail_out);

        if (ret == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
            // Truncated input
            inflateEnd(&stream);
            throw std::runtime_error("Decompression error: unexpected end of stream");
        }
    }

    inflateEnd(&stream);
    return output;
}

}  // namespace detail

inline std::string decompress_gzip(const std::string& input) {
    return detail::inflate_with(input, 16 + MAX_WBITS);
}

// "deflate" content coding is zlib-wrapped in theory; some servers send raw deflate
inline std::string decompress_deflate(const std::string& input) {
    try {
        return detail::inflate_with(input, MAX_WBITS);
    } catch (const std::runtime_error&) {
        return detail::inflate_with(input, -MAX_WBITS);
    }
}

}  // namespace coro_request
