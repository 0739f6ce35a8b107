#pragma once

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace coro_request {

namespace detail {

// Hex size from a chunk-size line, extensions stripped
inline size_t parse_chunk_size(std::string size_line) {
    auto ext = size_line.find(';');
    if (ext != std::string::npos) {
        size_line.erase(ext);
    }

    try {
        return std::stoul(size_line, nullptr, 16);
    } catch (const std::logic_error&) {
        throw std::runtime_error("Malformed chunked body: bad chunk size '" + size_line + "'");
    }
}

}  // namespace detail

// Decode a body sent with Transfer-Encoding: chunked. Trailers are discarded.
inline std::string decode_chunked(const std::string& data) {
    std::string result;
    size_t pos = 0;

    while (pos < data.size()) {
        size_t line_end = data.find("\r\n", pos);
        if (line_end == std::string::npos) {
            throw std::runtime_error("Malformed chunked body: missing chunk size line");
        }

        size_t chunk_size = detail::parse_chunk_size(data.substr(pos, line_end - pos));

        pos = line_end + 2;
        if (chunk_size == 0) {
            break;
        }
        if (pos + chunk_size > data.size()) {
            throw std::runtime_error("Malformed chunked body: truncated chunk");
        }

        result.append(data, pos, chunk_size);
        pos += chunk_size + 2;
    }

    return result;
}

// Follows chunk boundaries of a body that is still arriving, so the reader knows
// when the last chunk and its trailer section are complete. Payload bytes are
// skipped by length and never inspected.
class ChunkedBodyTracker {
public:
    explicit ChunkedBodyTracker(size_t body_start) : pos_(body_start) {}

    // data is the whole buffer received so far; it only ever grows between calls
    bool complete(const std::string& data) {
        while (!done_) {
            if (pending_ > 0) {
                size_t step = std::min(pending_, data.size() - pos_);
                pos_ += step;
                pending_ -= step;
                if (pending_ > 0) {
                    return false;
                }
                continue;
            }

            size_t line_end = data.find("\r\n", pos_);
            if (line_end == std::string::npos) {
                return false;
            }

            if (in_trailers_) {
                // An empty line ends the trailer section
                done_ = line_end == pos_;
                pos_ = line_end + 2;
                continue;
            }

            size_t chunk_size = detail::parse_chunk_size(data.substr(pos_, line_end - pos_));
            pos_ = line_end + 2;
            if (chunk_size == 0) {
                in_trailers_ = true;
            } else {
                pending_ = chunk_size + 2;  // payload and its CRLF
            }
        }
        return true;
    }

private:
    size_t pos_;
    size_t pending_{0};
    bool in_trailers_{false};
    bool done_{false};
};

}  // namespace coro_request
