#pragma once

#include <json11.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace coro_request {

// Unencoded request payload: string keys to arbitrary JSON-like values
using Parameters = json11::Json::object;
using ParameterValue = json11::Json;

// A file to upload as part of a multipart body. Immutable once constructed.
class File {
public:
    explicit File(std::string data,
         std::optional<std::string> filename = std::nullopt,
         std::optional<std::string> mimetype = std::nullopt,
         std::optional<Parameters> metadata = std::nullopt)
        : data_(std::move(data)),
          filename_(std::move(filename)),
          mimetype_(std::move(mimetype)),
          metadata_(std::move(metadata)) {}

    const std::string& data() const { return data_; }
    const std::optional<std::string>& filename() const { return filename_; }
    const std::optional<std::string>& mimetype() const { return mimetype_; }

    // Extra form fields sent alongside the file
    const std::optional<Parameters>& metadata() const { return metadata_; }

private:
    std::string data_;
    std::optional<std::string> filename_;
    std::optional<std::string> mimetype_;
    std::optional<Parameters> metadata_;
};

// Multipart field name paired with the file sent under it
using FileParameter = std::pair<std::string, File>;
using Files = std::vector<FileParameter>;

}  // namespace coro_request
