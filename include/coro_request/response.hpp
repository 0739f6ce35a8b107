#pragma once

#include "http_response.hpp"
#include <chrono>
#include <string>
#include <utility>

namespace coro_request {

// Timing of one execution: wall-clock start and elapsed seconds
class Metrics {
public:
    using Clock = std::chrono::system_clock;
    using Duration = std::chrono::duration<double>;

    Metrics(Clock::time_point start_date, Duration duration)
        : start_date_(start_date), duration_(duration) {}

    Clock::time_point start_date() const { return start_date_; }
    Duration duration() const { return duration_; }

    bool operator==(const Metrics& other) const {
        return start_date_ == other.start_date_ && duration_ == other.duration_;
    }
    bool operator!=(const Metrics& other) const { return !(*this == other); }

private:
    Clock::time_point start_date_;
    Duration duration_;
};

// Raw result of a loader: payload plus transport metadata
struct DataResponse {
    std::string data;
    HttpResponse response;

    bool operator==(const DataResponse& other) const {
        return data == other.data && response == other.response;
    }
    bool operator!=(const DataResponse& other) const { return !(*this == other); }
};

// Uploads report the same shape as a plain data request
using UploadResponse = DataResponse;

// Result of a download to disk: where the payload was written plus transport metadata
struct DownloadResponse {
    std::string path;
    HttpResponse response;

    bool operator==(const DownloadResponse& other) const {
        return path == other.path && response == other.response;
    }
    bool operator!=(const DownloadResponse& other) const { return !(*this == other); }
};

// Envelope produced once per execution. Modifiers derive new envelopes with the with_* helpers.
template <typename Request, typename Result = DataResponse>
class Response {
public:
    using request_type = Request;
    using result_type = Result;

    Response(Request request, Result result, Metrics metrics)
        : request_(std::move(request)), result_(std::move(result)), metrics_(metrics) {}

    const Request& request() const { return request_; }
    const Result& result() const { return result_; }
    const Metrics& metrics() const { return metrics_; }

    Response with_metrics(Metrics metrics) const& {
        return Response(request_, result_, metrics);
    }
    Response with_metrics(Metrics metrics) && {
        return Response(std::move(request_), std::move(result_), metrics);
    }

    Response with_result(Result result) const& {
        return Response(request_, std::move(result), metrics_);
    }
    Response with_result(Result result) && {
        return Response(std::move(request_), std::move(result), metrics_);
    }

    Response with_request(Request request) const& {
        return Response(std::move(request), result_, metrics_);
    }
    Response with_request(Request request) && {
        return Response(std::move(request), std::move(result_), metrics_);
    }

private:
    Request request_;
    Result result_;
    Metrics metrics_;
};

}  // namespace coro_request
