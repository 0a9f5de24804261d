#pragma once

#include <authfetch/core/types.h>
#include <authfetch/http/http_transport.h>
#include <authfetch/http/request_executor.h>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace authfetch::test {

inline http::HttpResponse makeResponse(long status, std::string body = {},
                                       std::vector<http::Header> headers = {}) {
    http::HttpResponse r;
    r.status = status;
    r.body = std::move(body);
    r.headers = std::move(headers);
    return r;
}

inline http::HttpResponse makeRedirect(long status, std::string location,
                                       std::vector<http::Header> extra = {}) {
    extra.push_back(http::Header{"Location", std::move(location)});
    return makeResponse(status, {}, std::move(extra));
}

/**
 * Scripted IHttpTransport. Each send() records the request as it would go on the wire
 * and consumes the next scripted step; when the script is empty the handler (if any)
 * answers. 2xx bodies are pushed through the sink the way the curl transport streams them.
 */
class FakeHttpTransport : public http::IHttpTransport {
public:
    using Handler = std::function<Result<http::HttpResponse>(const http::HttpRequest&)>;

    void enqueueResponse(http::HttpResponse response) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(Step{Result<http::HttpResponse>(std::move(response)), std::nullopt});
    }

    void enqueueResponse(long status, std::string body = {},
                         std::vector<http::Header> headers = {}) {
        enqueueResponse(makeResponse(status, std::move(body), std::move(headers)));
    }

    void enqueueError(ErrorCode code, std::string message) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(Step{Result<http::HttpResponse>(Error{code, std::move(message)}),
                               std::nullopt});
    }

    // Streams partialBody into the sink, then fails the transfer with the given error.
    void enqueuePartialThenError(std::string partialBody, ErrorCode code, std::string message) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(Step{Result<http::HttpResponse>(Error{code, std::move(message)}),
                               std::move(partialBody)});
    }

    void setHandler(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    Result<http::HttpResponse> send(const http::HttpRequest& request,
                                    const http::TransportOptions& options,
                                    const http::BodySink& sink, std::stop_token stop) override {
        std::optional<Step> step;
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            lastOptions_ = options;
            if (!script_.empty()) {
                step.emplace(std::move(script_.front()));
                script_.pop_front();
            } else {
                handler = handler_;
            }
        }
        if (stop.stop_requested())
            return Error{ErrorCode::OperationCancelled, "cancelled"};

        if (!step) {
            if (!handler)
                return Error{ErrorCode::NetworkError, "no scripted response for " + request.url};
            step.emplace(Step{handler(request), std::nullopt});
        }

        if (step->partialBody && sink) {
            auto w = sink(asBytes(*step->partialBody));
            if (!w)
                return w.error();
        }
        if (!step->result)
            return step->result.error();

        auto response = std::move(step->result).value();
        if (response.ok() && sink && !response.body.empty()) {
            auto w = sink(asBytes(response.body));
            if (!w)
                return w.error();
            response.streamedBytes = response.body.size();
            response.body.clear();
        }
        if (response.effectiveUrl.empty())
            response.effectiveUrl = request.url;
        return response;
    }

    std::vector<http::HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    std::size_t requestCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    http::TransportOptions lastOptions() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastOptions_;
    }

private:
    struct Step {
        Result<http::HttpResponse> result;
        std::optional<std::string> partialBody;
    };

    static ByteSpan asBytes(const std::string& s) {
        return ByteSpan{reinterpret_cast<const std::byte*>(s.data()), s.size()};
    }

    mutable std::mutex mutex_;
    std::deque<Step> script_;
    Handler handler_;
    std::vector<http::HttpRequest> requests_;
    http::TransportOptions lastOptions_;
};

// Records requested backoff delays instead of sleeping.
class RecordingSleeper {
public:
    http::SleepFunction fn() {
        return [this](std::chrono::duration<double> d, std::stop_token stop) {
            std::lock_guard<std::mutex> lock(mutex_);
            delays_.push_back(d.count());
            return !stop.stop_requested();
        };
    }

    std::vector<double> delays() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return delays_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<double> delays_;
};

// Routes the default spdlog logger into a string stream for the lifetime of the object.
class ScopedLogCapture {
public:
    ScopedLogCapture() : previous_(spdlog::default_logger()) {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream_);
        auto logger = std::make_shared<spdlog::logger>("authfetch-test", sink);
        logger->set_pattern("%l %v");
        logger->set_level(spdlog::level::trace);
        spdlog::set_default_logger(logger);
    }

    ~ScopedLogCapture() { spdlog::set_default_logger(previous_); }

    ScopedLogCapture(const ScopedLogCapture&) = delete;
    ScopedLogCapture& operator=(const ScopedLogCapture&) = delete;

    std::string text() const {
        spdlog::default_logger()->flush();
        return stream_.str();
    }

    std::size_t count(const std::string& needle) const {
        const auto all = text();
        std::size_t n = 0;
        for (auto pos = all.find(needle); pos != std::string::npos;
             pos = all.find(needle, pos + needle.size())) {
            ++n;
        }
        return n;
    }

private:
    std::ostringstream stream_;
    std::shared_ptr<spdlog::logger> previous_;
};

} // namespace authfetch::test
