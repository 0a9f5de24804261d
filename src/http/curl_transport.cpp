/*
 * curl_transport.cpp
 *
 * Single-hop HTTP transport on the libcurl easy API.
 * - Redirects are never followed here; the executor decides per hop.
 * - Inactivity timeout is expressed as LOW_SPEED_LIMIT=1 byte/s for readTimeout.
 * - Cancellation is polled through the transfer-info callback.
 */

#include <authfetch/http/http_transport.h>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <string_view>

namespace authfetch::http {

namespace {

// Non-2xx bodies are only inspected for error details.
constexpr std::size_t kMaxBufferedErrorBody = 1024 * 1024;

std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_ABORTED_BY_CALLBACK:
            err.code = ErrorCode::OperationCancelled;
            break;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            err.code = ErrorCode::InvalidArgument;
            break;
        default:
            err.code = ErrorCode::NetworkError;
            break;
    }
    return err;
}

struct TransferContext {
    CURL* curl{nullptr};
    const BodySink* sink{nullptr};
    HttpResponse* response{nullptr};
    std::stop_token stop;
    std::optional<Error> sinkError;
    bool bufferTruncated{false};
};

size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (userdata == nullptr)
        return 0;
    auto* ctx = static_cast<TransferContext*>(userdata);
    std::string_view line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.remove_suffix(1);

    // A new status line starts a new header block (e.g. after "100 Continue").
    if (line.size() >= 5 && line.substr(0, 5) == "HTTP/") {
        ctx->response->headers.clear();
        return total;
    }
    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;
    ctx->response->headers.push_back(
        Header{trim(line.substr(0, colon)), trim(line.substr(colon + 1))});
    return total;
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;
    auto* ctx = static_cast<TransferContext*>(userdata);
    if (total == 0)
        return 0;
    if (ctx->stop.stop_requested())
        return 0;

    long status = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
    if (status >= 200 && status < 300 && ctx->sink && *ctx->sink) {
        ByteSpan bytes{reinterpret_cast<const std::byte*>(ptr), total};
        auto r = (*ctx->sink)(bytes);
        if (!r) {
            ctx->sinkError = r.error();
            return 0; // abort transfer => CURLE_WRITE_ERROR
        }
        ctx->response->streamedBytes += total;
        return total;
    }

    auto& body = ctx->response->body;
    if (body.size() < kMaxBufferedErrorBody) {
        body.append(ptr, std::min(total, kMaxBufferedErrorBody - body.size()));
    } else {
        ctx->bufferTruncated = true;
    }
    return total;
}

int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    return (ctx && ctx->stop.stop_requested()) ? 1 : 0;
}

curl_slist* build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        if (h.value.empty()) {
            line.append(";"); // curl syntax for a header with an empty value
        } else {
            line.append(": ");
            line.append(h.value);
        }
        list = curl_slist_append(list, line.c_str());
    }
    // Suppress curl's default "Expect: 100-continue" for form bodies.
    return curl_slist_append(list, "Expect:");
}

void configure_common(CURL* curl, const TransportOptions& options) {
    // Inactivity timeout: abort when fewer than 1 byte/s arrives for readTimeout.
    const long idleSeconds =
        std::max<long>(1, static_cast<long>((options.readTimeout.count() + 999) / 1000));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, idleSeconds);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(options.connectTimeout.count()));

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    if (!options.caBundle.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, options.caBundle.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
}

struct CurlEasyDeleter {
    void operator()(CURL* c) const noexcept { curl_easy_cleanup(c); }
};
struct CurlSlistDeleter {
    void operator()(curl_slist* l) const noexcept { curl_slist_free_all(l); }
};

class CurlHttpTransport final : public IHttpTransport {
public:
    CurlHttpTransport() {
        static std::once_flag once;
        std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }
    ~CurlHttpTransport() override = default;

    Result<HttpResponse> send(const HttpRequest& request, const TransportOptions& options,
                              const BodySink& sink, std::stop_token stop) override {
        if (stop.stop_requested())
            return Error{ErrorCode::OperationCancelled, "request cancelled before start"};

        std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
        if (!curl) {
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }
        std::unique_ptr<curl_slist, CurlSlistDeleter> list(build_header_list(request.headers));

        HttpResponse response;
        TransferContext ctx;
        ctx.curl = curl.get();
        ctx.sink = &sink;
        ctx.response = &response;
        ctx.stop = stop;

        CURL* h = curl.get();
        curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
        if (request.method == HttpMethod::Post) {
            const auto bodySize = request.body ? request.body->size() : std::size_t{0};
            curl_easy_setopt(h, CURLOPT_POST, 1L);
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(bodySize));
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body ? request.body->c_str() : "");
        } else {
            curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        }
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, list.get());
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(h, CURLOPT_HEADERDATA, &ctx);
        curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(h, CURLOPT_XFERINFODATA, &ctx);
        curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
        configure_common(h, options);

        const CURLcode rc = curl_easy_perform(h);
        if (rc != CURLE_OK) {
            if (ctx.sinkError)
                return *ctx.sinkError;
            if (stop.stop_requested())
                return Error{ErrorCode::OperationCancelled, "request cancelled"};
            return makeCurlError(rc, std::string(methodName(request.method)) + " request");
        }

        curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);
        char* effective = nullptr;
        if (curl_easy_getinfo(h, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective)
            response.effectiveUrl = effective;
        else
            response.effectiveUrl = request.url;
        if (ctx.bufferTruncated) {
            spdlog::debug("HTTP {} response body truncated to {} bytes", response.status,
                          kMaxBufferedErrorBody);
        }
        return response;
    }
};

} // namespace

std::shared_ptr<IHttpTransport> makeCurlHttpTransport() {
    return std::make_shared<CurlHttpTransport>();
}

} // namespace authfetch::http
