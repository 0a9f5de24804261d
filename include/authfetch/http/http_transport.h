#pragma once

#include <authfetch/core/types.h>
#include <authfetch/http/http_types.h>

#include <chrono>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>

namespace authfetch::http {

struct TransportOptions {
    // Maximum time without receiving any bytes before the request fails with Timeout.
    std::chrono::milliseconds readTimeout{60000};
    std::chrono::milliseconds connectTimeout{30000};
    std::string caBundle;
};

// Receives the body of a 2xx response. Any other response body is buffered instead.
using BodySink = std::function<Result<void>(ByteSpan)>;

/**
 * Performs exactly one HTTP exchange. Implementations never follow redirects; 3xx
 * responses are returned with their Location header intact.
 *
 * Errors: NetworkError, Timeout, OperationCancelled, or the sink's own error when the
 * sink rejected a chunk.
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    virtual Result<HttpResponse> send(const HttpRequest& request, const TransportOptions& options,
                                      const BodySink& sink, std::stop_token stop) = 0;
};

std::shared_ptr<IHttpTransport> makeCurlHttpTransport();

} // namespace authfetch::http
