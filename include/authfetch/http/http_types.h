#pragma once

/*
 * authfetch HTTP model
 *
 * Plain data types shared by the transport, the credential header policy and the
 * retrying executor. A request describes exactly one hop; redirect handling lives in
 * the executor so that credential headers can be re-evaluated on every hop.
 */

#include <authfetch/core/types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace authfetch::http {

enum class HttpMethod { Get, Post };

constexpr const char* methodName(HttpMethod method) {
    return method == HttpMethod::Post ? "POST" : "GET";
}

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

inline constexpr const char* kAuthorizationHeader = "Authorization";
inline constexpr const char* kContentTypeHeader = "Content-Type";
inline constexpr const char* kFormUrlEncoded = "application/x-www-form-urlencoded";

struct HttpRequest {
    HttpMethod method{HttpMethod::Get};
    std::string url;
    std::vector<Header> headers;
    std::optional<std::string> body;
    // When false the executor returns 3xx responses as data instead of following them.
    bool followRedirects{true};
};

struct HttpResponse {
    long status{0};
    std::vector<Header> headers;
    // Buffered body. Empty when a 2xx body was streamed into a sink instead.
    std::string body;
    std::uint64_t streamedBytes{0};
    std::string effectiveUrl;

    [[nodiscard]] bool ok() const noexcept { return status >= 200 && status < 300; }
    [[nodiscard]] bool isRedirect() const noexcept {
        return status == 301 || status == 302 || status == 303 || status == 307 ||
               status == 308;
    }
    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
};

/**
 * Destination for successful response bodies.
 *
 * rewind(mark) discards everything written after the first `mark` bytes; the executor
 * calls it with the size the sink had when the request started before retrying an attempt
 * whose body was partially delivered, so earlier content of a reused sink survives.
 */
class IResponseSink {
public:
    virtual ~IResponseSink() = default;

    virtual Result<void> write(ByteSpan data) = 0;
    virtual Result<void> rewind(std::uint64_t mark) = 0;
    [[nodiscard]] virtual std::uint64_t bytesWritten() const = 0;
};

// Case-insensitive header helpers. Names are compared ASCII-folded.
bool iequals(std::string_view a, std::string_view b);
std::optional<std::string> findHeader(const std::vector<Header>& headers, std::string_view name);
void setHeader(std::vector<Header>& headers, std::string_view name, std::string value);
std::size_t removeHeader(std::vector<Header>& headers, std::string_view name);

} // namespace authfetch::http
