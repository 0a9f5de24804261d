#include <gtest/gtest.h>
#include <authfetch/http/http_transport.h>

#include <stop_token>

using namespace authfetch;
using namespace authfetch::http;

namespace {

BodySink discardSink() {
    return [](ByteSpan) -> Result<void> { return {}; };
}

HttpRequest getRequest(std::string url) {
    HttpRequest req;
    req.url = std::move(url);
    return req;
}

} // namespace

TEST(CurlTransportTest, CancelledBeforeStartSendsNothing) {
    auto transport = makeCurlHttpTransport();
    std::stop_source source;
    source.request_stop();
    auto r = transport->send(getRequest("http://127.0.0.1:1/never"), TransportOptions{},
                             discardSink(), source.get_token());
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::OperationCancelled);
}

TEST(CurlTransportTest, RefusedConnectionIsNetworkError) {
    auto transport = makeCurlHttpTransport();
    TransportOptions options;
    options.connectTimeout = std::chrono::milliseconds(2000);
    auto r = transport->send(getRequest("http://127.0.0.1:1/granule"), options, discardSink(),
                             {});
    ASSERT_FALSE(r);
    EXPECT_TRUE(r.error().code == ErrorCode::NetworkError ||
                r.error().code == ErrorCode::Timeout)
        << r.error().message;
}

TEST(CurlTransportTest, UnsupportedSchemeIsInvalidArgument) {
    auto transport = makeCurlHttpTransport();
    auto r = transport->send(getRequest("gopherz://data.example.gov/x"), TransportOptions{},
                             discardSink(), {});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument) << r.error().message;
}
