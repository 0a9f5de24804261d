#pragma once

#include <authfetch/auth/credential.h>
#include <authfetch/auth/token_exchanger.h>
#include <authfetch/config/client_config.h>
#include <authfetch/core/types.h>
#include <authfetch/download/destination_sink.h>
#include <authfetch/http/request_executor.h>
#include <authfetch/http/url.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <variant>

namespace authfetch::download {

// Ordered form fields sent as an application/x-www-form-urlencoded POST body.
using FormData = http::QueryParams;

inline constexpr const char* kRequestIdParam = "A-api-request-uuid";

struct DownloadSuccess {
    std::uint64_t bytesWritten{0};
    std::chrono::milliseconds duration{0};
    long status{0};
};

struct DownloadForbidden {
    std::string message;
    long status{0};
};

struct DownloadConsentRequired {
    std::string message;
    std::string resolutionUrl;
};

struct DownloadServerFailure {
    std::string message;
    std::optional<long> status;
};

using DownloadOutcome =
    std::variant<DownloadSuccess, DownloadForbidden, DownloadConsentRequired, DownloadServerFailure>;

const char* outcomeName(const DownloadOutcome& outcome);

struct DownloadContext {
    // Added to HTTP(S) URLs as A-api-request-uuid when non-empty.
    std::string requestId;
    std::stop_token stop;
};

/**
 * Retrieves a resource into a destination sink with the right credentials.
 *
 * - Caller credential, direct mode: sent as a bearer token (plus the application Basic
 *   identity when combined auth is configured).
 * - Caller credential, exchange mode: exchanged through TokenExchanger first.
 * - No credential: the application Basic identity when fallback is enabled, otherwise a
 *   ConfigurationError.
 *
 * The Error branch carries ConfigurationError, TokenExchangeFailed and
 * OperationCancelled (plus sink write failures); every HTTP-level failure is reported as
 * a DownloadOutcome.
 *
 * A null transport selects the libcurl transport.
 */
class AuthenticatedDownloader {
public:
    AuthenticatedDownloader(config::ClientConfig config,
                            std::shared_ptr<http::IHttpTransport> transport = nullptr,
                            http::SleepFunction sleep = {});

    Result<DownloadOutcome> download(std::string_view url,
                                     const std::optional<auth::Credential>& credential,
                                     const std::optional<FormData>& data, IDestinationSink& sink,
                                     std::string_view userAgent = {},
                                     const DownloadContext& context = {});

    [[nodiscard]] const config::ClientConfig& config() const noexcept { return config_; }
    auth::TokenExchanger& tokenExchanger() noexcept { return exchanger_; }

private:
    Result<auth::AuthorizationSpec>
    resolveAuthorization(const std::optional<auth::Credential>& credential, std::stop_token stop);
    std::optional<auth::AuthorizationSpec>
    fallbackAfterRejection(const auth::AuthorizationSpec& used) const;
    DownloadOutcome toOutcome(const http::ExecutionResult& result, const std::string& url,
                              std::chrono::milliseconds elapsed) const;

    std::optional<Error> configError_;
    config::ClientConfig config_;
    std::shared_ptr<http::IHttpTransport> transport_;
    auth::TokenExchanger exchanger_;
    http::RetryingRequestExecutor executor_;
};

} // namespace authfetch::download
