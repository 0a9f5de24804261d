#include <authfetch/auth/consent_error.h>
#include <authfetch/download/authenticated_downloader.h>
#include <authfetch/logging/logging.h>

#include <spdlog/spdlog.h>

namespace authfetch::download {

namespace {

config::ClientConfig normalizeConfig(config::ClientConfig input, std::optional<Error>& error) {
    auto validated = config::validateConfig(input);
    if (!validated) {
        error = validated.error();
        return input;
    }
    return std::move(validated).value();
}

http::ExecutorOptions executorOptions(const config::ClientConfig& c) {
    http::ExecutorOptions o;
    o.retry = c.retry;
    o.postUrlLength = c.postUrlLength;
    o.maxRedirects = c.maxRedirects;
    o.transport.readTimeout = c.requestTimeout;
    o.transport.connectTimeout = c.connectTimeout;
    o.transport.caBundle = c.caBundle;
    return o;
}

auth::OAuthClientConfig oauthConfig(const config::ClientConfig& c) {
    return auth::OAuthClientConfig{c.oauth.host, c.oauth.clientId, c.oauth.redirectUri,
                                   c.appIdentity};
}

// Best-effort "scheme://<host>/<path...>" split for telemetry; unknown shapes log "Unknown".
std::pair<std::string, std::string> telemetryHostPath(const std::string& url) {
    const auto scheme = url.find("://");
    if (scheme == std::string::npos)
        return {"Unknown", ""};
    const auto hostStart = scheme + 3;
    const auto slash = url.find('/', hostStart);
    if (slash == std::string::npos)
        return {url.substr(hostStart), ""};
    return {url.substr(hostStart, slash - hostStart), url.substr(slash)};
}

bool usesBearer(const auth::AuthorizationSpec& spec) {
    return spec.scheme == auth::AuthScheme::Bearer ||
           spec.scheme == auth::AuthScheme::BearerAndBasic;
}

} // namespace

const char* outcomeName(const DownloadOutcome& outcome) {
    switch (outcome.index()) {
        case 0:
            return "success";
        case 1:
            return "forbidden";
        case 2:
            return "consent_required";
        default:
            return "server_failure";
    }
}

AuthenticatedDownloader::AuthenticatedDownloader(config::ClientConfig config,
                                                 std::shared_ptr<http::IHttpTransport> transport,
                                                 http::SleepFunction sleep)
    : config_(normalizeConfig(std::move(config), configError_)),
      transport_(transport ? std::move(transport) : http::makeCurlHttpTransport()),
      exchanger_(oauthConfig(config_), transport_, executorOptions(config_).transport),
      executor_(transport_, auth::CredentialHeaderPolicy(auth::TrustedHostSet(config_.trustedHosts)),
                executorOptions(config_), std::move(sleep)) {
    if (configError_) {
        spdlog::warn("authenticated downloader configuration rejected: {}",
                     configError_->message);
    }
}

Result<auth::AuthorizationSpec>
AuthenticatedDownloader::resolveAuthorization(const std::optional<auth::Credential>& credential,
                                              std::stop_token stop) {
    if (credential && !credential->empty()) {
        auth::Credential bearer = *credential;
        if (config_.authMode == config::AuthMode::Exchange) {
            auto exchanged = exchanger_.exchange(*credential, stop);
            if (!exchanged)
                return exchanged.error();
            bearer = exchanged.value().value;
        }
        if (config_.combinedAuth)
            return auth::AuthorizationSpec::bearerAndBasic(std::move(bearer), config_.appIdentity);
        return auth::AuthorizationSpec::bearerOnly(std::move(bearer));
    }
    if (config_.fallbackAuthnEnabled) {
        if (config_.appIdentity.empty()) {
            return Error{ErrorCode::ConfigurationError,
                         "fallback authentication is enabled but no username is configured"};
        }
        return auth::AuthorizationSpec::basicOnly(config_.appIdentity);
    }
    return Error{ErrorCode::ConfigurationError,
                 "no credential supplied and fallback authentication is disabled"};
}

std::optional<auth::AuthorizationSpec>
AuthenticatedDownloader::fallbackAfterRejection(const auth::AuthorizationSpec& used) const {
    if (config_.authMode != config::AuthMode::Exchange || !config_.fallbackAuthnEnabled)
        return std::nullopt;
    if (!usesBearer(used) || config_.appIdentity.empty())
        return std::nullopt;
    return auth::AuthorizationSpec::basicOnly(config_.appIdentity);
}

DownloadOutcome AuthenticatedDownloader::toOutcome(const http::ExecutionResult& result,
                                                   const std::string& url,
                                                   std::chrono::milliseconds elapsed) const {
    const long status = result.response ? result.response->status : 0;
    switch (result.status) {
        case http::ExecutionStatus::Success:
            return DownloadSuccess{result.bytesWritten, elapsed, status};

        case http::ExecutionStatus::PermanentFailure:
        case http::ExecutionStatus::ConsentRequired:
            if (result.response) {
                if (auto consent = auth::translateConsentError(result.response->body)) {
                    spdlog::info("{} (HTTP {})", consent->message, status);
                    return DownloadConsentRequired{consent->message, consent->resolutionUrl};
                }
            }
            if (result.status == http::ExecutionStatus::PermanentFailure) {
                std::string msg = "Forbidden: Unable to download " + url + " (HTTP " +
                                  std::to_string(status) + "). Will not retry.";
                spdlog::info("{}", msg);
                return DownloadForbidden{std::move(msg), status};
            }
            break;

        case http::ExecutionStatus::ExhaustedRetries:
            break;
    }

    std::string msg = "Unable to download " + url + " after " + std::to_string(result.attempts) +
                      (result.attempts == 1 ? " attempt" : " attempts");
    if (result.response) {
        msg += ": last status " + std::to_string(status);
    } else if (result.lastError) {
        msg += ": " + result.lastError->message;
    }
    msg += "; all retries exhausted.";
    return DownloadServerFailure{std::move(msg),
                                 result.response ? std::optional<long>(status) : std::nullopt};
}

Result<DownloadOutcome>
AuthenticatedDownloader::download(std::string_view url,
                                  const std::optional<auth::Credential>& credential,
                                  const std::optional<FormData>& data, IDestinationSink& sink,
                                  std::string_view userAgent, const DownloadContext& context) {
    const auto start = std::chrono::steady_clock::now();
    if (configError_)
        return *configError_;
    if (url.empty())
        return Error{ErrorCode::InvalidArgument, "download URL is empty"};

    std::string target = http::localhostUrl(url, config_.localstackHost);
    if (!context.requestId.empty() && http::isHttpUrl(target))
        target = http::withQueryParameter(target, kRequestIdParam, context.requestId);

    auto authorization = resolveAuthorization(credential, context.stop);
    if (!authorization)
        return authorization.error();

    const auto redacted = logging::redactUrl(target);
    const auto [host, path] = telemetryHostPath(redacted);
    logging::logEvent(spdlog::level::info, "timing.download.start",
                      {{"url", redacted}, {"host", host}, {"path", path}});

    http::ExecuteRequest request;
    request.url = target;
    if (data)
        request.formBody = http::formEncode(*data);
    request.headers.push_back(
        http::Header{"User-Agent", config::buildUserAgent(config_, userAgent)});
    request.auth = authorization.value();

    auto executed = executor_.execute(request, sink, context.stop);
    if (!executed)
        return executed.error();
    auto result = std::move(executed).value();

    if (result.status == http::ExecutionStatus::PermanentFailure &&
        !(result.response && auth::translateConsentError(result.response->body))) {
        if (auto fallback = fallbackAfterRejection(request.auth)) {
            logging::logEvent(spdlog::level::info, "download.fallback_basic",
                              {{"url", redacted},
                               {"status", result.response ? result.response->status : 0L}});
            request.auth = std::move(*fallback);
            auto retried = executor_.execute(request, sink, context.stop);
            if (!retried)
                return retried.error();
            result = std::move(retried).value();
        }
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    auto outcome = toOutcome(result, redacted, elapsed);
    if (const auto* ok = std::get_if<DownloadSuccess>(&outcome)) {
        logging::logEvent(spdlog::level::info, "timing.download.end",
                          {{"durationMs", ok->duration.count()},
                           {"host", host},
                           {"path", path},
                           {"size", ok->bytesWritten}});
    }
    return outcome;
}

} // namespace authfetch::download
