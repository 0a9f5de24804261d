#include <authfetch/auth/token_exchanger.h>
#include <authfetch/http/url.h>
#include <authfetch/logging/logging.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>

namespace authfetch::auth {

namespace {

constexpr std::chrono::milliseconds kInflightPollInterval{20};

std::string trimTrailingSlash(std::string s) {
    while (!s.empty() && s.back() == '/')
        s.pop_back();
    return s;
}

Error exchangeError(const Error& cause, std::string_view step) {
    if (cause.code == ErrorCode::OperationCancelled)
        return cause;
    return Error{ErrorCode::TokenExchangeFailed,
                 std::string(step) + " failed: " + cause.message};
}

} // namespace

TokenExchanger::TokenExchanger(OAuthClientConfig config,
                               std::shared_ptr<http::IHttpTransport> transport,
                               http::TransportOptions options)
    : config_(std::move(config)), transport_(std::move(transport)), options_(std::move(options)) {
    config_.host = trimTrailingSlash(config_.host);
    TrustedHostSet trusted;
    if (auto host = http::urlHost(config_.host))
        trusted.add(*host);
    policy_ = CredentialHeaderPolicy(std::move(trusted));
}

std::string TokenExchanger::authorizeUrl() const {
    return config_.host + "/oauth/authorize?" +
           http::formEncode({{"response_type", "code"},
                             {"client_id", config_.clientId},
                             {"redirect_uri", config_.redirectUri}});
}

std::string TokenExchanger::tokenUrl() const {
    return config_.host + "/oauth/token";
}

std::size_t TokenExchanger::cachedTokenCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

void TokenExchanger::clearCache() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

Result<ExchangedToken> TokenExchanger::exchange(const Credential& userCredential,
                                                std::stop_token stop) {
    if (userCredential.empty())
        return Error{ErrorCode::InvalidArgument, "cannot exchange an empty credential"};
    if (!transport_)
        return Error{ErrorCode::ConfigurationError, "token exchanger has no transport"};

    const auto& key = userCredential.reveal();
    for (;;) {
        std::promise<Result<ExchangedToken>> promise;
        std::shared_future<Result<ExchangedToken>> shared;
        bool leader = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (auto it = cache_.find(key); it != cache_.end())
                return it->second;
            if (auto it = inflight_.find(key); it != inflight_.end()) {
                shared = it->second;
            } else {
                shared = promise.get_future().share();
                inflight_.emplace(key, shared);
                leader = true;
            }
        }

        if (leader) {
            auto result = performExchange(userCredential, stop);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (result)
                    cache_.emplace(key, result.value());
                inflight_.erase(key);
            }
            promise.set_value(result);
            return result;
        }

        while (shared.wait_for(kInflightPollInterval) != std::future_status::ready) {
            if (stop.stop_requested())
                return Error{ErrorCode::OperationCancelled, "token exchange cancelled"};
        }
        auto result = shared.get();
        // The leader's cancellation is its own; take over the exchange unless we were
        // cancelled too.
        if (!result && result.error().code == ErrorCode::OperationCancelled &&
            !stop.stop_requested()) {
            continue;
        }
        return result;
    }
}

Result<ExchangedToken> TokenExchanger::performExchange(const Credential& userCredential,
                                                       std::stop_token stop) {
    spdlog::debug("exchanging user credential {} at {}", userCredential, config_.host);
    auto code = requestAuthorizationCode(userCredential, stop);
    if (!code)
        return code.error();
    auto token = redeemCode(code.value(), stop);
    if (!token)
        return token.error();
    logging::logEvent(spdlog::level::info, "token.exchange.success",
                      {{"host", http::urlHost(config_.host).value_or("")}});
    return ExchangedToken{std::move(token).value(), userCredential};
}

Result<std::string> TokenExchanger::requestAuthorizationCode(const Credential& userCredential,
                                                             std::stop_token stop) {
    http::HttpRequest request;
    request.method = http::HttpMethod::Get;
    request.url = authorizeUrl();
    request.followRedirects = false;
    policy_.apply(request, AuthorizationSpec::bearerAndBasic(userCredential, config_.app));

    auto sent = transport_->send(request, options_, {}, stop);
    if (!sent)
        return exchangeError(sent.error(), "authorization request");
    const auto& response = sent.value();

    const auto location = response.header("Location");
    if (!response.isRedirect() || !location) {
        return Error{ErrorCode::TokenExchangeFailed,
                     "authorization request returned HTTP " + std::to_string(response.status) +
                         " without a redirect"};
    }
    for (const auto& [name, value] : http::parseQuery(http::splitQuery(*location).second)) {
        if (name == "code" && !value.empty())
            return value;
    }
    return Error{ErrorCode::TokenExchangeFailed,
                 "authorization redirect did not carry an authorization code"};
}

Result<Credential> TokenExchanger::redeemCode(const std::string& code, std::stop_token stop) {
    http::HttpRequest request;
    request.method = http::HttpMethod::Post;
    request.url = tokenUrl();
    request.followRedirects = false;
    request.body = http::formEncode({{"grant_type", "authorization_code"},
                                     {"code", code},
                                     {"redirect_uri", config_.redirectUri}});
    http::setHeader(request.headers, http::kContentTypeHeader, http::kFormUrlEncoded);
    policy_.apply(request, AuthorizationSpec::basicOnly(config_.app));

    std::string body;
    http::BodySink collect = [&body](ByteSpan bytes) -> Result<void> {
        body.append(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        return {};
    };
    auto sent = transport_->send(request, options_, collect, stop);
    if (!sent)
        return exchangeError(sent.error(), "token request");
    const auto& response = sent.value();
    if (!response.ok()) {
        return Error{ErrorCode::TokenExchangeFailed,
                     "token request returned HTTP " + std::to_string(response.status)};
    }
    if (body.empty())
        body = response.body;

    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("access_token") ||
        !j["access_token"].is_string() || j["access_token"].get<std::string>().empty()) {
        return Error{ErrorCode::TokenExchangeFailed, "token response did not contain access_token"};
    }
    return Credential{j["access_token"].get<std::string>()};
}

} // namespace authfetch::auth
