#pragma once

#include <authfetch/auth/credential.h>
#include <authfetch/auth/credential_header_policy.h>
#include <authfetch/core/types.h>
#include <authfetch/http/http_transport.h>

#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <unordered_map>

namespace authfetch::auth {

struct OAuthClientConfig {
    std::string host; // base URL of the authorization server
    std::string clientId;
    std::string redirectUri;
    BasicIdentity app;
};

struct ExchangedToken {
    Credential value;
    Credential sourceCredential;
};

/**
 * Exchanges a user credential for an application-scoped access token using the
 * authorization-code flow:
 *
 *   1. GET  <host>/oauth/authorize?response_type=code&client_id=..&redirect_uri=..
 *      with "Authorization: Bearer <user>, Basic <app>", redirect not followed; the
 *      code is read from the Location query.
 *   2. POST <host>/oauth/token (form body grant_type, code, redirect_uri) with
 *      "Authorization: Basic <app>"; the token is the JSON "access_token".
 *
 * Successful results are cached per user credential for the lifetime of the exchanger.
 * Concurrent callers for the same credential share a single in-flight exchange. A caller's
 * stop token only cancels that caller: waiters stop waiting when their own token fires, and
 * a waiter whose leader was cancelled runs the exchange itself.
 */
class TokenExchanger {
public:
    TokenExchanger(OAuthClientConfig config, std::shared_ptr<http::IHttpTransport> transport,
                   http::TransportOptions options = {});

    Result<ExchangedToken> exchange(const Credential& userCredential, std::stop_token stop = {});

    [[nodiscard]] std::size_t cachedTokenCount() const;
    void clearCache();

    [[nodiscard]] std::string authorizeUrl() const;
    [[nodiscard]] std::string tokenUrl() const;

private:
    Result<ExchangedToken> performExchange(const Credential& userCredential,
                                           std::stop_token stop);
    Result<std::string> requestAuthorizationCode(const Credential& userCredential,
                                                 std::stop_token stop);
    Result<Credential> redeemCode(const std::string& code, std::stop_token stop);

    OAuthClientConfig config_;
    std::shared_ptr<http::IHttpTransport> transport_;
    http::TransportOptions options_;
    CredentialHeaderPolicy policy_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ExchangedToken> cache_;
    std::unordered_map<std::string, std::shared_future<Result<ExchangedToken>>> inflight_;
};

} // namespace authfetch::auth
