#pragma once

#include <authfetch/auth/credential.h>
#include <authfetch/core/types.h>
#include <authfetch/http/retry_policy.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace authfetch::config {

enum class AuthMode {
    Direct,  // caller credential is sent as the bearer token
    Exchange // caller credential is exchanged for an access token first
};

const char* authModeName(AuthMode mode);

struct OAuthSettings {
    std::string host; // base URL, e.g. https://urs.earthdata.nasa.gov
    std::string clientId;
    std::string redirectUri;
};

/**
 * Client configuration. Built from defaults, an optional flat TOML file and environment
 * overrides, in that order.
 */
struct ClientConfig {
    std::vector<std::string> trustedHosts;
    AuthMode authMode{AuthMode::Direct};
    OAuthSettings oauth;
    // Application identity used for token exchange and fallback Basic authentication.
    auth::BasicIdentity appIdentity;
    bool combinedAuth{false};
    bool fallbackAuthnEnabled{false};

    http::RetryPolicy retry{};
    std::size_t postUrlLength{2000};
    std::chrono::milliseconds requestTimeout{60000};
    std::chrono::milliseconds connectTimeout{30000};
    int maxRedirects{10};
    std::string caBundle;

    std::string userAgent;
    std::string appName;
    std::string localstackHost{"localhost"};

    bool textLogger{true};
    std::string logLevel{"info"};
};

using EnvLookup = std::function<const char*(const char*)>;

Result<void> applyTomlFile(ClientConfig& config, const std::filesystem::path& path);
Result<void> applyEnvironment(ClientConfig& config, const EnvLookup& lookup);

// Defaults, then the file (if non-empty and present), then process environment; validated.
Result<ClientConfig> loadConfig(const std::filesystem::path& path = {});

// Rejects malformed values and adds the OAuth host to the trusted set.
Result<ClientConfig> validateConfig(ClientConfig config);

// "<configured agent> authfetch/<version> (<app name>) <client agent>", empty parts omitted.
std::string buildUserAgent(const ClientConfig& config, std::string_view clientAgent = {});

} // namespace authfetch::config
