#include <authfetch/config/client_config.h>
#include <authfetch/config/config_helpers.h>
#include <authfetch/http/url.h>
#include <authfetch/version.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>

namespace authfetch::config {

namespace {

Result<long long> parseInteger(std::string_view key, const std::string& raw) {
    long long v = 0;
    const char* first = raw.data();
    const char* last = raw.data() + raw.size();
    auto [ptr, ec] = std::from_chars(first, last, v);
    if (ec != std::errc{} || ptr != last) {
        return Error{ErrorCode::ConfigurationError,
                     std::string(key) + ": expected an integer, got '" + raw + "'"};
    }
    return v;
}

Result<double> parseDouble(std::string_view key, const std::string& raw) {
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(raw.c_str(), &end);
    if (raw.empty() || errno != 0 || end != raw.c_str() + raw.size() || !std::isfinite(v)) {
        return Error{ErrorCode::ConfigurationError,
                     std::string(key) + ": expected a number, got '" + raw + "'"};
    }
    return v;
}

Result<AuthMode> parseAuthMode(const std::string& raw) {
    std::string v = raw;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "direct" || v == "bearer")
        return AuthMode::Direct;
    if (v == "exchange" || v == "legacy")
        return AuthMode::Exchange;
    return Error{ErrorCode::ConfigurationError, "auth mode must be 'direct' or 'exchange', got '" +
                                                    raw + "'"};
}

// Applies one key (file key or env variable) to the config.
Result<void> applySetting(ClientConfig& c, std::string_view key, const std::string& value) {
    if (key == "auth.trusted_hosts") {
        c.trustedHosts = parseStringList(value);
    } else if (key == "auth.mode") {
        auto m = parseAuthMode(value);
        if (!m)
            return m.error();
        c.authMode = m.value();
    } else if (key == "auth.username") {
        c.appIdentity.username = value;
    } else if (key == "auth.password") {
        c.appIdentity.password = value;
    } else if (key == "auth.combined") {
        c.combinedAuth = envTruthy(value.c_str());
    } else if (key == "auth.fallback_enabled") {
        c.fallbackAuthnEnabled = envTruthy(value.c_str());
    } else if (key == "oauth.host") {
        c.oauth.host = value;
    } else if (key == "oauth.client_id") {
        c.oauth.clientId = value;
    } else if (key == "oauth.redirect_uri") {
        c.oauth.redirectUri = value;
    } else if (key == "retry.max_attempts") {
        auto v = parseInteger(key, value);
        if (!v)
            return v.error();
        c.retry.maxAttempts = static_cast<int>(v.value());
    } else if (key == "retry.base_delay_seconds") {
        auto v = parseDouble(key, value);
        if (!v)
            return v.error();
        c.retry.baseDelaySeconds = v.value();
    } else if (key == "retry.max_delay_seconds") {
        auto v = parseDouble(key, value);
        if (!v)
            return v.error();
        c.retry.maxDelaySeconds = v.value();
    } else if (key == "http.post_url_length") {
        auto v = parseInteger(key, value);
        if (!v)
            return v.error();
        if (v.value() <= 0)
            return Error{ErrorCode::ConfigurationError, "http.post_url_length must be positive"};
        c.postUrlLength = static_cast<std::size_t>(v.value());
    } else if (key == "http.request_timeout_ms") {
        auto v = parseInteger(key, value);
        if (!v)
            return v.error();
        c.requestTimeout = std::chrono::milliseconds(v.value());
    } else if (key == "http.connect_timeout_ms") {
        auto v = parseInteger(key, value);
        if (!v)
            return v.error();
        c.connectTimeout = std::chrono::milliseconds(v.value());
    } else if (key == "http.max_redirects") {
        auto v = parseInteger(key, value);
        if (!v)
            return v.error();
        c.maxRedirects = static_cast<int>(v.value());
    } else if (key == "http.ca_bundle") {
        c.caBundle = value;
    } else if (key == "http.user_agent") {
        c.userAgent = value;
    } else if (key == "http.localstack_host") {
        c.localstackHost = value;
    } else if (key == "logging.app_name") {
        c.appName = value;
    } else if (key == "logging.text") {
        c.textLogger = envTruthy(value.c_str());
    } else if (key == "logging.level") {
        c.logLevel = value;
    } else {
        spdlog::debug("config: ignoring unknown key '{}'", key);
    }
    return {};
}

struct EnvBinding {
    const char* name;
    const char* key;
};

// Later entries win, so AUTHFETCH_* names override the shorter compatibility names.
constexpr EnvBinding kEnvBindings[] = {
    {"OAUTH_HOST", "oauth.host"},
    {"EDL_CLIENT_ID", "oauth.client_id"},
    {"EDL_REDIRECT_URI", "oauth.redirect_uri"},
    {"EDL_USERNAME", "auth.username"},
    {"EDL_PASSWORD", "auth.password"},
    {"FALLBACK_AUTHN_ENABLED", "auth.fallback_enabled"},
    {"MAX_DOWNLOAD_RETRIES", "retry.max_attempts"},
    {"POST_URL_LENGTH", "http.post_url_length"},
    {"USER_AGENT", "http.user_agent"},
    {"LOCALSTACK_HOST", "http.localstack_host"},
    {"APP_NAME", "logging.app_name"},
    {"TEXT_LOGGER", "logging.text"},
    {"AUTHFETCH_TRUSTED_HOSTS", "auth.trusted_hosts"},
    {"AUTHFETCH_AUTH_MODE", "auth.mode"},
    {"AUTHFETCH_COMBINED_AUTH", "auth.combined"},
    {"AUTHFETCH_OAUTH_HOST", "oauth.host"},
    {"AUTHFETCH_CLIENT_ID", "oauth.client_id"},
    {"AUTHFETCH_REDIRECT_URI", "oauth.redirect_uri"},
    {"AUTHFETCH_MAX_ATTEMPTS", "retry.max_attempts"},
    {"AUTHFETCH_RETRY_BASE_DELAY", "retry.base_delay_seconds"},
    {"AUTHFETCH_RETRY_MAX_DELAY", "retry.max_delay_seconds"},
    {"AUTHFETCH_REQUEST_TIMEOUT_MS", "http.request_timeout_ms"},
    {"AUTHFETCH_CONNECT_TIMEOUT_MS", "http.connect_timeout_ms"},
    {"AUTHFETCH_MAX_REDIRECTS", "http.max_redirects"},
    {"AUTHFETCH_CA_BUNDLE", "http.ca_bundle"},
    {"AUTHFETCH_LOG_LEVEL", "logging.level"},
};

} // namespace

const char* authModeName(AuthMode mode) {
    return mode == AuthMode::Exchange ? "exchange" : "direct";
}

Result<void> applyTomlFile(ClientConfig& config, const std::filesystem::path& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        return Error{ErrorCode::ConfigurationError, "config file not found: " + path.string()};
    }
    for (const auto& [key, value] : parseSimpleTomlFlat(path)) {
        if (auto r = applySetting(config, key, value); !r)
            return r;
    }
    return {};
}

Result<void> applyEnvironment(ClientConfig& config, const EnvLookup& lookup) {
    if (!lookup)
        return {};
    for (const auto& binding : kEnvBindings) {
        const char* raw = lookup(binding.name);
        if (!raw)
            continue;
        std::string value(raw);
        // MAX_DOWNLOAD_RETRIES historically allowed 0 to mean a single attempt.
        if (std::string_view(binding.name) == "MAX_DOWNLOAD_RETRIES" && value == "0")
            value = "1";
        if (auto r = applySetting(config, binding.key, value); !r) {
            return Error{r.error().code,
                         std::string(binding.name) + " (" + r.error().message + ")"};
        }
    }
    return {};
}

Result<ClientConfig> loadConfig(const std::filesystem::path& path) {
    ClientConfig config;
    if (!path.empty()) {
        if (auto r = applyTomlFile(config, path); !r)
            return r.error();
    }
    if (auto r = applyEnvironment(config, [](const char* name) { return std::getenv(name); }); !r)
        return r.error();
    return validateConfig(std::move(config));
}

Result<ClientConfig> validateConfig(ClientConfig config) {
    if (auto r = config.retry.validate(); !r)
        return r.error();
    if (config.requestTimeout.count() <= 0)
        return Error{ErrorCode::ConfigurationError, "request timeout must be positive"};
    if (config.connectTimeout.count() <= 0)
        return Error{ErrorCode::ConfigurationError, "connect timeout must be positive"};
    if (config.postUrlLength == 0)
        return Error{ErrorCode::ConfigurationError, "post_url_length must be positive"};
    if (config.maxRedirects < 0)
        return Error{ErrorCode::ConfigurationError, "max_redirects must be >= 0"};

    for (auto& host : config.trustedHosts) {
        std::transform(host.begin(), host.end(), host.begin(),
                       [](unsigned char ch) { return std::tolower(ch); });
        if (host.empty() || host == "*" || host == "*.") {
            return Error{ErrorCode::ConfigurationError,
                         "trusted host pattern '" + host + "' is not allowed"};
        }
    }

    if (!config.oauth.host.empty()) {
        auto host = http::urlHost(config.oauth.host);
        if (!host) {
            return Error{ErrorCode::ConfigurationError,
                         "oauth host is not an absolute URL: " + config.oauth.host};
        }
        if (std::find(config.trustedHosts.begin(), config.trustedHosts.end(), *host) ==
            config.trustedHosts.end()) {
            config.trustedHosts.push_back(*host);
        }
    }

    if (config.authMode == AuthMode::Exchange) {
        if (config.oauth.host.empty() || config.oauth.clientId.empty() ||
            config.oauth.redirectUri.empty()) {
            return Error{ErrorCode::ConfigurationError,
                         "exchange mode requires oauth host, client_id and redirect_uri"};
        }
        if (config.appIdentity.empty()) {
            return Error{ErrorCode::ConfigurationError,
                         "exchange mode requires an application identity (username/password)"};
        }
    }
    if (config.combinedAuth && config.appIdentity.empty()) {
        return Error{ErrorCode::ConfigurationError,
                     "combined authorization requires an application identity"};
    }
    return config;
}

std::string buildUserAgent(const ClientConfig& config, std::string_view clientAgent) {
    std::string ua = config.userAgent;
    if (!ua.empty())
        ua.push_back(' ');
    ua += "authfetch/";
    ua += AUTHFETCH_VERSION_STRING;
    if (!config.appName.empty())
        ua += " (" + config.appName + ")";
    if (!clientAgent.empty()) {
        ua.push_back(' ');
        ua.append(clientAgent);
    }
    return ua;
}

} // namespace authfetch::config
