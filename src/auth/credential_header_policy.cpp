#include <authfetch/auth/credential_header_policy.h>
#include <authfetch/http/url.h>
#include <authfetch/logging/logging.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace authfetch::auth {

namespace {

// Query parameters that mark a pre-signed URL (S3 SigV4/SigV2, GCS, Azure SAS).
constexpr std::array<std::string_view, 6> kSignatureParams = {
    "x-amz-signature", "x-amz-credential", "signature",
    "x-goog-signature", "x-goog-credential", "sig"};

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string stripTrailingDot(std::string host) {
    if (!host.empty() && host.back() == '.')
        host.pop_back();
    return host;
}

} // namespace

TrustedHostSet::TrustedHostSet(const std::vector<std::string>& patterns) {
    for (const auto& p : patterns)
        add(p);
}

void TrustedHostSet::add(std::string_view pattern) {
    auto p = stripTrailingDot(to_lower(pattern));
    if (p.empty())
        return;
    if (p.size() > 2 && p[0] == '*' && p[1] == '.') {
        suffixes_.push_back(p.substr(1));
    } else if (p.find('*') == std::string::npos) {
        exact_.push_back(std::move(p));
    } else {
        spdlog::warn("ignoring unsupported trusted host pattern '{}'", pattern);
    }
}

bool TrustedHostSet::matches(std::string_view host) const {
    const auto h = stripTrailingDot(to_lower(host));
    if (h.empty())
        return false;
    if (std::find(exact_.begin(), exact_.end(), h) != exact_.end())
        return true;
    for (const auto& suffix : suffixes_) {
        // ".example.com" matches "a.example.com" but neither "example.com" nor "badexample.com".
        if (h.size() > suffix.size() &&
            h.compare(h.size() - suffix.size(), suffix.size(), suffix) == 0) {
            return true;
        }
    }
    return false;
}

bool CredentialHeaderPolicy::hasSignedQuery(std::string_view url) {
    const auto query = http::splitQuery(url).second;
    if (query.empty())
        return false;
    for (const auto& param : http::parseQuery(query)) {
        const auto lowered = to_lower(param.first);
        if (std::find(kSignatureParams.begin(), kSignatureParams.end(), lowered) !=
            kSignatureParams.end()) {
            return true;
        }
    }
    return false;
}

bool CredentialHeaderPolicy::shouldAttachCredential(std::string_view targetUrl) const {
    auto host = http::urlHost(targetUrl);
    if (!host)
        return false;
    if (!trusted_.matches(*host))
        return false;
    return !hasSignedQuery(targetUrl);
}

std::optional<std::string>
CredentialHeaderPolicy::authorizationValue(const AuthorizationSpec& auth) {
    switch (auth.scheme) {
        case AuthScheme::Bearer:
            if (auth.bearer.empty())
                return std::nullopt;
            return "Bearer " + auth.bearer.reveal();
        case AuthScheme::BearerAndBasic:
            if (auth.bearer.empty())
                return std::nullopt;
            if (auth.basic.empty())
                return "Bearer " + auth.bearer.reveal();
            return "Bearer " + auth.bearer.reveal() + ", " + auth.basic.authorizationValue();
        case AuthScheme::Basic:
            if (auth.basic.empty())
                return std::nullopt;
            return auth.basic.authorizationValue();
        case AuthScheme::None:
            break;
    }
    return std::nullopt;
}

void CredentialHeaderPolicy::apply(http::HttpRequest& request,
                                   const AuthorizationSpec& auth) const {
    const auto removed = http::removeHeader(request.headers, http::kAuthorizationHeader);
    if (auth.scheme == AuthScheme::None)
        return;
    if (!shouldAttachCredential(request.url)) {
        if (removed > 0) {
            spdlog::debug("credential withheld for {}", logging::redactUrl(request.url));
        }
        return;
    }
    if (auto value = authorizationValue(auth)) {
        request.headers.push_back(http::Header{http::kAuthorizationHeader, std::move(*value)});
    }
}

} // namespace authfetch::auth
