#pragma once

#include <authfetch/auth/credential.h>
#include <authfetch/http/http_types.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace authfetch::auth {

/**
 * Set of hosts allowed to receive credentials.
 *
 * Entries are exact hostnames ("urs.earthdata.nasa.gov") or wildcard suffixes
 * ("*.earthdata.nasa.gov", matching subdomains on a label boundary but not the apex).
 * Matching is case-insensitive; ports are ignored.
 */
class TrustedHostSet {
public:
    TrustedHostSet() = default;
    explicit TrustedHostSet(const std::vector<std::string>& patterns);

    void add(std::string_view pattern);
    [[nodiscard]] bool matches(std::string_view host) const;
    [[nodiscard]] bool empty() const noexcept { return exact_.empty() && suffixes_.empty(); }

private:
    std::vector<std::string> exact_;
    std::vector<std::string> suffixes_; // stored with the leading '.'
};

enum class AuthScheme {
    None,
    Bearer,         // Authorization: Bearer <credential>
    BearerAndBasic, // Authorization: Bearer <credential>, Basic <app identity>
    Basic           // Authorization: Basic <identity>
};

struct AuthorizationSpec {
    AuthScheme scheme{AuthScheme::None};
    Credential bearer;
    BasicIdentity basic;

    static AuthorizationSpec none() { return {}; }
    static AuthorizationSpec bearerOnly(Credential c) {
        return {AuthScheme::Bearer, std::move(c), {}};
    }
    static AuthorizationSpec bearerAndBasic(Credential c, BasicIdentity b) {
        return {AuthScheme::BearerAndBasic, std::move(c), std::move(b)};
    }
    static AuthorizationSpec basicOnly(BasicIdentity b) {
        return {AuthScheme::Basic, Credential{}, std::move(b)};
    }
};

/**
 * Decides, per outgoing request, whether the Authorization header may be sent.
 *
 * apply() is idempotent and is invoked for every hop, so an Authorization header set for
 * a trusted origin is removed again when a redirect leaves the trusted set.
 */
class CredentialHeaderPolicy {
public:
    CredentialHeaderPolicy() = default;
    explicit CredentialHeaderPolicy(TrustedHostSet trusted) : trusted_(std::move(trusted)) {}

    // False for untrusted/unparseable hosts and for URLs whose query already carries a
    // signature.
    [[nodiscard]] bool shouldAttachCredential(std::string_view targetUrl) const;

    void apply(http::HttpRequest& request, const AuthorizationSpec& auth) const;

    [[nodiscard]] static bool hasSignedQuery(std::string_view url);
    [[nodiscard]] static std::optional<std::string> authorizationValue(const AuthorizationSpec& auth);

    [[nodiscard]] const TrustedHostSet& trustedHosts() const noexcept { return trusted_; }

private:
    TrustedHostSet trusted_;
};

} // namespace authfetch::auth
