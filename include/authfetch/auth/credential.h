#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace authfetch::auth {

/**
 * Opaque user credential (bearer token or exchangeable access token).
 *
 * The raw value is only reachable through reveal(); formatting a Credential for logs
 * always yields "***".
 */
class Credential {
public:
    Credential() = default;
    explicit Credential(std::string value) : value_(std::move(value)) {}

    [[nodiscard]] const std::string& reveal() const noexcept { return value_; }
    [[nodiscard]] bool empty() const noexcept { return value_.empty(); }
    [[nodiscard]] static constexpr std::string_view redacted() noexcept { return "***"; }

    friend bool operator==(const Credential& a, const Credential& b) {
        return a.value_ == b.value_;
    }

private:
    std::string value_;
};

/**
 * Username/password pair sent with HTTP Basic authentication.
 */
struct BasicIdentity {
    std::string username;
    std::string password;

    [[nodiscard]] bool empty() const noexcept { return username.empty(); }
    // "Basic <base64(username:password)>"
    [[nodiscard]] std::string authorizationValue() const;
};

std::string base64Encode(std::string_view data);

} // namespace authfetch::auth

#include <spdlog/fmt/fmt.h>

template <> struct fmt::formatter<authfetch::auth::Credential> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const authfetch::auth::Credential&, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", authfetch::auth::Credential::redacted());
    }
};
