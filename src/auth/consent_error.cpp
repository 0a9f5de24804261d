#include <authfetch/auth/consent_error.h>

#include <nlohmann/json.hpp>

namespace authfetch::auth {

std::optional<ConsentRequiredError> translateConsentError(std::string_view body) {
    if (body.empty())
        return std::nullopt;
    auto j = nlohmann::json::parse(body.begin(), body.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object())
        return std::nullopt;
    if (!j.contains("error_description") || !j.contains("resolution_url"))
        return std::nullopt;

    const auto& url = j["resolution_url"];
    ConsentRequiredError err;
    err.resolutionUrl = url.is_string() ? url.get<std::string>() : url.dump();
    err.message = "Request could not be completed because you need to agree to the EULA at " +
                  err.resolutionUrl;
    return err;
}

} // namespace authfetch::auth
