#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace authfetch::auth {

/**
 * A server-side refusal that the user can resolve by accepting terms (e.g. a EULA).
 */
struct ConsentRequiredError {
    std::string message;
    std::string resolutionUrl;
};

// Recognizes a JSON object body carrying both "error_description" and "resolution_url".
// Anything else (non-JSON, other shapes, either key missing) yields nullopt.
std::optional<ConsentRequiredError> translateConsentError(std::string_view body);

} // namespace authfetch::auth
