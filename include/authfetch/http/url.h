#pragma once

#include <authfetch/core/types.h>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace authfetch::http {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

struct ParsedUrl {
    std::string scheme; // lowercase
    std::string host;   // lowercase, no brackets for IPv6
    std::string port;   // empty when not explicit
    std::string path;
    std::string query; // without '?'
};

Result<ParsedUrl> parseUrl(std::string_view url);

// Lowercased host of an absolute URL, or nullopt when the URL cannot be parsed.
std::optional<std::string> urlHost(std::string_view url);

bool isHttpUrl(std::string_view url);

// Rewrites a "localhost" host to localHostname; other URLs are returned unchanged.
std::string localhostUrl(std::string_view url, std::string_view localHostname);

// Resolves a (possibly relative) Location value against the URL that produced it.
Result<std::string> resolveReference(std::string_view base, std::string_view reference);

// RFC 3986 unreserved characters pass through; formStyle encodes space as '+'.
std::string percentEncode(std::string_view in, bool formStyle = false);
std::string percentDecode(std::string_view in, bool formStyle = false);

QueryParams parseQuery(std::string_view query);
std::string formEncode(const QueryParams& params);

// Sets name=value (value encoded) in the query, replacing any existing occurrences of name
// and keeping the fragment last.
std::string withQueryParameter(std::string_view url, std::string_view name,
                               std::string_view value);

// Splits "scheme://netloc/path?query#frag" into {"scheme://netloc/path", "query"}.
std::pair<std::string, std::string> splitQuery(std::string_view url);

} // namespace authfetch::http
