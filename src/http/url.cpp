#include <authfetch/http/url.h>

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <memory>

namespace authfetch::http {

namespace {

struct CurlUrlDeleter {
    void operator()(CURLU* h) const noexcept { curl_url_cleanup(h); }
};
using CurlUrlPtr = std::unique_ptr<CURLU, CurlUrlDeleter>;

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string getPart(CURLU* h, CURLUPart part, unsigned int flags = 0) {
    char* value = nullptr;
    if (curl_url_get(h, part, &value, flags) != CURLUE_OK || !value)
        return {};
    std::string out(value);
    curl_free(value);
    return out;
}

Result<CurlUrlPtr> makeHandle(std::string_view url) {
    CurlUrlPtr h(curl_url());
    if (!h)
        return Error{ErrorCode::InternalError, "curl_url() failed"};
    const std::string s(url);
    const auto rc = curl_url_set(h.get(), CURLUPART_URL, s.c_str(), 0);
    if (rc != CURLUE_OK) {
        return Error{ErrorCode::InvalidArgument,
                     std::string("Invalid URL: ") + curl_url_strerror(rc)};
    }
    return h;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace

Result<ParsedUrl> parseUrl(std::string_view url) {
    auto h = makeHandle(url);
    if (!h)
        return h.error();
    ParsedUrl out;
    out.scheme = to_lower(getPart(h.value().get(), CURLUPART_SCHEME));
    out.host = to_lower(getPart(h.value().get(), CURLUPART_HOST));
    out.port = getPart(h.value().get(), CURLUPART_PORT);
    out.path = getPart(h.value().get(), CURLUPART_PATH);
    out.query = getPart(h.value().get(), CURLUPART_QUERY);
    if (out.host.size() >= 2 && out.host.front() == '[' && out.host.back() == ']')
        out.host = out.host.substr(1, out.host.size() - 2);
    return out;
}

std::optional<std::string> urlHost(std::string_view url) {
    auto parsed = parseUrl(url);
    if (!parsed || parsed.value().host.empty())
        return std::nullopt;
    return parsed.value().host;
}

bool isHttpUrl(std::string_view url) {
    const auto lower = to_lower(std::string(url.substr(0, 8)));
    return lower.rfind("http://", 0) == 0 || lower.rfind("https://", 0) == 0;
}

std::string localhostUrl(std::string_view url, std::string_view localHostname) {
    auto h = makeHandle(url);
    if (!h || localHostname.empty())
        return std::string(url);
    if (to_lower(getPart(h.value().get(), CURLUPART_HOST)) != "localhost")
        return std::string(url);
    const std::string host(localHostname);
    if (curl_url_set(h.value().get(), CURLUPART_HOST, host.c_str(), 0) != CURLUE_OK)
        return std::string(url);
    return getPart(h.value().get(), CURLUPART_URL);
}

Result<std::string> resolveReference(std::string_view base, std::string_view reference) {
    auto h = makeHandle(base);
    if (!h)
        return h.error();
    const std::string ref(reference);
    const auto rc = curl_url_set(h.value().get(), CURLUPART_URL, ref.c_str(), 0);
    if (rc != CURLUE_OK) {
        return Error{ErrorCode::InvalidData,
                     std::string("Invalid redirect location: ") + curl_url_strerror(rc)};
    }
    auto resolved = getPart(h.value().get(), CURLUPART_URL);
    if (resolved.empty())
        return Error{ErrorCode::InvalidData, "Redirect location resolved to an empty URL"};
    return resolved;
}

std::string percentEncode(std::string_view in, bool formStyle) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(in.size() * 3);
    for (unsigned char c : in) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else if (c == ' ' && formStyle) {
            out.push_back('+');
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string percentDecode(std::string_view in, bool formStyle) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        const char c = in[i];
        if (c == '%' && i + 2 < in.size()) {
            const int hi = hexValue(in[i + 1]);
            const int lo = hexValue(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(formStyle && c == '+' ? ' ' : c);
    }
    return out;
}

QueryParams parseQuery(std::string_view query) {
    QueryParams out;
    size_t start = 0;
    while (start <= query.size()) {
        auto amp = query.find('&', start);
        auto item = query.substr(start, amp == std::string_view::npos ? std::string_view::npos
                                                                      : amp - start);
        if (!item.empty()) {
            auto eq = item.find('=');
            if (eq == std::string_view::npos) {
                out.emplace_back(percentDecode(item, true), std::string{});
            } else {
                out.emplace_back(percentDecode(item.substr(0, eq), true),
                                 percentDecode(item.substr(eq + 1), true));
            }
        }
        if (amp == std::string_view::npos)
            break;
        start = amp + 1;
    }
    return out;
}

std::string formEncode(const QueryParams& params) {
    std::string out;
    for (const auto& [k, v] : params) {
        if (!out.empty())
            out.push_back('&');
        out += percentEncode(k, true);
        out.push_back('=');
        out += percentEncode(v, true);
    }
    return out;
}

std::string withQueryParameter(std::string_view url, std::string_view name,
                               std::string_view value) {
    const auto hash = url.find('#');
    std::string head(url.substr(0, hash));
    const std::string fragment(hash == std::string_view::npos ? std::string_view{}
                                                              : url.substr(hash));
    const auto q = head.find('?');
    if (q == std::string::npos) {
        head.push_back('?');
    } else {
        std::string kept;
        const std::string query = head.substr(q + 1);
        size_t start = 0;
        while (start < query.size()) {
            auto amp = query.find('&', start);
            const auto item =
                query.substr(start, amp == std::string::npos ? std::string::npos : amp - start);
            const auto eq = item.find('=');
            if (!item.empty() && percentDecode(item.substr(0, eq), true) != name) {
                kept += item;
                kept.push_back('&');
            }
            if (amp == std::string::npos)
                break;
            start = amp + 1;
        }
        head.resize(q + 1);
        head += kept;
    }
    head += percentEncode(name, true);
    head.push_back('=');
    head += percentEncode(value, true);
    return head + fragment;
}

std::pair<std::string, std::string> splitQuery(std::string_view url) {
    const auto hash = url.find('#');
    const auto head = url.substr(0, hash);
    const auto q = head.find('?');
    if (q == std::string_view::npos)
        return {std::string(head), std::string{}};
    return {std::string(head.substr(0, q)), std::string(head.substr(q + 1))};
}

} // namespace authfetch::http
