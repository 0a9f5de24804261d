#include <authfetch/http/http_types.h>

#include <algorithm>
#include <cctype>

namespace authfetch::http {

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::optional<std::string> findHeader(const std::vector<Header>& headers, std::string_view name) {
    for (const auto& h : headers) {
        if (iequals(h.name, name))
            return h.value;
    }
    return std::nullopt;
}

void setHeader(std::vector<Header>& headers, std::string_view name, std::string value) {
    removeHeader(headers, name);
    headers.push_back(Header{std::string(name), std::move(value)});
}

std::size_t removeHeader(std::vector<Header>& headers, std::string_view name) {
    const auto before = headers.size();
    headers.erase(std::remove_if(headers.begin(), headers.end(),
                                 [&](const Header& h) { return iequals(h.name, name); }),
                  headers.end());
    return before - headers.size();
}

std::optional<std::string> HttpResponse::header(std::string_view name) const {
    return findHeader(headers, name);
}

} // namespace authfetch::http
