#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace authfetch::config {

inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Unset, empty, "0", "false", "off" and "no" (any case) are false; anything else is true.
bool envTruthy(const char* value);

// Reads a flat TOML file into "section.key" -> value. Arrays are kept as their raw text.
// A missing file yields an empty map.
std::map<std::string, std::string> parseSimpleTomlFlat(const std::filesystem::path& path);

// Accepts "a,b" or ["a", "b"].
std::vector<std::string> parseStringList(const std::string& raw);

} // namespace authfetch::config
