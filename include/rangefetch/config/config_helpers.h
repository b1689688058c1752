#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>

namespace rangefetch::config {

// String trimming utilities
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

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion for "~" and "~/..."; "~user" forms are returned unchanged.
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (path.empty() || path[0] != '~')
        return path;
    const char* home = std::getenv("HOME");
    if (!home)
        return path;
    if (path.size() == 1)
        return std::filesystem::path(home);
    if (path[1] == '/')
        return std::filesystem::path(home) / path.substr(2);
    return path;
}

// Parse a value from a TOML config file. Accepts "[section] key = value" and
// "section.key = value". Returns an empty string when absent.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Get standard config path
// Unix: $XDG_CONFIG_HOME/rangefetch/config.toml or ~/.config/rangefetch/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

// Config file resolution: explicit override -> RANGEFETCH_CONFIG -> get_config_path()
std::filesystem::path resolve_config_path(const std::string& override_path = "");

} // namespace rangefetch::config
