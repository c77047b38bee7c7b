#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace fleet::config {

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

// Whole-string millisecond count; nullopt for anything else.
std::optional<std::chrono::milliseconds> parse_ms(std::string_view s);

// Parse a value from a TOML config file. Accepts `[section] key = v` and
// `section.key = v`. Returns "" if the file, section, or key is absent.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Config file location: override > FLEET_CONFIG > $XDG_CONFIG_HOME/fleet/config.toml >
// ~/.config/fleet/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace fleet::config
