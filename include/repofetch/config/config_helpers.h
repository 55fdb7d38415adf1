#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace repofetch::config {

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

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Accepts true/false, yes/no, on/off, 1/0 (case-insensitive).
std::optional<bool> parse_bool(std::string_view s);

// Milliseconds from a decimal string; nullopt when not a non-negative integer.
std::optional<std::chrono::milliseconds> parse_ms(std::string_view s);

// Parse a value from TOML config file. Accepts both "[section] key = v" and
// "section.key = v". Returns nullopt when the file or key is absent.
std::optional<std::string> parse_config_value(const std::filesystem::path& config_path,
                                              const std::string& section,
                                              const std::string& key);

// Get standard config path:
// override -> $REPOFETCH_CONFIG -> $XDG_CONFIG_HOME/repofetch/config.toml -> ~/.config/...
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user cache directory
/// $XDG_CACHE_HOME/repofetch or ~/.cache/repofetch
std::filesystem::path get_cache_dir();

} // namespace repofetch::config
