#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace modelfetch::config {

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

// Tilde expansion ("~" and "~/...")
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            if (path.size() == 1)
                return std::filesystem::path(home);
            if (path[1] == '/')
                return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Scalar parsing; nullopt on malformed input so callers can keep their default.
std::optional<std::uint64_t> parse_u64(std::string_view s);
std::optional<double> parse_double(std::string_view s);
std::optional<bool> parse_bool(std::string_view s);

// Parse a value from a TOML-style config file ("" when absent)
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// $MODELFETCH_CONFIG when set, else $XDG_CONFIG_HOME/modelfetch/config.toml (~/.config fallback)
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the default artifact cache directory
/// $XDG_CACHE_HOME/modelfetch/models or ~/.cache/modelfetch/models
std::filesystem::path get_cache_dir();

// Read an environment variable; nullopt when unset or empty
std::optional<std::string> env_value(const char* name);

} // namespace modelfetch::config
