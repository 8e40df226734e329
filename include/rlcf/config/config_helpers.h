#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace rlcf::config {

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
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            if (path.size() <= 2)
                return std::filesystem::path(home);
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Typed value parsing. Malformed input yields std::nullopt so callers keep defaults.
std::optional<double> parse_double(std::string_view s);
std::optional<long long> parse_int(std::string_view s);
std::optional<bool> parse_bool(std::string_view s);
std::optional<std::chrono::milliseconds> parse_ms(std::string_view s);

// Flattened "section.key" -> value map for the whole file. Later duplicates win.
std::map<std::string, std::string> parse_config_file(const std::filesystem::path& config_path);

// Env override name for a key: RLCF_<SECTION>_<KEY>, upper-cased.
std::string env_override_name(std::string_view section, std::string_view key);

// Get standard config path ($RLCF_CONFIG, then XDG, then ~/.config/rlcf/config.toml)
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace rlcf::config
