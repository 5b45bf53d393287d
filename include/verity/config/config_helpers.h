#pragma once

#include <verity/core/types.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace verity::config {

// Flattened TOML keys: "section.key" -> raw (unquoted) value
using ConfigMap = std::map<std::string, std::string>;

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

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return path.size() > 2 ? std::filesystem::path(home) / path.substr(2)
                                   : std::filesystem::path(home);
        }
    }
    return path;
}

// Non-empty environment value, if set
inline std::optional<std::string> env_value(const char* name) {
    if (const char* v = std::getenv(name); v && *v) {
        return std::string(v);
    }
    return std::nullopt;
}

// Read a whole TOML file into a flat map. Both "[section] key = v" and "section.key = v" forms are
// accepted; later keys override earlier ones.
Result<ConfigMap> parse_config_file(const std::filesystem::path& config_path);

// Parse a single value from a TOML config file; empty string when absent
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Typed accessors over a parsed map. A present but malformed value is an InvalidConfiguration
// error, an absent value yields std::nullopt.
Result<std::optional<double>> get_double(const ConfigMap& map, const std::string& key);
Result<std::optional<long long>> get_int(const ConfigMap& map, const std::string& key);
Result<std::optional<bool>> get_bool(const ConfigMap& map, const std::string& key);

/// Resolves the config file: override > VERITY_CONFIG > $XDG_CONFIG_HOME/verity/config.toml >
/// ~/.config/verity/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user data directory (databases)
/// VERITY_DATA_DIR > $XDG_DATA_HOME/verity > ~/.local/share/verity
std::filesystem::path get_data_dir();

} // namespace verity::config
