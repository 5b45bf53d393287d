#include <spdlog/spdlog.h>
#include <charconv>
#include <fstream>
#include <verity/config/config_helpers.h>

namespace verity::config {

namespace {

// Strip a trailing "# comment" that is not inside a quoted string
std::string strip_inline_comment(const std::string& v) {
    char quote = 0;
    for (size_t i = 0; i < v.size(); ++i) {
        char c = v[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return v.substr(0, i);
        }
    }
    return v;
}

Error malformed(const std::string& key, const std::string& value, const char* expected) {
    return Error{ErrorCode::InvalidConfiguration,
                 fmt::format("Config key '{}' expects {}, got '{}'", key, expected, value)};
}

} // namespace

Result<ConfigMap> parse_config_file(const std::filesystem::path& config_path) {
    std::ifstream file(config_path);
    if (!file) {
        return Error{ErrorCode::FileNotFound,
                     fmt::format("Cannot open config file: {}", config_path.string())};
    }

    ConfigMap values;
    std::string line;
    std::string currentSection;
    size_t lineNo = 0;

    while (std::getline(file, line)) {
        ++lineNo;
        trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                spdlog::warn("Config {}:{}: unterminated section header", config_path.string(),
                             lineNo);
                continue;
            }
            currentSection = line.substr(1, end - 1);
            trim(currentSection);
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            spdlog::debug("Config {}:{}: ignoring line without '='", config_path.string(), lineNo);
            continue;
        }

        std::string k = line.substr(0, eq);
        std::string v = strip_inline_comment(line.substr(eq + 1));
        trim(k);
        if (k.empty()) {
            continue;
        }

        // Dotted keys are taken as already qualified
        std::string fullKey =
            (currentSection.empty() || k.find('.') != std::string::npos) ? k
                                                                         : currentSection + "." + k;
        values[fullKey] = unquote(v);
    }

    return values;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto parsed = parse_config_file(config_path);
    if (!parsed) {
        return "";
    }
    const auto& map = parsed.value();
    auto it = map.find(section.empty() ? key : section + "." + key);
    return it == map.end() ? std::string{} : it->second;
}

Result<std::optional<double>> get_double(const ConfigMap& map, const std::string& key) {
    auto it = map.find(key);
    if (it == map.end()) {
        return std::optional<double>{};
    }
    const std::string& raw = it->second;
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (ec != std::errc{} || ptr != raw.data() + raw.size()) {
        return malformed(key, raw, "a number");
    }
    return std::optional<double>{value};
}

Result<std::optional<long long>> get_int(const ConfigMap& map, const std::string& key) {
    auto it = map.find(key);
    if (it == map.end()) {
        return std::optional<long long>{};
    }
    const std::string& raw = it->second;
    long long value = 0;
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (ec != std::errc{} || ptr != raw.data() + raw.size()) {
        return malformed(key, raw, "an integer");
    }
    return std::optional<long long>{value};
}

Result<std::optional<bool>> get_bool(const ConfigMap& map, const std::string& key) {
    auto it = map.find(key);
    if (it == map.end()) {
        return std::optional<bool>{};
    }
    std::string v = to_lower(it->second);
    if (v == "true" || v == "1" || v == "yes" || v == "on") {
        return std::optional<bool>{true};
    }
    if (v == "false" || v == "0" || v == "no" || v == "off") {
        return std::optional<bool>{false};
    }
    return malformed(key, it->second, "a boolean");
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (auto env = env_value("VERITY_CONFIG")) {
        return expand_tilde(*env);
    }

    std::filesystem::path configHome;
    if (auto xdg = env_value("XDG_CONFIG_HOME")) {
        configHome = std::filesystem::path(*xdg);
    } else if (auto home = env_value("HOME")) {
        configHome = std::filesystem::path(*home) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "verity" / "config.toml";
    }

    return configHome / "verity" / "config.toml";
}

std::filesystem::path get_data_dir() {
    if (auto env = env_value("VERITY_DATA_DIR")) {
        return expand_tilde(*env);
    }
    if (auto xdg = env_value("XDG_DATA_HOME")) {
        return std::filesystem::path(*xdg) / "verity";
    }
    if (auto home = env_value("HOME")) {
        return std::filesystem::path(*home) / ".local" / "share" / "verity";
    }
    return std::filesystem::current_path() / "verity_data";
}

} // namespace verity::config
