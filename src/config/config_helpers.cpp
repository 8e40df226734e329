#include <rlcf/config/config_helpers.h>

#include <charconv>
#include <cmath>
#include <fstream>

namespace rlcf::config {

namespace {

// Splits one non-comment line into key/value; false for section headers and junk.
bool split_key_value(const std::string& line, std::string& key, std::string& value) {
    size_t eq = line.find('=');
    if (eq == std::string::npos)
        return false;
    key = line.substr(0, eq);
    value = line.substr(eq + 1);
    trim(key);
    trim(value);

    // Remove inline comments outside of quotes
    bool inQuote = false;
    char quote = 0;
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (inQuote) {
            if (c == quote)
                inQuote = false;
        } else if (c == '"' || c == '\'') {
            inQuote = true;
            quote = c;
        } else if (c == '#') {
            value = value.substr(0, i);
            trim(value);
            break;
        }
    }
    value = unquote(value);
    return !key.empty();
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

std::optional<double> parse_double(std::string_view s) {
    std::string v(s);
    trim(v);
    if (v.empty())
        return std::nullopt;
    try {
        size_t used = 0;
        double d = std::stod(v, &used);
        if (used != v.size() || !std::isfinite(d))
            return std::nullopt;
        return d;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<long long> parse_int(std::string_view s) {
    std::string v(s);
    trim(v);
    long long out = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
    if (ec != std::errc{} || ptr != v.data() + v.size() || v.empty())
        return std::nullopt;
    return out;
}

std::optional<bool> parse_bool(std::string_view s) {
    auto v = lower(s);
    trim(v);
    if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
    if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
    return std::nullopt;
}

std::optional<std::chrono::milliseconds> parse_ms(std::string_view s) {
    auto n = parse_int(s);
    if (!n || *n < 0)
        return std::nullopt;
    return std::chrono::milliseconds(*n);
}

std::map<std::string, std::string> parse_config_file(const std::filesystem::path& config_path) {
    std::map<std::string, std::string> out;
    std::ifstream file(config_path);
    if (!file) {
        return out;
    }

    std::string line;
    std::string currentSection;
    while (std::getline(file, line)) {
        trim(line);
        if (line.empty() || line[0] == '#')
            continue;

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        std::string k, v;
        if (!split_key_value(line, k, v))
            continue;
        // Support both "retrieval.top_k" at top level and "[retrieval] top_k"
        if (currentSection.empty() || k.find('.') != std::string::npos) {
            out[k] = v;
        } else {
            out[currentSection + "." + k] = v;
        }
    }
    return out;
}

std::string env_override_name(std::string_view section, std::string_view key) {
    std::string name = "RLCF_";
    for (char c : section)
        name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    name.push_back('_');
    for (char c : key)
        name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    return name;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("RLCF_CONFIG"); env && *env) {
        return expand_tilde(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("rlcf") / "config.toml";
    }

    return configHome / "rlcf" / "config.toml";
}

} // namespace rlcf::config
