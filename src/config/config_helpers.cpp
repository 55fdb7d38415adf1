#include <repofetch/config/config_helpers.h>

#include <charconv>
#include <fstream>

namespace repofetch::config {

std::optional<bool> parse_bool(std::string_view s) {
    std::string v(s);
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    return std::nullopt;
}

std::optional<std::chrono::milliseconds> parse_ms(std::string_view s) {
    std::string v(s);
    trim(v);
    if (v.empty())
        return std::nullopt;
    long long ms = 0;
    const char* first = v.data();
    const char* last = v.data() + v.size();
    auto res = std::from_chars(first, last, ms);
    if (res.ec != std::errc() || res.ptr != last || ms < 0)
        return std::nullopt;
    return std::chrono::milliseconds(ms);
}

std::optional<std::string> parse_config_value(const std::filesystem::path& config_path,
                                              const std::string& section,
                                              const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return std::nullopt;
    }

    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos)
            continue;

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments (outside of quotes)
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        if ((currentSection == section && k == key) ||
            (currentSection.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return std::nullopt;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }
    if (const char* env = std::getenv("REPOFETCH_CONFIG"); env && *env) {
        return std::filesystem::path(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path(".repofetch") / "config.toml";
    }

    return configHome / "repofetch" / "config.toml";
}

std::filesystem::path get_cache_dir() {
    if (const char* xdg_cache = std::getenv("XDG_CACHE_HOME"); xdg_cache && *xdg_cache) {
        return std::filesystem::path(xdg_cache) / "repofetch";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".cache" / "repofetch";
    }
    return std::filesystem::current_path() / ".repofetch-cache";
}

} // namespace repofetch::config
