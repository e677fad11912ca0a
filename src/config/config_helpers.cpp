#include <charconv>
#include <cstdlib>
#include <fstream>
#include <system_error>

#include <modelfetch/config/config_helpers.h>

namespace modelfetch::config {

std::optional<std::uint64_t> parse_u64(std::string_view s) {
    std::string v(s);
    trim(v);
    // Allow TOML digit separators: 1_048_576
    v.erase(std::remove(v.begin(), v.end(), '_'), v.end());
    if (v.empty())
        return std::nullopt;
    std::uint64_t out = 0;
    auto res = std::from_chars(v.data(), v.data() + v.size(), out);
    if (res.ec != std::errc() || res.ptr != v.data() + v.size())
        return std::nullopt;
    return out;
}

std::optional<double> parse_double(std::string_view s) {
    std::string v(s);
    trim(v);
    if (v.empty())
        return std::nullopt;
    char* end = nullptr;
    const double out = std::strtod(v.c_str(), &end);
    if (end != v.c_str() + v.size())
        return std::nullopt;
    return out;
}

std::optional<bool> parse_bool(std::string_view s) {
    std::string v(s);
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
    if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
    return std::nullopt;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

    while (std::getline(file, line)) {
        trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
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

        // Both "[downloader] key" and top-level "downloader.key" are accepted
        if ((in_target_section && k == key) || (!section.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

std::optional<std::string> env_value(const char* name) {
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0')
        return std::nullopt;
    return std::string(v);
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }
    if (auto env = env_value("MODELFETCH_CONFIG")) {
        return expand_tilde(*env);
    }

    std::filesystem::path configHome;
    if (auto xdg = env_value("XDG_CONFIG_HOME")) {
        configHome = std::filesystem::path(*xdg);
    } else if (auto home = env_value("HOME")) {
        configHome = std::filesystem::path(*home) / ".config";
    } else {
        return {};
    }
    return configHome / "modelfetch" / "config.toml";
}

std::filesystem::path get_cache_dir() {
    if (auto xdg = env_value("XDG_CACHE_HOME")) {
        return std::filesystem::path(*xdg) / "modelfetch" / "models";
    }
    if (auto home = env_value("HOME")) {
        return std::filesystem::path(*home) / ".cache" / "modelfetch" / "models";
    }
    return std::filesystem::current_path() / "modelfetch_cache";
}

} // namespace modelfetch::config
