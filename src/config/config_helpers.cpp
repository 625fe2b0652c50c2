#include <surge/config/config_helpers.h>

#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string_view>

namespace surge::config {

namespace {

std::string_view stripped(std::string_view s) {
    constexpr std::string_view kBlank = " \t\r\n";
    const auto first = s.find_first_not_of(kBlank);
    if (first == std::string_view::npos)
        return {};
    return s.substr(first, s.find_last_not_of(kBlank) - first + 1);
}

bool isQuoted(std::string_view v) {
    return v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front();
}

// Value text after '=': quoted strings keep '#', bare values lose a trailing comment.
std::string valueOf(std::string_view raw) {
    auto v = stripped(raw);
    if (!v.empty() && v.front() != '"' && v.front() != '\'') {
        if (auto hash = v.find('#'); hash != std::string_view::npos)
            v = stripped(v.substr(0, hash));
    }
    if (isQuoted(v))
        v = v.substr(1, v.size() - 2);
    return std::string(v);
}

ConfigSections parseStream(std::istream& in, const std::string& origin) {
    ConfigSections sections;
    std::string section;
    std::string raw;
    int lineNo = 0;

    while (std::getline(in, raw)) {
        ++lineNo;
        const auto line = stripped(raw);
        if (line.empty() || line.front() == '#')
            continue;

        if (line.front() == '[') {
            const auto close = line.find(']');
            if (close == std::string_view::npos) {
                spdlog::warn("[Config] {}:{}: unterminated section header", origin, lineNo);
                continue;
            }
            section = std::string(stripped(line.substr(1, close - 1)));
            continue;
        }

        const auto eq = line.find('=');
        if (eq == std::string_view::npos || eq == 0) {
            spdlog::warn("[Config] {}:{}: ignoring '{}'", origin, lineNo, line);
            continue;
        }
        sections[section][std::string(stripped(line.substr(0, eq)))] =
            valueOf(line.substr(eq + 1));
    }
    return sections;
}

std::filesystem::path fromEnv(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::filesystem::path(value) : std::filesystem::path{};
}

} // namespace

Result<ConfigSections> parseConfigFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file)
        return Error{ErrorCode::FileNotFound, "cannot read config file " + path.string()};
    return parseStream(file, path.string());
}

ConfigSections parseConfigText(const std::string& text) {
    std::istringstream in(text);
    return parseStream(in, "<text>");
}

std::filesystem::path expandHome(const std::string& path) {
    if (path.empty() || path.front() != '~')
        return path;
    const auto home = fromEnv("HOME");
    if (home.empty())
        return path;
    if (path.size() == 1)
        return home;
    if (path[1] != '/')
        return path;
    return home / path.substr(2);
}

std::filesystem::path resolveConfigPath(const std::string& requested) {
    if (!requested.empty())
        return expandHome(requested);
    if (auto xdg = fromEnv("XDG_CONFIG_HOME"); !xdg.empty())
        return xdg / "surge" / "config.toml";
    if (auto home = fromEnv("HOME"); !home.empty())
        return home / ".config" / "surge" / "config.toml";
    return std::filesystem::path("surge.toml");
}

std::filesystem::path defaultDataDir() {
    if (auto xdg = fromEnv("XDG_DATA_HOME"); !xdg.empty())
        return xdg / "surge";
    if (auto home = fromEnv("HOME"); !home.empty())
        return home / ".local" / "share" / "surge";
    return std::filesystem::current_path();
}

} // namespace surge::config
