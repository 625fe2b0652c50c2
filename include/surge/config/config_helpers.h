#pragma once

#include <surge/core/types.h>

#include <filesystem>
#include <map>
#include <string>

namespace surge::config {

/// section -> key -> raw value
using ConfigSections = std::map<std::string, std::map<std::string, std::string>>;

/// Reads the flat TOML subset surge config files use: `[section]` headers
/// (dotted names kept verbatim), `key = value` pairs, `#` comments and
/// single or double quoted strings. Keys before the first header land in
/// section "". Lines that fit none of these are skipped with a warning.
Result<ConfigSections> parseConfigFile(const std::filesystem::path& path);

ConfigSections parseConfigText(const std::string& text);

/// Leading `~` or `~/` becomes $HOME.
std::filesystem::path expandHome(const std::string& path);

/// `requested` with `~` expanded, or $XDG_CONFIG_HOME/surge/config.toml,
/// or ~/.config/surge/config.toml.
std::filesystem::path resolveConfigPath(const std::string& requested = "");

/// $XDG_DATA_HOME/surge, ~/.local/share/surge, else the working directory.
std::filesystem::path defaultDataDir();

} // namespace surge::config
