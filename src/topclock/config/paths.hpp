#pragma once

#include "topclock/config/config.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace topclock::paths {

constexpr char const* APP_DIR = "topclock";
constexpr char const* SETTINGS_FILE = "config.toml";
constexpr char const* GEOMETRY_FILE = "clock.json";

/// $XDG_CONFIG_HOME/topclock, else $HOME/.config/topclock
std::optional<std::filesystem::path> config_dir();

/// Command line argument takes priority over the config directory
std::string settings_path(int argc, char* argv[]);

/// Directory holding the running executable (empty if it cannot be resolved)
std::filesystem::path executable_dir();

std::filesystem::path geometry_path(Config const& config);

} // namespace topclock::paths
