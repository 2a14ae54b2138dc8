#include "paths.hpp"
#include <cstdlib>
#include <system_error>

namespace topclock::paths {

std::optional<std::filesystem::path> config_dir()
{
    if (char const* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    {
        return std::filesystem::path(xdg) / APP_DIR;
    }

    if (char const* home = std::getenv("HOME"); home && *home)
    {
        return std::filesystem::path(home) / ".config" / APP_DIR;
    }

    return std::nullopt;
}

std::string settings_path(int argc, char* argv[])
{
    if (argc > 1)
    {
        return argv[1];
    }

    if (auto dir = config_dir())
    {
        return (*dir / SETTINGS_FILE).string();
    }

    return "";
}

std::filesystem::path executable_dir()
{
    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec)
        return {};
    return exe.parent_path();
}

std::filesystem::path geometry_path(Config const& config)
{
    if (!config.general.geometry_file.empty())
    {
        return config.general.geometry_file;
    }

    if (auto dir = config_dir())
    {
        return *dir / GEOMETRY_FILE;
    }

    return executable_dir() / GEOMETRY_FILE;
}

} // namespace topclock::paths
