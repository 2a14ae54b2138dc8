#include "topclock/config/paths.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdlib>
#include <optional>
#include <string>

using namespace topclock;

namespace {

/// Sets an environment variable for the scope of a test and restores it afterwards.
class ScopedEnv
{
public:
    ScopedEnv(char const* name, char const* value)
        : name_(name)
    {
        if (char const* previous = std::getenv(name))
            previous_ = previous;
        if (value)
            setenv(name, value, 1);
        else
            unsetenv(name);
    }

    ~ScopedEnv()
    {
        if (previous_)
            setenv(name_, previous_->c_str(), 1);
        else
            unsetenv(name_);
    }

    ScopedEnv(ScopedEnv const&) = delete;
    ScopedEnv& operator=(ScopedEnv const&) = delete;

private:
    char const* name_;
    std::optional<std::string> previous_;
};

} // namespace

TEST_CASE("Config directory prefers XDG_CONFIG_HOME", "[paths]")
{
    ScopedEnv xdg("XDG_CONFIG_HOME", "/tmp/xdg");
    ScopedEnv home("HOME", "/home/someone");

    REQUIRE(paths::config_dir() == std::filesystem::path("/tmp/xdg/topclock"));
}

TEST_CASE("Config directory falls back to HOME/.config", "[paths]")
{
    ScopedEnv xdg("XDG_CONFIG_HOME", nullptr);
    ScopedEnv home("HOME", "/home/someone");

    REQUIRE(paths::config_dir() == std::filesystem::path("/home/someone/.config/topclock"));
}

TEST_CASE("Config directory is unknown without XDG_CONFIG_HOME or HOME", "[paths][edge]")
{
    ScopedEnv xdg("XDG_CONFIG_HOME", nullptr);
    ScopedEnv home("HOME", nullptr);

    REQUIRE_FALSE(paths::config_dir().has_value());
}

TEST_CASE("Settings path from the command line wins", "[paths]")
{
    ScopedEnv xdg("XDG_CONFIG_HOME", "/tmp/xdg");

    char program[] = "topclock";
    char argument[] = "/etc/topclock.toml";
    char* argv[] = { program, argument, nullptr };

    REQUIRE(paths::settings_path(2, argv) == "/etc/topclock.toml");
    REQUIRE(paths::settings_path(1, argv) == "/tmp/xdg/topclock/config.toml");
}

TEST_CASE("Geometry file follows the config", "[paths]")
{
    ScopedEnv xdg("XDG_CONFIG_HOME", "/tmp/xdg");

    Config cfg = default_config();
    REQUIRE(paths::geometry_path(cfg) == std::filesystem::path("/tmp/xdg/topclock/clock.json"));

    cfg.general.geometry_file = "/var/tmp/pinned.json";
    REQUIRE(paths::geometry_path(cfg) == std::filesystem::path("/var/tmp/pinned.json"));
}

TEST_CASE("Geometry file sits beside the executable without a config directory", "[paths][edge]")
{
    ScopedEnv xdg("XDG_CONFIG_HOME", nullptr);
    ScopedEnv home("HOME", nullptr);

    auto path = paths::geometry_path(default_config());
    REQUIRE(path.filename() == "clock.json");
    REQUIRE(path.parent_path() == paths::executable_dir());
}
