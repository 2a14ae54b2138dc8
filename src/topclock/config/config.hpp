#pragma once

#include "topclock/core/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace topclock {

struct GeneralConfig
{
    std::string geometry_file; // Empty: clock.json beside the settings file
};

struct WindowConfig
{
    std::string title = "clock";
    int32_t chrome_height = DEFAULT_CHROME_HEIGHT;
    bool always_on_top = true;
    bool resizable = true;
    uint32_t fps = 60;
};

struct AppearanceConfig
{
    uint32_t background = 0x000021;
    uint32_t digits = 0xFFFFFF;     // colour code 0
    uint32_t separators = 0xFFFF00; // colour code 1
    uint32_t meridiem = 0x0000FF;   // colour code 2
    int32_t padding = 10;
    // XLFD pattern, "{}" is replaced by the pixel size
    std::string font = "-*-dejavu sans mono-bold-r-normal--{}-*-*-*-*-*-iso10646-1";
    std::string fallback_font = "fixed";
};

struct InteractionConfig
{
    int32_t drag_threshold = DEFAULT_DRAG_THRESHOLD;
    bool drag_requires_borderless = true;
    uint32_t save_delay_ms = 1000;
};

struct KeybindConfig
{
    std::string mod;
    std::string key;
    std::string action;
};

struct Config
{
    GeneralConfig general;
    WindowConfig window;
    AppearanceConfig appearance;
    InteractionConfig interaction;
    std::vector<KeybindConfig> keybinds;
};

std::optional<Config> load_config(std::string const& path);
Config default_config();

} // namespace topclock
