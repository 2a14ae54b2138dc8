#include "config.hpp"
#include "topclock/core/log.hpp"
#include <toml++/toml.hpp>

namespace topclock
{

Config default_config()
{
    Config cfg;

    cfg.keybinds = {
        { "", "Escape", "quit" },
        { "", "q", "quit" },
        { "", "b", "toggle_border" },
    };

    return cfg;
}

std::optional<Config> load_config(std::string const& path)
{
    try
    {
        auto tbl = toml::parse_file(path);
        Config cfg = default_config();

        // General
        if (auto general = tbl["general"].as_table())
        {
            if (auto v = (*general)["geometry_file"].value<std::string>())
                cfg.general.geometry_file = *v;
        }

        // Window
        if (auto window = tbl["window"].as_table())
        {
            if (auto v = (*window)["title"].value<std::string>())
                cfg.window.title = *v;
            if (auto v = (*window)["chrome_height"].value<int64_t>())
                cfg.window.chrome_height = static_cast<int32_t>(*v);
            if (auto v = (*window)["always_on_top"].value<bool>())
                cfg.window.always_on_top = *v;
            if (auto v = (*window)["resizable"].value<bool>())
                cfg.window.resizable = *v;
            if (auto v = (*window)["fps"].value<int64_t>(); v && *v > 0)
                cfg.window.fps = static_cast<uint32_t>(*v);
        }

        // Appearance
        if (auto appearance = tbl["appearance"].as_table())
        {
            if (auto v = (*appearance)["background"].value<int64_t>())
                cfg.appearance.background = static_cast<uint32_t>(*v);
            if (auto v = (*appearance)["digits"].value<int64_t>())
                cfg.appearance.digits = static_cast<uint32_t>(*v);
            if (auto v = (*appearance)["separators"].value<int64_t>())
                cfg.appearance.separators = static_cast<uint32_t>(*v);
            if (auto v = (*appearance)["meridiem"].value<int64_t>())
                cfg.appearance.meridiem = static_cast<uint32_t>(*v);
            if (auto v = (*appearance)["padding"].value<int64_t>())
                cfg.appearance.padding = static_cast<int32_t>(*v);
            if (auto v = (*appearance)["font"].value<std::string>())
                cfg.appearance.font = *v;
            if (auto v = (*appearance)["fallback_font"].value<std::string>())
                cfg.appearance.fallback_font = *v;
        }

        // Interaction
        if (auto interaction = tbl["interaction"].as_table())
        {
            if (auto v = (*interaction)["drag_threshold"].value<int64_t>())
                cfg.interaction.drag_threshold = static_cast<int32_t>(*v);
            if (auto v = (*interaction)["drag_requires_borderless"].value<bool>())
                cfg.interaction.drag_requires_borderless = *v;
            if (auto v = (*interaction)["save_delay_ms"].value<int64_t>(); v && *v >= 0)
                cfg.interaction.save_delay_ms = static_cast<uint32_t>(*v);
        }

        // Keybinds
        if (auto keybinds = tbl["keybinds"].as_array())
        {
            cfg.keybinds.clear();
            for (auto const& item : *keybinds)
            {
                if (auto kb = item.as_table())
                {
                    KeybindConfig keybind;
                    if (auto v = (*kb)["mod"].value<std::string>())
                        keybind.mod = *v;
                    if (auto v = (*kb)["key"].value<std::string>())
                        keybind.key = *v;
                    if (auto v = (*kb)["action"].value<std::string>())
                        keybind.action = *v;
                    cfg.keybinds.push_back(keybind);
                }
            }
        }

        return cfg;
    }
    catch (toml::parse_error const& err)
    {
        LOG_ERROR("Config parse error in {}: {}", path, err.description());
        return std::nullopt;
    }
    catch (std::exception const& e)
    {
        LOG_ERROR("Config error in {}: {}", path, e.what());
        return std::nullopt;
    }
}

} // namespace topclock
