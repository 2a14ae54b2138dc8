#include "keybind.hpp"
#include "topclock/core/log.hpp"
#include <X11/Xlib.h>
#include <sstream>

namespace topclock {

KeybindManager::KeybindManager(Config const& config)
{
    for (auto const& kb : config.keybinds)
    {
        uint16_t mod = parse_modifier(kb.mod);
        xcb_keysym_t keysym = parse_keysym(kb.key);
        auto action = parse_action(kb.action);

        if (keysym == XCB_NO_SYMBOL)
        {
            LOG_WARN("Ignoring keybind with unknown key '{}'", kb.key);
            continue;
        }
        if (!action)
        {
            LOG_WARN("Ignoring keybind with unknown action '{}'", kb.action);
            continue;
        }

        bindings_[{ mod, keysym }] = Action{ *action };
    }
}

std::optional<Action> KeybindManager::resolve(uint16_t state, xcb_keysym_t keysym) const
{
    uint16_t cleanMod = state & ~(XCB_MOD_MASK_LOCK | XCB_MOD_MASK_2);

    auto it = bindings_.find({ cleanMod, keysym });
    if (it != bindings_.end())
    {
        return it->second;
    }
    return std::nullopt;
}

uint16_t KeybindManager::parse_modifier(std::string const& mod)
{
    uint16_t result = 0;
    std::istringstream stream(mod);
    std::string token;

    while (std::getline(stream, token, '+'))
    {
        if (token == "super")
            result |= XCB_MOD_MASK_4;
        else if (token == "shift")
            result |= XCB_MOD_MASK_SHIFT;
        else if (token == "ctrl" || token == "control")
            result |= XCB_MOD_MASK_CONTROL;
        else if (token == "alt")
            result |= XCB_MOD_MASK_1;
    }

    return result;
}

xcb_keysym_t KeybindManager::parse_keysym(std::string const& key)
{
    KeySym sym = XStringToKeysym(key.c_str());
    if (sym != NoSymbol)
    {
        return static_cast<xcb_keysym_t>(sym);
    }
    return XCB_NO_SYMBOL;
}

std::optional<ActionType> KeybindManager::parse_action(std::string const& name)
{
    if (name == "quit")
        return ActionType::Quit;
    if (name == "toggle_border")
        return ActionType::ToggleBorder;
    return std::nullopt;
}

} // namespace topclock
