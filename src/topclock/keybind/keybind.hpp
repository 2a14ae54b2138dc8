#pragma once

#include "topclock/config/config.hpp"
#include <map>
#include <optional>
#include <string>
#include <xcb/xcb.h>

namespace topclock {

struct KeyBinding
{
    uint16_t modifier;
    xcb_keysym_t keysym;

    auto operator<=>(KeyBinding const&) const = default;
};

enum class ActionType
{
    Quit,
    ToggleBorder
};

struct Action
{
    ActionType type;
};

/**
 * @brief Maps key presses on the clock window to actions.
 *
 * Bindings with an unknown key or action name are skipped with a warning.
 * Lock and Num Lock are ignored when resolving.
 */
class KeybindManager
{
public:
    explicit KeybindManager(Config const& config);

    std::optional<Action> resolve(uint16_t state, xcb_keysym_t keysym) const;
    size_t size() const { return bindings_.size(); }

    static uint16_t parse_modifier(std::string const& mod);
    static xcb_keysym_t parse_keysym(std::string const& key);
    static std::optional<ActionType> parse_action(std::string const& name);

private:
    std::map<KeyBinding, Action> bindings_;
};

} // namespace topclock
