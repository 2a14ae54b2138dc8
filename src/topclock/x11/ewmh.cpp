#include "ewmh.hpp"
#include <stdexcept>

namespace topclock {

Ewmh::Ewmh(Connection& conn)
    : conn_(conn)
{
    xcb_intern_atom_cookie_t* cookies = xcb_ewmh_init_atoms(conn_.get(), &ewmh_);
    if (!xcb_ewmh_init_atoms_replies(&ewmh_, cookies, nullptr))
    {
        throw std::runtime_error("Failed to initialize EWMH atoms");
    }
}

Ewmh::~Ewmh()
{
    xcb_ewmh_connection_wipe(&ewmh_);
}

void Ewmh::set_wm_name(xcb_window_t window, std::string const& name)
{
    xcb_ewmh_set_wm_name(&ewmh_, window, static_cast<uint32_t>(name.size()), name.c_str());
}

void Ewmh::set_wm_pid(xcb_window_t window, uint32_t pid)
{
    xcb_ewmh_set_wm_pid(&ewmh_, window, pid);
}

void Ewmh::set_initial_state(xcb_window_t window, std::vector<xcb_atom_t> const& states)
{
    if (states.empty())
    {
        xcb_delete_property(conn_.get(), window, ewmh_._NET_WM_STATE);
        return;
    }
    xcb_ewmh_set_wm_state(&ewmh_, window, static_cast<uint32_t>(states.size()), const_cast<xcb_atom_t*>(states.data()));
}

void Ewmh::request_state(xcb_window_t window, xcb_atom_t state, bool enabled)
{
    xcb_ewmh_request_change_wm_state(
        &ewmh_,
        conn_.screen_number(),
        window,
        enabled ? XCB_EWMH_WM_STATE_ADD : XCB_EWMH_WM_STATE_REMOVE,
        state,
        XCB_NONE,
        XCB_EWMH_CLIENT_SOURCE_TYPE_NORMAL
    );
}

bool Ewmh::has_window_state(xcb_window_t window, xcb_atom_t state) const
{
    xcb_ewmh_get_atoms_reply_t current;
    if (!xcb_ewmh_get_wm_state_reply(&ewmh_, xcb_ewmh_get_wm_state(&ewmh_, window), &current, nullptr))
        return false;

    bool found = false;
    for (uint32_t i = 0; i < current.atoms_len; ++i)
    {
        if (current.atoms[i] == state)
        {
            found = true;
            break;
        }
    }
    xcb_ewmh_get_atoms_reply_wipe(&current);
    return found;
}

FrameExtents Ewmh::frame_extents(xcb_window_t window) const
{
    FrameExtents result;
    xcb_ewmh_get_extents_reply_t extents;
    if (xcb_ewmh_get_frame_extents_reply(&ewmh_, xcb_ewmh_get_frame_extents(&ewmh_, window), &extents, nullptr))
    {
        result.left = extents.left;
        result.right = extents.right;
        result.top = extents.top;
        result.bottom = extents.bottom;
    }
    return result;
}

} // namespace topclock
