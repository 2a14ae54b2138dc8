#pragma once

#include "connection.hpp"
#include <string>
#include <vector>
#include <xcb/xcb_ewmh.h>

namespace topclock {

struct FrameExtents
{
    uint32_t left = 0;
    uint32_t right = 0;
    uint32_t top = 0;
    uint32_t bottom = 0;
};

/**
 * @brief Client-side EWMH helpers for the clock window.
 *
 * Before the window is mapped its _NET_WM_STATE is written directly; once
 * mapped, state changes go through a client message to the root window so
 * the window manager applies them.
 */
class Ewmh
{
public:
    explicit Ewmh(Connection& conn);
    ~Ewmh();

    Ewmh(Ewmh const&) = delete;
    Ewmh& operator=(Ewmh const&) = delete;

    void set_wm_name(xcb_window_t window, std::string const& name);
    void set_wm_pid(xcb_window_t window, uint32_t pid);

    // Unmapped windows only
    void set_initial_state(xcb_window_t window, std::vector<xcb_atom_t> const& states);

    // Mapped windows: ask the window manager
    void request_state(xcb_window_t window, xcb_atom_t state, bool enabled);

    bool has_window_state(xcb_window_t window, xcb_atom_t state) const;

    /// Decoration size reported by the window manager (zeros when there is none)
    FrameExtents frame_extents(xcb_window_t window) const;

    xcb_ewmh_connection_t* get() { return &ewmh_; }
    xcb_ewmh_connection_t* get() const { return &ewmh_; }

private:
    Connection& conn_;
    mutable xcb_ewmh_connection_t ewmh_; // mutable: XCB EWMH API isn't const-correct
};

} // namespace topclock
