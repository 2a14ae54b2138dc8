#pragma once

#include "connection.hpp"
#include "ewmh.hpp"
#include "topclock/core/display.hpp"
#include "topclock/core/size_tracker.hpp"
#include "topclock/core/types.hpp"
#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace topclock {

struct Monitor
{
    xcb_randr_output_t output = XCB_NONE;
    std::string name;
    Rect bounds;
};

/// Window width or height as the protocol carries it: 16 bits, at least 1.
inline uint16_t window_dimension(int32_t value)
{
    return static_cast<uint16_t>(std::clamp<int32_t>(value, 1, UINT16_MAX));
}

struct XcbDisplaySettings
{
    std::string title = "clock";
    Size initial_size{ DEFAULT_WIDTH, DEFAULT_HEIGHT };
    int32_t chrome_height = DEFAULT_CHROME_HEIGHT;
    uint32_t background = 0x000000;
};

/**
 * @brief DisplayBackend over a single top-level XCB window.
 *
 * Decorations are requested through _MOTIF_WM_HINTS, always-on-top through
 * _NET_WM_STATE_ABOVE, resizability through WM_NORMAL_HINTS. Monitors come
 * from RandR CRTCs (one fallback monitor covering the screen otherwise).
 *
 * Border changes compensate from the last requested size, since a window
 * manager may not have applied an earlier resize when the change is made.
 *
 * Positions are the top-left corner of the frame: the content origin minus
 * the _NET_FRAME_EXTENTS the window manager reports.
 */
class XcbDisplay : public DisplayBackend
{
public:
    XcbDisplay(Connection& conn, Ewmh& ewmh, XcbDisplaySettings settings);
    ~XcbDisplay() override;

    XcbDisplay(XcbDisplay const&) = delete;
    XcbDisplay& operator=(XcbDisplay const&) = delete;

    void map();
    void detect_monitors();

    xcb_window_t window() const { return window_; }
    std::vector<Monitor> const& monitors() const { return monitors_; }
    bool is_delete_request(xcb_client_message_event_t const& e) const;
    void handle_configure_notify(xcb_configure_notify_event_t const& e);

    // DisplayBackend
    Size content_size() const override;
    void set_content_size(Size size) override;
    Point position() const override;
    void set_position(Point position) override;
    int32_t monitor_count() const override;
    int32_t current_monitor() const override;
    Rect monitor_bounds(int32_t index) const override;
    void set_monitor(int32_t index) override;
    bool decorated() const override { return decorated_; }
    void set_decorated(bool decorated) override;
    bool always_on_top() const override;
    void set_always_on_top(bool enabled) override;
    bool resizable() const override { return resizable_; }
    void set_resizable(bool enabled) override;

private:
    Connection& conn_;
    Ewmh& ewmh_;
    XcbDisplaySettings settings_;
    xcb_window_t window_ = XCB_NONE;
    std::vector<Monitor> monitors_;
    SizeTracker size_tracker_;
    bool mapped_ = false;
    bool decorated_ = true; // X windows start out decorated by the window manager
    bool resizable_ = true;
    xcb_atom_t motif_wm_hints_ = XCB_NONE;
    xcb_atom_t wm_protocols_ = XCB_NONE;
    xcb_atom_t wm_delete_window_ = XCB_NONE;

    void create_window();
    void create_fallback_monitor();
    void write_motif_hints(bool decorated);
    void update_normal_hints(Size size, Point position);
    std::vector<Rect> monitor_rects() const;
};

} // namespace topclock
