#pragma once

#include "topclock/config/config.hpp"
#include "topclock/config/geometry_store.hpp"
#include "topclock/core/session.hpp"
#include "topclock/keybind/keybind.hpp"
#include "topclock/x11/connection.hpp"
#include "topclock/x11/ewmh.hpp"
#include "topclock/x11/renderer.hpp"
#include "topclock/x11/xcb_display.hpp"
#include <filesystem>

namespace topclock {

/**
 * @brief The clock process: one window, one frame loop.
 *
 * Each iteration waits on the X connection until the next frame deadline,
 * drains pending events (pointer and key input reach the session first),
 * then steps the session and redraws.
 */
class ClockApp
{
public:
    ClockApp(Config config, std::filesystem::path geometry_file);
    ~ClockApp() = default;

    ClockApp(ClockApp const&) = delete;
    ClockApp& operator=(ClockApp const&) = delete;

    void run();

private:
    Config config_;
    GeometryStore store_;
    WindowGeometry initial_;
    Connection conn_;
    Ewmh ewmh_;
    XcbDisplay display_;
    ClockRenderer renderer_;
    KeybindManager keybinds_;
    ClockSession session_;
    bool running_ = true;

    void handle_event(xcb_generic_event_t const& event);
    void handle_button_press(xcb_button_press_event_t const& e);
    void handle_button_release(xcb_button_release_event_t const& e);
    void handle_motion_notify(xcb_motion_notify_event_t const& e);
    void handle_key_press(xcb_key_press_event_t const& e);
    void handle_client_message(xcb_client_message_event_t const& e);
    void draw();
};

} // namespace topclock
