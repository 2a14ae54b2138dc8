/**
 * @file app_events.cpp
 * @brief X event dispatch for ClockApp
 *
 * Translates button and motion events into PointerEvents for the session,
 * resolves key presses through the keybind table, and handles window
 * manager close requests, configure notifications, exposure and monitor
 * changes.
 */

#include "app.hpp"
#include "topclock/core/log.hpp"

namespace topclock {

void ClockApp::handle_event(xcb_generic_event_t const& event)
{
    uint8_t response_type = event.response_type & ~0x80;

    if (conn_.has_randr() && response_type == conn_.randr_event_base() + XCB_RANDR_SCREEN_CHANGE_NOTIFY)
    {
        LOG_DEBUG("Screen layout changed, refreshing monitors");
        display_.detect_monitors();
        return;
    }

    switch (response_type)
    {
        case XCB_BUTTON_PRESS:
            handle_button_press(reinterpret_cast<xcb_button_press_event_t const&>(event));
            break;
        case XCB_BUTTON_RELEASE:
            handle_button_release(reinterpret_cast<xcb_button_release_event_t const&>(event));
            break;
        case XCB_MOTION_NOTIFY:
            handle_motion_notify(reinterpret_cast<xcb_motion_notify_event_t const&>(event));
            break;
        case XCB_KEY_PRESS:
            handle_key_press(reinterpret_cast<xcb_key_press_event_t const&>(event));
            break;
        case XCB_CLIENT_MESSAGE:
            handle_client_message(reinterpret_cast<xcb_client_message_event_t const&>(event));
            break;
        case XCB_CONFIGURE_NOTIFY:
            display_.handle_configure_notify(reinterpret_cast<xcb_configure_notify_event_t const&>(event));
            break;
        case XCB_EXPOSE:
        {
            auto const& e = reinterpret_cast<xcb_expose_event_t const&>(event);
            if (e.count == 0)
                draw();
            break;
        }
        case XCB_MAPPING_NOTIFY:
        {
            auto e = reinterpret_cast<xcb_mapping_notify_event_t const&>(event);
            xcb_refresh_keyboard_mapping(conn_.keysyms(), &e);
            break;
        }
        default:
            break;
    }
}

void ClockApp::handle_button_press(xcb_button_press_event_t const& e)
{
    PointerEvent pointer;
    pointer.kind = PointerEvent::Kind::Press;
    pointer.button = e.detail;
    pointer.local = { e.event_x, e.event_y };
    pointer.screen = { e.root_x, e.root_y };
    session_.handle_pointer(pointer, SaveScheduler::Clock::now());
}

void ClockApp::handle_button_release(xcb_button_release_event_t const& e)
{
    PointerEvent pointer;
    pointer.kind = PointerEvent::Kind::Release;
    pointer.button = e.detail;
    pointer.local = { e.event_x, e.event_y };
    pointer.screen = { e.root_x, e.root_y };
    session_.handle_pointer(pointer, SaveScheduler::Clock::now());
}

void ClockApp::handle_motion_notify(xcb_motion_notify_event_t const& e)
{
    if (!(e.state & XCB_BUTTON_MASK_1))
        return;

    PointerEvent pointer;
    pointer.kind = PointerEvent::Kind::Move;
    pointer.button = PRIMARY_BUTTON;
    pointer.local = { e.event_x, e.event_y };
    pointer.screen = { e.root_x, e.root_y };
    session_.handle_pointer(pointer, SaveScheduler::Clock::now());
}

void ClockApp::handle_key_press(xcb_key_press_event_t const& e)
{
    xcb_keysym_t keysym = xcb_key_symbols_get_keysym(conn_.keysyms(), e.detail, 0);
    LOG_KEY(e.state, keysym);
    auto action = keybinds_.resolve(e.state, keysym);
    if (!action)
        return;

    switch (action->type)
    {
        case ActionType::Quit:
            LOG_INFO("Quit requested from keyboard");
            running_ = false;
            break;
        case ActionType::ToggleBorder:
            session_.toggle_border(SaveScheduler::Clock::now());
            break;
    }
}

void ClockApp::handle_client_message(xcb_client_message_event_t const& e)
{
    if (display_.is_delete_request(e))
    {
        LOG_INFO("Window manager asked the clock to close");
        running_ = false;
    }
}

} // namespace topclock
