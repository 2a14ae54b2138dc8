#include "xcb_display.hpp"
#include "topclock/core/log.hpp"
#include "topclock/core/policy.hpp"
#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <unistd.h>
#include <utility>
#include <xcb/xcb_icccm.h>

namespace topclock {

namespace {

// _MOTIF_WM_HINTS layout (five 32-bit fields)
constexpr uint32_t MWM_HINTS_DECORATIONS = 1u << 1;
constexpr uint32_t MWM_DECOR_ALL = 1u << 0;

struct MotifWmHints
{
    uint32_t flags = 0;
    uint32_t functions = 0;
    uint32_t decorations = 0;
    int32_t input_mode = 0;
    uint32_t status = 0;
};

constexpr char WM_CLASS[] = "topclock\0topclock";

} // namespace

XcbDisplay::XcbDisplay(Connection& conn, Ewmh& ewmh, XcbDisplaySettings settings)
    : conn_(conn)
    , ewmh_(ewmh)
    , settings_(std::move(settings))
    , size_tracker_({ window_dimension(settings_.initial_size.width), window_dimension(settings_.initial_size.height) })
{
    motif_wm_hints_ = conn_.intern_atom("_MOTIF_WM_HINTS");
    wm_protocols_ = conn_.intern_atom("WM_PROTOCOLS");
    wm_delete_window_ = conn_.intern_atom("WM_DELETE_WINDOW");

    detect_monitors();
    create_window();

    if (conn_.has_randr())
    {
        xcb_randr_select_input(conn_.get(), conn_.screen()->root, XCB_RANDR_NOTIFY_MASK_SCREEN_CHANGE);
    }
    conn_.flush();
}

XcbDisplay::~XcbDisplay()
{
    if (window_ != XCB_NONE)
    {
        xcb_destroy_window(conn_.get(), window_);
        conn_.flush();
    }
}

void XcbDisplay::create_window()
{
    uint32_t event_mask = XCB_EVENT_MASK_EXPOSURE | XCB_EVENT_MASK_STRUCTURE_NOTIFY | XCB_EVENT_MASK_BUTTON_PRESS
        | XCB_EVENT_MASK_BUTTON_RELEASE | XCB_EVENT_MASK_BUTTON_MOTION | XCB_EVENT_MASK_KEY_PRESS;
    uint32_t mask = XCB_CW_BACK_PIXEL | XCB_CW_EVENT_MASK;
    uint32_t values[2] = { settings_.background, event_mask };

    uint16_t width = window_dimension(settings_.initial_size.width);
    uint16_t height = window_dimension(settings_.initial_size.height);

    window_ = xcb_generate_id(conn_.get());
    auto cookie = xcb_create_window_checked(
        conn_.get(),
        XCB_COPY_FROM_PARENT,
        window_,
        conn_.screen()->root,
        0,
        0,
        width,
        height,
        0,
        XCB_WINDOW_CLASS_INPUT_OUTPUT,
        conn_.screen()->root_visual,
        mask,
        values
    );
    if (auto* err = xcb_request_check(conn_.get(), cookie))
    {
        free(err);
        window_ = XCB_NONE;
        throw std::runtime_error("Failed to create the clock window");
    }

    xcb_icccm_set_wm_name(
        conn_.get(),
        window_,
        XCB_ATOM_STRING,
        8,
        static_cast<uint32_t>(settings_.title.size()),
        settings_.title.c_str()
    );
    ewmh_.set_wm_name(window_, settings_.title);
    ewmh_.set_wm_pid(window_, static_cast<uint32_t>(getpid()));
    xcb_icccm_set_wm_class(conn_.get(), window_, sizeof(WM_CLASS), WM_CLASS);
    xcb_icccm_set_wm_protocols(conn_.get(), window_, wm_protocols_, 1, &wm_delete_window_);
    update_normal_hints({ width, height }, { 0, 0 });
}

void XcbDisplay::map()
{
    xcb_map_window(conn_.get(), window_);
    mapped_ = true;
    conn_.flush();
}

void XcbDisplay::detect_monitors()
{
    monitors_.clear();

    if (!conn_.has_randr())
    {
        create_fallback_monitor();
        return;
    }

    auto res_cookie = xcb_randr_get_screen_resources_current(conn_.get(), conn_.screen()->root);
    auto* res_reply = xcb_randr_get_screen_resources_current_reply(conn_.get(), res_cookie, nullptr);

    if (!res_reply)
    {
        create_fallback_monitor();
        return;
    }

    int num_outputs = xcb_randr_get_screen_resources_current_outputs_length(res_reply);
    xcb_randr_output_t* outputs = xcb_randr_get_screen_resources_current_outputs(res_reply);

    for (int i = 0; i < num_outputs; ++i)
    {
        auto out_cookie = xcb_randr_get_output_info(conn_.get(), outputs[i], res_reply->config_timestamp);
        auto* out_reply = xcb_randr_get_output_info_reply(conn_.get(), out_cookie, nullptr);

        if (!out_reply)
            continue;
        if (out_reply->connection != XCB_RANDR_CONNECTION_CONNECTED || out_reply->crtc == XCB_NONE)
        {
            free(out_reply);
            continue;
        }

        int name_len = xcb_randr_get_output_info_name_length(out_reply);
        uint8_t* name_data = xcb_randr_get_output_info_name(out_reply);
        std::string output_name(reinterpret_cast<char*>(name_data), name_len);

        auto crtc_cookie = xcb_randr_get_crtc_info(conn_.get(), out_reply->crtc, res_reply->config_timestamp);
        auto* crtc_reply = xcb_randr_get_crtc_info_reply(conn_.get(), crtc_cookie, nullptr);

        if (crtc_reply && crtc_reply->width > 0 && crtc_reply->height > 0)
        {
            Monitor monitor;
            monitor.output = outputs[i];
            monitor.name = output_name;
            monitor.bounds = { crtc_reply->x, crtc_reply->y, crtc_reply->width, crtc_reply->height };
            monitors_.push_back(monitor);
        }

        free(crtc_reply);
        free(out_reply);
    }

    free(res_reply);

    if (monitors_.empty())
    {
        create_fallback_monitor();
        return;
    }

    std::ranges::sort(
        monitors_,
        [](Monitor const& a, Monitor const& b)
        { return a.bounds.x != b.bounds.x ? a.bounds.x < b.bounds.x : a.bounds.y < b.bounds.y; }
    );

    for (auto const& monitor : monitors_)
    {
        LOG_DEBUG(
            "Monitor {}: {}x{}+{}+{}",
            monitor.name,
            monitor.bounds.width,
            monitor.bounds.height,
            monitor.bounds.x,
            monitor.bounds.y
        );
    }
}

void XcbDisplay::create_fallback_monitor()
{
    Monitor monitor;
    monitor.name = "default";
    monitor.bounds = { 0, 0, conn_.screen()->width_in_pixels, conn_.screen()->height_in_pixels };
    monitors_.push_back(monitor);
}

bool XcbDisplay::is_delete_request(xcb_client_message_event_t const& e) const
{
    return e.window == window_ && e.type == wm_protocols_ && e.format == 32
        && e.data.data32[0] == wm_delete_window_;
}

void XcbDisplay::handle_configure_notify(xcb_configure_notify_event_t const& e)
{
    if (e.window != window_)
        return;

    if (!size_tracker_.observed({ e.width, e.height }, e.sequence))
        LOG_TRACE("Ignoring configure notify {}x{} older than the last resize", e.width, e.height);
}

Size XcbDisplay::content_size() const
{
    auto* reply = xcb_get_geometry_reply(conn_.get(), xcb_get_geometry(conn_.get(), window_), nullptr);
    if (!reply)
        return size_tracker_.size();

    Size size{ reply->width, reply->height };
    free(reply);
    return size;
}

void XcbDisplay::set_content_size(Size size)
{
    size = { window_dimension(size.width), window_dimension(size.height) };

    if (!resizable_)
        update_normal_hints(size, position());

    uint32_t values[] = { static_cast<uint32_t>(size.width), static_cast<uint32_t>(size.height) };
    auto cookie =
        xcb_configure_window(conn_.get(), window_, XCB_CONFIG_WINDOW_WIDTH | XCB_CONFIG_WINDOW_HEIGHT, values);
    size_tracker_.requested(size, static_cast<uint16_t>(cookie.sequence));
    conn_.flush();
}

Point XcbDisplay::position() const
{
    auto cookie = xcb_translate_coordinates(conn_.get(), window_, conn_.screen()->root, 0, 0);
    auto* reply = xcb_translate_coordinates_reply(conn_.get(), cookie, nullptr);
    if (!reply)
        return {};

    FrameExtents extents = ewmh_.frame_extents(window_);
    Point origin{ reply->dst_x - static_cast<int32_t>(extents.left), reply->dst_y - static_cast<int32_t>(extents.top) };
    free(reply);
    return origin;
}

void XcbDisplay::set_position(Point position)
{
    uint32_t values[] = { static_cast<uint32_t>(position.x), static_cast<uint32_t>(position.y) };
    xcb_configure_window(conn_.get(), window_, XCB_CONFIG_WINDOW_X | XCB_CONFIG_WINDOW_Y, values);
    conn_.flush();
}

int32_t XcbDisplay::monitor_count() const
{
    return static_cast<int32_t>(monitors_.size());
}

int32_t XcbDisplay::current_monitor() const
{
    auto rects = monitor_rects();
    return monitor_policy::monitor_for_window(rects, position(), content_size());
}

Rect XcbDisplay::monitor_bounds(int32_t index) const
{
    if (monitors_.empty())
        return { 0, 0, conn_.screen()->width_in_pixels, conn_.screen()->height_in_pixels };
    return monitors_[static_cast<size_t>(monitor_policy::resolve_index(index, monitor_count()))].bounds;
}

void XcbDisplay::set_monitor(int32_t index)
{
    set_position(monitor_bounds(index).origin());
}

void XcbDisplay::set_decorated(bool decorated)
{
    if (decorated == decorated_)
        return;

    // Window managers keep the client size when the frame changes; adjust it
    // so the outer footprint stays where it was. A geometry query could still
    // return a size from before a resize the window manager has not applied.
    Size content = size_tracker_.size();
    write_motif_hints(decorated);
    decorated_ = decorated;

    int32_t height =
        chrome_policy::transition_height(content.height, !decorated, decorated, settings_.chrome_height);
    set_content_size({ content.width, height });
}

void XcbDisplay::set_always_on_top(bool enabled)
{
    xcb_atom_t above = ewmh_.get()->_NET_WM_STATE_ABOVE;
    if (mapped_)
        ewmh_.request_state(window_, above, enabled);
    else
        ewmh_.set_initial_state(window_, enabled ? std::vector<xcb_atom_t>{ above } : std::vector<xcb_atom_t>{});

    conn_.flush();
}

bool XcbDisplay::always_on_top() const
{
    return ewmh_.has_window_state(window_, ewmh_.get()->_NET_WM_STATE_ABOVE);
}

void XcbDisplay::set_resizable(bool enabled)
{
    resizable_ = enabled;
    update_normal_hints(content_size(), position());
    conn_.flush();
}

void XcbDisplay::write_motif_hints(bool decorated)
{
    MotifWmHints hints;
    hints.flags = MWM_HINTS_DECORATIONS;
    hints.decorations = decorated ? MWM_DECOR_ALL : 0;

    xcb_change_property(
        conn_.get(),
        XCB_PROP_MODE_REPLACE,
        window_,
        motif_wm_hints_,
        motif_wm_hints_,
        32,
        sizeof(MotifWmHints) / sizeof(uint32_t),
        &hints
    );
}

void XcbDisplay::update_normal_hints(Size size, Point position)
{
    xcb_size_hints_t hints{};
    xcb_icccm_size_hints_set_position(&hints, 1, position.x, position.y);
    xcb_icccm_size_hints_set_win_gravity(&hints, XCB_GRAVITY_NORTH_WEST);
    if (resizable_)
    {
        xcb_icccm_size_hints_set_min_size(&hints, 1, 1);
    }
    else
    {
        xcb_icccm_size_hints_set_min_size(&hints, size.width, size.height);
        xcb_icccm_size_hints_set_max_size(&hints, size.width, size.height);
    }
    xcb_icccm_set_wm_normal_hints(conn_.get(), window_, &hints);
}

std::vector<Rect> XcbDisplay::monitor_rects() const
{
    std::vector<Rect> rects;
    rects.reserve(monitors_.size());
    for (auto const& monitor : monitors_)
        rects.push_back(monitor.bounds);
    return rects;
}

} // namespace topclock
