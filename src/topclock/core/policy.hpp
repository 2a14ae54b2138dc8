#pragma once

#include "topclock/core/types.hpp"
#include <cstdint>
#include <optional>
#include <span>

namespace topclock::chrome_policy {

// One rule drives every border transition: the outer footprint
// (content + chrome while decorated) is what the user sees, and it is what
// a border change keeps stable.

inline int32_t footprint_height(int32_t content_height, bool border, int32_t chrome_height)
{
    return border ? content_height + chrome_height : content_height;
}

inline int32_t content_height_for(int32_t footprint, bool border, int32_t chrome_height)
{
    return border ? footprint - chrome_height : footprint;
}

/// Content height to request before switching from `from_border` to `to_border`.
inline int32_t transition_height(int32_t content_height, bool from_border, bool to_border, int32_t chrome_height)
{
    return content_height_for(footprint_height(content_height, from_border, chrome_height), to_border, chrome_height);
}

/**
 * @brief Height to request at startup while the window is still in its live border state.
 *
 * The stored height was captured in `target_border` state. Translating it into
 * the live state means the later footprint-preserving set_decorated() lands
 * exactly on the stored content height.
 */
inline int32_t startup_height(int32_t stored_height, bool live_border, bool target_border, int32_t chrome_height)
{
    return transition_height(stored_height, target_border, live_border, chrome_height);
}

/// Height to request when toggling a visible window from `live_border` to `want_border`.
inline int32_t toggle_height(int32_t live_height, bool live_border, bool want_border, int32_t chrome_height)
{
    return transition_height(live_height, live_border, want_border, chrome_height);
}

} // namespace topclock::chrome_policy

namespace topclock::placement_policy {

/// Integer division rounding toward negative infinity.
inline int32_t floor_div(int32_t value, int32_t divisor)
{
    int32_t quotient = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0)))
        --quotient;
    return quotient;
}

/// monitor_origin + floor((monitor_size - window_size) / 2)
inline Point centered_position(Rect monitor, Size window)
{
    return { monitor.x + floor_div(monitor.width - window.width, 2),
             monitor.y + floor_div(monitor.height - window.height, 2) };
}

} // namespace topclock::placement_policy

namespace topclock::monitor_policy {

inline bool is_valid_index(int32_t index, int32_t count) { return index >= 0 && index < count; }

/// Invalid indices fall back to the first monitor.
inline int32_t resolve_index(int32_t index, int32_t count) { return is_valid_index(index, count) ? index : 0; }

inline std::optional<int32_t> monitor_index_at_point(std::span<Rect const> monitors, Point point)
{
    for (size_t i = 0; i < monitors.size(); ++i)
    {
        if (monitors[i].contains(point))
            return static_cast<int32_t>(i);
    }
    return std::nullopt;
}

/// Monitor holding the window's centre, or the first monitor when it is off-screen.
inline int32_t monitor_for_window(std::span<Rect const> monitors, Point position, Size size)
{
    Point center{ position.x + size.width / 2, position.y + size.height / 2 };
    return monitor_index_at_point(monitors, center).value_or(0);
}

} // namespace topclock::monitor_policy

namespace topclock::drag_policy {

/// True when the pointer travelled strictly further than `threshold` pixels.
inline bool exceeds_threshold(Point press, Point current, int32_t threshold)
{
    int64_t dx = static_cast<int64_t>(current.x) - press.x;
    int64_t dy = static_cast<int64_t>(current.y) - press.y;
    int64_t limit = static_cast<int64_t>(threshold) * threshold;
    return dx * dx + dy * dy > limit;
}

inline bool can_drag(bool border, bool requires_borderless) { return !requires_borderless || !border; }

/// press_window_position + (pointer_screen - press_pointer_screen)
inline Point dragged_position(Point press_window, Point press_screen, Point current_screen)
{
    return { press_window.x + (current_screen.x - press_screen.x), press_window.y + (current_screen.y - press_screen.y) };
}

} // namespace topclock::drag_policy
