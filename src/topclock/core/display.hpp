#pragma once

#include "types.hpp"
#include <cstdint>

namespace topclock {

/**
 * @brief Pointer transition delivered to the drag controller.
 *
 * `local` is relative to the window's content origin, `screen` is in root
 * coordinates. Both are captured from the same event.
 */
struct PointerEvent
{
    enum class Kind
    {
        Press,
        Move,
        Release
    };

    Kind kind = Kind::Move;
    uint8_t button = 1;
    Point local;
    Point screen;
};

constexpr uint8_t PRIMARY_BUTTON = 1;

/**
 * @brief Capability set the geometry and drag logic need from a windowing system.
 *
 * Calls are assumed to succeed once the window exists. Implementations:
 * XcbDisplay (x11/xcb_display.hpp) and the in-memory fake used by the tests.
 *
 * Decoration contract: set_decorated() preserves the outer footprint
 * (content + chrome while decorated). Removing decorations grows the content
 * area by the chrome height, adding them shrinks it by the same amount.
 */
class DisplayBackend
{
public:
    virtual ~DisplayBackend() = default;

    // Content area
    virtual Size content_size() const = 0;
    virtual void set_content_size(Size size) = 0;

    // Top-left corner of the window in screen space
    virtual Point position() const = 0;
    virtual void set_position(Point position) = 0;

    // Monitors, ordered left to right
    virtual int32_t monitor_count() const = 0;
    virtual int32_t current_monitor() const = 0;
    virtual Rect monitor_bounds(int32_t index) const = 0;

    /// Moves the window onto a monitor. Out-of-range indices resolve to monitor 0.
    virtual void set_monitor(int32_t index) = 0;

    // Window flags
    virtual bool decorated() const = 0;
    virtual void set_decorated(bool decorated) = 0;
    virtual bool always_on_top() const = 0;
    virtual void set_always_on_top(bool enabled) = 0;
    virtual bool resizable() const = 0;
    virtual void set_resizable(bool enabled) = 0;
};

} // namespace topclock
