#pragma once

#include "topclock/core/display.hpp"
#include "topclock/core/geometry_controller.hpp"
#include "topclock/core/types.hpp"

namespace topclock {

struct DragSettings
{
    int32_t threshold = DEFAULT_DRAG_THRESHOLD;
    bool requires_borderless = true;
};

/**
 * @brief Click-versus-drag state machine for the primary pointer button.
 *
 * The lifecycle is:
 *   Idle -(press)-> ArmedAtPress -(travel past threshold, borderless)-> Dragging
 *   ArmedAtPress -(release)-> Idle, toggles the border (a click)
 *   Dragging -(release)-> Idle, commits the new position
 *
 * Polling is suspended from press to release so the per-frame poll does not
 * fight the manual moves. While dragging the window is moved directly on the
 * display; the cached record only learns the position on release.
 */
class DragController
{
public:
    enum class State
    {
        Idle,
        ArmedAtPress,
        Dragging
    };

    DragController(GeometryController& geometry, DragSettings settings);

    /// Returns true when the gesture left the geometry dirty (needs saving).
    bool handle(PointerEvent const& event);

    State state() const { return state_; }

private:
    GeometryController& geometry_;
    DragSettings settings_;
    State state_ = State::Idle;
    Point press_local_;
    Point press_screen_;
    Point press_window_;
    bool disqualified_ = false; // moved too far to be a click, but could not drag

    void press(PointerEvent const& event);
    void move(PointerEvent const& event);
    bool release();
};

} // namespace topclock
