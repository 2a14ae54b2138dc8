#pragma once

#include "topclock/config/geometry_store.hpp"
#include "topclock/core/display.hpp"
#include "topclock/core/drag.hpp"
#include "topclock/core/geometry_controller.hpp"
#include "topclock/core/save_scheduler.hpp"
#include <chrono>

namespace topclock {

struct SessionSettings
{
    int32_t chrome_height = DEFAULT_CHROME_HEIGHT;
    WindowFlags flags;
    DragSettings drag;
    std::chrono::milliseconds save_delay{ 1000 };
};

/**
 * @brief Per-frame orchestration of geometry, dragging and persistence.
 *
 * Independent of any windowing system so the whole frame sequence runs
 * against a fake display in tests. Within one frame the caller must feed
 * input first (handle_pointer, toggle_border), then call step(): the poll
 * runs before the save check so a click-triggered toggle is bookkept in the
 * same frame.
 */
class ClockSession
{
public:
    using Clock = SaveScheduler::Clock;

    ClockSession(DisplayBackend& display, GeometryStore const& store, SessionSettings const& settings);

    ClockSession(ClockSession const&) = delete;
    ClockSession& operator=(ClockSession const&) = delete;

    /// Apply window flags and the loaded record. A first run schedules a save of the centred result.
    void start(WindowGeometry const& initial, Clock::time_point now);

    void handle_pointer(PointerEvent const& event, Clock::time_point now);
    void toggle_border(Clock::time_point now);

    /// Poll for external changes, then run the debounced save.
    void step(Clock::time_point now);

    /// Flush a pending save. Call once before the window goes away.
    void shutdown();

    GeometryController const& geometry() const { return geometry_; }
    DragController const& drag() const { return drag_; }
    SaveScheduler const& scheduler() const { return scheduler_; }

private:
    GeometryStore const& store_;
    WindowFlags flags_;
    GeometryController geometry_;
    DragController drag_;
    SaveScheduler scheduler_;
};

} // namespace topclock
