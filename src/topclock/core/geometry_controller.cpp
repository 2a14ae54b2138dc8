#include "geometry_controller.hpp"
#include "topclock/core/log.hpp"
#include "topclock/core/policy.hpp"

namespace topclock {

GeometryController::GeometryController(DisplayBackend& display, int32_t chrome_height)
    : display_(display)
    , chrome_height_(chrome_height)
{
}

void GeometryController::apply_flags(WindowFlags const& flags)
{
    display_.set_resizable(flags.resizable);
    display_.set_always_on_top(flags.always_on_top);
}

void GeometryController::apply_saved(WindowGeometry const& saved)
{
    geometry_ = saved;
    auto& record = geometry_.persisted;

    // New windows come up decorated, but ask rather than assume
    bool live_border = display_.decorated();
    int32_t initial_height =
        chrome_policy::startup_height(record.height, live_border, record.border, chrome_height_);

    int32_t count = display_.monitor_count();
    if (!monitor_policy::is_valid_index(record.monitor, count))
    {
        LOG_DEBUG("Saved monitor {} not present ({} attached), display picks the fallback", record.monitor, count);
    }

    // Monitor first: placement is undefined until it is set
    display_.set_monitor(record.monitor);
    display_.set_content_size({ record.width, initial_height });
    display_.set_decorated(record.border);
    record.monitor = display_.current_monitor();

    if (geometry_.needs_centering)
    {
        record.position = placement_policy::centered_position(display_.monitor_bounds(record.monitor), record.size());
        geometry_.needs_centering = false;
        LOG_INFO("Centering on monitor {} at ({}, {})", record.monitor, record.position.x, record.position.y);
    }

    display_.set_position(record.position);

    LOG_DEBUG(
        "Applied geometry: {}x{} at ({}, {}) monitor={} border={} (initial height {})",
        record.width,
        record.height,
        record.position.x,
        record.position.y,
        record.monitor,
        record.border,
        initial_height
    );
}

std::optional<PersistedGeometry> GeometryController::poll()
{
    if (geometry_.suspended)
        return std::nullopt;

    PersistedGeometry live = snapshot();
    if (live == geometry_.persisted)
        return std::nullopt;

    geometry_.persisted = live;
    LOG_TRACE(
        "Geometry changed: {}x{} at ({}, {}) monitor={} border={}",
        live.width,
        live.height,
        live.position.x,
        live.position.y,
        live.monitor,
        live.border
    );
    return live;
}

bool GeometryController::set_border(bool want_border)
{
    bool live_border = display_.decorated();
    if (live_border == want_border)
        return false;

    // The cache may lag behind what the user currently sees
    Size live = display_.content_size();
    int32_t height = chrome_policy::toggle_height(live.height, live_border, want_border, chrome_height_);

    // set_decorated() carries the compensating resize
    display_.set_decorated(want_border);
    geometry_.persisted.border = want_border;
    geometry_.persisted.width = live.width;
    geometry_.persisted.height = height;

    LOG_INFO("Border {} ({}x{} -> {}x{})", want_border ? "on" : "off", live.width, live.height, live.width, height);
    return true;
}

bool GeometryController::toggle_border()
{
    return set_border(!geometry_.persisted.border);
}

void GeometryController::set_suspended(bool suspended)
{
    geometry_.suspended = suspended;
}

void GeometryController::capture_position()
{
    geometry_.persisted.position = display_.position();
}

PersistedGeometry GeometryController::snapshot() const
{
    PersistedGeometry live;
    Size size = display_.content_size();
    live.width = size.width;
    live.height = size.height;
    live.position = display_.position();
    live.monitor = display_.current_monitor();
    live.border = display_.decorated();
    return live;
}

} // namespace topclock
