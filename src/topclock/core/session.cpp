#include "session.hpp"
#include "topclock/core/log.hpp"

namespace topclock {

ClockSession::ClockSession(DisplayBackend& display, GeometryStore const& store, SessionSettings const& settings)
    : store_(store)
    , flags_(settings.flags)
    , geometry_(display, settings.chrome_height)
    , drag_(geometry_, settings.drag)
    , scheduler_(settings.save_delay, [this]() { return store_.save(geometry_.persisted()); })
{
}

void ClockSession::start(WindowGeometry const& initial, Clock::time_point now)
{
    geometry_.apply_flags(flags_);
    geometry_.apply_saved(initial);

    // Nothing on disk yet: persist the centred placement once it settles
    if (initial.needs_centering)
        scheduler_.notify_changed(now);
}

void ClockSession::handle_pointer(PointerEvent const& event, Clock::time_point now)
{
    if (drag_.handle(event))
        scheduler_.notify_changed(now);
}

void ClockSession::toggle_border(Clock::time_point now)
{
    if (geometry_.toggle_border())
        scheduler_.notify_changed(now);
}

void ClockSession::step(Clock::time_point now)
{
    if (geometry_.poll())
        scheduler_.notify_changed(now);

    scheduler_.tick(now);
}

void ClockSession::shutdown()
{
    scheduler_.flush();
}

} // namespace topclock
