#include "save_scheduler.hpp"
#include "topclock/core/log.hpp"
#include <utility>

namespace topclock {

SaveScheduler::SaveScheduler(std::chrono::milliseconds interval, WriteFn write)
    : interval_(interval)
    , write_(std::move(write))
{
}

void SaveScheduler::notify_changed(Clock::time_point now)
{
    pending_ = true;
    last_change_ = now;
}

bool SaveScheduler::tick(Clock::time_point now)
{
    if (!pending_)
        return false;

    auto quiet = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_change_);
    if (quiet < interval_)
        return false;

    if (!write())
    {
        // Restart the quiet period so a failing disk is not hammered every frame
        last_change_ = now;
        return false;
    }

    LOG_DEBUG("Geometry saved after {}ms delay", quiet.count());
    return true;
}

bool SaveScheduler::flush()
{
    if (!pending_)
        return false;

    if (!write())
        return false;

    LOG_INFO("Final save on exit");
    return true;
}

bool SaveScheduler::write()
{
    if (!write_ || !write_())
    {
        LOG_ERROR("Geometry save failed, will retry after the next quiet period");
        return false;
    }
    pending_ = false;
    return true;
}

} // namespace topclock
