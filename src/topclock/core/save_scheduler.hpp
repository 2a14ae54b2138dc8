#pragma once

#include <chrono>
#include <functional>

namespace topclock {

/**
 * @brief Debounces geometry writes until a quiet period has elapsed.
 *
 * notify_changed() only records the time of the latest change; tick() performs
 * the write once `interval` has passed since then. Bursts of changes (a resize,
 * a drag) coalesce into one write. A failed write keeps the pending flag so the
 * next quiet period retries it. flush() forces the pending write at shutdown.
 */
class SaveScheduler
{
public:
    using Clock = std::chrono::steady_clock;
    using WriteFn = std::function<bool()>;

    SaveScheduler(std::chrono::milliseconds interval, WriteFn write);

    void notify_changed(Clock::time_point now);

    /// Returns true when a write succeeded during this call.
    bool tick(Clock::time_point now);

    /// Unconditional write of a pending change. Returns false when nothing was pending or the write failed.
    bool flush();

    bool pending() const { return pending_; }
    std::chrono::milliseconds interval() const { return interval_; }

private:
    std::chrono::milliseconds interval_;
    WriteFn write_;
    bool pending_ = false;
    Clock::time_point last_change_;

    bool write();
};

} // namespace topclock
