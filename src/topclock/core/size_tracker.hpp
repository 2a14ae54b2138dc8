#pragma once

#include "topclock/core/types.hpp"
#include <cstdint>

namespace topclock {

/**
 * @brief Content size the window is expected to have once outstanding
 * configure requests land.
 *
 * A window manager may hold a resize request for a while, so a geometry
 * query issued right after it still returns the old size. Chrome
 * compensation works from this value instead.
 *
 * Sequence numbers are the low 16 bits the X server stamps on events, so
 * comparisons wrap.
 */
class SizeTracker
{
public:
    explicit SizeTracker(Size initial)
        : size_(initial)
    {
    }

    void requested(Size size, uint16_t sequence)
    {
        size_ = size;
        request_sequence_ = sequence;
        pending_ = true;
    }

    /// Returns false for notifications generated before the last request was processed.
    bool observed(Size size, uint16_t event_sequence)
    {
        if (pending_ && sequence_before(event_sequence, request_sequence_))
            return false;
        size_ = size;
        pending_ = false;
        return true;
    }

    Size size() const { return size_; }
    bool pending() const { return pending_; }

    static bool sequence_before(uint16_t a, uint16_t b) { return static_cast<int16_t>(static_cast<uint16_t>(a - b)) < 0; }

private:
    Size size_;
    uint16_t request_sequence_ = 0;
    bool pending_ = false;
};

} // namespace topclock
