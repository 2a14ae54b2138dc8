#pragma once

#include "topclock/core/display.hpp"
#include "topclock/core/policy.hpp"
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace topclock::test {

/**
 * In-memory DisplayBackend. Follows the footprint contract on decoration
 * changes and records every mutating call for order assertions.
 *
 * With defer_resizes set, size changes queue until apply_pending(), the way a
 * window manager holds configure requests. Decoration changes then
 * compensate from the last requested size, as XcbDisplay does.
 */
class FakeDisplay : public DisplayBackend
{
public:
    explicit FakeDisplay(std::vector<Rect> monitors = { Rect{ 0, 0, 1920, 1080 } }, int32_t chrome_height = 35)
        : monitors_(std::move(monitors))
        , chrome_height_(chrome_height)
    {
    }

    std::vector<std::string> calls;
    int size_sets = 0;
    int position_sets = 0;
    bool defer_resizes = false;

    Size content_size() const override { return size_; }
    void set_content_size(Size size) override
    {
        calls.push_back("size");
        ++size_sets;
        request_size(size);
    }

    Point position() const override { return position_; }
    void set_position(Point position) override
    {
        calls.push_back("position");
        ++position_sets;
        position_ = position;
    }

    int32_t monitor_count() const override { return static_cast<int32_t>(monitors_.size()); }
    int32_t current_monitor() const override
    {
        return monitor_policy::monitor_for_window(monitors_, position_, size_);
    }
    Rect monitor_bounds(int32_t index) const override
    {
        return monitors_[static_cast<size_t>(monitor_policy::resolve_index(index, monitor_count()))];
    }
    void set_monitor(int32_t index) override
    {
        calls.push_back("monitor");
        position_ = monitor_bounds(index).origin();
    }

    bool decorated() const override { return decorated_; }
    void set_decorated(bool decorated) override
    {
        calls.push_back("decorated");
        if (decorated == decorated_)
            return;
        Size size = requested_;
        size.height = chrome_policy::transition_height(size.height, decorated_, decorated, chrome_height_);
        decorated_ = decorated;
        request_size(size);
    }

    bool always_on_top() const override { return always_on_top_; }
    void set_always_on_top(bool enabled) override { always_on_top_ = enabled; }
    bool resizable() const override { return resizable_; }
    void set_resizable(bool enabled) override { resizable_ = enabled; }

    // Simulate the user or window manager acting on the window
    void external_resize(Size size) { size_ = requested_ = size; }

    void apply_pending()
    {
        for (Size size : pending_)
            size_ = size;
        pending_.clear();
    }
    std::size_t pending_count() const { return pending_.size(); }
    void external_move(Point position) { position_ = position; }
    void external_decorate(bool decorated) { decorated_ = decorated; }

private:
    std::vector<Rect> monitors_;
    int32_t chrome_height_;
    Size size_{ 200, 80 };
    Size requested_{ 200, 80 };
    std::vector<Size> pending_;
    Point position_;
    bool decorated_ = true;
    bool always_on_top_ = false;
    bool resizable_ = true;

    void request_size(Size size)
    {
        requested_ = size;
        if (defer_resizes)
            pending_.push_back(size);
        else
            size_ = size;
    }
};

} // namespace topclock::test
