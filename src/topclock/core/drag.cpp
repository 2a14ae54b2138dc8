/**
 * @file drag.cpp
 * @brief Pointer press/move/release handling for the clock window
 *
 * A press arms the controller and suspends geometry polling. Travel past the
 * threshold turns the gesture into a window move (borderless windows only by
 * default; decorated windows are moved through their titlebar). A release
 * without travel is a click and toggles the border.
 */

#include "drag.hpp"
#include "topclock/core/log.hpp"
#include "topclock/core/policy.hpp"

namespace topclock {

DragController::DragController(GeometryController& geometry, DragSettings settings)
    : geometry_(geometry)
    , settings_(settings)
{
}

bool DragController::handle(PointerEvent const& event)
{
    if (event.button != PRIMARY_BUTTON)
        return false;

    switch (event.kind)
    {
        case PointerEvent::Kind::Press:
            press(event);
            return false;
        case PointerEvent::Kind::Move:
            move(event);
            return false;
        case PointerEvent::Kind::Release:
            return release();
    }
    return false;
}

void DragController::press(PointerEvent const& event)
{
    if (state_ != State::Idle)
        return;

    state_ = State::ArmedAtPress;
    press_local_ = event.local;
    press_screen_ = event.screen;
    press_window_ = geometry_.display().position();
    disqualified_ = false;
    geometry_.set_suspended(true);

    LOG_TRACE(
        "Press at local ({}, {}) screen ({}, {}), window at ({}, {})",
        press_local_.x,
        press_local_.y,
        press_screen_.x,
        press_screen_.y,
        press_window_.x,
        press_window_.y
    );
}

void DragController::move(PointerEvent const& event)
{
    if (state_ == State::ArmedAtPress)
    {
        if (disqualified_ || !drag_policy::exceeds_threshold(press_screen_, event.screen, settings_.threshold))
            return;

        if (!drag_policy::can_drag(geometry_.display().decorated(), settings_.requires_borderless))
        {
            disqualified_ = true;
            LOG_DEBUG("Pointer moved past threshold on a decorated window, not a click");
            return;
        }

        state_ = State::Dragging;
        LOG_DEBUG("Drag started");
    }

    if (state_ != State::Dragging)
        return;

    Point target = drag_policy::dragged_position(press_window_, press_screen_, event.screen);
    geometry_.display().set_position(target);
}

bool DragController::release()
{
    State previous = state_;
    state_ = State::Idle;

    switch (previous)
    {
        case State::Idle:
            return false;

        case State::Dragging:
            geometry_.capture_position();
            geometry_.set_suspended(false);
            LOG_DEBUG(
                "Drag ended at ({}, {})",
                geometry_.persisted().position.x,
                geometry_.persisted().position.y
            );
            return true;

        case State::ArmedAtPress:
            geometry_.set_suspended(false);
            if (disqualified_)
                return false;
            geometry_.toggle_border();
            return true;
    }
    return false;
}

} // namespace topclock
