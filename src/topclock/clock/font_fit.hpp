#pragma once

#include "topclock/core/types.hpp"
#include <cstdint>
#include <functional>

namespace topclock::clock {

struct TextExtent
{
    int32_t width = 0;
    int32_t height = 0;

    bool operator==(TextExtent const&) const = default;
};

struct FontFit
{
    int32_t size = 1;
    TextExtent extent;
};

/// Measures the clock text at a given pixel size.
using MeasureFn = std::function<TextExtent(int32_t size)>;

/**
 * @brief Largest font size whose text fits the box minus padding.
 *
 * Starts from the available height and steps down one pixel at a time until
 * the measured width fits. Falls back to size 1.
 */
FontFit fit_font(Size box, int32_t padding, MeasureFn const& measure);

/// Top-left corner that centres `extent` inside `box`.
Point centered_text_origin(Size box, TextExtent extent);

} // namespace topclock::clock
