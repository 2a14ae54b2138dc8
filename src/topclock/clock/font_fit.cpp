#include "font_fit.hpp"

namespace topclock::clock {

FontFit fit_font(Size box, int32_t padding, MeasureFn const& measure)
{
    int32_t max_width = box.width - padding * 2;
    int32_t max_height = box.height - padding * 2;

    for (int32_t size = max_height; size > 1; --size)
    {
        TextExtent extent = measure(size);
        if (extent.width <= max_width)
            return { size, extent };
    }

    return { 1, measure(1) };
}

Point centered_text_origin(Size box, TextExtent extent)
{
    return { (box.width - extent.width) / 2, (box.height - extent.height) / 2 };
}

} // namespace topclock::clock
