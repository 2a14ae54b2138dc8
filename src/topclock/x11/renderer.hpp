#pragma once

#include "connection.hpp"
#include "topclock/clock/font_fit.hpp"
#include "topclock/clock/time_format.hpp"
#include "topclock/config/config.hpp"
#include <map>
#include <string_view>

namespace topclock {

/**
 * @brief Draws the colour-coded clock into a window.
 *
 * Frames are composed in an off-screen pixmap the size of the window and
 * copied over in one request. The font size is refitted only when the window
 * size changes.
 */
class ClockRenderer
{
public:
    ClockRenderer(Connection& conn, AppearanceConfig appearance);
    ~ClockRenderer();

    ClockRenderer(ClockRenderer const&) = delete;
    ClockRenderer& operator=(ClockRenderer const&) = delete;

    void draw(xcb_window_t window, Size size, clock::ClockTime const& time);

private:
    struct TextMetrics
    {
        clock::TextExtent extent;
        int32_t ascent = 0;
    };

    Connection& conn_;
    AppearanceConfig appearance_;
    xcb_gcontext_t gc_ = XCB_NONE;
    xcb_pixmap_t pixmap_ = XCB_NONE;
    Size pixmap_size_;
    xcb_font_t fallback_font_ = XCB_NONE;
    std::map<int32_t, xcb_font_t> fonts_; // XCB_NONE marks sizes that failed to open
    Size fitted_for_;
    clock::FontFit fit_;
    int32_t ascent_ = 0;
    bool warned_no_font_ = false;

    xcb_font_t open_font(std::string const& name);
    xcb_font_t font_for(int32_t size);
    TextMetrics measure(xcb_font_t font, std::string_view text) const;
    void refit(Size size, std::string const& sample);
    void ensure_pixmap(xcb_window_t window, Size size);
    uint32_t color_for(uint8_t code) const;
};

} // namespace topclock
