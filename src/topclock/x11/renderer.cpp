#include "renderer.hpp"
#include "topclock/clock/color_codes.hpp"
#include "topclock/core/log.hpp"
#include <algorithm>
#include <cstdlib>
#include <utility>
#include <vector>

namespace topclock {

namespace {

std::string font_name_for(std::string const& pattern, int32_t size)
{
    std::string name = pattern;
    auto slot = name.find("{}");
    if (slot != std::string::npos)
        name.replace(slot, 2, std::to_string(size));
    return name;
}

} // namespace

ClockRenderer::ClockRenderer(Connection& conn, AppearanceConfig appearance)
    : conn_(conn)
    , appearance_(std::move(appearance))
    , gc_(xcb_generate_id(conn_.get()))
{
    fallback_font_ = open_font(appearance_.fallback_font);
    if (fallback_font_ == XCB_NONE)
    {
        LOG_WARN("Fallback font '{}' unavailable", appearance_.fallback_font);
    }

    uint32_t mask = XCB_GC_FOREGROUND | XCB_GC_BACKGROUND | XCB_GC_GRAPHICS_EXPOSURES;
    uint32_t values[3] = { appearance_.digits, appearance_.background, 0 };
    xcb_create_gc(conn_.get(), gc_, conn_.screen()->root, mask, values);
}

ClockRenderer::~ClockRenderer()
{
    for (auto const& [size, font] : fonts_)
    {
        if (font != XCB_NONE)
            xcb_close_font(conn_.get(), font);
    }
    if (fallback_font_ != XCB_NONE)
        xcb_close_font(conn_.get(), fallback_font_);
    if (pixmap_ != XCB_NONE)
        xcb_free_pixmap(conn_.get(), pixmap_);
    xcb_free_gc(conn_.get(), gc_);
}

void ClockRenderer::draw(xcb_window_t window, Size size, clock::ClockTime const& time)
{
    if (size.width <= 0 || size.height <= 0)
        return;

    std::string sample = clock::plain_text(time);
    if (size != fitted_for_)
        refit(size, sample);

    ensure_pixmap(window, size);

    uint32_t fill[] = { appearance_.background };
    xcb_change_gc(conn_.get(), gc_, XCB_GC_FOREGROUND, fill);
    xcb_rectangle_t rect = { 0, 0, static_cast<uint16_t>(size.width), static_cast<uint16_t>(size.height) };
    xcb_poly_fill_rectangle(conn_.get(), pixmap_, gc_, 1, &rect);

    xcb_font_t font = font_for(fit_.size);
    if (font != XCB_NONE)
    {
        Point origin = clock::centered_text_origin(size, fit_.extent);
        int32_t x = origin.x;
        int32_t baseline = origin.y + ascent_;

        std::string markup = clock::colored_markup(time);
        for (auto const& segment : clock::split_segments(markup))
        {
            if (segment.text.empty())
                continue;

            uint32_t values[] = { color_for(segment.color.value_or(0)), font };
            xcb_change_gc(conn_.get(), gc_, XCB_GC_FOREGROUND | XCB_GC_FONT, values);
            xcb_image_text_8(
                conn_.get(),
                static_cast<uint8_t>(segment.text.size()),
                pixmap_,
                gc_,
                static_cast<int16_t>(x),
                static_cast<int16_t>(baseline),
                segment.text.data()
            );
            x += measure(font, segment.text).extent.width;
        }
    }
    else if (!warned_no_font_)
    {
        LOG_ERROR("No usable font, clock text is not drawn");
        warned_no_font_ = true;
    }

    xcb_copy_area(
        conn_.get(),
        pixmap_,
        window,
        gc_,
        0,
        0,
        0,
        0,
        static_cast<uint16_t>(size.width),
        static_cast<uint16_t>(size.height)
    );
    conn_.flush();
}

xcb_font_t ClockRenderer::open_font(std::string const& name)
{
    xcb_font_t font = xcb_generate_id(conn_.get());
    auto cookie = xcb_open_font_checked(conn_.get(), font, static_cast<uint16_t>(name.size()), name.c_str());
    if (auto* err = xcb_request_check(conn_.get(), cookie))
    {
        free(err);
        return XCB_NONE;
    }
    return font;
}

xcb_font_t ClockRenderer::font_for(int32_t size)
{
    auto it = fonts_.find(size);
    if (it == fonts_.end())
    {
        std::string name = font_name_for(appearance_.font, size);
        xcb_font_t font = open_font(name);
        if (font == XCB_NONE)
            LOG_TRACE("Font '{}' unavailable", name);
        it = fonts_.emplace(size, font).first;
    }
    return it->second != XCB_NONE ? it->second : fallback_font_;
}

ClockRenderer::TextMetrics ClockRenderer::measure(xcb_font_t font, std::string_view text) const
{
    if (font == XCB_NONE || text.empty())
        return {};

    std::vector<xcb_char2b_t> chars;
    chars.reserve(text.size());
    for (char c : text)
        chars.push_back({ 0, static_cast<uint8_t>(c) });

    auto cookie = xcb_query_text_extents(conn_.get(), font, static_cast<uint32_t>(chars.size()), chars.data());
    auto* reply = xcb_query_text_extents_reply(conn_.get(), cookie, nullptr);
    if (!reply)
        return {};

    TextMetrics metrics;
    metrics.extent = { reply->overall_width, reply->font_ascent + reply->font_descent };
    metrics.ascent = reply->font_ascent;
    free(reply);
    return metrics;
}

void ClockRenderer::refit(Size size, std::string const& sample)
{
    fit_ = clock::fit_font(
        size,
        appearance_.padding,
        [this, &sample](int32_t font_size) { return measure(font_for(font_size), sample).extent; }
    );
    ascent_ = measure(font_for(fit_.size), sample).ascent;
    fitted_for_ = size;
    LOG_DEBUG("Font size {} for {}x{}", fit_.size, size.width, size.height);
}

void ClockRenderer::ensure_pixmap(xcb_window_t window, Size size)
{
    if (pixmap_ != XCB_NONE && pixmap_size_ == size)
        return;

    if (pixmap_ != XCB_NONE)
        xcb_free_pixmap(conn_.get(), pixmap_);

    pixmap_ = xcb_generate_id(conn_.get());
    xcb_create_pixmap(
        conn_.get(),
        conn_.screen()->root_depth,
        pixmap_,
        window,
        static_cast<uint16_t>(size.width),
        static_cast<uint16_t>(size.height)
    );
    pixmap_size_ = size;
}

uint32_t ClockRenderer::color_for(uint8_t code) const
{
    switch (code)
    {
        case 1:
            return appearance_.separators;
        case 2:
            return appearance_.meridiem;
        default:
            return appearance_.digits;
    }
}

} // namespace topclock
