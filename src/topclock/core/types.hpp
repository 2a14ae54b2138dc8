#pragma once

#include <cstdint>

namespace topclock {

// ─────────────────────────────────────────────────────────────────────────────
// Constants
// ─────────────────────────────────────────────────────────────────────────────

/// Typical Linux titlebar height attributed to OS-drawn decorations
constexpr int32_t DEFAULT_CHROME_HEIGHT = 35;

/// Pointer travel (pixels) before a press becomes a drag
constexpr int32_t DEFAULT_DRAG_THRESHOLD = 3;

constexpr int32_t DEFAULT_WIDTH = 300;
constexpr int32_t DEFAULT_HEIGHT = 100;

// ─────────────────────────────────────────────────────────────────────────────
// Basic geometry types
// ─────────────────────────────────────────────────────────────────────────────

struct Point
{
    int32_t x = 0;
    int32_t y = 0;

    bool operator==(Point const&) const = default;
};

struct Size
{
    int32_t width = 0;
    int32_t height = 0;

    bool operator==(Size const&) const = default;
};

struct Rect
{
    int32_t x = 0;
    int32_t y = 0;
    int32_t width = 0;
    int32_t height = 0;

    Point origin() const { return { x, y }; }
    Size size() const { return { width, height }; }

    bool contains(Point p) const { return p.x >= x && p.x < x + width && p.y >= y && p.y < y + height; }

    bool operator==(Rect const&) const = default;
};

// ─────────────────────────────────────────────────────────────────────────────
// Window geometry record
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief The persisted subset of the window record.
 *
 * This is the only type the geometry store reads or writes. `height` is the
 * content height observed in the record's own border state; the outer
 * footprint is `height + chrome * border`.
 */
struct PersistedGeometry
{
    int32_t width = DEFAULT_WIDTH;
    int32_t height = DEFAULT_HEIGHT;
    int32_t monitor = 0;
    Point position;
    bool border = true;

    Size size() const { return { width, height }; }

    bool operator==(PersistedGeometry const&) const = default;
};

/**
 * @brief Live window record for the process lifetime.
 *
 * The runtime-only flags sit beside the persisted projection, never inside
 * it, so they cannot round-trip through storage.
 */
struct WindowGeometry
{
    PersistedGeometry persisted;
    bool needs_centering = false; ///< No usable record existed at load time
    bool suspended = false;       ///< Poll disabled while a press/drag is in progress
};

} // namespace topclock
