#pragma once

#include "topclock/core/display.hpp"
#include "topclock/core/types.hpp"
#include <optional>

namespace topclock {

struct WindowFlags
{
    bool always_on_top = true;
    bool resizable = true;
};

/**
 * @brief Reconciles the border state with window size and position.
 *
 * Owns the live WindowGeometry and keeps it in step with the display through
 * three entry points:
 *   apply_saved  -> once at startup (monitor, size, border, position, centering)
 *   poll         -> once per frame, reports OS-driven resizes and moves
 *   set_border   -> explicit user toggle with chrome-height compensation
 */
class GeometryController
{
public:
    GeometryController(DisplayBackend& display, int32_t chrome_height);

    GeometryController(GeometryController const&) = delete;
    GeometryController& operator=(GeometryController const&) = delete;

    void apply_flags(WindowFlags const& flags);

    /**
     * @brief Push a loaded (or default) record onto the freshly created window.
     *
     * Order matters: monitor before position, then size, then border, and the
     * position last because a decoration change may shift the window. When
     * `needs_centering` is set the window is centred on the resolved monitor
     * and the flag is cleared.
     */
    void apply_saved(WindowGeometry const& saved);

    /**
     * @brief Compare the live window against the cached record.
     *
     * Returns the new snapshot when any field differs (and caches it), or
     * nullopt when nothing changed or polling is suspended.
     */
    std::optional<PersistedGeometry> poll();

    /// Returns false when the window is already in the requested state.
    bool set_border(bool want_border);
    bool toggle_border();

    void set_suspended(bool suspended);
    bool suspended() const { return geometry_.suspended; }

    /// Copy the display's live position into the cached record.
    void capture_position();

    WindowGeometry const& geometry() const { return geometry_; }
    PersistedGeometry const& persisted() const { return geometry_.persisted; }
    DisplayBackend& display() { return display_; }
    int32_t chrome_height() const { return chrome_height_; }

private:
    DisplayBackend& display_;
    int32_t chrome_height_;
    WindowGeometry geometry_;

    PersistedGeometry snapshot() const;
};

} // namespace topclock
