#pragma once

#include "topclock/core/types.hpp"
#include <filesystem>
#include <string>

namespace topclock {

/**
 * @brief File-backed persistence of the window geometry.
 *
 * Reads and writes only PersistedGeometry, so runtime flags cannot leak into
 * the file. The file is a small JSON document:
 *
 *   {
 *       "version": 1.0,
 *       "screen": {
 *           "height": 100,
 *           "width": 300,
 *           "monitor": 0,
 *           "position": { "x": 810, "y": 490 },
 *           "border": true
 *       }
 *   }
 *
 * It is read once at startup and overwritten wholesale on every save.
 */
class GeometryStore
{
public:
    static constexpr double FORMAT_VERSION = 1.0;

    enum class LoadStatus
    {
        Loaded,
        NotFound,
        Malformed
    };

    struct LoadResult
    {
        LoadStatus status = LoadStatus::NotFound;
        PersistedGeometry geometry; // defaults unless Loaded
    };

    explicit GeometryStore(std::filesystem::path path);

    LoadResult load() const;
    bool save(PersistedGeometry const& geometry) const;

    std::filesystem::path const& path() const { return path_; }

    static std::string serialize(PersistedGeometry const& geometry);

private:
    std::filesystem::path path_;
};

/// Seed the live record from a load result. Anything but a real record means first run.
WindowGeometry initial_geometry(GeometryStore::LoadResult const& result);

} // namespace topclock
