#include "geometry_store.hpp"
#include "topclock/core/log.hpp"
#include <cmath>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <optional>
#include <system_error>
#include <utility>

namespace topclock {

using json = nlohmann::json;

namespace {

constexpr int JSON_INDENT = 4;

// Values that do not fit an int32 are treated like a field of the wrong type
std::optional<int32_t> read_int(json const& object, char const* key)
{
    if (!object.is_object())
        return std::nullopt;
    auto it = object.find(key);
    if (it == object.end())
        return std::nullopt;

    constexpr auto lo = std::numeric_limits<int32_t>::min();
    constexpr auto hi = std::numeric_limits<int32_t>::max();

    if (it->is_number_integer())
    {
        if (it->is_number_unsigned())
        {
            auto v = it->get<uint64_t>();
            if (v > static_cast<uint64_t>(hi))
                return std::nullopt;
            return static_cast<int32_t>(v);
        }
        auto v = it->get<int64_t>();
        if (v < lo || v > hi)
            return std::nullopt;
        return static_cast<int32_t>(v);
    }
    // Positions are written as floats by older versions
    if (it->is_number_float())
    {
        double v = std::trunc(it->get<double>());
        if (!std::isfinite(v) || v < lo || v > hi)
            return std::nullopt;
        return static_cast<int32_t>(v);
    }
    return std::nullopt;
}

json const& member(json const& object, char const* key, json const& fallback)
{
    if (!object.is_object())
        return fallback;
    auto it = object.find(key);
    return it != object.end() ? *it : fallback;
}

std::optional<bool> read_bool(json const& object, char const* key)
{
    if (!object.is_object())
        return std::nullopt;
    auto it = object.find(key);
    if (it == object.end() || !it->is_boolean())
        return std::nullopt;
    return it->get<bool>();
}

} // namespace

GeometryStore::GeometryStore(std::filesystem::path path)
    : path_(std::move(path))
{
}

GeometryStore::LoadResult GeometryStore::load() const
{
    LoadResult result;

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec))
    {
        LOG_INFO("No geometry found at {}, using defaults", path_.string());
        result.status = LoadStatus::NotFound;
        return result;
    }

    std::ifstream in(path_);
    if (!in)
    {
        LOG_WARN("Cannot read geometry file {}, using defaults", path_.string());
        result.status = LoadStatus::Malformed;
        return result;
    }

    json root = json::parse(in, nullptr, false);
    if (root.is_discarded() || !root.is_object())
    {
        LOG_WARN("Malformed geometry file {}, using defaults", path_.string());
        result.status = LoadStatus::Malformed;
        return result;
    }

    json const empty = json::object();
    json const& screen = member(root, "screen", empty);
    json const& position = member(screen, "position", empty);
    auto& geometry = result.geometry;

    if (auto v = read_int(screen, "width"))
        geometry.width = *v;
    if (auto v = read_int(screen, "height"))
        geometry.height = *v;
    if (auto v = read_int(screen, "monitor"))
        geometry.monitor = *v;
    if (auto v = read_int(position, "x"))
        geometry.position.x = *v;
    if (auto v = read_int(position, "y"))
        geometry.position.y = *v;
    if (auto v = read_bool(screen, "border"))
        geometry.border = *v;

    result.status = LoadStatus::Loaded;
    LOG_INFO("Geometry loaded from {}", path_.string());
    return result;
}

bool GeometryStore::save(PersistedGeometry const& geometry) const
{
    std::error_code ec;
    if (path_.has_parent_path())
    {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec)
        {
            LOG_ERROR("Cannot create {}: {}", path_.parent_path().string(), ec.message());
            return false;
        }
    }

    std::ofstream out(path_, std::ios::trunc);
    if (!out)
    {
        LOG_ERROR("Cannot open {} for writing", path_.string());
        return false;
    }

    out << serialize(geometry);
    out.flush();
    if (!out)
    {
        LOG_ERROR("Failed writing {}", path_.string());
        return false;
    }

    LOG_INFO("Geometry saved to {}", path_.string());
    return true;
}

std::string GeometryStore::serialize(PersistedGeometry const& geometry)
{
    // ordered_json keeps the field order of the record
    nlohmann::ordered_json root;
    root["version"] = FORMAT_VERSION;
    auto& screen = root["screen"];
    screen["height"] = geometry.height;
    screen["width"] = geometry.width;
    screen["monitor"] = geometry.monitor;
    screen["position"]["x"] = geometry.position.x;
    screen["position"]["y"] = geometry.position.y;
    screen["border"] = geometry.border;
    return root.dump(JSON_INDENT) + '\n';
}

WindowGeometry initial_geometry(GeometryStore::LoadResult const& result)
{
    WindowGeometry geometry;
    geometry.persisted = result.geometry;
    geometry.needs_centering = result.status != GeometryStore::LoadStatus::Loaded;
    geometry.suspended = false;
    return geometry;
}

} // namespace topclock
