#include "tile_config/geography.hpp"

#include <cmath>
#include <stdexcept>

#include <fmt/format.h>
#include <mbgl/util/constants.hpp>
#include <mbgl/util/geo.hpp>
#include <mbgl/util/projection.hpp>

#include "tile_config/errors.hpp"
#include "tile_config/json_fields.hpp"

namespace tile_config {

namespace {
constexpr std::string_view k_spherical_mercator_name{"spherical mercator"};
constexpr std::string_view k_wgs84_name{"WGS84"};
}  // namespace

std::string_view SphericalMercator::name() const noexcept {
    return k_spherical_mercator_name;
}

std::string_view SphericalMercator::srs() const noexcept {
    return "EPSG:3857";
}

TileCoordinate SphericalMercator::location_coordinate(const Location& location) const {
    mbgl::LatLng lat_lng{};
    try {
        lat_lng = mbgl::LatLng{location.latitude_deg, location.longitude_deg};
    } catch (const std::domain_error& exc) {
        throw ConfigurationError(fmt::format(
            "Invalid location ({}, {}): {}", location.latitude_deg, location.longitude_deg, exc.what()
        ));
    }
    const mbgl::Point<double> projected = mbgl::Projection::project(lat_lng, 1.0);
    return TileCoordinate{0.0, projected.x / mbgl::util::tileSize_D, projected.y / mbgl::util::tileSize_D};
}

Location SphericalMercator::coordinate_location(const TileCoordinate& coordinate) const {
    const double scale = std::pow(2.0, coordinate.zoom);
    const mbgl::Point<double> projected{coordinate.column * mbgl::util::tileSize_D, coordinate.row * mbgl::util::tileSize_D};
    const mbgl::LatLng lat_lng = mbgl::Projection::unproject(projected, scale);
    return Location{lat_lng.latitude(), lat_lng.longitude()};
}

std::string_view Wgs84::name() const noexcept {
    return k_wgs84_name;
}

std::string_view Wgs84::srs() const noexcept {
    return "EPSG:4326";
}

TileCoordinate Wgs84::location_coordinate(const Location& location) const {
    return TileCoordinate{0.0, (location.longitude_deg + 180.0) / 180.0, (90.0 - location.latitude_deg) / 180.0};
}

Location Wgs84::coordinate_location(const TileCoordinate& coordinate) const {
    const TileCoordinate base = coordinate.zoom_to(0.0);
    return Location{90.0 - base.row * 180.0, base.column * 180.0 - 180.0};
}

ProjectionPtr make_projection(std::string_view name) {
    const std::string lowered = lower_case(name);
    if (lowered == k_spherical_mercator_name) {
        return std::make_unique<SphericalMercator>();
    }
    if (lowered == lower_case(k_wgs84_name)) {
        return std::make_unique<Wgs84>();
    }
    throw ConfigurationError(fmt::format(R"(Unknown projection: "{}")", name));
}

}  // namespace tile_config
