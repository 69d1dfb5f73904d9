// === Geography ===============================================================
//
// Projections translate between geographic locations and tile-pyramid
// coordinates. Layers name their projection in configuration; the builder
// uses it to turn geographic bounds into tile coordinates.

#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "tile_config/types.hpp"

namespace tile_config {

/** @brief Bidirectional transform between locations and tile coordinates. */
class Projection {
  public:
    virtual ~Projection() = default;

    /** @brief Name the projection is registered under. */
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    /** @brief Spatial reference identifier, e.g. "EPSG:3857". */
    [[nodiscard]] virtual std::string_view srs() const noexcept = 0;
    /** @brief Zoom-0 tile coordinate of a location. */
    [[nodiscard]] virtual TileCoordinate location_coordinate(const Location& location) const = 0;
    /** @brief Location of a tile coordinate at any zoom. */
    [[nodiscard]] virtual Location coordinate_location(const TileCoordinate& coordinate) const = 0;
};

/** @brief Web mercator, one square tile at zoom 0. */
class SphericalMercator final : public Projection {
  public:
    [[nodiscard]] std::string_view name() const noexcept override;
    [[nodiscard]] std::string_view srs() const noexcept override;
    [[nodiscard]] TileCoordinate location_coordinate(const Location& location) const override;
    [[nodiscard]] Location coordinate_location(const TileCoordinate& coordinate) const override;
};

/** @brief Unprojected latitude/longitude, two tiles side by side at zoom 0. */
class Wgs84 final : public Projection {
  public:
    [[nodiscard]] std::string_view name() const noexcept override;
    [[nodiscard]] std::string_view srs() const noexcept override;
    [[nodiscard]] TileCoordinate location_coordinate(const Location& location) const override;
    [[nodiscard]] Location coordinate_location(const TileCoordinate& coordinate) const override;
};

using ProjectionPtr = std::unique_ptr<const Projection>;

/**
 * @brief Look up a projection by its case-insensitive name.
 *
 * @throws ConfigurationError for names other than "spherical mercator" and "WGS84".
 */
ProjectionPtr make_projection(std::string_view name);

}  // namespace tile_config
