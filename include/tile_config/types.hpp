// === Core Types ==============================================================
//
// Collects the small value types shared across the builder: geographic
// locations, tile-pyramid coordinates and the enums describing provider
// options.

#pragma once

#include <string>

namespace tile_config {

/**
 * @brief Represents a latitude/longitude pair in decimal degrees.
 */
struct Location final {
    double latitude_deg{};   /**< Latitude in decimal degrees. */
    double longitude_deg{};  /**< Longitude in decimal degrees. */
};

/**
 * @brief Address in the tile pyramid.
 *
 * Row and column are fractional so that a point can be reprojected between
 * zoom levels without losing precision; whole numbers address a tile's
 * top-left corner. Each zoom step doubles (zooming in) or halves (zooming
 * out) both row and column.
 */
struct TileCoordinate final {
    double zoom{};    /**< Zoom level. */
    double column{};  /**< Column, growing eastward. */
    double row{};     /**< Row, growing southward. */

    /** @brief The same point expressed at zoom level `destination`. */
    [[nodiscard]] TileCoordinate zoom_to(double destination) const;
    /** @brief The same point expressed `delta` zoom levels away. */
    [[nodiscard]] TileCoordinate zoom_by(double delta) const;
    /** @brief Neighbor one column to the east. */
    [[nodiscard]] TileCoordinate right(double distance = 1.0) const noexcept;
    /** @brief Neighbor one row to the south. */
    [[nodiscard]] TileCoordinate down(double distance = 1.0) const noexcept;

    bool operator==(const TileCoordinate&) const = default;
};

/** @brief "(zoom, column, row)" rendering used in logs and diagnostics. */
std::string to_string(const TileCoordinate& coordinate);

/**
 * @brief Identifies how a vector data provider clips features to tiles.
 */
enum class ClipMode {
    Off,    /**< Features are emitted whole. */
    On,     /**< Features are clipped to the tile edge. */
    Padded  /**< Features are clipped to the tile edge plus a buffer. */
};

}  // namespace tile_config
