// === Bounds ==================================================================
//
// A region of the tile pyramid given by two corners at possibly different
// zoom levels: the top-left corner at the finest zoom served and the
// bottom-right corner at the coarsest. Layers carry an optional Bounds to
// refuse tile requests outside the region.

#pragma once

#include <string>

#include "tile_config/types.hpp"

namespace tile_config {

/** @brief Inclusive tile-pyramid bounding region. */
class Bounds final {
  public:
    /**
     * @brief Construct from the two corners.
     *
     * @param upper_left_high Left-most column, top-most row, finest zoom.
     * @param lower_right_low Right-most column, bottom-most row, coarsest zoom.
     * @throws ConfigurationError when the high zoom is below the low zoom.
     */
    Bounds(TileCoordinate upper_left_high, TileCoordinate lower_right_low);

    [[nodiscard]] const TileCoordinate& upper_left_high() const noexcept;
    [[nodiscard]] const TileCoordinate& lower_right_low() const noexcept;

    /**
     * @brief True when `tile` lies outside the region.
     *
     * A tile covers an area, so its top-left corner is compared against the
     * bottom-right bound and its bottom-right corner against the top-left
     * bound, each after reprojecting to that bound's zoom.
     */
    [[nodiscard]] bool excludes(const TileCoordinate& tile) const;

  private:
    TileCoordinate upper_left_high_;
    TileCoordinate lower_right_low_;
};

std::string to_string(const Bounds& bounds);

}  // namespace tile_config
