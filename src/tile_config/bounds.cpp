#include "tile_config/bounds.hpp"

#include <fmt/format.h>

#include "tile_config/errors.hpp"

namespace tile_config {

Bounds::Bounds(TileCoordinate upper_left_high, TileCoordinate lower_right_low)
    : upper_left_high_(upper_left_high),
      lower_right_low_(lower_right_low) {
    if (upper_left_high_.zoom < lower_right_low_.zoom) {
        throw ConfigurationError(fmt::format(
            "Bounds high zoom {} is below low zoom {}", upper_left_high_.zoom, lower_right_low_.zoom
        ));
    }
}

const TileCoordinate& Bounds::upper_left_high() const noexcept {
    return upper_left_high_;
}

const TileCoordinate& Bounds::lower_right_low() const noexcept {
    return lower_right_low_;
}

bool Bounds::excludes(const TileCoordinate& tile) const {
    if (tile.zoom > upper_left_high_.zoom) {
        // too zoomed-in
        return true;
    }

    if (tile.zoom < lower_right_low_.zoom) {
        // too zoomed-out
        return true;
    }

    const TileCoordinate top_left = tile.zoom_to(lower_right_low_.zoom);
    if (top_left.column > lower_right_low_.column || top_left.row > lower_right_low_.row) {
        return true;
    }

    const TileCoordinate bottom_right = tile.right().down().zoom_to(upper_left_high_.zoom);
    if (bottom_right.column < upper_left_high_.column || bottom_right.row < upper_left_high_.row) {
        return true;
    }

    return false;
}

std::string to_string(const Bounds& bounds) {
    return fmt::format("Bounds {} - {}", to_string(bounds.upper_left_high()), to_string(bounds.lower_right_low()));
}

}  // namespace tile_config
