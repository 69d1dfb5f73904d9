#include "tile_config/types.hpp"

#include <cmath>

#include <fmt/format.h>

namespace tile_config {

TileCoordinate TileCoordinate::zoom_to(double destination) const {
    const double scale = std::pow(2.0, destination - zoom);
    return TileCoordinate{destination, column * scale, row * scale};
}

TileCoordinate TileCoordinate::zoom_by(double delta) const {
    return zoom_to(zoom + delta);
}

TileCoordinate TileCoordinate::right(double distance) const noexcept {
    return TileCoordinate{zoom, column + distance, row};
}

TileCoordinate TileCoordinate::down(double distance) const noexcept {
    return TileCoordinate{zoom, column, row + distance};
}

std::string to_string(const TileCoordinate& coordinate) {
    return fmt::format("({}, {}, {})", coordinate.zoom, coordinate.column, coordinate.row);
}

}  // namespace tile_config
