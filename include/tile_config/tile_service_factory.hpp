// === Tile Service Factory ====================================================
//
// Catalog of well-known upstream tile services a reverse proxy provider can
// name instead of spelling out a URL template.

#pragma once

#include <string>
#include <string_view>

#include <mbgl/util/tile_server_options.hpp>

namespace tile_config {

struct TileServiceDescriptor final {
    std::string name{};                                /**< Canonical upper-case service name. */
    mbgl::TileServerOptions tile_server_options{};     /**< Server options for the upstream host. */
    std::string url_template{};                        /**< Tile URL with {Z}, {X} and {Y} placeholders. */
};

/**
 * @brief Build a descriptor for a named upstream, matched case-insensitively.
 *
 * @throws ConfigurationError for names outside the catalog.
 */
TileServiceDescriptor make_tile_service_descriptor(std::string_view upstream_name);

}  // namespace tile_config
