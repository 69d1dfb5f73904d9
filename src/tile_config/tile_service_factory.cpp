#include "tile_config/tile_service_factory.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

#include "tile_config/errors.hpp"

namespace tile_config {

namespace {
constexpr char k_openstreetmap_base_url[] = "https://tile.openstreetmap.org"; /**< Standard OSM raster tiles. */
constexpr char k_openstreetmap_path[] = "/{Z}/{X}/{Y}.png";
constexpr char k_mapbox_satellite_path[] = "/v4/mapbox.satellite/{Z}/{X}/{Y}.png"; /**< Mapbox satellite raster tileset. */
constexpr char k_maplibre_demo_path[] = "/tiles/{Z}/{X}/{Y}.pbf"; /**< Public MapLibre demo vector tiles. */
}  // namespace

/**
 * @brief Build a tile service descriptor for the requested upstream.
 */
TileServiceDescriptor make_tile_service_descriptor(std::string_view upstream_name) {
    std::string canonical_name{upstream_name};
    std::transform(canonical_name.begin(), canonical_name.end(), canonical_name.begin(), [](unsigned char value) {
        return static_cast<char>(std::toupper(value));
    });

    TileServiceDescriptor descriptor{};
    descriptor.name = canonical_name;

    if (canonical_name == "OPENSTREETMAP") {
        descriptor.tile_server_options.withBaseURL(k_openstreetmap_base_url);
        descriptor.url_template = std::string{k_openstreetmap_base_url} + k_openstreetmap_path;
    } else if (canonical_name == "MAPBOX_SATELLITE") {
        descriptor.tile_server_options = mbgl::TileServerOptions::MapboxConfiguration();
        descriptor.url_template = descriptor.tile_server_options.baseURL() + k_mapbox_satellite_path;
    } else if (canonical_name == "MAPLIBRE_DEMO") {
        descriptor.tile_server_options = mbgl::TileServerOptions::MapLibreConfiguration();
        descriptor.url_template = descriptor.tile_server_options.baseURL() + k_maplibre_demo_path;
    } else {
        throw ConfigurationError(fmt::format(R"(Unknown upstream tile provider: "{}")", upstream_name));
    }

    return descriptor;
}

}  // namespace tile_config
