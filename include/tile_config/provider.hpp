// === Provider ================================================================
//
// Providers produce tile content for a layer. The builder only records each
// provider's validated parameters; rendering, proxying and archive reading
// are done by the serving process. A Provider is owned by its Layer and
// points back at it for context (projection, metatile, configuration).

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

#include "tile_config/class_loader.hpp"
#include "tile_config/tile_service_factory.hpp"
#include "tile_config/types.hpp"

namespace tile_config {

class Layer;

/** @brief Renders tiles from a map style file ("mapnik"). */
struct StyledRendererProvider final {
    std::string mapfile{};               /**< Style file path or URL. */
    std::optional<std::string> fonts{};  /**< Extra font directory. */
};

/** @brief Forwards tile requests to an upstream server ("proxy"). */
struct ReverseProxyProvider final {
    std::optional<std::string> url{};                    /**< Upstream URL template. */
    std::optional<TileServiceDescriptor> upstream{};     /**< Named upstream from the catalog. */
};

/** @brief Fetches images from a templated URL ("url template"). */
struct UrlTemplateProvider final {
    std::string url_template{};
};

/** @brief Serves vector features from a data source driver ("vector"). */
struct VectorDataProvider final {
    std::string driver{};                           /**< Driver name, e.g. "PostgreSQL" or "GeoJSON". */
    nlohmann::json parameters{};                    /**< Driver connection parameters. */
    std::optional<nlohmann::json> properties{};     /**< Property filter: list of names or rename mapping. */
    bool projected{};                               /**< Emit projected rather than geographic coordinates. */
    bool verbose{};                                 /**< Log queries. */
    std::optional<double> spacing{};                /**< Point spacing for simplification; absent disables it. */
    ClipMode clipped{ClipMode::On};
};

/** @brief Reads tiles from a tile archive ("mbtiles"). */
struct TileArchiveProvider final {
    std::string tileset{};  /**< Archive file reference. */
};

/** @brief Provider supplied by a plugin library. */
struct CustomProvider final {
    ResolvedSymbol constructor{};
    nlohmann::json kwargs{nlohmann::json::object()};
};

using ProviderBackend = std::variant<
    StyledRendererProvider,
    ReverseProxyProvider,
    UrlTemplateProvider,
    VectorDataProvider,
    TileArchiveProvider,
    CustomProvider>;

/** @brief Validated provider bound to its owning layer. */
class Provider final {
  public:
    Provider(const Layer& layer, ProviderBackend backend);

    /** @brief Layer that owns this provider. */
    [[nodiscard]] const Layer& layer() const noexcept;
    [[nodiscard]] const ProviderBackend& backend() const noexcept;
    /** @brief Variant name: "StyledRenderer", "ReverseProxy", "UrlTemplate", "VectorData", "TileArchive" or "Custom". */
    [[nodiscard]] std::string_view kind() const noexcept;

    template <typename Backend>
    [[nodiscard]] const Backend* get_if() const noexcept {
        return std::get_if<Backend>(&backend_);
    }

  private:
    const Layer* layer_;
    ProviderBackend backend_;
};

using ProviderPtr = std::unique_ptr<const Provider>;

/**
 * @brief Build a provider from a layer's "provider" section.
 *
 * `name` selects a builtin provider (case-insensitive: mapnik, proxy,
 * url template, vector, mbtiles); `class` selects a plugin with `kwargs`.
 *
 * @throws ConfigurationError for shape problems, unknown names and missing
 *         required fields.
 */
ProviderPtr build_provider(const nlohmann::json& spec, const Layer& layer);

}  // namespace tile_config
