// === Layer ===================================================================
//
// A layer is the named unit tiles are requested from: it binds a projection,
// a provider, metatile batching, optional serving bounds and cache behavior
// knobs. This header also declares the layer collection interface a
// Configuration exposes and the factory that assembles a Layer from its
// configuration section.

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "tile_config/bounds.hpp"
#include "tile_config/geography.hpp"
#include "tile_config/provider.hpp"
#include "tile_config/types.hpp"

namespace tile_config {

class Configuration;

/** @brief Render-time batching of adjacent tiles. */
struct Metatile final {
    int buffer{0};   /**< Extra pixels rendered around the batch. */
    int rows{1};     /**< Tiles per batch, vertically. */
    int columns{1};  /**< Tiles per batch, horizontally. */

    /** @brief True when more than one tile is rendered per batch. */
    [[nodiscard]] bool is_for_real() const noexcept {
        return rows > 1 || columns > 1;
    }
};

/** @brief Preview page parameters; each is independently optional. */
struct PreviewOptions final {
    std::optional<double> lat{};
    std::optional<double> lon{};
    std::optional<int> zoom{};
    std::optional<std::string> ext{};
};

/** @brief Cache and serving knobs read from a layer section. */
struct LayerOptions final {
    std::optional<int> cache_lifespan{};          /**< Seconds a cached tile stays fresh. */
    std::optional<int> stale_lock_timeout{};      /**< Seconds before a render lock is considered stale. */
    bool write_cache{true};                       /**< Whether rendered tiles are written to the cache. */
    std::optional<std::string> allowed_origin{};  /**< Value for cross-origin response headers. */
    PreviewOptions preview{};
    std::optional<Bounds> bounds{};
};

/** @brief A named tile-serving unit. */
class Layer final {
  public:
    Layer(std::string name, const Configuration& configuration, ProjectionPtr projection, Metatile metatile, LayerOptions options);
    Layer(const Layer&) = delete;
    Layer& operator=(const Layer&) = delete;

    [[nodiscard]] const std::string& name() const noexcept;
    /** @brief Configuration the layer belongs to. */
    [[nodiscard]] const Configuration& configuration() const noexcept;
    [[nodiscard]] const Projection& projection() const noexcept;
    [[nodiscard]] const Metatile& metatile() const noexcept;
    [[nodiscard]] const LayerOptions& options() const noexcept;
    [[nodiscard]] const std::optional<Bounds>& bounds() const noexcept;

    [[nodiscard]] std::optional<int> cache_lifespan() const noexcept;
    /** @brief Stale lock timeout in seconds, 15 when not configured. */
    [[nodiscard]] int stale_lock_timeout() const noexcept;
    [[nodiscard]] bool write_cache() const noexcept;
    [[nodiscard]] const std::optional<std::string>& allowed_origin() const noexcept;

    /** @brief Preview parameters with defaults applied (37.80, -122.26, zoom 10, "png"). */
    [[nodiscard]] double preview_lat() const noexcept;
    [[nodiscard]] double preview_lon() const noexcept;
    [[nodiscard]] int preview_zoom() const noexcept;
    [[nodiscard]] std::string preview_ext() const;

    /** @brief True when the layer's bounds exclude `tile`; a layer without bounds excludes nothing. */
    [[nodiscard]] bool excludes(const TileCoordinate& tile) const;

    /** @throws std::logic_error before a provider is attached. */
    [[nodiscard]] const Provider& provider() const;
    [[nodiscard]] const nlohmann::json& jpeg_options() const noexcept;
    [[nodiscard]] const nlohmann::json& png_options() const noexcept;

    void attach_provider(ProviderPtr provider);
    void set_jpeg_options(nlohmann::json options);
    void set_png_options(nlohmann::json options);

  private:
    std::string str_name_;
    const Configuration* configuration_;
    ProjectionPtr projection_;
    Metatile metatile_;
    LayerOptions options_;
    ProviderPtr provider_;
    nlohmann::json json_jpeg_options_;
    nlohmann::json json_png_options_;
};

using LayerPtr = std::unique_ptr<Layer>;
using LayerItem = std::pair<std::string, const Layer*>;

/**
 * @brief Read-only view of a configuration's layers.
 *
 * Implementations may be static maps or computed on demand from an external
 * source; consumers rely only on these four operations.
 */
class LayerCollection {
  public:
    virtual ~LayerCollection() = default;

    /** @brief Layer registered under `name`, or nullptr. */
    [[nodiscard]] virtual const Layer* find(std::string_view name) const = 0;
    [[nodiscard]] virtual bool contains(std::string_view name) const = 0;
    [[nodiscard]] virtual std::vector<std::string> names() const = 0;
    [[nodiscard]] virtual std::vector<LayerItem> items() const = 0;

    /** @throws std::out_of_range when `name` is not present. */
    [[nodiscard]] const Layer& at(std::string_view name) const;
};

/** @brief Map-backed collection filled by the builder. */
class LayerMap final : public LayerCollection {
  public:
    [[nodiscard]] const Layer* find(std::string_view name) const override;
    [[nodiscard]] bool contains(std::string_view name) const override;
    [[nodiscard]] std::vector<std::string> names() const override;
    [[nodiscard]] std::vector<LayerItem> items() const override;

    /** @brief Register `layer` under `name`, replacing any earlier layer of that name. */
    void insert(std::string name, LayerPtr layer);
    [[nodiscard]] std::size_t size() const noexcept;

  private:
    std::map<std::string, LayerPtr, std::less<>> map_layers_;
};

/**
 * @brief Assemble a Layer from its configuration section.
 *
 * @param name Key of the layer in the "layers" section.
 * @param spec Layer section; must be a JSON object.
 * @param configuration Owner the layer refers back to.
 * @param dirpath Directory of the configuration.
 * @throws ConfigurationError for shape problems; coercion failures propagate
 *         as std::invalid_argument or std::out_of_range.
 */
LayerPtr build_layer(const std::string& name, const nlohmann::json& spec, const Configuration& configuration, const std::string& dirpath);

}  // namespace tile_config
