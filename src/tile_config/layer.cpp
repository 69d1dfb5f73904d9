#include "tile_config/layer.hpp"

#include <array>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "tile_config/coercion.hpp"
#include "tile_config/errors.hpp"
#include "tile_config/json_fields.hpp"
#include "tile_config/logging.hpp"

namespace tile_config {

namespace {
constexpr int k_default_stale_lock_timeout_s{15};
constexpr double k_default_preview_lat{37.80};
constexpr double k_default_preview_lon{-122.26};
constexpr int k_default_preview_zoom{10};
constexpr char k_default_preview_ext[] = "png";
constexpr std::string_view k_default_projection{"spherical mercator"};

LayerOptions parse_layer_options(const nlohmann::json& spec) {
    LayerOptions options{};
    if (const nlohmann::json* lifespan = find_field(spec, "cache lifespan"); lifespan != nullptr) {
        options.cache_lifespan = to_int(*lifespan);
    }
    if (const nlohmann::json* timeout = find_field(spec, "stale lock timeout"); timeout != nullptr) {
        options.stale_lock_timeout = to_int(*timeout);
    }
    if (const nlohmann::json* write_cache = find_field(spec, "write cache"); write_cache != nullptr) {
        options.write_cache = to_bool(*write_cache);
    }
    if (const nlohmann::json* origin = find_field(spec, "allowed origin"); origin != nullptr) {
        options.allowed_origin = to_string(*origin);
    }
    return options;
}

PreviewOptions parse_preview(const nlohmann::json& preview_spec) {
    require_object(preview_spec, "Layer preview");
    PreviewOptions preview{};
    if (const nlohmann::json* lat = find_field(preview_spec, "lat"); lat != nullptr) {
        preview.lat = to_double(*lat);
    }
    if (const nlohmann::json* lon = find_field(preview_spec, "lon"); lon != nullptr) {
        preview.lon = to_double(*lon);
    }
    if (const nlohmann::json* zoom = find_field(preview_spec, "zoom"); zoom != nullptr) {
        preview.zoom = to_int(*zoom);
    }
    if (const nlohmann::json* ext = find_field(preview_spec, "ext"); ext != nullptr) {
        preview.ext = to_string(*ext);
    }
    return preview;
}

Bounds parse_bounds(const nlohmann::json& bounds_spec, const Projection& projection) {
    if (!bounds_spec.is_object()) {
        throw ConfigurationError("Layer bounds must be a dictionary, not: " + bounds_spec.dump());
    }

    constexpr std::array<std::string_view, 6> k_bounds_fields{"north", "west", "south", "east", "high", "low"};
    std::array<double, 6> values{};
    for (std::size_t index = 0; index < k_bounds_fields.size(); ++index) {
        const nlohmann::json* value = find_field(bounds_spec, k_bounds_fields[index]);
        if (value == nullptr || !value->is_number()) {
            throw ConfigurationError(
                "Missing part of bounds for layer, need north, south, east, west, high, and low: " + bounds_spec.dump()
            );
        }
        values[index] = value->get<double>();
    }
    const auto [north, west, south, east, high, low] = values;

    const TileCoordinate upper_left_high = projection.location_coordinate(Location{north, west}).zoom_to(high);
    const TileCoordinate lower_right_low = projection.location_coordinate(Location{south, east}).zoom_to(low);
    return Bounds{upper_left_high, lower_right_low};
}

Metatile parse_metatile(const nlohmann::json& metatile_spec) {
    require_object(metatile_spec, "Layer metatile");
    Metatile metatile{};
    if (const nlohmann::json* buffer = find_field(metatile_spec, "buffer"); buffer != nullptr) {
        metatile.buffer = to_int(*buffer);
    }
    if (const nlohmann::json* rows = find_field(metatile_spec, "rows"); rows != nullptr) {
        metatile.rows = to_int(*rows);
    }
    if (const nlohmann::json* columns = find_field(metatile_spec, "columns"); columns != nullptr) {
        metatile.columns = to_int(*columns);
    }
    return metatile;
}

nlohmann::json parse_encoder_options(const nlohmann::json& spec, std::string_view field) {
    const nlohmann::json* options = find_field(spec, field);
    if (options == nullptr) {
        return nlohmann::json::object();
    }
    require_object(*options, fmt::format("Layer {}", field));
    return *options;
}

}  // namespace

Layer::Layer(std::string name, const Configuration& configuration, ProjectionPtr projection, Metatile metatile, LayerOptions options)
    : str_name_(std::move(name)),
      configuration_(&configuration),
      projection_(std::move(projection)),
      metatile_(metatile),
      options_(std::move(options)),
      json_jpeg_options_(nlohmann::json::object()),
      json_png_options_(nlohmann::json::object()) {
    if (!projection_) {
        throw std::invalid_argument("Layer requires a projection");
    }
}

const std::string& Layer::name() const noexcept {
    return str_name_;
}

const Configuration& Layer::configuration() const noexcept {
    return *configuration_;
}

const Projection& Layer::projection() const noexcept {
    return *projection_;
}

const Metatile& Layer::metatile() const noexcept {
    return metatile_;
}

const LayerOptions& Layer::options() const noexcept {
    return options_;
}

const std::optional<Bounds>& Layer::bounds() const noexcept {
    return options_.bounds;
}

std::optional<int> Layer::cache_lifespan() const noexcept {
    return options_.cache_lifespan;
}

int Layer::stale_lock_timeout() const noexcept {
    return options_.stale_lock_timeout.value_or(k_default_stale_lock_timeout_s);
}

bool Layer::write_cache() const noexcept {
    return options_.write_cache;
}

const std::optional<std::string>& Layer::allowed_origin() const noexcept {
    return options_.allowed_origin;
}

double Layer::preview_lat() const noexcept {
    return options_.preview.lat.value_or(k_default_preview_lat);
}

double Layer::preview_lon() const noexcept {
    return options_.preview.lon.value_or(k_default_preview_lon);
}

int Layer::preview_zoom() const noexcept {
    return options_.preview.zoom.value_or(k_default_preview_zoom);
}

std::string Layer::preview_ext() const {
    return options_.preview.ext.value_or(k_default_preview_ext);
}

bool Layer::excludes(const TileCoordinate& tile) const {
    return options_.bounds.has_value() && options_.bounds->excludes(tile);
}

const Provider& Layer::provider() const {
    if (!provider_) {
        throw std::logic_error("Layer " + str_name_ + " has no provider");
    }
    return *provider_;
}

const nlohmann::json& Layer::jpeg_options() const noexcept {
    return json_jpeg_options_;
}

const nlohmann::json& Layer::png_options() const noexcept {
    return json_png_options_;
}

void Layer::attach_provider(ProviderPtr provider) {
    provider_ = std::move(provider);
}

void Layer::set_jpeg_options(nlohmann::json options) {
    json_jpeg_options_ = std::move(options);
}

void Layer::set_png_options(nlohmann::json options) {
    json_png_options_ = std::move(options);
}

const Layer& LayerCollection::at(std::string_view name) const {
    const Layer* layer = find(name);
    if (layer == nullptr) {
        throw std::out_of_range(fmt::format(R"(No layer named "{}")", name));
    }
    return *layer;
}

const Layer* LayerMap::find(std::string_view name) const {
    const auto iter_layer = map_layers_.find(name);
    if (iter_layer == map_layers_.end()) {
        return nullptr;
    }
    return iter_layer->second.get();
}

bool LayerMap::contains(std::string_view name) const {
    return map_layers_.find(name) != map_layers_.end();
}

std::vector<std::string> LayerMap::names() const {
    std::vector<std::string> list_names{};
    list_names.reserve(map_layers_.size());
    for (const auto& [name, layer] : map_layers_) {
        list_names.push_back(name);
    }
    return list_names;
}

std::vector<LayerItem> LayerMap::items() const {
    std::vector<LayerItem> list_items{};
    list_items.reserve(map_layers_.size());
    for (const auto& [name, layer] : map_layers_) {
        list_items.emplace_back(name, layer.get());
    }
    return list_items;
}

void LayerMap::insert(std::string name, LayerPtr layer) {
    map_layers_.insert_or_assign(std::move(name), std::move(layer));
}

std::size_t LayerMap::size() const noexcept {
    return map_layers_.size();
}

LayerPtr build_layer(const std::string& name, const nlohmann::json& spec, const Configuration& configuration, const std::string& dirpath) {
    require_object(spec, fmt::format(R"(Layer "{}")", name));
    auto logger = get_logger();
    logger->debug("Building layer {} relative to {}", name, dirpath);

    const nlohmann::json* projection_name = find_field(spec, "projection");
    ProjectionPtr projection = make_projection(
        projection_name != nullptr ? to_string(*projection_name) : std::string{k_default_projection}
    );

    LayerOptions options = parse_layer_options(spec);
    if (const nlohmann::json* preview = find_field(spec, "preview"); preview != nullptr) {
        options.preview = parse_preview(*preview);
    }
    if (const nlohmann::json* bounds = find_field(spec, "bounds"); bounds != nullptr) {
        options.bounds = parse_bounds(*bounds, *projection);
    }

    Metatile metatile{};
    if (const nlohmann::json* metatile_spec = find_field(spec, "metatile"); metatile_spec != nullptr) {
        metatile = parse_metatile(*metatile_spec);
    }

    nlohmann::json jpeg_options = parse_encoder_options(spec, "jpeg options");
    nlohmann::json png_options = parse_encoder_options(spec, "png options");

    auto layer = std::make_unique<Layer>(name, configuration, std::move(projection), metatile, std::move(options));

    const nlohmann::json* provider_spec = find_field(spec, "provider");
    layer->attach_provider(build_provider(provider_spec != nullptr ? *provider_spec : nlohmann::json::object(), *layer));
    layer->set_jpeg_options(std::move(jpeg_options));
    layer->set_png_options(std::move(png_options));

    logger->debug(
        "Built layer {}: projection={} provider={} bounds={}",
        name,
        layer->projection().name(),
        layer->provider().kind(),
        layer->bounds().has_value() ? to_string(*layer->bounds()) : std::string{"none"}
    );
    return layer;
}

}  // namespace tile_config
