// === Configuration Builder ===================================================
//
// Turns a parsed configuration document into the strongly-typed object graph
// served by the tile server. The cache hierarchy is built once; each entry of
// the "layers" section then becomes a Layer with its provider attached.
//
// Responsibilities
// - Reject documents whose top-level shape is wrong before touching any
//   section.
// - Build every layer against the Configuration it will live in, so the
//   back-references are valid from the moment the layer exists.
// - Surface file and parse failures of on-disk documents as
//   ConfigurationError naming the file.
//
// External dependencies
// - nlohmann/json for the document model.
// - `tile_config/logging.hpp` to report what was built.

#include "tile_config/configuration.hpp"

#include <fstream>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "tile_config/errors.hpp"
#include "tile_config/json_fields.hpp"
#include "tile_config/logging.hpp"

namespace tile_config {

Configuration::Configuration(Cache cache, std::string dirpath)
    : cache_(std::move(cache)),
      str_dirpath_(std::move(dirpath)),
      layers_(std::make_unique<LayerMap>()) {}

const Cache& Configuration::cache() const noexcept {
    return cache_;
}

const std::string& Configuration::dirpath() const noexcept {
    return str_dirpath_;
}

const LayerCollection& Configuration::layers() const noexcept {
    return *layers_;
}

void Configuration::replace_layers(std::unique_ptr<LayerCollection> layers) {
    if (!layers) {
        throw std::invalid_argument("Configuration requires a layer collection");
    }
    layers_ = std::move(layers);
}

ConfigurationPtr ConfigurationBuilder::build(const nlohmann::json& spec, const std::string& dirpath) {
    require_object(spec, "Configuration");
    auto logger = get_logger();

    const nlohmann::json* cache_spec = find_field(spec, "cache");
    Cache cache = build_cache(cache_spec != nullptr ? *cache_spec : nlohmann::json::object(), dirpath);

    auto config = std::make_unique<Configuration>(std::move(cache), dirpath);

    auto layer_map = std::make_unique<LayerMap>();
    if (const nlohmann::json* layers_spec = find_field(spec, "layers"); layers_spec != nullptr) {
        require_object(*layers_spec, "Configuration layers");
        for (const auto& [name, layer_spec] : layers_spec->items()) {
            layer_map->insert(name, build_layer(name, layer_spec, *config, dirpath));
        }
    }

    const std::size_t layer_count = layer_map->size();
    config->replace_layers(std::move(layer_map));

    logger->info("Configuration built: cache={} layers={} dirpath={}", config->cache().kind(), layer_count, dirpath);
    return config;
}

ConfigurationPtr ConfigurationBuilder::load_file(const std::filesystem::path& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw ConfigurationError(fmt::format("Unable to open configuration file {}", config_path.string()));
    }

    nlohmann::json spec{};
    try {
        file >> spec;
    } catch (const nlohmann::json::parse_error& exc) {
        throw ConfigurationError(fmt::format("Malformed configuration file {}: {}", config_path.string(), exc.what()));
    }

    const std::filesystem::path dirpath = std::filesystem::absolute(config_path).parent_path();
    get_logger()->info("Loading configuration from {}", config_path.string());
    return build(spec, dirpath.string());
}

}  // namespace tile_config
