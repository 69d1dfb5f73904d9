#include <cstdlib>
#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

#include "tile_config/class_loader.hpp"
#include "tile_config/configuration.hpp"
#include "tile_config/logging.hpp"
#include "tile_config/settings.hpp"
#include "tile_config/version.hpp"

namespace {

constexpr int k_config_only_argc{2};
constexpr int k_tile_check_argc{6};

void print_usage(const char* program) {
    std::cerr << "usage: " << program << " <config.json> [<layer> <zoom> <column> <row>]\n";
}

void report_configuration(const tile_config::Configuration& configuration) {
    auto logger = tile_config::get_logger();
    logger->info("Cache: {}", configuration.cache().kind());
    if (const auto* multi = configuration.cache().get_if<tile_config::MultiCache>(); multi != nullptr) {
        for (const auto& tier : multi->tiers) {
            logger->info("  tier: {}", tier.kind());
        }
    }

    for (const auto& [name, layer] : configuration.layers().items()) {
        const tile_config::Metatile& metatile = layer->metatile();
        logger->info(
            "Layer {}: projection={} provider={} metatile={}x{}+{} bounds={}",
            name,
            layer->projection().name(),
            layer->provider().kind(),
            metatile.rows,
            metatile.columns,
            metatile.buffer,
            layer->bounds().has_value() ? tile_config::to_string(*layer->bounds()) : std::string{"none"}
        );
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace tile_config;

    if (argc != k_config_only_argc && argc != k_tile_check_argc) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try {
        const RuntimeSettings settings = SettingsLoader::load();
        auto logger = initialize_logger(settings.log_directory);
        set_log_level(settings.log_level);
        logger->info("tile-config-check {}", k_version);

        for (const auto& directory : settings.plugin_directories) {
            ClassLoader::instance().add_search_directory(directory);
        }

        ConfigurationPtr configuration = ConfigurationBuilder::load_file(argv[1]);
        report_configuration(*configuration);

        if (argc == k_tile_check_argc) {
            const std::string layer_name{argv[2]};
            const Layer* layer = configuration->layers().find(layer_name);
            if (layer == nullptr) {
                logger->error("No layer named {}", layer_name);
                return EXIT_FAILURE;
            }
            const TileCoordinate tile{
                static_cast<double>(std::stoi(argv[3])),
                static_cast<double>(std::stoi(argv[4])),
                static_cast<double>(std::stoi(argv[5]))
            };
            logger->info("Tile {} is {} by layer {}", to_string(tile), layer->excludes(tile) ? "excluded" : "included", layer_name);
        }
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
