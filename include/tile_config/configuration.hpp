// === Configuration ===========================================================
//
// Exposes the built site configuration (one cache, a base directory and a
// collection of layers) and `ConfigurationBuilder`, which translates a JSON
// configuration document into it. A build either returns a complete
// Configuration or throws; reloading means building a new one and discarding
// the old.

#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "tile_config/cache.hpp"
#include "tile_config/layer.hpp"

namespace tile_config {

/**
 * @brief Complete site configuration.
 *
 * Layers hold a pointer back to their Configuration, so instances are handed
 * out behind a std::unique_ptr and never copied or moved.
 */
class Configuration final {
  public:
    Configuration(Cache cache, std::string dirpath);
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    [[nodiscard]] const Cache& cache() const noexcept;
    /** @brief Directory (or URL) relative paths in the configuration resolve against. */
    [[nodiscard]] const std::string& dirpath() const noexcept;
    [[nodiscard]] const LayerCollection& layers() const noexcept;

    /** @brief Substitute the layer collection, e.g. with one computed from an external source. */
    void replace_layers(std::unique_ptr<LayerCollection> layers);

  private:
    Cache cache_;
    std::string str_dirpath_;
    std::unique_ptr<LayerCollection> layers_;
};

using ConfigurationPtr = std::unique_ptr<Configuration>;

/**
 * @brief Utility responsible for building Configuration from JSON documents.
 */
class ConfigurationBuilder final {
  public:
    /**
     * @brief Build a configuration document.
     *
     * @param spec Top-level object with "cache" and "layers" sections.
     * @param dirpath Directory of the document, for relative paths.
     * @throws ConfigurationError on any schema problem; nothing partial is returned.
     */
    static ConfigurationPtr build(const nlohmann::json& spec, const std::string& dirpath = ".");

    /** @brief Read and build a JSON file, resolving paths against its directory. */
    static ConfigurationPtr load_file(const std::filesystem::path& config_path);
};

}  // namespace tile_config
