// === Runtime Settings ========================================================
//
// Settings of the command line tool that do not belong in a tile
// configuration document: where logs go, how verbose they are and where
// plugin libraries live. `SettingsLoader` reads them from environment
// variables so the rest of the code never calls `std::getenv`.

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace tile_config {

/** @brief Environment-derived knobs for the tile_config tools. */
struct RuntimeSettings final {
    std::string log_directory{};                              /**< Destination directory for structured logs. */
    std::string log_level{};                                  /**< spdlog level name. */
    std::vector<std::filesystem::path> plugin_directories{};  /**< Searched by the Class Loader, in order. */
};

/**
 * @brief Utility responsible for hydrating RuntimeSettings from environment
 *        variables.
 */
class SettingsLoader final {
  public:
    static RuntimeSettings load();
};

}  // namespace tile_config
