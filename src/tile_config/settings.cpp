#include "tile_config/settings.hpp"

#include <cstdlib>
#include <string_view>

namespace tile_config {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};
constexpr std::string_view k_default_log_level{"info"};

std::string parse_string(const char* variable_name, std::string_view fallback) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::string{fallback};
    }
    return std::string{raw_value};
}

std::vector<std::filesystem::path> parse_search_path(const char* variable_name) {
    std::vector<std::filesystem::path> list_directories{};
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr) {
        return list_directories;
    }
    std::string_view remaining{raw_value};
    while (!remaining.empty()) {
        const std::size_t separator = remaining.find(':');
        const std::string_view entry = remaining.substr(0, separator);
        if (!entry.empty()) {
            list_directories.emplace_back(std::string{entry});
        }
        if (separator == std::string_view::npos) {
            break;
        }
        remaining.remove_prefix(separator + 1);
    }
    return list_directories;
}

}  // namespace

RuntimeSettings SettingsLoader::load() {
    RuntimeSettings settings{};
    settings.log_directory = parse_string("TILE_CONFIG_LOG_DIR", k_default_log_directory);
    settings.log_level = parse_string("TILE_CONFIG_LOG_LEVEL", k_default_log_level);
    settings.plugin_directories = parse_search_path("TILE_CONFIG_PLUGIN_PATH");
    return settings;
}

}  // namespace tile_config
