#include "tile_config/json_fields.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

#include "tile_config/errors.hpp"

namespace tile_config {

const nlohmann::json* find_field(const nlohmann::json& spec, std::string_view field) {
    if (!spec.is_object()) {
        return nullptr;
    }
    const auto iter_field = spec.find(std::string{field});
    if (iter_field == spec.end()) {
        return nullptr;
    }
    return &*iter_field;
}

const nlohmann::json& require_field(const nlohmann::json& spec, std::string_view field, std::string_view owner) {
    const nlohmann::json* value = find_field(spec, field);
    if (value == nullptr) {
        throw ConfigurationError(fmt::format(R"({} requires "{}": {})", owner, field, spec.dump()));
    }
    return *value;
}

void require_object(const nlohmann::json& value, std::string_view what) {
    if (!value.is_object()) {
        throw ConfigurationError(fmt::format("{} must be a dictionary, not: {}", what, value.dump()));
    }
}

std::string lower_case(std::string_view text) {
    std::string lowered{text};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char value) {
        return static_cast<char>(std::tolower(value));
    });
    return lowered;
}

}  // namespace tile_config
