// === JSON Fields =============================================================
//
// Lookup helpers shared by the cache, provider and layer factories. Shape
// problems (a section that is not an object, a missing required field) are
// reported as ConfigurationError with the offending fragment serialized.

#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace tile_config {

/** @brief Pointer to `spec[field]`, or nullptr when absent. */
[[nodiscard]] const nlohmann::json* find_field(const nlohmann::json& spec, std::string_view field);

/**
 * @brief `spec[field]`, which must be present.
 *
 * @param owner Label for the message, e.g. "Disk cache".
 * @throws ConfigurationError when the field is missing.
 */
const nlohmann::json& require_field(const nlohmann::json& spec, std::string_view field, std::string_view owner);

/** @throws ConfigurationError unless `value` is a JSON object. */
void require_object(const nlohmann::json& value, std::string_view what);

/** @brief ASCII lower-casing used for case-insensitive registry names. */
std::string lower_case(std::string_view text);

}  // namespace tile_config
