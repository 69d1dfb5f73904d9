// === Coercion ================================================================
//
// Scalar conversions applied to loosely typed configuration values. The rules
// mirror what hand-written JSON configurations rely on: numeric strings are
// accepted where integers or floats are expected, and booleans follow
// truthiness (empty strings, zero, null and empty containers are false).
//
// Every helper throws std::invalid_argument (or std::out_of_range for values
// that do not fit) instead of ConfigurationError; callers let these propagate.

#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace tile_config {

/** @brief Integer coercion; floats truncate toward zero, strings must hold a whole base-10 integer. */
int to_int(const nlohmann::json& value);

/** @brief Floating point coercion of numbers, booleans and numeric strings. */
double to_double(const nlohmann::json& value);

/** @brief Truthiness of any JSON value. */
bool to_bool(const nlohmann::json& value) noexcept;

/** @brief Strings pass through; any other value is serialized. */
std::string to_string(const nlohmann::json& value);

/** @brief Parse an octal permission string such as "0022" or "0o755". */
int parse_octal(const nlohmann::json& value);

}  // namespace tile_config
