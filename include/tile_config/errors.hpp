// === Errors ==================================================================
//
// Declares the single exception type surfaced to callers for configuration
// problems. Coercion failures (non-numeric strings, non-octal umasks) are not
// translated into this type and reach callers as the standard exceptions
// raised by the coercion helpers.

#pragma once

#include <stdexcept>
#include <string>

namespace tile_config {

/**
 * @brief Raised for every user-facing configuration failure.
 *
 * Messages that refer to a malformed input fragment embed its serialized JSON
 * form; Class Loader failures embed the specifier and the loader's message.
 */
class ConfigurationError final : public std::runtime_error {
  public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

}  // namespace tile_config
