// === Path Resolver ===========================================================
//
// Resolves resource paths named in a configuration against the directory the
// configuration came from. That directory may be a local path, a "file://"
// URL or a remote URL; some resources (disk cache roots) must end up as an
// unambiguous local path, which `enforced_local_path` guarantees.

#pragma once

#include <string>
#include <string_view>

namespace tile_config {

/** @brief Components of a URL or plain path; absent parts are empty. */
struct ParsedUrl final {
    std::string scheme{};    /**< Lower-cased scheme without the colon. */
    std::string netloc{};    /**< Authority following "//". */
    std::string path{};      /**< Path component. */
    std::string query{};     /**< Text after '?', without the '?'. */
    std::string fragment{};  /**< Text after '#', without the '#'. */
};

/** @brief Split a URL into its components; plain paths yield only a path. */
ParsedUrl parse_url(std::string_view text);

/** @brief Resolve `reference` against `base` with URL reference-resolution rules. */
std::string url_join(std::string_view base, std::string_view reference);

/**
 * @brief Return a local filesystem path for `relpath`, relative to `dirpath`.
 *
 * @param relpath Path as written in the configuration; may be "file://".
 * @param dirpath Directory of the configuration; may be a URL.
 * @param context Label used in error messages, e.g. "Disk cache path".
 * @throws ConfigurationError when `relpath` is remote, or when it is a plain
 *         path combined with a remote `dirpath`.
 */
std::string enforced_local_path(std::string_view relpath, std::string_view dirpath, std::string_view context = "Path");

}  // namespace tile_config
