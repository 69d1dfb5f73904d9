// === Cache ===================================================================
//
// Cache backends a configuration can select. Each builtin backend is a plain
// parameter struct; the storage behavior behind it lives in the serving
// process. `build_cache` turns the "cache" section of a configuration into
// one of these variants, recursing through multi-tier chains.

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "tile_config/class_loader.hpp"
#include "tile_config/logging.hpp"

namespace tile_config {

struct Cache;

/** @brief Stores nothing; every lookup misses. */
struct NullCache final {};

/** @brief Stores nothing, optionally logging each operation. */
struct TestCache final {
    std::shared_ptr<spdlog::logger> log_sink{};  /**< Set when the cache is verbose. */
};

/** @brief Tiles stored as files under a local directory. */
struct DiskCache final {
    std::string path{};                                /**< Resolved local root directory. */
    std::optional<int> umask{};                        /**< Permission mask for created files. */
    std::optional<std::string> dirs{};                 /**< Directory layout, e.g. "safe" or "portable". */
    std::optional<std::vector<std::string>> gzip{};    /**< Extensions stored compressed. */
};

/** @brief Ordered chain of caches, fastest and smallest first. */
struct MultiCache final {
    std::vector<Cache> tiers;  /**< Never empty once built. */
};

/** @brief Memcache-style distributed key-value store. */
struct RemoteKvCache final {
    std::vector<std::string> servers{"127.0.0.1:11211"};  /**< host:port entries. */
    int lifespan{};                                       /**< Entry lifetime in seconds; 0 keeps forever. */
    int revision{};                                       /**< Key prefix revision used to invalidate in bulk. */
};

/** @brief S3-style object storage bucket. */
struct ObjectStoreCache final {
    std::optional<std::string> bucket{};
    std::optional<std::string> access{};
    std::optional<std::string> secret{};
};

/** @brief Backend supplied by a plugin library. */
struct CustomCache final {
    ResolvedSymbol constructor{};                           /**< Plugin constructor. */
    nlohmann::json kwargs{nlohmann::json::object()};        /**< Flat construction arguments. */
};

using CacheBackend = std::variant<NullCache, TestCache, DiskCache, MultiCache, RemoteKvCache, ObjectStoreCache, CustomCache>;

/** @brief A configured cache: one backend variant. */
struct Cache final {
    CacheBackend backend{};

    /** @brief Variant name: "Null", "Test", "Disk", "Multi", "RemoteKV", "ObjectStore" or "Custom". */
    [[nodiscard]] std::string_view kind() const noexcept;

    template <typename Backend>
    [[nodiscard]] const Backend* get_if() const noexcept {
        return std::get_if<Backend>(&backend);
    }
};

/**
 * @brief Build a cache from its configuration section.
 *
 * `name` selects a builtin backend (case-insensitive: null, test, disk,
 * multi, memcache, memcached, s3); `class` selects a plugin through the Class
 * Loader with `kwargs` forwarded verbatim.
 *
 * @param spec Cache section; must be a JSON object.
 * @param dirpath Directory relative paths are resolved against.
 * @throws ConfigurationError for shape problems and unknown names.
 * @throws std::invalid_argument for a non-octal umask.
 */
Cache build_cache(const nlohmann::json& spec, const std::string& dirpath);

}  // namespace tile_config
