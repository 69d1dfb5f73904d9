#include "tile_config/cache.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include <fmt/format.h>

#include "tile_config/coercion.hpp"
#include "tile_config/errors.hpp"
#include "tile_config/json_fields.hpp"
#include "tile_config/path_resolver.hpp"

namespace tile_config {

namespace {

using CacheParser = CacheBackend (*)(const nlohmann::json&, const std::string&);

CacheBackend parse_null_cache(const nlohmann::json&, const std::string&) {
    return NullCache{};
}

CacheBackend parse_test_cache(const nlohmann::json& spec, const std::string&) {
    TestCache cache{};
    if (const nlohmann::json* verbose = find_field(spec, "verbose"); verbose != nullptr && to_bool(*verbose)) {
        cache.log_sink = make_stderr_logger("test-cache");
    }
    return cache;
}

CacheBackend parse_disk_cache(const nlohmann::json& spec, const std::string& dirpath) {
    DiskCache cache{};
    const std::string raw_path = require_field(spec, "path", "Disk cache").get<std::string>();
    cache.path = enforced_local_path(raw_path, dirpath, "Disk cache path");

    if (const nlohmann::json* umask = find_field(spec, "umask"); umask != nullptr) {
        cache.umask = parse_octal(*umask);
    }
    if (const nlohmann::json* dirs = find_field(spec, "dirs"); dirs != nullptr) {
        cache.dirs = dirs->get<std::string>();
    }
    if (const nlohmann::json* gzip = find_field(spec, "gzip"); gzip != nullptr) {
        cache.gzip = gzip->get<std::vector<std::string>>();
    }
    return cache;
}

CacheBackend parse_multi_cache(const nlohmann::json& spec, const std::string& dirpath) {
    const nlohmann::json& tiers = require_field(spec, "tiers", "Multi cache");
    if (!tiers.is_array() || tiers.empty()) {
        throw ConfigurationError(fmt::format("Multi cache tiers must be a non-empty list, not: {}", tiers.dump()));
    }

    MultiCache cache{};
    cache.tiers.reserve(tiers.size());
    for (const auto& tier_spec : tiers) {
        cache.tiers.push_back(build_cache(tier_spec, dirpath));
    }
    return cache;
}

CacheBackend parse_remote_kv_cache(const nlohmann::json& spec, const std::string&) {
    RemoteKvCache cache{};
    if (const nlohmann::json* servers = find_field(spec, "servers"); servers != nullptr) {
        cache.servers = servers->get<std::vector<std::string>>();
    }
    if (const nlohmann::json* lifespan = find_field(spec, "lifespan"); lifespan != nullptr) {
        cache.lifespan = lifespan->get<int>();
    }
    if (const nlohmann::json* revision = find_field(spec, "revision"); revision != nullptr) {
        cache.revision = revision->get<int>();
    }
    return cache;
}

CacheBackend parse_object_store_cache(const nlohmann::json& spec, const std::string&) {
    ObjectStoreCache cache{};
    if (const nlohmann::json* bucket = find_field(spec, "bucket"); bucket != nullptr) {
        cache.bucket = bucket->get<std::string>();
    }
    if (const nlohmann::json* access = find_field(spec, "access"); access != nullptr) {
        cache.access = access->get<std::string>();
    }
    if (const nlohmann::json* secret = find_field(spec, "secret"); secret != nullptr) {
        cache.secret = secret->get<std::string>();
    }
    return cache;
}

constexpr std::array<std::pair<std::string_view, CacheParser>, 7> k_builtin_caches{{
    {"null", parse_null_cache},
    {"test", parse_test_cache},
    {"disk", parse_disk_cache},
    {"multi", parse_multi_cache},
    {"memcache", parse_remote_kv_cache},
    {"memcached", parse_remote_kv_cache},
    {"s3", parse_object_store_cache},
}};

CacheBackend parse_custom_cache(const nlohmann::json& spec) {
    CustomCache cache{};
    cache.constructor = load_class_path(to_string(spec.at("class")));
    if (const nlohmann::json* kwargs = find_field(spec, "kwargs"); kwargs != nullptr) {
        require_object(*kwargs, "Cache kwargs");
        cache.kwargs = *kwargs;
    }
    return cache;
}

}  // namespace

std::string_view Cache::kind() const noexcept {
    struct KindVisitor final {
        std::string_view operator()(const NullCache&) const noexcept { return "Null"; }
        std::string_view operator()(const TestCache&) const noexcept { return "Test"; }
        std::string_view operator()(const DiskCache&) const noexcept { return "Disk"; }
        std::string_view operator()(const MultiCache&) const noexcept { return "Multi"; }
        std::string_view operator()(const RemoteKvCache&) const noexcept { return "RemoteKV"; }
        std::string_view operator()(const ObjectStoreCache&) const noexcept { return "ObjectStore"; }
        std::string_view operator()(const CustomCache&) const noexcept { return "Custom"; }
    };
    return std::visit(KindVisitor{}, backend);
}

Cache build_cache(const nlohmann::json& spec, const std::string& dirpath) {
    require_object(spec, "Cache configuration");

    Cache cache{};
    if (const nlohmann::json* name = find_field(spec, "name"); name != nullptr) {
        if (!name->is_string()) {
            throw ConfigurationError(fmt::format("Cache name must be a string: {}", spec.dump()));
        }
        const std::string cache_name = name->get<std::string>();
        const std::string lookup_name = lower_case(cache_name);
        const auto iter_parser = std::find_if(k_builtin_caches.begin(), k_builtin_caches.end(), [&lookup_name](const auto& entry) {
            return entry.first == lookup_name;
        });
        if (iter_parser == k_builtin_caches.end()) {
            throw ConfigurationError(fmt::format(R"(Unknown cache name: "{}")", cache_name));
        }
        cache.backend = iter_parser->second(spec, dirpath);
    } else if (find_field(spec, "class") != nullptr) {
        cache.backend = parse_custom_cache(spec);
    } else {
        throw ConfigurationError(fmt::format("Missing required cache name or class: {}", spec.dump()));
    }

    get_logger()->debug("Built {} cache", cache.kind());
    return cache;
}

}  // namespace tile_config
