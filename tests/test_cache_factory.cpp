#include <cstring>
#include <stdexcept>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "logging_test_fixture.hpp"
#include "tile_config/cache.hpp"
#include "tile_config/errors.hpp"

using namespace tile_config;
using nlohmann::json;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    tile_config::test::ensure_logger_initialized();
    return true;
}();
}  // namespace

TEST_CASE("Cache factory builds a quiet test cache") {
    const Cache cache = build_cache(json{{"name", "Test"}}, "/srv/tiles");
    REQUIRE(cache.kind() == "Test");
    REQUIRE(cache.get_if<TestCache>() != nullptr);
    REQUIRE(cache.get_if<TestCache>()->log_sink == nullptr);
}

TEST_CASE("Cache factory attaches a log sink to a verbose test cache") {
    const Cache cache = build_cache(json{{"name", "test"}, {"verbose", true}}, "/srv/tiles");
    REQUIRE(cache.get_if<TestCache>()->log_sink != nullptr);
}

TEST_CASE("Cache factory builds a null cache") {
    const Cache cache = build_cache(json{{"name", "NULL"}}, "/srv/tiles");
    REQUIRE(cache.kind() == "Null");
}

TEST_CASE("Cache factory resolves a disk path against the configuration directory") {
    const json spec = {
        {"name", "Disk"},
        {"path", "cache"},
        {"umask", "0022"},
        {"dirs", "portable"},
        {"gzip", {"xml", "json"}},
    };
    const Cache cache = build_cache(spec, "/srv/tiles");

    const DiskCache* disk = cache.get_if<DiskCache>();
    REQUIRE(disk != nullptr);
    REQUIRE(disk->path == "/srv/tiles/cache");
    REQUIRE(disk->umask == 18);
    REQUIRE(disk->dirs == "portable");
    REQUIRE(disk->gzip.has_value());
    REQUIRE(disk->gzip->size() == 2);
    REQUIRE(disk->gzip->front() == "xml");
}

TEST_CASE("Cache factory leaves optional disk settings unset") {
    const Cache cache = build_cache(json{{"name", "Disk"}, {"path", "/var/tiles"}}, "/srv/tiles");
    const DiskCache* disk = cache.get_if<DiskCache>();
    REQUIRE(disk->path == "/var/tiles");
    REQUIRE_FALSE(disk->umask.has_value());
    REQUIRE_FALSE(disk->dirs.has_value());
    REQUIRE_FALSE(disk->gzip.has_value());
}

TEST_CASE("Cache factory propagates a non-octal umask") {
    REQUIRE_THROWS_AS(
        build_cache(json{{"name", "Disk"}, {"path", "/var/tiles"}, {"umask", "0089"}}, "/srv/tiles"),
        std::invalid_argument
    );
}

TEST_CASE("Cache factory refuses a plain disk path in a remote configuration") {
    REQUIRE_THROWS_AS(
        build_cache(json{{"name", "Disk"}, {"path", "cache"}}, "http://example.com/config"),
        ConfigurationError
    );
}

TEST_CASE("Cache factory requires a disk path") {
    REQUIRE_THROWS_WITH(build_cache(json{{"name", "Disk"}}, "/srv/tiles"), Catch::Matchers::ContainsSubstring("\"path\""));
}

TEST_CASE("Cache factory builds multi-tier caches in order") {
    const json spec = {
        {"name", "Multi"},
        {"tiers", json::array({json{{"name", "Disk"}, {"path", "/a"}}, json{{"name", "Disk"}, {"path", "/b"}}})},
    };
    const Cache cache = build_cache(spec, "/srv/tiles");

    const MultiCache* multi = cache.get_if<MultiCache>();
    REQUIRE(multi != nullptr);
    REQUIRE(multi->tiers.size() == 2);
    REQUIRE(multi->tiers[0].get_if<DiskCache>()->path == "/a");
    REQUIRE(multi->tiers[1].get_if<DiskCache>()->path == "/b");
}

TEST_CASE("Cache factory nests multi-tier caches") {
    const json spec = {
        {"name", "multi"},
        {"tiers", json::array({json{{"name", "Test"}}, json{{"name", "Multi"}, {"tiers", json::array({json{{"name", "Null"}}})}}})},
    };
    const Cache cache = build_cache(spec, "/srv/tiles");
    const MultiCache& inner = *cache.get_if<MultiCache>()->tiers[1].get_if<MultiCache>();
    REQUIRE(inner.tiers.front().kind() == "Null");
}

TEST_CASE("Cache factory rejects empty tier lists") {
    REQUIRE_THROWS_AS(build_cache(json{{"name", "Multi"}, {"tiers", json::array()}}, "/srv/tiles"), ConfigurationError);
    REQUIRE_THROWS_AS(build_cache(json{{"name", "Multi"}}, "/srv/tiles"), ConfigurationError);
}

TEST_CASE("Cache factory fills memcache defaults") {
    const Cache cache = build_cache(json{{"name", "Memcache"}}, "/srv/tiles");
    const RemoteKvCache* remote = cache.get_if<RemoteKvCache>();
    REQUIRE(remote != nullptr);
    REQUIRE(remote->servers == std::vector<std::string>{"127.0.0.1:11211"});
    REQUIRE(remote->lifespan == 0);
    REQUIRE(remote->revision == 0);
}

TEST_CASE("Cache factory reads memcached settings") {
    const json spec = {{"name", "Memcached"}, {"servers", {"cache1:11211", "cache2:11211"}}, {"lifespan", 3600}, {"revision", 4}};
    const RemoteKvCache* remote = build_cache(spec, "/srv/tiles").get_if<RemoteKvCache>();
    REQUIRE(remote->servers.size() == 2);
    REQUIRE(remote->lifespan == 3600);
    REQUIRE(remote->revision == 4);
}

TEST_CASE("Cache factory builds an object store cache") {
    const json spec = {{"name", "S3"}, {"bucket", "tiles"}, {"access", "AKIA"}, {"secret", "hush"}};
    const ObjectStoreCache* store = build_cache(spec, "/srv/tiles").get_if<ObjectStoreCache>();
    REQUIRE(store != nullptr);
    REQUIRE(store->bucket == "tiles");
    REQUIRE(store->access == "AKIA");
    REQUIRE(store->secret == "hush");
}

TEST_CASE("Cache factory names an unknown cache") {
    REQUIRE_THROWS_WITH(build_cache(json{{"name", "Redis"}}, "/srv/tiles"), Catch::Matchers::ContainsSubstring("\"Redis\""));
}

TEST_CASE("Cache factory requires a name or class") {
    REQUIRE_THROWS_WITH(
        build_cache(json{{"path", "/var/tiles"}}, "/srv/tiles"),
        Catch::Matchers::ContainsSubstring("Missing required cache name or class") && Catch::Matchers::ContainsSubstring("/var/tiles")
    );
}

TEST_CASE("Cache factory rejects a cache section that is not an object") {
    REQUIRE_THROWS_AS(build_cache(json("Disk"), "/srv/tiles"), ConfigurationError);
}

TEST_CASE("Cache factory loads a plugin cache class with kwargs") {
    ClassLoader::instance().add_search_directory(TILE_CONFIG_TEST_PLUGIN_DIR);
    const json spec = {{"class", "tile_config.test_plugin:make_tile_cache"}, {"kwargs", {{"ttl", 30}}}};
    const Cache cache = build_cache(spec, "/srv/tiles");

    const CustomCache* custom = cache.get_if<CustomCache>();
    REQUIRE(custom != nullptr);
    REQUIRE(custom->kwargs.at("ttl") == 30);
    using Constructor = const char* (*)(const char*);
    REQUIRE(std::strcmp(custom->constructor.as<Constructor>()(nullptr), "tile-cache") == 0);
}

TEST_CASE("Cache factory prefers the builtin name over a class") {
    const Cache cache = build_cache(json{{"name", "Test"}, {"class", "no_such_module:Cache"}}, "/srv/tiles");
    REQUIRE(cache.kind() == "Test");
}

TEST_CASE("Cache factory rejects a name that is not a string") {
    REQUIRE_THROWS_AS(build_cache(json{{"name", nullptr}}, "/srv/tiles"), ConfigurationError);
    REQUIRE_THROWS_WITH(
        build_cache(json{{"name", 7}, {"path", "/var/tiles"}}, "/srv/tiles"),
        Catch::Matchers::ContainsSubstring("Cache name must be a string") && Catch::Matchers::ContainsSubstring("/var/tiles")
    );
}
