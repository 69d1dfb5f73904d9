#include <cstring>
#include <stdexcept>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "logging_test_fixture.hpp"
#include "tile_config/configuration.hpp"
#include "tile_config/errors.hpp"
#include "tile_config/provider.hpp"

using namespace tile_config;
using nlohmann::json;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    tile_config::test::ensure_logger_initialized();
    return true;
}();

struct ProviderFixture {
    Configuration configuration{Cache{}, "/srv/tiles"};
    Layer layer{"roads", configuration, make_projection("spherical mercator"), Metatile{}, LayerOptions{}};
};
}  // namespace

TEST_CASE_METHOD(ProviderFixture, "Provider factory builds a styled renderer") {
    const ProviderPtr provider = build_provider(json{{"name", "Mapnik"}, {"mapfile", "style.xml"}, {"fonts", "fonts/"}}, layer);

    REQUIRE(provider->kind() == "StyledRenderer");
    const StyledRendererProvider* renderer = provider->get_if<StyledRendererProvider>();
    REQUIRE(renderer->mapfile == "style.xml");
    REQUIRE(renderer->fonts == "fonts/");
}

TEST_CASE_METHOD(ProviderFixture, "Provider factory requires a mapfile") {
    REQUIRE_THROWS_AS(build_provider(json{{"name", "mapnik"}}, layer), ConfigurationError);
    REQUIRE_THROWS_WITH(build_provider(json{{"name", "mapnik"}}, layer), Catch::Matchers::ContainsSubstring("\"mapfile\""));
}

TEST_CASE_METHOD(ProviderFixture, "Provider factory builds a proxy from a URL") {
    const ProviderPtr provider = build_provider(json{{"name", "proxy"}, {"url", "http://tiles.example.com/{Z}/{X}/{Y}.png"}}, layer);

    const ReverseProxyProvider* proxy = provider->get_if<ReverseProxyProvider>();
    REQUIRE(proxy != nullptr);
    REQUIRE(proxy->url == "http://tiles.example.com/{Z}/{X}/{Y}.png");
    REQUIRE_FALSE(proxy->upstream.has_value());
}

TEST_CASE_METHOD(ProviderFixture, "Provider factory builds a proxy from a named upstream") {
    const ProviderPtr provider = build_provider(json{{"name", "Proxy"}, {"provider", "openstreetmap"}}, layer);

    const ReverseProxyProvider* proxy = provider->get_if<ReverseProxyProvider>();
    REQUIRE(proxy->upstream.has_value());
    REQUIRE(proxy->upstream->name == "OPENSTREETMAP");
    REQUIRE_THAT(proxy->upstream->url_template, Catch::Matchers::ContainsSubstring("{Z}"));
    REQUIRE_FALSE(proxy->url.has_value());
}

TEST_CASE_METHOD(ProviderFixture, "Provider factory accepts a proxy with neither URL nor upstream") {
    const ProviderPtr provider = build_provider(json{{"name", "proxy"}}, layer);
    REQUIRE(provider->kind() == "ReverseProxy");
}

TEST_CASE_METHOD(ProviderFixture, "Provider factory names an unknown upstream") {
    REQUIRE_THROWS_WITH(
        build_provider(json{{"name", "proxy"}, {"provider", "NOWHERE"}}, layer),
        Catch::Matchers::ContainsSubstring("Unknown upstream tile provider") && Catch::Matchers::ContainsSubstring("NOWHERE")
    );
}

TEST_CASE_METHOD(ProviderFixture, "Provider factory builds a URL template provider") {
    const ProviderPtr provider = build_provider(
        json{{"name", "URL Template"}, {"template", "http://example.com/wms?bbox=$xmin,$ymin,$xmax,$ymax"}}, layer
    );
    REQUIRE(provider->get_if<UrlTemplateProvider>()->url_template == "http://example.com/wms?bbox=$xmin,$ymin,$xmax,$ymax");
    REQUIRE_THROWS_AS(build_provider(json{{"name", "url template"}}, layer), ConfigurationError);
}

TEST_CASE_METHOD(ProviderFixture, "Provider factory reads vector provider settings") {
    const json spec = {
        {"name", "vector"},
        {"driver", "PostgreSQL"},
        {"parameters", {{"dbname", "geodata"}, {"table", "roads"}}},
        {"properties", {"name", "highway"}},
        {"projected", true},
        {"verbose", 1},
        {"spacing", "2.5"},
        {"clipped", "padded"},
    };
    const ProviderPtr provider = build_provider(spec, layer);

    const VectorDataProvider* vector = provider->get_if<VectorDataProvider>();
    REQUIRE(vector != nullptr);
    REQUIRE(vector->driver == "PostgreSQL");
    REQUIRE(vector->parameters.at("table") == "roads");
    REQUIRE(vector->properties.has_value());
    REQUIRE(vector->properties->size() == 2);
    REQUIRE(vector->projected);
    REQUIRE(vector->verbose);
    REQUIRE(vector->spacing.has_value());
    REQUIRE(*vector->spacing == Catch::Approx(2.5));
    REQUIRE(vector->clipped == ClipMode::Padded);
}

TEST_CASE_METHOD(ProviderFixture, "Provider factory applies vector defaults") {
    const json spec = {{"name", "vector"}, {"driver", "GeoJSON"}, {"parameters", {{"file", "roads.geojson"}}}};
    const VectorDataProvider* vector = build_provider(spec, layer)->get_if<VectorDataProvider>();

    REQUIRE(vector->clipped == ClipMode::On);
    REQUIRE_FALSE(vector->projected);
    REQUIRE_FALSE(vector->verbose);
    REQUIRE_FALSE(vector->spacing.has_value());
    REQUIRE_FALSE(vector->properties.has_value());
}

TEST_CASE_METHOD(ProviderFixture, "Provider factory turns clipping off for false values") {
    const json spec = {{"name", "vector"}, {"driver", "GeoJSON"}, {"parameters", {{"file", "roads.geojson"}}}, {"clipped", false}};
    REQUIRE(build_provider(spec, layer)->get_if<VectorDataProvider>()->clipped == ClipMode::Off);
}

TEST_CASE_METHOD(ProviderFixture, "Provider factory rejects vector parameters that are not an object") {
    const json spec = {{"name", "vector"}, {"driver", "GeoJSON"}, {"parameters", "roads.geojson"}};
    REQUIRE_THROWS_AS(build_provider(spec, layer), ConfigurationError);
}

TEST_CASE_METHOD(ProviderFixture, "Provider factory propagates a non-numeric spacing") {
    const json spec = {{"name", "vector"}, {"driver", "GeoJSON"}, {"parameters", json::object()}, {"spacing", "wide"}};
    REQUIRE_THROWS_AS(build_provider(spec, layer), std::invalid_argument);
}

TEST_CASE_METHOD(ProviderFixture, "Provider factory builds a tile archive provider") {
    const ProviderPtr provider = build_provider(json{{"name", "MBTiles"}, {"tileset", "world.mbtiles"}}, layer);
    REQUIRE(provider->get_if<TileArchiveProvider>()->tileset == "world.mbtiles");
}

TEST_CASE_METHOD(ProviderFixture, "Provider factory names an unknown provider") {
    REQUIRE_THROWS_WITH(build_provider(json{{"name", "Bogus"}}, layer), Catch::Matchers::ContainsSubstring("\"Bogus\""));
}

TEST_CASE_METHOD(ProviderFixture, "Provider factory requires a name or class") {
    REQUIRE_THROWS_WITH(
        build_provider(json{{"mapfile", "style.xml"}}, layer),
        Catch::Matchers::ContainsSubstring("Missing required provider name or class") && Catch::Matchers::ContainsSubstring("style.xml")
    );
    REQUIRE_THROWS_AS(build_provider(json::array(), layer), ConfigurationError);
}

TEST_CASE_METHOD(ProviderFixture, "Provider factory loads a plugin provider class") {
    ClassLoader::instance().add_search_directory(TILE_CONFIG_TEST_PLUGIN_DIR);
    const json spec = {{"class", "tile_config.test_plugin.make_tile_provider"}, {"kwargs", {{"layer", "roads"}}}};
    const ProviderPtr provider = build_provider(spec, layer);

    const CustomProvider* custom = provider->get_if<CustomProvider>();
    REQUIRE(custom != nullptr);
    REQUIRE(custom->kwargs.at("layer") == "roads");
    using Constructor = const char* (*)(const char*);
    REQUIRE(std::strcmp(custom->constructor.as<Constructor>()(nullptr), "tile-provider") == 0);
}

TEST_CASE_METHOD(ProviderFixture, "Provider points back at its layer") {
    const ProviderPtr provider = build_provider(json{{"name", "mbtiles"}, {"tileset", "world.mbtiles"}}, layer);
    REQUIRE(&provider->layer() == &layer);
    REQUIRE(&provider->layer().configuration() == &configuration);
}

TEST_CASE_METHOD(ProviderFixture, "Provider factory rejects a name that is not a string") {
    REQUIRE_THROWS_AS(build_provider(json{{"name", nullptr}}, layer), ConfigurationError);
    REQUIRE_THROWS_WITH(
        build_provider(json{{"name", json::array({"mapnik"})}, {"mapfile", "style.xml"}}, layer),
        Catch::Matchers::ContainsSubstring("Provider name must be a string") && Catch::Matchers::ContainsSubstring("style.xml")
    );
}
