#include "tile_config/provider.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include <fmt/format.h>

#include "tile_config/coercion.hpp"
#include "tile_config/errors.hpp"
#include "tile_config/json_fields.hpp"
#include "tile_config/logging.hpp"

namespace tile_config {

namespace {

using ProviderParser = ProviderBackend (*)(const nlohmann::json&);

ProviderBackend parse_styled_renderer(const nlohmann::json& spec) {
    StyledRendererProvider provider{};
    provider.mapfile = require_field(spec, "mapfile", "Mapnik provider").get<std::string>();
    if (const nlohmann::json* fonts = find_field(spec, "fonts"); fonts != nullptr && !fonts->is_null()) {
        provider.fonts = fonts->get<std::string>();
    }
    return provider;
}

ProviderBackend parse_reverse_proxy(const nlohmann::json& spec) {
    ReverseProxyProvider provider{};
    if (const nlohmann::json* url = find_field(spec, "url"); url != nullptr) {
        provider.url = url->get<std::string>();
    }
    if (const nlohmann::json* upstream = find_field(spec, "provider"); upstream != nullptr) {
        provider.upstream = make_tile_service_descriptor(upstream->get<std::string>());
    }
    return provider;
}

ProviderBackend parse_url_template(const nlohmann::json& spec) {
    UrlTemplateProvider provider{};
    provider.url_template = require_field(spec, "template", "URL template provider").get<std::string>();
    return provider;
}

ClipMode parse_clip_mode(const nlohmann::json& spec) {
    const nlohmann::json* clipped = find_field(spec, "clipped");
    if (clipped == nullptr) {
        return ClipMode::On;
    }
    if (clipped->is_string() && clipped->get_ref<const std::string&>() == "padded") {
        return ClipMode::Padded;
    }
    return to_bool(*clipped) ? ClipMode::On : ClipMode::Off;
}

ProviderBackend parse_vector_data(const nlohmann::json& spec) {
    VectorDataProvider provider{};
    provider.driver = require_field(spec, "driver", "Vector provider").get<std::string>();

    const nlohmann::json& parameters = require_field(spec, "parameters", "Vector provider");
    require_object(parameters, "Vector provider parameters");
    provider.parameters = parameters;

    if (const nlohmann::json* properties = find_field(spec, "properties"); properties != nullptr && !properties->is_null()) {
        provider.properties = *properties;
    }
    if (const nlohmann::json* projected = find_field(spec, "projected"); projected != nullptr) {
        provider.projected = to_bool(*projected);
    }
    if (const nlohmann::json* verbose = find_field(spec, "verbose"); verbose != nullptr) {
        provider.verbose = to_bool(*verbose);
    }
    if (const nlohmann::json* spacing = find_field(spec, "spacing"); spacing != nullptr) {
        provider.spacing = to_double(*spacing);
    }
    provider.clipped = parse_clip_mode(spec);
    return provider;
}

ProviderBackend parse_tile_archive(const nlohmann::json& spec) {
    TileArchiveProvider provider{};
    provider.tileset = require_field(spec, "tileset", "MBTiles provider").get<std::string>();
    return provider;
}

constexpr std::array<std::pair<std::string_view, ProviderParser>, 5> k_builtin_providers{{
    {"mapnik", parse_styled_renderer},
    {"proxy", parse_reverse_proxy},
    {"url template", parse_url_template},
    {"vector", parse_vector_data},
    {"mbtiles", parse_tile_archive},
}};

ProviderBackend parse_custom_provider(const nlohmann::json& spec) {
    CustomProvider provider{};
    provider.constructor = load_class_path(to_string(spec.at("class")));
    if (const nlohmann::json* kwargs = find_field(spec, "kwargs"); kwargs != nullptr) {
        require_object(*kwargs, "Provider kwargs");
        provider.kwargs = *kwargs;
    }
    return provider;
}

ProviderBackend parse_provider_backend(const nlohmann::json& spec) {
    if (const nlohmann::json* name = find_field(spec, "name"); name != nullptr) {
        if (!name->is_string()) {
            throw ConfigurationError(fmt::format("Provider name must be a string: {}", spec.dump()));
        }
        const std::string provider_name = name->get<std::string>();
        const std::string lookup_name = lower_case(provider_name);
        const auto iter_parser = std::find_if(k_builtin_providers.begin(), k_builtin_providers.end(), [&lookup_name](const auto& entry) {
            return entry.first == lookup_name;
        });
        if (iter_parser == k_builtin_providers.end()) {
            throw ConfigurationError(fmt::format(R"(Unknown provider name: "{}")", provider_name));
        }
        return iter_parser->second(spec);
    }
    if (find_field(spec, "class") != nullptr) {
        return parse_custom_provider(spec);
    }
    throw ConfigurationError(fmt::format("Missing required provider name or class: {}", spec.dump()));
}

}  // namespace

Provider::Provider(const Layer& layer, ProviderBackend backend)
    : layer_(&layer),
      backend_(std::move(backend)) {}

const Layer& Provider::layer() const noexcept {
    return *layer_;
}

const ProviderBackend& Provider::backend() const noexcept {
    return backend_;
}

std::string_view Provider::kind() const noexcept {
    struct KindVisitor final {
        std::string_view operator()(const StyledRendererProvider&) const noexcept { return "StyledRenderer"; }
        std::string_view operator()(const ReverseProxyProvider&) const noexcept { return "ReverseProxy"; }
        std::string_view operator()(const UrlTemplateProvider&) const noexcept { return "UrlTemplate"; }
        std::string_view operator()(const VectorDataProvider&) const noexcept { return "VectorData"; }
        std::string_view operator()(const TileArchiveProvider&) const noexcept { return "TileArchive"; }
        std::string_view operator()(const CustomProvider&) const noexcept { return "Custom"; }
    };
    return std::visit(KindVisitor{}, backend_);
}

ProviderPtr build_provider(const nlohmann::json& spec, const Layer& layer) {
    require_object(spec, "Provider configuration");
    auto provider = std::make_unique<const Provider>(layer, parse_provider_backend(spec));
    get_logger()->debug("Built {} provider", provider->kind());
    return provider;
}

}  // namespace tile_config
