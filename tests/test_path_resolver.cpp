#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "tile_config/errors.hpp"
#include "tile_config/path_resolver.hpp"

using namespace tile_config;

TEST_CASE("enforced_local_path keeps absolute paths") {
    REQUIRE(enforced_local_path("/abs/path", "/cfg/dir", "Disk cache path") == "/abs/path");
}

TEST_CASE("enforced_local_path joins plain paths on the filesystem") {
    REQUIRE(enforced_local_path("rel/p", "/cfg/dir", "Disk cache path") == "/cfg/dir/rel/p");
    REQUIRE(enforced_local_path("rel/p", "/cfg/dir/", "Disk cache path") == "/cfg/dir/rel/p");
}

TEST_CASE("enforced_local_path refuses a plain path under a remote configuration") {
    REQUIRE_THROWS_AS(enforced_local_path("relative/p", "http://example.com/cfg", "Disk cache path"), ConfigurationError);
    REQUIRE_THROWS_WITH(
        enforced_local_path("relative/p", "http://example.com/cfg", "Disk cache path"),
        Catch::Matchers::ContainsSubstring("must start with \"file://\"") && Catch::Matchers::ContainsSubstring("relative/p")
    );
}

TEST_CASE("enforced_local_path refuses remote resource paths") {
    REQUIRE_THROWS_WITH(
        enforced_local_path("s3://bucket/tiles", "/cfg/dir", "Disk cache path"),
        Catch::Matchers::ContainsSubstring("Disk cache path path must be a local file path") && Catch::Matchers::ContainsSubstring("s3://bucket/tiles")
    );
}

TEST_CASE("enforced_local_path accepts file URLs under a remote configuration") {
    REQUIRE(enforced_local_path("file:///abs/p", "http://example.com/cfg", "Disk cache path") == "/abs/p");
}

TEST_CASE("enforced_local_path URL-joins against a file URL directory") {
    REQUIRE(enforced_local_path("rel/p", "file:///cfg/dir/", "Disk cache path") == "/cfg/dir/rel/p");
    REQUIRE(enforced_local_path("rel/p", "file:///cfg/dir", "Disk cache path") == "/cfg/rel/p");
    REQUIRE(enforced_local_path("../p", "file:///cfg/dir/", "Disk cache path") == "/cfg/p");
}

TEST_CASE("parse_url splits scheme, authority, path, query and fragment") {
    const ParsedUrl parsed = parse_url("HTTP://Example.com:80/a/b?x=1#top");
    REQUIRE(parsed.scheme == "http");
    REQUIRE(parsed.netloc == "Example.com:80");
    REQUIRE(parsed.path == "/a/b");
    REQUIRE(parsed.query == "x=1");
    REQUIRE(parsed.fragment == "top");
}

TEST_CASE("parse_url treats host:port as a path") {
    const ParsedUrl parsed = parse_url("localhost:8080");
    REQUIRE(parsed.scheme.empty());
    REQUIRE(parsed.path == "localhost:8080");
}

TEST_CASE("url_join follows reference resolution rules") {
    REQUIRE(url_join("http://a/b/c/d", "../g") == "http://a/b/g");
    REQUIRE(url_join("http://a/b/c/d", "g?y") == "http://a/b/c/g?y");
    REQUIRE(url_join("http://a/b/c/d", "/g") == "http://a/g");
    REQUIRE(url_join("http://a/b/c/d", "//g") == "http://g");
    REQUIRE(url_join("http://a/b/c/d", "https://other/x") == "https://other/x");
    REQUIRE(url_join("/cfg/dir/", "./style.xml") == "/cfg/dir/style.xml");
}
