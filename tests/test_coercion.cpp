#include <stdexcept>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "tile_config/coercion.hpp"

using namespace tile_config;
using nlohmann::json;

TEST_CASE("to_int accepts numbers, booleans and integer strings") {
    REQUIRE(to_int(json(42)) == 42);
    REQUIRE(to_int(json(3.9)) == 3);
    REQUIRE(to_int(json(-3.9)) == -3);
    REQUIRE(to_int(json(true)) == 1);
    REQUIRE(to_int(json(" 300 ")) == 300);
}

TEST_CASE("to_int rejects values that are not whole numbers") {
    REQUIRE_THROWS_AS(to_int(json("1.5")), std::invalid_argument);
    REQUIRE_THROWS_AS(to_int(json("soon")), std::invalid_argument);
    REQUIRE_THROWS_AS(to_int(json(nullptr)), std::invalid_argument);
    REQUIRE_THROWS_AS(to_int(json::array()), std::invalid_argument);
    REQUIRE_THROWS_AS(to_int(json("99999999999")), std::out_of_range);
}

TEST_CASE("to_double accepts numeric strings") {
    REQUIRE(to_double(json("2.5")) == Catch::Approx(2.5));
    REQUIRE(to_double(json(7)) == Catch::Approx(7.0));
    REQUIRE_THROWS_AS(to_double(json("2.5km")), std::invalid_argument);
}

TEST_CASE("to_bool follows truthiness") {
    REQUIRE_FALSE(to_bool(json(nullptr)));
    REQUIRE_FALSE(to_bool(json(0)));
    REQUIRE_FALSE(to_bool(json("")));
    REQUIRE_FALSE(to_bool(json::array()));
    REQUIRE_FALSE(to_bool(json::object()));
    REQUIRE(to_bool(json(1)));
    REQUIRE(to_bool(json("false")));
    REQUIRE(to_bool(json::array({0})));
}

TEST_CASE("to_string serializes non-string values") {
    REQUIRE(to_string(json("*")) == "*");
    REQUIRE(to_string(json(5)) == "5");
    REQUIRE(to_string(json(true)) == "true");
}

TEST_CASE("parse_octal reads permission strings") {
    REQUIRE(parse_octal(json("0022")) == 18);
    REQUIRE(parse_octal(json("0o755")) == 493);
    REQUIRE(parse_octal(json("0000")) == 0);
}

TEST_CASE("parse_octal rejects non-octal input") {
    REQUIRE_THROWS_AS(parse_octal(json("0089")), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_octal(json("")), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_octal(json(22)), std::invalid_argument);
}
