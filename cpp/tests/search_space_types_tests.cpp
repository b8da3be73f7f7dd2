#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

#include "libtune/search_space_types.hpp"

TEST_CASE("Value predicates follow the held alternative", "[search_space_types]") {
    const libtune::Value integral = std::int64_t{3};
    const libtune::Value floating = 2.5;
    const libtune::Value label = std::string("relu");

    REQUIRE(libtune::is_integral(integral));
    REQUIRE(libtune::is_numeric(integral));
    REQUIRE_FALSE(libtune::is_floating(integral));

    REQUIRE(libtune::is_floating(floating));
    REQUIRE(libtune::is_numeric(floating));

    REQUIRE(libtune::is_label(label));
    REQUIRE_FALSE(libtune::is_numeric(label));
}

TEST_CASE("Value conversions", "[search_space_types]") {
    REQUIRE(libtune::to_double(libtune::Value(std::int64_t{4})) == Catch::Approx(4.0));
    REQUIRE(libtune::to_double(libtune::Value(0.25)) == Catch::Approx(0.25));
    REQUIRE_THROWS_AS(libtune::to_double(libtune::Value(std::string("a"))), std::invalid_argument);

    REQUIRE(libtune::to_string(libtune::Value(std::int64_t{-7})) == "-7");
    REQUIRE(libtune::to_string(libtune::Value(std::string("tanh"))) == "tanh");
    REQUIRE(libtune::to_string(libtune::Value(0.5)) == "0.5");
}

TEST_CASE("DistributionKind names", "[search_space_types]") {
    REQUIRE(libtune::to_string(libtune::DistributionKind::Real) == "real");
    REQUIRE(libtune::to_string(libtune::DistributionKind::Integer) == "integer");
    REQUIRE(libtune::to_string(libtune::DistributionKind::Categorical) == "categorical");
}
