#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <Eigen/Core>

#include <cfloat>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "libtune/random_state.hpp"
#include "libtune/real_distribution.hpp"

TEST_CASE("Real samples stay within bounds", "[real_distribution]") {
    const std::vector<std::pair<double, double>> bounds = {{0.0, 1.0}, {-5.0, -4.5}, {1e-3, 1e3}};
    for (std::uint64_t seed : {0ULL, 1ULL, 42ULL, 1234567ULL}) {
        for (const auto& [low, high] : bounds) {
            libtune::Real real(low, high);
            for (const auto& value : real.rvs(2000, seed)) {
                REQUIRE(libtune::is_floating(value));
                REQUIRE(std::get<double>(value) >= low);
                REQUIRE(std::get<double>(value) <= high);
            }
        }
    }
}

TEST_CASE("Real sampling is reproducible", "[real_distribution]") {
    libtune::Real real(0.5, 8.0);
    REQUIRE(real.rvs(50, 42) == real.rvs(50, 42));
    REQUIRE(real.rvs(50, 42) != real.rvs(50, 43));

    auto first = libtune::make_random_engine(9);
    auto second = libtune::make_random_engine(9);
    REQUIRE(real.rvs(first) == real.rvs(second));
}

TEST_CASE("Real clamps draws from wide priors", "[real_distribution]") {
    libtune::Real above(0.0, 1.0, libtune::make_normal_prior(100.0, 1.0));
    for (const auto& value : above.rvs(100, 3)) {
        REQUIRE(std::get<double>(value) == 1.0);
    }

    libtune::Real below(0.0, 1.0, libtune::make_normal_prior(-100.0, 1.0));
    for (const auto& value : below.rvs(100, 3)) {
        REQUIRE(std::get<double>(value) == 0.0);
    }
}

TEST_CASE("Real transformers", "[real_distribution]") {
    libtune::Real real(1e-4, 1.0, "uniform", "log10");
    REQUIRE(real.kind() == libtune::DistributionKind::Real);
    REQUIRE(real.transformer()->name() == "log10");

    const std::vector<libtune::Value> values = {1e-3, 0.5};
    const Eigen::MatrixXd warped = real.transform(values);
    REQUIRE(warped(0, 0) == Catch::Approx(-3.0));

    const auto restored = real.inverse_transform(warped);
    REQUIRE(std::get<double>(restored[0]) == Catch::Approx(1e-3));
    REQUIRE(std::get<double>(restored[1]) == Catch::Approx(0.5));

    libtune::Real custom(0.1, 2.0, "uniform", libtune::make_log_transformer());
    REQUIRE(custom.transformer()->name() == "log");
}

TEST_CASE("Real rejects invalid configuration", "[real_distribution]") {
    REQUIRE_THROWS_AS(libtune::Real(1.0, 1.0), std::invalid_argument);
    REQUIRE_THROWS_AS(libtune::Real(2.0, 1.0), std::invalid_argument);
    REQUIRE_THROWS_AS(libtune::Real(-DBL_MAX, DBL_MAX), std::invalid_argument);
    REQUIRE_THROWS_AS(libtune::Real(0.0, 1.0, "normal"), std::invalid_argument);
    REQUIRE_THROWS_AS(libtune::Real(0.0, 1.0, "uniform", "sqrt"), std::invalid_argument);
    REQUIRE_THROWS_AS(libtune::Real(0.0, 1.0, "uniform", "onehot"), std::invalid_argument);
    REQUIRE_THROWS_AS(libtune::Real(0.0, 1.0, std::shared_ptr<const libtune::Prior>()), std::invalid_argument);
    REQUIRE_THROWS_AS(libtune::Real(0.0, 1.0, "uniform", std::shared_ptr<const libtune::Transformer>()),
                      std::invalid_argument);
}

TEST_CASE("make_real describes the dimension", "[real_distribution]") {
    auto real = libtune::make_real(0.0, 2.0);
    REQUIRE(real->kind() == libtune::DistributionKind::Real);
    REQUIRE(real->to_string() == "Real(low=0, high=2, prior=uniform, transformer=identity)");
}
