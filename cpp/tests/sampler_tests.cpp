#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "libtune/random_state.hpp"
#include "libtune/sampler.hpp"

using libtune::GridSpec;

TEST_CASE("sample_points is reproducible for a fixed seed", "[sampler]") {
    const GridSpec grid = {{1, 100}, {0.0, 1.0}, {"a", "b", "c"}};

    const auto first = libtune::sample_points(grid, 10, 42).collect();
    const auto second = libtune::sample_points(grid, 10, 42).collect();
    REQUIRE(first.size() == 10);
    REQUIRE(first == second);

    const auto other = libtune::sample_points(grid, 10, 43).collect();
    REQUIRE(first != other);
}

TEST_CASE("sample_points overloads share one seeding path", "[sampler]") {
    const GridSpec grid = {{{1, 5}}, {{0.5, 2.5}, {"x", "y"}}};

    const auto positional = libtune::sample_points(grid, 25, 7).collect();

    libtune::SamplingOptions options;
    options.n_points = 25;
    options.random_state = 7;
    REQUIRE(libtune::sample_points(grid, options).collect() == positional);

    REQUIRE(libtune::sample_points(grid, 25, libtune::RandomEngine(7)).collect() == positional);
    REQUIRE(libtune::sample_points(grid, 25, libtune::make_random_engine(7)).collect() == positional);
}

TEST_CASE("sample_points chooses sub-grids uniformly", "[sampler]") {
    const GridSpec grid = {{{1, 5}}, {{1, 5}, {1, 5}, {1, 5}}};
    constexpr std::size_t n = 100000;

    std::size_t single = 0;
    std::size_t triple = 0;
    for (const auto& point : libtune::sample_points(grid, n, 0)) {
        if (point.size() == 1) {
            ++single;
        } else if (point.size() == 3) {
            ++triple;
        }
    }
    REQUIRE(single + triple == n);
    REQUIRE(static_cast<double>(single) / n == Catch::Approx(0.5).margin(0.01));
}

TEST_CASE("sample_points yields typed values per dimension", "[sampler]") {
    const GridSpec grid = {{-3, 3}, {0.25, 0.75}, {"relu", "tanh", "gelu"}};

    for (const auto& point : libtune::sample_points(grid, 200, 11)) {
        REQUIRE(point.size() == 3);

        REQUIRE(std::holds_alternative<std::int64_t>(point[0]));
        const auto integer = std::get<std::int64_t>(point[0]);
        REQUIRE(integer >= -3);
        REQUIRE(integer < 3);

        REQUIRE(std::holds_alternative<double>(point[1]));
        const auto real = std::get<double>(point[1]);
        REQUIRE(real >= 0.25);
        REQUIRE(real <= 0.75);

        REQUIRE(std::holds_alternative<std::string>(point[2]));
        const auto& label = std::get<std::string>(point[2]);
        REQUIRE((label == "relu" || label == "tanh" || label == "gelu"));
    }
}

TEST_CASE("PointSampler produces exactly n_points", "[sampler]") {
    auto sampler = libtune::sample_points({{1, 10}}, 5, 3);
    REQUIRE(sampler.remaining() == 5);
    REQUIRE(sampler.grid().size() == 1);

    std::size_t count = 0;
    for (const auto& point : sampler) {
        REQUIRE(point.size() == 1);
        ++count;
    }
    REQUIRE(count == 5);
    REQUIRE(sampler.remaining() == 0);
    REQUIRE_FALSE(sampler.has_next());
    REQUIRE(sampler.begin() == sampler.end());
    REQUIRE_THROWS_AS(sampler.next(), std::out_of_range);
}

TEST_CASE("PointSampler continues across partial passes", "[sampler]") {
    const GridSpec grid = {{1, 1000}};
    const auto all = libtune::sample_points(grid, 6, 99).collect();

    auto sampler = libtune::sample_points(grid, 6, 99);
    std::vector<libtune::Point> pieces;
    pieces.push_back(sampler.next());
    pieces.push_back(sampler.next());
    REQUIRE(sampler.remaining() == 4);
    for (auto& point : sampler.collect()) {
        pieces.push_back(std::move(point));
    }
    REQUIRE(pieces == all);
}

TEST_CASE("sample_points handles edge cases", "[sampler]") {
    SECTION("Zero points") {
        auto sampler = libtune::sample_points({{1, 2}}, 0, 1);
        REQUIRE_FALSE(sampler.has_next());
        REQUIRE(sampler.collect().empty());
    }

    SECTION("Default options draw a single point") {
        REQUIRE(libtune::sample_points({{0.0, 1.0}}, libtune::SamplingOptions{}).collect().size() == 1);
    }

    SECTION("Invalid grids are rejected before sampling") {
        REQUIRE_THROWS_AS(libtune::sample_points({{1}}, 3, 1), std::invalid_argument);
        REQUIRE_THROWS_AS(libtune::sample_points(GridSpec(std::vector<GridSpec>{}), 3, 1), std::invalid_argument);
    }

    SECTION("Empty normalized grid") {
        REQUIRE_THROWS_AS(libtune::PointSampler(libtune::Grid{}, 1, libtune::make_random_engine(1)),
                          std::invalid_argument);
    }
}
