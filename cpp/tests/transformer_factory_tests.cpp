#include "libtune/transformer_factory.hpp"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>
#include <vector>

TEST_CASE("TransformerFactory creates transformers by name", "[transformer_factory]") {
    const std::vector<libtune::Value> categories = {std::string("a"), std::string("b")};

    SECTION("Identity") {
        auto transformer = libtune::TransformerFactory::create("identity");
        REQUIRE(transformer != nullptr);
        REQUIRE(transformer->name() == "identity");
    }

    SECTION("Log") {
        REQUIRE(libtune::TransformerFactory::create("log")->name() == "log");
        REQUIRE(libtune::TransformerFactory::create("log10")->name() == "log10");
    }

    SECTION("One-hot aliases") {
        auto onehot = libtune::TransformerFactory::create("onehot", categories);
        auto hyphenated = libtune::TransformerFactory::create("one-hot", categories);
        REQUIRE(onehot->name() == "onehot");
        REQUIRE(hyphenated->transformed_size() == 2);
    }

    SECTION("Labels") {
        auto labels = libtune::TransformerFactory::create("labels", categories);
        REQUIRE(labels->name() == "labels");
        REQUIRE(labels->transformed_size() == 1);
    }

    SECTION("Stateful transformer without categories") {
        REQUIRE_THROWS_AS(libtune::TransformerFactory::create("onehot"), std::invalid_argument);
    }

    SECTION("Unknown transformer") {
        REQUIRE_THROWS_AS(libtune::TransformerFactory::create("sqrt"), std::invalid_argument);
    }
}
