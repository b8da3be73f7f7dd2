#pragma once

#include "libtune/distribution.hpp"
#include "libtune/search_space_types.hpp"

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace libtune {

using SubGrid = std::vector<DistributionPtr>;

// Mutually exclusive sub-grids; one is active per sampled point.
using Grid = std::vector<SubGrid>;

// Loosely typed search-space input: a scalar, a distribution, or a list of GridSpec.
//
//   {{1, 5}, {0.1, 1.0}, {"relu", "tanh"}}            one sub-grid, three dimensions
//   {{{1, 5}}, {{"a", "b", "c"}, {0.0, 1.0}}}         two alternative sub-grids
//
// A braced list always builds a list node, so {1} is a one-element list, not the scalar 1.
class GridSpec {
public:
    enum class Shape {
        Scalar,
        Distribution,
        List
    };

    GridSpec(int value);
    GridSpec(long value);
    GridSpec(long long value);
    GridSpec(double value);
    GridSpec(const char* label);
    GridSpec(std::string label);
    GridSpec(Value value);

    template <typename D, std::enable_if_t<std::is_base_of_v<Distribution, D>, int> = 0>
    GridSpec(std::shared_ptr<D> distribution)
        : GridSpec(Shape::Distribution) {
        set_distribution(std::move(distribution));
    }

    GridSpec(std::initializer_list<GridSpec> items);

    explicit GridSpec(std::vector<GridSpec> items);

    // An already normalized grid, as a list of sub-grid lists.
    GridSpec(const Grid& grid);

    [[nodiscard]] Shape shape() const noexcept;

    [[nodiscard]] bool is_scalar() const noexcept;

    [[nodiscard]] bool is_distribution() const noexcept;

    [[nodiscard]] bool is_list() const noexcept;

    [[nodiscard]] const Value& scalar() const;

    [[nodiscard]] const DistributionPtr& distribution() const;

    [[nodiscard]] const std::vector<GridSpec>& items() const;

private:
    explicit GridSpec(Shape shape);

    void set_distribution(DistributionPtr distribution);

    Shape shape_;
    Value scalar_{};
    DistributionPtr distribution_;
    std::vector<GridSpec> items_;
};

// Converts user input into typed sub-grids without touching the input.
//
// The input is flat (a single implicit sub-grid) when its first element is a distribution,
// or a list whose first element is a scalar. It is nested (a list of sub-grids) when its
// first element is a list whose first element is a list or a distribution.
//
// Per dimension entry:
//   distribution                             kept as is
//   more than two values, or first a string  Categorical of all values
//   two values, first integral               Integer(low, high)
//   two values, first floating               Real(low, high)
// Anything else throws std::invalid_argument.
[[nodiscard]] Grid normalize_grid(const GridSpec& grid);

}  // namespace libtune
