#include "libtune/grid.hpp"

#include "libtune/categorical_distribution.hpp"
#include "libtune/integer_distribution.hpp"
#include "libtune/logging.hpp"
#include "libtune/real_distribution.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace libtune {

namespace {
[[nodiscard]] std::string position(std::size_t sub_grid, std::size_t dimension) {
    return "sub-grid " + std::to_string(sub_grid) + ", dimension " + std::to_string(dimension);
}

[[nodiscard]] bool is_flat(const GridSpec& grid) {
    const auto& first = grid.items().front();
    if (first.is_distribution()) {
        return true;
    }
    if (first.is_list() && !first.items().empty()) {
        const auto& inner = first.items().front();
        if (inner.is_scalar()) {
            return true;
        }
        if (inner.is_list() || inner.is_distribution()) {
            return false;
        }
    }
    throw std::invalid_argument(
        "cannot tell whether the grid is a flat list of dimensions or a list of sub-grids: "
        "the first element must be a distribution or a non-empty list");
}

[[nodiscard]] DistributionPtr to_distribution(const GridSpec& spec, std::size_t sub_grid, std::size_t dimension) {
    if (spec.is_distribution()) {
        return spec.distribution();
    }
    if (!spec.is_list() || spec.items().empty()) {
        throw std::invalid_argument(position(sub_grid, dimension) +
                                    ": expected a distribution or a non-empty list of values");
    }

    std::vector<Value> values;
    values.reserve(spec.items().size());
    for (const auto& item : spec.items()) {
        if (!item.is_scalar()) {
            throw std::invalid_argument(position(sub_grid, dimension) + ": dimension values must be scalars");
        }
        values.push_back(item.scalar());
    }

    if (values.size() > 2 || is_label(values.front())) {
        return make_categorical(std::move(values));
    }
    if (values.size() == 2) {
        // Integral first: an integral value would also pass as a real one.
        if (is_integral(values[0])) {
            if (!is_integral(values[1])) {
                throw std::invalid_argument(position(sub_grid, dimension) +
                                            ": Integer bounds must both be integral, got high " +
                                            to_string(values[1]));
            }
            return make_integer(std::get<std::int64_t>(values[0]), std::get<std::int64_t>(values[1]));
        }
        if (is_floating(values[0])) {
            if (!is_numeric(values[1])) {
                throw std::invalid_argument(position(sub_grid, dimension) + ": Real bounds must be numeric, got high " +
                                            to_string(values[1]));
            }
            return make_real(std::get<double>(values[0]), to_double(values[1]));
        }
    }
    throw std::invalid_argument(position(sub_grid, dimension) + ": cannot classify a dimension with " +
                                std::to_string(values.size()) + " numeric value(s)");
}
}  // namespace

GridSpec::GridSpec(Shape shape)
    : shape_(shape) {}

GridSpec::GridSpec(int value)
    : GridSpec(Value(static_cast<std::int64_t>(value))) {}

GridSpec::GridSpec(long value)
    : GridSpec(Value(static_cast<std::int64_t>(value))) {}

GridSpec::GridSpec(long long value)
    : GridSpec(Value(static_cast<std::int64_t>(value))) {}

GridSpec::GridSpec(double value)
    : GridSpec(Value(value)) {}

GridSpec::GridSpec(const char* label)
    : GridSpec(Value(std::string(label))) {}

GridSpec::GridSpec(std::string label)
    : GridSpec(Value(std::move(label))) {}

GridSpec::GridSpec(Value value)
    : shape_(Shape::Scalar), scalar_(std::move(value)) {}

GridSpec::GridSpec(std::initializer_list<GridSpec> items)
    : shape_(Shape::List), items_(items) {}

GridSpec::GridSpec(std::vector<GridSpec> items)
    : shape_(Shape::List), items_(std::move(items)) {}

GridSpec::GridSpec(const Grid& grid)
    : shape_(Shape::List) {
    items_.reserve(grid.size());
    for (const auto& sub_grid : grid) {
        std::vector<GridSpec> dimensions;
        dimensions.reserve(sub_grid.size());
        for (const auto& distribution : sub_grid) {
            dimensions.emplace_back(distribution);
        }
        items_.emplace_back(std::move(dimensions));
    }
}

void GridSpec::set_distribution(DistributionPtr distribution) {
    if (!distribution) {
        throw std::invalid_argument("grid distribution must be non-null");
    }
    distribution_ = std::move(distribution);
}

GridSpec::Shape GridSpec::shape() const noexcept {
    return shape_;
}

bool GridSpec::is_scalar() const noexcept {
    return shape_ == Shape::Scalar;
}

bool GridSpec::is_distribution() const noexcept {
    return shape_ == Shape::Distribution;
}

bool GridSpec::is_list() const noexcept {
    return shape_ == Shape::List;
}

const Value& GridSpec::scalar() const {
    if (!is_scalar()) {
        throw std::logic_error("grid spec is not a scalar");
    }
    return scalar_;
}

const DistributionPtr& GridSpec::distribution() const {
    if (!is_distribution()) {
        throw std::logic_error("grid spec is not a distribution");
    }
    return distribution_;
}

const std::vector<GridSpec>& GridSpec::items() const {
    if (!is_list()) {
        throw std::logic_error("grid spec is not a list");
    }
    return items_;
}

Grid normalize_grid(const GridSpec& grid) {
    if (!grid.is_list() || grid.items().empty()) {
        throw std::invalid_argument("grid must be a non-empty list");
    }

    const bool flat = is_flat(grid);
    std::vector<const GridSpec*> sub_grids;
    if (flat) {
        sub_grids.push_back(&grid);
    } else {
        for (const auto& item : grid.items()) {
            sub_grids.push_back(&item);
        }
    }
    logger()->debug("normalizing {} grid with {} sub-grid(s)", flat ? "flat" : "nested", sub_grids.size());

    Grid normalized;
    normalized.reserve(sub_grids.size());
    for (std::size_t s = 0; s < sub_grids.size(); ++s) {
        const GridSpec& sub_grid = *sub_grids[s];
        if (!sub_grid.is_list() || sub_grid.items().empty()) {
            throw std::invalid_argument("sub-grid " + std::to_string(s) + " must be a non-empty list of dimensions");
        }
        SubGrid dimensions;
        dimensions.reserve(sub_grid.items().size());
        for (std::size_t d = 0; d < sub_grid.items().size(); ++d) {
            dimensions.push_back(to_distribution(sub_grid.items()[d], s, d));
            if (logger()->should_log(spdlog::level::debug)) {
                logger()->debug("{} -> {}", position(s, d), dimensions.back()->to_string());
            }
        }
        normalized.push_back(std::move(dimensions));
    }
    return normalized;
}

}  // namespace libtune
