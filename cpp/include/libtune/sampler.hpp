#pragma once

#include "libtune/grid.hpp"
#include "libtune/search_space_types.hpp"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <vector>

namespace libtune {

struct SamplingOptions {
    std::size_t n_points{1};
    std::optional<std::uint64_t> random_state{};  // unset: seeded from std::random_device
};

// Lazy, single-pass sequence of exactly n_points sampled points.
// For each point one sub-grid is chosen uniformly, then every dimension of it is drawn
// in order, all from the same engine. Iterating again continues where the last pass stopped;
// reproduce a sequence by sampling again with the same seed.
class PointSampler {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Point;
        using difference_type = std::ptrdiff_t;
        using pointer = const Point*;
        using reference = const Point&;

        iterator() = default;

        [[nodiscard]] reference operator*() const { return current_; }

        [[nodiscard]] pointer operator->() const { return &current_; }

        iterator& operator++();

        void operator++(int) { ++*this; }

        [[nodiscard]] bool operator==(const iterator& other) const noexcept { return sampler_ == other.sampler_; }

        [[nodiscard]] bool operator!=(const iterator& other) const noexcept { return !(*this == other); }

    private:
        friend class PointSampler;

        explicit iterator(PointSampler* sampler);

        PointSampler* sampler_{nullptr};
        Point current_;
    };

    PointSampler(Grid grid, std::size_t n_points, RandomEngine rng);

    [[nodiscard]] iterator begin();

    [[nodiscard]] iterator end();

    [[nodiscard]] bool has_next() const noexcept;

    // Throws std::out_of_range once all points have been produced.
    [[nodiscard]] Point next();

    // Drains the remaining points.
    [[nodiscard]] std::vector<Point> collect();

    [[nodiscard]] std::size_t remaining() const noexcept;

    [[nodiscard]] const Grid& grid() const noexcept;

private:
    Grid grid_;
    std::size_t remaining_;
    RandomEngine rng_;
};

// Normalizes `grid` and samples `n_points` points from a single engine seeded by `random_state`.
[[nodiscard]] PointSampler sample_points(const GridSpec& grid,
                                         std::size_t n_points = 1,
                                         std::optional<std::uint64_t> random_state = std::nullopt);

[[nodiscard]] PointSampler sample_points(const GridSpec& grid, const SamplingOptions& options);

// Uses a caller-supplied engine, moved into the sampler.
[[nodiscard]] PointSampler sample_points(const GridSpec& grid, std::size_t n_points, RandomEngine rng);

}  // namespace libtune
