#include "libtune/sampler.hpp"

#include "libtune/logging.hpp"
#include "libtune/random_state.hpp"

#include <random>
#include <stdexcept>
#include <utility>

namespace libtune {

PointSampler::iterator::iterator(PointSampler* sampler)
    : sampler_(sampler) {
    ++*this;
}

PointSampler::iterator& PointSampler::iterator::operator++() {
    if (sampler_ == nullptr) {
        return *this;
    }
    if (!sampler_->has_next()) {
        sampler_ = nullptr;
        current_.clear();
        return *this;
    }
    current_ = sampler_->next();
    return *this;
}

PointSampler::PointSampler(Grid grid, std::size_t n_points, RandomEngine rng)
    : grid_(std::move(grid)), remaining_(n_points), rng_(std::move(rng)) {
    if (grid_.empty()) {
        throw std::invalid_argument("cannot sample from an empty grid");
    }
}

PointSampler::iterator PointSampler::begin() {
    return iterator(this);
}

PointSampler::iterator PointSampler::end() {
    return iterator();
}

bool PointSampler::has_next() const noexcept {
    return remaining_ > 0;
}

Point PointSampler::next() {
    if (!has_next()) {
        throw std::out_of_range("point sampler is exhausted");
    }
    --remaining_;

    std::uniform_int_distribution<std::size_t> pick(0, grid_.size() - 1);
    const std::size_t chosen = pick(rng_);
    const auto& sub_grid = grid_[chosen];
    logger()->trace("sampling sub-grid {} of {}", chosen, grid_.size());

    Point point;
    point.reserve(sub_grid.size());
    for (const auto& distribution : sub_grid) {
        point.push_back(distribution->rvs(rng_));
    }
    return point;
}

std::vector<Point> PointSampler::collect() {
    std::vector<Point> points;
    points.reserve(remaining_);
    while (has_next()) {
        points.push_back(next());
    }
    return points;
}

std::size_t PointSampler::remaining() const noexcept {
    return remaining_;
}

const Grid& PointSampler::grid() const noexcept {
    return grid_;
}

PointSampler sample_points(const GridSpec& grid, std::size_t n_points, std::optional<std::uint64_t> random_state) {
    return PointSampler(normalize_grid(grid), n_points, make_random_engine(random_state));
}

PointSampler sample_points(const GridSpec& grid, const SamplingOptions& options) {
    return sample_points(grid, options.n_points, options.random_state);
}

PointSampler sample_points(const GridSpec& grid, std::size_t n_points, RandomEngine rng) {
    return PointSampler(normalize_grid(grid), n_points, std::move(rng));
}

}  // namespace libtune
