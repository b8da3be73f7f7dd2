#include "libtune/prior.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <utility>

namespace libtune {

UniformPrior::UniformPrior(double low, double high)
    : low_(low), high_(high) {
    if (!(high_ > low_)) {
        throw std::invalid_argument("uniform prior requires high > low");
    }
    if (!std::isfinite(high_ - low_)) {
        throw std::invalid_argument("uniform prior range high - low must be finite");
    }
}

std::string UniformPrior::name() const {
    return "uniform";
}

double UniformPrior::draw(RandomEngine& rng) const {
    std::uniform_real_distribution<double> distribution(low_, high_);
    return distribution(rng);
}

UniformIntegerPrior::UniformIntegerPrior(std::int64_t low, std::int64_t high)
    : low_(low), high_(high) {
    if (!(high_ > low_)) {
        throw std::invalid_argument("uniform integer prior requires high > low");
    }
}

std::string UniformIntegerPrior::name() const {
    return "uniform_integer";
}

double UniformIntegerPrior::draw(RandomEngine& rng) const {
    return static_cast<double>(draw_integer(rng));
}

std::int64_t UniformIntegerPrior::draw_integer(RandomEngine& rng) const {
    std::uniform_int_distribution<std::int64_t> distribution(low_, high_ - 1);
    return distribution(rng);
}

NormalPrior::NormalPrior(double mean, double stddev)
    : mean_(mean), stddev_(stddev) {
    if (!(stddev_ > 0.0)) {
        throw std::invalid_argument("normal prior requires positive standard deviation");
    }
}

std::string NormalPrior::name() const {
    return "normal";
}

double NormalPrior::draw(RandomEngine& rng) const {
    std::normal_distribution<double> distribution(mean_, stddev_);
    return distribution(rng);
}

LogUniformPrior::LogUniformPrior(double low, double high) {
    if (!(low > 0.0) || !(high > low)) {
        throw std::invalid_argument("log-uniform prior requires 0 < low < high");
    }
    log_low_ = std::log(low);
    log_high_ = std::log(high);
}

std::string LogUniformPrior::name() const {
    return "log_uniform";
}

double LogUniformPrior::draw(RandomEngine& rng) const {
    std::uniform_real_distribution<double> distribution(log_low_, log_high_);
    return std::exp(distribution(rng));
}

DiscretePrior::DiscretePrior(std::vector<double> weights)
    : weights_(std::move(weights)) {
    if (weights_.empty()) {
        throw std::invalid_argument("discrete prior requires at least one weight");
    }
    cumulative_.reserve(weights_.size());
    double total = 0.0;
    for (std::size_t i = 0; i < weights_.size(); ++i) {
        const double w = weights_[i];
        if (!(w >= 0.0) || !std::isfinite(w)) {
            throw std::invalid_argument("discrete prior weights must be finite and non-negative");
        }
        total += w;
        cumulative_.push_back(total);
        if (w > 0.0) {
            last_positive_ = i;
        }
    }
    if (!(total > 0.0) || !std::isfinite(total)) {
        throw std::invalid_argument("discrete prior weights must sum to a positive finite value");
    }
}

std::string DiscretePrior::name() const {
    return "discrete";
}

double DiscretePrior::draw(RandomEngine& rng) const {
    return static_cast<double>(draw_index(rng));
}

// Inverse CDF over the running sums; zero weights own an empty interval.
std::size_t DiscretePrior::draw_index(RandomEngine& rng) const {
    std::uniform_real_distribution<double> unit(0.0, cumulative_.back());
    const double u = unit(rng);
    const auto it = std::upper_bound(cumulative_.begin(), cumulative_.end(), u);
    if (it == cumulative_.end()) {
        return last_positive_;
    }
    return static_cast<std::size_t>(it - cumulative_.begin());
}

const std::vector<double>& DiscretePrior::weights() const noexcept {
    return weights_;
}

std::shared_ptr<const Prior> make_uniform_prior(double low, double high) {
    return std::make_shared<UniformPrior>(low, high);
}

std::shared_ptr<const Prior> make_uniform_integer_prior(std::int64_t low, std::int64_t high) {
    return std::make_shared<UniformIntegerPrior>(low, high);
}

std::shared_ptr<const Prior> make_normal_prior(double mean, double stddev) {
    return std::make_shared<NormalPrior>(mean, stddev);
}

std::shared_ptr<const Prior> make_log_uniform_prior(double low, double high) {
    return std::make_shared<LogUniformPrior>(low, high);
}

std::shared_ptr<const Prior> make_discrete_prior(std::vector<double> weights) {
    return std::make_shared<DiscretePrior>(std::move(weights));
}

}  // namespace libtune
