#pragma once

#include "libtune/search_space_types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace libtune {

// Frozen random variate used to draw values of a dimension.
class Prior {
public:
    virtual ~Prior() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    [[nodiscard]] virtual double draw(RandomEngine& rng) const = 0;
};

// Continuous uniform on [low, high). high - low must be finite.
class UniformPrior final : public Prior {
public:
    UniformPrior(double low, double high);

    [[nodiscard]] std::string name() const override;

    [[nodiscard]] double draw(RandomEngine& rng) const override;

private:
    double low_;
    double high_;
};

// Discrete uniform on the integers in [low, high).
class UniformIntegerPrior final : public Prior {
public:
    UniformIntegerPrior(std::int64_t low, std::int64_t high);

    [[nodiscard]] std::string name() const override;

    [[nodiscard]] double draw(RandomEngine& rng) const override;

    [[nodiscard]] std::int64_t draw_integer(RandomEngine& rng) const;

private:
    std::int64_t low_;
    std::int64_t high_;
};

class NormalPrior final : public Prior {
public:
    NormalPrior(double mean, double stddev);

    [[nodiscard]] std::string name() const override;

    [[nodiscard]] double draw(RandomEngine& rng) const override;

private:
    double mean_;
    double stddev_;
};

// Uniform in log space between low and high, both strictly positive.
class LogUniformPrior final : public Prior {
public:
    LogUniformPrior(double low, double high);

    [[nodiscard]] std::string name() const override;

    [[nodiscard]] double draw(RandomEngine& rng) const override;

private:
    double log_low_;
    double log_high_;
};

// Index in [0, weights.size()) drawn with probability proportional to its weight.
class DiscretePrior final : public Prior {
public:
    explicit DiscretePrior(std::vector<double> weights);

    [[nodiscard]] std::string name() const override;

    [[nodiscard]] double draw(RandomEngine& rng) const override;

    [[nodiscard]] std::size_t draw_index(RandomEngine& rng) const;

    [[nodiscard]] const std::vector<double>& weights() const noexcept;

private:
    std::vector<double> weights_;
    std::vector<double> cumulative_;
    std::size_t last_positive_{0};
};

std::shared_ptr<const Prior> make_uniform_prior(double low, double high);

std::shared_ptr<const Prior> make_uniform_integer_prior(std::int64_t low, std::int64_t high);

std::shared_ptr<const Prior> make_normal_prior(double mean, double stddev);

std::shared_ptr<const Prior> make_log_uniform_prior(double low, double high);

std::shared_ptr<const Prior> make_discrete_prior(std::vector<double> weights);

}  // namespace libtune
