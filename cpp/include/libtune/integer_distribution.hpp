#pragma once

#include "libtune/distribution.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace libtune {

// Dimension taking integer values.
// The uniform prior draws from [low, high), high exclusive. Draws from other priors are
// rounded to the nearest integer. Every draw is clamped into [low, high].
// Accepted transformer names: "identity".
class Integer final : public Distribution {
public:
    Integer(std::int64_t low,
            std::int64_t high,
            PriorSpec prior = "uniform",
            TransformerSpec transformer = "identity");

    [[nodiscard]] DistributionKind kind() const noexcept override;

    [[nodiscard]] Value draw(RandomEngine& rng) const override;

    [[nodiscard]] std::string to_string() const override;

    // Numeric results are rounded to the nearest integer.
    [[nodiscard]] std::vector<Value> inverse_transform(const Eigen::MatrixXd& warped) const override;

    [[nodiscard]] std::int64_t low() const noexcept;

    [[nodiscard]] std::int64_t high() const noexcept;

    [[nodiscard]] const std::shared_ptr<const Prior>& prior() const noexcept;

private:
    std::int64_t low_;
    std::int64_t high_;
    std::shared_ptr<const Prior> prior_;
    std::shared_ptr<const UniformIntegerPrior> uniform_;
};

[[nodiscard]] DistributionPtr make_integer(std::int64_t low,
                                           std::int64_t high,
                                           PriorSpec prior = "uniform",
                                           TransformerSpec transformer = "identity");

}  // namespace libtune
