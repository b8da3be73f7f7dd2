#pragma once

#include "libtune/distribution.hpp"

#include <memory>
#include <string>

namespace libtune {

// Dimension taking any real value in [low, high].
// The uniform prior draws from [low, high); draws from any prior are clamped into [low, high].
// Accepted transformer names: "identity", "log", "log10".
class Real final : public Distribution {
public:
    Real(double low, double high, PriorSpec prior = "uniform", TransformerSpec transformer = "identity");

    [[nodiscard]] DistributionKind kind() const noexcept override;

    [[nodiscard]] Value draw(RandomEngine& rng) const override;

    [[nodiscard]] std::string to_string() const override;

    [[nodiscard]] double low() const noexcept;

    [[nodiscard]] double high() const noexcept;

    [[nodiscard]] const std::shared_ptr<const Prior>& prior() const noexcept;

private:
    double low_;
    double high_;
    std::shared_ptr<const Prior> prior_;
};

[[nodiscard]] DistributionPtr make_real(double low,
                                        double high,
                                        PriorSpec prior = "uniform",
                                        TransformerSpec transformer = "identity");

}  // namespace libtune
