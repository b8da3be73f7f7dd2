#pragma once

#include "libtune/distribution.hpp"

#include <optional>
#include <string>
#include <vector>

namespace libtune {

// Dimension taking one of a fixed, ordered set of distinct labels.
// Without a prior every category is equally likely. The default one-hot transformer is
// fitted on the categories at construction.
// Accepted transformer names: "onehot", "one-hot", "labels".
class Categorical final : public Distribution {
public:
    explicit Categorical(std::vector<Value> categories,
                         std::optional<std::vector<double>> prior = std::nullopt,
                         TransformerSpec transformer = "onehot");

    [[nodiscard]] DistributionKind kind() const noexcept override;

    [[nodiscard]] Value draw(RandomEngine& rng) const override;

    [[nodiscard]] std::string to_string() const override;

    [[nodiscard]] const std::vector<Value>& categories() const noexcept;

    [[nodiscard]] const std::vector<double>& probabilities() const noexcept;

private:
    std::vector<Value> categories_;
    DiscretePrior prior_;
};

[[nodiscard]] DistributionPtr make_categorical(std::vector<Value> categories,
                                               std::optional<std::vector<double>> prior = std::nullopt,
                                               TransformerSpec transformer = "onehot");

}  // namespace libtune
