#pragma once

#include "libtune/prior.hpp"
#include "libtune/search_space_types.hpp"
#include "libtune/transformer.hpp"

#include <Eigen/Core>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace libtune {

// A transformer given either by name or as an already fitted object.
using TransformerSpec = std::variant<std::string, std::shared_ptr<const Transformer>>;

// A prior given either by name ("uniform") or as a frozen variate.
using PriorSpec = std::variant<std::string, std::shared_ptr<const Prior>>;

// One search dimension: its domain, sampling policy and warping transformer.
// The variants are closed: Real, Integer and Categorical.
class Distribution {
public:
    virtual ~Distribution() = default;

    [[nodiscard]] virtual DistributionKind kind() const noexcept = 0;

    // Draws one value from the prior, using and advancing `rng`.
    [[nodiscard]] virtual Value draw(RandomEngine& rng) const = 0;

    [[nodiscard]] virtual std::string to_string() const = 0;

    [[nodiscard]] Value rvs(RandomEngine& rng) const;

    [[nodiscard]] std::vector<Value> rvs(std::size_t n_samples, RandomEngine& rng) const;

    // Same seed and sample count give identical values.
    [[nodiscard]] std::vector<Value> rvs(std::size_t n_samples, std::uint64_t seed) const;

    // Original space to warped space.
    [[nodiscard]] Eigen::MatrixXd transform(const std::vector<Value>& values) const;

    // Warped space to original space.
    [[nodiscard]] virtual std::vector<Value> inverse_transform(const Eigen::MatrixXd& warped) const;

    [[nodiscard]] const std::shared_ptr<const Transformer>& transformer() const noexcept;

protected:
    explicit Distribution(std::shared_ptr<const Transformer> transformer);

    [[nodiscard]] static std::shared_ptr<const Transformer> resolve_transformer(
        const TransformerSpec& spec,
        std::initializer_list<const char*> accepted_names,
        const std::vector<Value>& categories,
        const std::string& owner);

    [[nodiscard]] static std::shared_ptr<const Prior> resolve_prior(const PriorSpec& spec,
                                                                   std::shared_ptr<const Prior> uniform,
                                                                   const std::string& owner);

private:
    std::shared_ptr<const Transformer> transformer_;
};

using DistributionPtr = std::shared_ptr<const Distribution>;

}  // namespace libtune
