#include "libtune/distribution.hpp"

#include "libtune/random_state.hpp"
#include "libtune/transformer_factory.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace libtune {

Distribution::Distribution(std::shared_ptr<const Transformer> transformer)
    : transformer_(std::move(transformer)) {
    if (!transformer_) {
        throw std::invalid_argument("distribution transformer must be non-null");
    }
}

Value Distribution::rvs(RandomEngine& rng) const {
    return draw(rng);
}

std::vector<Value> Distribution::rvs(std::size_t n_samples, RandomEngine& rng) const {
    std::vector<Value> samples;
    samples.reserve(n_samples);
    for (std::size_t i = 0; i < n_samples; ++i) {
        samples.push_back(draw(rng));
    }
    return samples;
}

std::vector<Value> Distribution::rvs(std::size_t n_samples, std::uint64_t seed) const {
    auto rng = make_random_engine(seed);
    return rvs(n_samples, rng);
}

Eigen::MatrixXd Distribution::transform(const std::vector<Value>& values) const {
    return transformer_->transform(values);
}

std::vector<Value> Distribution::inverse_transform(const Eigen::MatrixXd& warped) const {
    return transformer_->inverse_transform(warped);
}

const std::shared_ptr<const Transformer>& Distribution::transformer() const noexcept {
    return transformer_;
}

std::shared_ptr<const Transformer> Distribution::resolve_transformer(const TransformerSpec& spec,
                                                                     std::initializer_list<const char*> accepted_names,
                                                                     const std::vector<Value>& categories,
                                                                     const std::string& owner) {
    if (const auto* object = std::get_if<std::shared_ptr<const Transformer>>(&spec)) {
        if (!*object) {
            throw std::invalid_argument(owner + " transformer object must be non-null");
        }
        return *object;
    }
    const auto& name = std::get<std::string>(spec);
    const bool accepted = std::any_of(accepted_names.begin(), accepted_names.end(),
                                      [&name](const char* candidate) { return name == candidate; });
    if (!accepted) {
        throw std::invalid_argument("'" + name + "' is not a valid transformer for " + owner);
    }
    return TransformerFactory::create(name, categories);
}

std::shared_ptr<const Prior> Distribution::resolve_prior(const PriorSpec& spec,
                                                         std::shared_ptr<const Prior> uniform,
                                                         const std::string& owner) {
    if (const auto* object = std::get_if<std::shared_ptr<const Prior>>(&spec)) {
        if (!*object) {
            throw std::invalid_argument(owner + " prior object must be non-null");
        }
        return *object;
    }
    const auto& name = std::get<std::string>(spec);
    if (name != "uniform") {
        throw std::invalid_argument(owner + " prior should be either 'uniform' or a prior object, got '" + name + "'");
    }
    return uniform;
}

}  // namespace libtune
