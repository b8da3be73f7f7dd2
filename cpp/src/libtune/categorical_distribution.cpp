#include "libtune/categorical_distribution.hpp"

#include "libtune/logging.hpp"

#include <cmath>
#include <memory>
#include <numeric>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace libtune {

namespace {
constexpr double kProbabilityTolerance = 1e-8;

[[nodiscard]] const std::vector<Value>& checked_categories(const std::vector<Value>& categories) {
    if (categories.empty()) {
        throw std::invalid_argument("Categorical requires at least one category");
    }
    const std::set<Value> distinct(categories.begin(), categories.end());
    if (distinct.size() != categories.size()) {
        throw std::invalid_argument("Categorical categories must be distinct");
    }
    return categories;
}

[[nodiscard]] std::vector<double> prior_weights(const std::optional<std::vector<double>>& prior, std::size_t n) {
    if (!prior) {
        return std::vector<double>(n, 1.0 / static_cast<double>(n));
    }
    if (prior->size() != n) {
        throw std::invalid_argument("Categorical prior has " + std::to_string(prior->size()) +
                                    " probabilities for " + std::to_string(n) + " categories");
    }
    const double total = std::accumulate(prior->begin(), prior->end(), 0.0);
    if (std::abs(total - 1.0) > kProbabilityTolerance) {
        logger()->warn("Categorical prior sums to {}, using it as relative weights", total);
    }
    return *prior;
}
}  // namespace

Categorical::Categorical(std::vector<Value> categories,
                         std::optional<std::vector<double>> prior,
                         TransformerSpec transformer)
    : Distribution(resolve_transformer(transformer,
                                       {"onehot", "one-hot", "labels"},
                                       checked_categories(categories),
                                       "Categorical")),
      categories_(std::move(categories)),
      prior_(prior_weights(prior, categories_.size())) {}

DistributionKind Categorical::kind() const noexcept {
    return DistributionKind::Categorical;
}

Value Categorical::draw(RandomEngine& rng) const {
    return categories_[prior_.draw_index(rng)];
}

std::string Categorical::to_string() const {
    std::ostringstream out;
    out << "Categorical(categories=(";
    for (std::size_t i = 0; i < categories_.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << libtune::to_string(categories_[i]);
    }
    out << "), prior=(";
    const auto& weights = prior_.weights();
    for (std::size_t i = 0; i < weights.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << weights[i];
    }
    out << "), transformer=" << transformer()->name() << ")";
    return out.str();
}

const std::vector<Value>& Categorical::categories() const noexcept {
    return categories_;
}

const std::vector<double>& Categorical::probabilities() const noexcept {
    return prior_.weights();
}

DistributionPtr make_categorical(std::vector<Value> categories,
                                 std::optional<std::vector<double>> prior,
                                 TransformerSpec transformer) {
    return std::make_shared<Categorical>(std::move(categories), std::move(prior), std::move(transformer));
}

}  // namespace libtune
