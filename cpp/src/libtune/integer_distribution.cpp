#include "libtune/integer_distribution.hpp"

#include "libtune/logging.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace libtune {

namespace {
[[nodiscard]] std::int64_t checked_low(std::int64_t low, std::int64_t high) {
    if (!(low < high)) {
        throw std::invalid_argument("Integer requires low < high");
    }
    return low;
}
}  // namespace

Integer::Integer(std::int64_t low, std::int64_t high, PriorSpec prior, TransformerSpec transformer)
    : Distribution(resolve_transformer(transformer, {"identity"}, {}, "Integer")),
      low_(checked_low(low, high)),
      high_(high),
      uniform_(std::make_shared<UniformIntegerPrior>(low, high)) {
    prior_ = resolve_prior(prior, uniform_, "Integer");
    if (prior_ != uniform_) {
        uniform_.reset();
    }
}

DistributionKind Integer::kind() const noexcept {
    return DistributionKind::Integer;
}

Value Integer::draw(RandomEngine& rng) const {
    if (uniform_) {
        return std::clamp(uniform_->draw_integer(rng), low_, high_);
    }
    // Out-of-range draws return the exact bound; llround only sees draws strictly inside.
    const double raw = prior_->draw(rng);
    if (std::isnan(raw) || raw <= static_cast<double>(low_)) {
        if (!(raw == static_cast<double>(low_))) {
            logger()->debug("Integer draw {} clamped to [{}, {}]", raw, low_, high_);
        }
        return low_;
    }
    if (raw >= static_cast<double>(high_)) {
        if (raw != static_cast<double>(high_)) {
            logger()->debug("Integer draw {} clamped to [{}, {}]", raw, low_, high_);
        }
        return high_;
    }
    return std::clamp(static_cast<std::int64_t>(std::llround(raw)), low_, high_);
}

std::string Integer::to_string() const {
    std::ostringstream out;
    out << "Integer(low=" << low_ << ", high=" << high_ << ", prior=" << prior_->name()
        << ", transformer=" << transformer()->name() << ")";
    return out.str();
}

std::vector<Value> Integer::inverse_transform(const Eigen::MatrixXd& warped) const {
    auto values = Distribution::inverse_transform(warped);
    for (auto& value : values) {
        if (is_floating(value)) {
            value = static_cast<std::int64_t>(std::llround(std::get<double>(value)));
        }
    }
    return values;
}

std::int64_t Integer::low() const noexcept {
    return low_;
}

std::int64_t Integer::high() const noexcept {
    return high_;
}

const std::shared_ptr<const Prior>& Integer::prior() const noexcept {
    return prior_;
}

DistributionPtr make_integer(std::int64_t low, std::int64_t high, PriorSpec prior, TransformerSpec transformer) {
    return std::make_shared<Integer>(low, high, std::move(prior), std::move(transformer));
}

}  // namespace libtune
