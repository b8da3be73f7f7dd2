#include "libtune/real_distribution.hpp"

#include "libtune/logging.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace libtune {

namespace {
[[nodiscard]] double checked_low(double low, double high) {
    if (!std::isfinite(low) || !std::isfinite(high)) {
        throw std::invalid_argument("Real bounds must be finite");
    }
    if (!(low < high)) {
        throw std::invalid_argument("Real requires low < high");
    }
    if (!std::isfinite(high - low)) {
        throw std::invalid_argument("Real range high - low must be finite");
    }
    return low;
}
}  // namespace

Real::Real(double low, double high, PriorSpec prior, TransformerSpec transformer)
    : Distribution(resolve_transformer(transformer, {"identity", "log", "log10"}, {}, "Real")),
      low_(checked_low(low, high)),
      high_(high),
      prior_(resolve_prior(prior, make_uniform_prior(low, high), "Real")) {}

DistributionKind Real::kind() const noexcept {
    return DistributionKind::Real;
}

Value Real::draw(RandomEngine& rng) const {
    const double raw = prior_->draw(rng);
    const double clamped = std::isnan(raw) ? low_ : std::clamp(raw, low_, high_);
    if (clamped != raw) {
        logger()->debug("Real draw {} clamped to [{}, {}]", raw, low_, high_);
    }
    return clamped;
}

std::string Real::to_string() const {
    std::ostringstream out;
    out << "Real(low=" << low_ << ", high=" << high_ << ", prior=" << prior_->name()
        << ", transformer=" << transformer()->name() << ")";
    return out.str();
}

double Real::low() const noexcept {
    return low_;
}

double Real::high() const noexcept {
    return high_;
}

const std::shared_ptr<const Prior>& Real::prior() const noexcept {
    return prior_;
}

DistributionPtr make_real(double low, double high, PriorSpec prior, TransformerSpec transformer) {
    return std::make_shared<Real>(low, high, std::move(prior), std::move(transformer));
}

}  // namespace libtune
