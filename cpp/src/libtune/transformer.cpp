#include "libtune/transformer.hpp"

#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>

namespace libtune {

namespace {
void require_columns(const Eigen::MatrixXd& warped, Eigen::Index expected) {
    if (warped.cols() != expected) {
        throw std::invalid_argument("warped values have " + std::to_string(warped.cols()) +
                                    " columns, expected " + std::to_string(expected));
    }
}
}  // namespace

Eigen::MatrixXd NumericTransformer::transform(const std::vector<Value>& values) const {
    Eigen::MatrixXd warped(static_cast<Eigen::Index>(values.size()), 1);
    for (std::size_t i = 0; i < values.size(); ++i) {
        warped(static_cast<Eigen::Index>(i), 0) = to_warped(to_double(values[i]));
    }
    return warped;
}

std::vector<Value> NumericTransformer::inverse_transform(const Eigen::MatrixXd& warped) const {
    require_columns(warped, 1);
    std::vector<Value> values;
    values.reserve(static_cast<std::size_t>(warped.rows()));
    for (Eigen::Index i = 0; i < warped.rows(); ++i) {
        values.emplace_back(from_warped(warped(i, 0)));
    }
    return values;
}

std::string IdentityTransformer::name() const {
    return "identity";
}

std::shared_ptr<const Transformer> IdentityTransformer::fit(const std::vector<Value>& /*values*/) const {
    return make_identity_transformer();
}

double IdentityTransformer::to_warped(double original) const {
    return original;
}

double IdentityTransformer::from_warped(double warped) const {
    return warped;
}

std::string LogTransformer::name() const {
    return "log";
}

std::shared_ptr<const Transformer> LogTransformer::fit(const std::vector<Value>& /*values*/) const {
    return make_log_transformer();
}

double LogTransformer::to_warped(double original) const {
    return std::log(original);
}

double LogTransformer::from_warped(double warped) const {
    return std::exp(warped);
}

std::string Log10Transformer::name() const {
    return "log10";
}

std::shared_ptr<const Transformer> Log10Transformer::fit(const std::vector<Value>& /*values*/) const {
    return make_log10_transformer();
}

double Log10Transformer::to_warped(double original) const {
    return std::log10(original);
}

double Log10Transformer::from_warped(double warped) const {
    return std::pow(10.0, warped);
}

LabelIndex::LabelIndex(const std::vector<Value>& values) {
    if (values.empty()) {
        throw std::invalid_argument("label encoding requires at least one label");
    }
    for (const auto& value : values) {
        positions_.emplace(value, 0);
    }
    classes_.reserve(positions_.size());
    for (auto& [label, position] : positions_) {
        position = static_cast<Eigen::Index>(classes_.size());
        classes_.push_back(label);
    }
}

Eigen::Index LabelIndex::index_of(const Value& label) const {
    const auto it = positions_.find(label);
    if (it == positions_.end()) {
        throw std::out_of_range("label '" + to_string(label) + "' was not seen when fitting the encoder");
    }
    return it->second;
}

const Value& LabelIndex::label_at(Eigen::Index index) const {
    if (index < 0 || index >= size()) {
        throw std::out_of_range("label index " + std::to_string(index) + " outside fitted labels");
    }
    return classes_[static_cast<std::size_t>(index)];
}

const std::vector<Value>& LabelIndex::classes() const noexcept {
    return classes_;
}

Eigen::Index LabelIndex::size() const noexcept {
    return static_cast<Eigen::Index>(classes_.size());
}

CategoricalEncoder::CategoricalEncoder(const std::vector<Value>& values)
    : labels_(values) {}

std::string CategoricalEncoder::name() const {
    return "onehot";
}

std::shared_ptr<const Transformer> CategoricalEncoder::fit(const std::vector<Value>& values) const {
    return std::make_shared<CategoricalEncoder>(values);
}

Eigen::MatrixXd CategoricalEncoder::transform(const std::vector<Value>& values) const {
    Eigen::MatrixXd warped = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(values.size()), labels_.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        warped(static_cast<Eigen::Index>(i), labels_.index_of(values[i])) = 1.0;
    }
    return warped;
}

std::vector<Value> CategoricalEncoder::inverse_transform(const Eigen::MatrixXd& warped) const {
    require_columns(warped, labels_.size());
    std::vector<Value> values;
    values.reserve(static_cast<std::size_t>(warped.rows()));
    for (Eigen::Index i = 0; i < warped.rows(); ++i) {
        Eigen::Index best = 0;
        warped.row(i).maxCoeff(&best);
        values.push_back(labels_.label_at(best));
    }
    return values;
}

Eigen::Index CategoricalEncoder::transformed_size() const noexcept {
    return labels_.size();
}

const std::vector<Value>& CategoricalEncoder::classes() const noexcept {
    return labels_.classes();
}

LabelEncoder::LabelEncoder(const std::vector<Value>& values)
    : labels_(values) {}

std::string LabelEncoder::name() const {
    return "labels";
}

std::shared_ptr<const Transformer> LabelEncoder::fit(const std::vector<Value>& values) const {
    return std::make_shared<LabelEncoder>(values);
}

Eigen::MatrixXd LabelEncoder::transform(const std::vector<Value>& values) const {
    Eigen::MatrixXd warped(static_cast<Eigen::Index>(values.size()), 1);
    for (std::size_t i = 0; i < values.size(); ++i) {
        warped(static_cast<Eigen::Index>(i), 0) = static_cast<double>(labels_.index_of(values[i]));
    }
    return warped;
}

std::vector<Value> LabelEncoder::inverse_transform(const Eigen::MatrixXd& warped) const {
    require_columns(warped, 1);
    std::vector<Value> values;
    values.reserve(static_cast<std::size_t>(warped.rows()));
    for (Eigen::Index i = 0; i < warped.rows(); ++i) {
        values.push_back(labels_.label_at(static_cast<Eigen::Index>(std::llround(warped(i, 0)))));
    }
    return values;
}

const std::vector<Value>& LabelEncoder::classes() const noexcept {
    return labels_.classes();
}

std::shared_ptr<const Transformer> make_identity_transformer() {
    static const std::shared_ptr<const Transformer> kIdentity = std::make_shared<IdentityTransformer>();
    return kIdentity;
}

std::shared_ptr<const Transformer> make_log_transformer() {
    static const std::shared_ptr<const Transformer> kLog = std::make_shared<LogTransformer>();
    return kLog;
}

std::shared_ptr<const Transformer> make_log10_transformer() {
    static const std::shared_ptr<const Transformer> kLog10 = std::make_shared<Log10Transformer>();
    return kLog10;
}

std::shared_ptr<const Transformer> make_categorical_encoder(const std::vector<Value>& categories) {
    return std::make_shared<CategoricalEncoder>(categories);
}

std::shared_ptr<const Transformer> make_label_encoder(const std::vector<Value>& categories) {
    return std::make_shared<LabelEncoder>(categories);
}

}  // namespace libtune
