#pragma once

#include "libtune/search_space_types.hpp"

#include <Eigen/Core>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace libtune {

// Bidirectional mapping between original and warped values of one dimension.
// Warped values are a matrix with one row per value and transformed_size() columns.
// Transformers are immutable; fit() returns a fitted transformer instead of mutating.
class Transformer {
public:
    virtual ~Transformer() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    [[nodiscard]] virtual std::shared_ptr<const Transformer> fit(const std::vector<Value>& values) const = 0;

    [[nodiscard]] virtual Eigen::MatrixXd transform(const std::vector<Value>& values) const = 0;

    [[nodiscard]] virtual std::vector<Value> inverse_transform(const Eigen::MatrixXd& warped) const = 0;

    [[nodiscard]] virtual Eigen::Index transformed_size() const noexcept { return 1; }
};

// Elementwise transform of numeric values into a single warped column.
class NumericTransformer : public Transformer {
public:
    [[nodiscard]] Eigen::MatrixXd transform(const std::vector<Value>& values) const override;

    [[nodiscard]] std::vector<Value> inverse_transform(const Eigen::MatrixXd& warped) const override;

    [[nodiscard]] virtual double to_warped(double original) const = 0;

    [[nodiscard]] virtual double from_warped(double warped) const = 0;
};

class IdentityTransformer final : public NumericTransformer {
public:
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] std::shared_ptr<const Transformer> fit(const std::vector<Value>& values) const override;

    [[nodiscard]] double to_warped(double original) const override;

    [[nodiscard]] double from_warped(double warped) const override;
};

// Input must be strictly positive; this is not checked.
class LogTransformer final : public NumericTransformer {
public:
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] std::shared_ptr<const Transformer> fit(const std::vector<Value>& values) const override;

    [[nodiscard]] double to_warped(double original) const override;

    [[nodiscard]] double from_warped(double warped) const override;
};

// Input must be strictly positive; this is not checked.
class Log10Transformer final : public NumericTransformer {
public:
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] std::shared_ptr<const Transformer> fit(const std::vector<Value>& values) const override;

    [[nodiscard]] double to_warped(double original) const override;

    [[nodiscard]] double from_warped(double warped) const override;
};

// Sorted distinct labels and their positions.
class LabelIndex {
public:
    explicit LabelIndex(const std::vector<Value>& values);

    // Throws std::out_of_range for labels outside the fitted set.
    [[nodiscard]] Eigen::Index index_of(const Value& label) const;

    [[nodiscard]] const Value& label_at(Eigen::Index index) const;

    [[nodiscard]] const std::vector<Value>& classes() const noexcept;

    [[nodiscard]] Eigen::Index size() const noexcept;

private:
    std::vector<Value> classes_;
    std::map<Value, Eigen::Index> positions_;
};

// One-hot encoding. Constructing the encoder fits it, so an unfitted encoder cannot exist.
class CategoricalEncoder final : public Transformer {
public:
    explicit CategoricalEncoder(const std::vector<Value>& values);

    [[nodiscard]] std::string name() const override;

    [[nodiscard]] std::shared_ptr<const Transformer> fit(const std::vector<Value>& values) const override;

    // Labels not seen when fitting are a precondition violation and throw std::out_of_range.
    [[nodiscard]] Eigen::MatrixXd transform(const std::vector<Value>& values) const override;

    // Each row maps back to the label of its largest column.
    [[nodiscard]] std::vector<Value> inverse_transform(const Eigen::MatrixXd& warped) const override;

    [[nodiscard]] Eigen::Index transformed_size() const noexcept override;

    [[nodiscard]] const std::vector<Value>& classes() const noexcept;

private:
    LabelIndex labels_;
};

// Maps each label to its index among the sorted fitted labels.
class LabelEncoder final : public Transformer {
public:
    explicit LabelEncoder(const std::vector<Value>& values);

    [[nodiscard]] std::string name() const override;

    [[nodiscard]] std::shared_ptr<const Transformer> fit(const std::vector<Value>& values) const override;

    [[nodiscard]] Eigen::MatrixXd transform(const std::vector<Value>& values) const override;

    [[nodiscard]] std::vector<Value> inverse_transform(const Eigen::MatrixXd& warped) const override;

    [[nodiscard]] const std::vector<Value>& classes() const noexcept;

private:
    LabelIndex labels_;
};

std::shared_ptr<const Transformer> make_identity_transformer();

std::shared_ptr<const Transformer> make_log_transformer();

std::shared_ptr<const Transformer> make_log10_transformer();

std::shared_ptr<const Transformer> make_categorical_encoder(const std::vector<Value>& categories);

std::shared_ptr<const Transformer> make_label_encoder(const std::vector<Value>& categories);

}  // namespace libtune
