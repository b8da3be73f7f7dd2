#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <variant>
#include <vector>

namespace libtune {

enum class DistributionKind {
    Real,
    Integer,
    Categorical
};

// One parameter value in original space.
using Value = std::variant<std::int64_t, double, std::string>;

// One sampled tuple, one entry per dimension of the chosen sub-grid.
using Point = std::vector<Value>;

using RandomEngine = std::mt19937_64;

[[nodiscard]] bool is_integral(const Value& value) noexcept;

[[nodiscard]] bool is_floating(const Value& value) noexcept;

[[nodiscard]] bool is_label(const Value& value) noexcept;

[[nodiscard]] bool is_numeric(const Value& value) noexcept;

// Throws std::invalid_argument for string labels.
[[nodiscard]] double to_double(const Value& value);

[[nodiscard]] std::string to_string(const Value& value);

[[nodiscard]] std::string to_string(DistributionKind kind);

}  // namespace libtune
