#include "libtune/search_space_types.hpp"

#include <sstream>
#include <stdexcept>

namespace libtune {

bool is_integral(const Value& value) noexcept {
    return std::holds_alternative<std::int64_t>(value);
}

bool is_floating(const Value& value) noexcept {
    return std::holds_alternative<double>(value);
}

bool is_label(const Value& value) noexcept {
    return std::holds_alternative<std::string>(value);
}

bool is_numeric(const Value& value) noexcept {
    return is_integral(value) || is_floating(value);
}

double to_double(const Value& value) {
    if (const auto* integral = std::get_if<std::int64_t>(&value)) {
        return static_cast<double>(*integral);
    }
    if (const auto* floating = std::get_if<double>(&value)) {
        return *floating;
    }
    throw std::invalid_argument("expected a numeric value, got label '" + std::get<std::string>(value) + "'");
}

std::string to_string(const Value& value) {
    if (const auto* label = std::get_if<std::string>(&value)) {
        return *label;
    }
    if (const auto* integral = std::get_if<std::int64_t>(&value)) {
        return std::to_string(*integral);
    }
    std::ostringstream out;
    out << std::get<double>(value);
    return out.str();
}

std::string to_string(DistributionKind kind) {
    switch (kind) {
        case DistributionKind::Real:
            return "real";
        case DistributionKind::Integer:
            return "integer";
        case DistributionKind::Categorical:
            return "categorical";
    }
    return "unknown";
}

}  // namespace libtune
