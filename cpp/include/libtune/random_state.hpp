#pragma once

#include "libtune/search_space_types.hpp"

#include <cstdint>
#include <optional>

namespace libtune {

// Seeded engine when a seed is given, otherwise seeded from std::random_device.
[[nodiscard]] RandomEngine make_random_engine(std::optional<std::uint64_t> seed = std::nullopt);

}  // namespace libtune
