#include "libtune/random_state.hpp"

#include <random>

namespace libtune {

RandomEngine make_random_engine(std::optional<std::uint64_t> seed) {
    if (seed) {
        return RandomEngine(*seed);
    }
    std::random_device device;
    std::seed_seq sequence{device(), device(), device(), device()};
    return RandomEngine(sequence);
}

}  // namespace libtune
