#include "random.hpp"

#include <stdexcept>

namespace causal {
namespace random {

Random::Random(uint32_t seed) : seed_(seed & M) {
    // 0 and M are fixed points of the recurrence
    if (seed_ == 0 || seed_ == M) {
        seed_ = 1;
    }
}

auto Random::next32() -> uint32_t {
    uint64_t product = uint64_t{seed_} * A;
    seed_ = static_cast<uint32_t>((product >> 31) + (product & M));
    if (seed_ > M) {
        seed_ -= M;
    }
    return seed_;
}

auto Random::between_one_and(uint32_t n) -> uint32_t {
    if (n == 0) {
        throw std::invalid_argument("upper bound must be positive");
    }
    return next32() % n + 1;
}
}  // namespace random
}  // namespace causal
