#pragma once

#include <cstdint>

namespace causal {
namespace random {
// Park-Miller generator. Deterministic per seed, one instance per thread.
class Random {
   public:
    explicit Random(uint32_t seed);

    auto next32() -> uint32_t;

    // Uniform in [1, n]. Throws std::invalid_argument when n is 0.
    auto between_one_and(uint32_t n) -> uint32_t;

   private:
    uint32_t seed_;

    enum : uint32_t {
        M = 2147483647L  // 2^31-1
    };

    enum : uint64_t {
        A = 16807  // bits 14, 8, 7, 5, 2, 1, 0
    };
};

}  // namespace random
}  // namespace causal
