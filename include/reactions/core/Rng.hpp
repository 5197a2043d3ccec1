#pragma once
// include/reactions/core/Rng.hpp
//
// Small seedable generator for reaction jitter and random alternatives.
// Tests seed it explicitly; hosts normally use FromEntropy().

#include <cstdint>
#include <random>

namespace reactions::rng {

using Seed = std::uint64_t;

inline std::uint64_t mix64(std::uint64_t x) {
    x += 0x9E3779B97F4A7C15ull;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
    return x ^ (x >> 31);
}

// PCG32 (XSH-RR).
struct Pcg32 {
    std::uint64_t state = 0;
    std::uint64_t inc   = 1; // must be odd

    Pcg32() { seed(0); }
    explicit Pcg32(Seed initstate, Seed sequence = 0) { seed(initstate, sequence); }

    static Pcg32 FromEntropy() {
        std::random_device rd;
        const Seed hi = static_cast<Seed>(rd());
        const Seed lo = static_cast<Seed>(rd());
        return Pcg32((hi << 32) | lo);
    }

    void seed(Seed initstate, Seed sequence = 0) {
        state = 0;
        inc   = (mix64(sequence) << 1u) | 1u;
        next_u32();
        state += mix64(initstate);
        next_u32();
    }

    std::uint32_t next_u32() {
        const std::uint64_t old = state;
        state = old * 6364136223846793005ull + inc;
        const auto xorshifted = static_cast<std::uint32_t>(((old >> 18u) ^ old) >> 27u);
        const auto rot        = static_cast<std::uint32_t>(old >> 59u);
        return (xorshifted >> rot) | (xorshifted << ((-static_cast<int>(rot)) & 31));
    }

    // Uniform on [0, bound) without modulo bias. bound == 0 yields 0.
    std::uint32_t next_bounded(std::uint32_t bound) {
        if (bound == 0)
            return 0;
        const std::uint32_t threshold = static_cast<std::uint32_t>(-bound) % bound;
        for (;;) {
            const std::uint32_t r = next_u32();
            if (r >= threshold) return r % bound;
        }
    }
};

} // namespace reactions::rng
