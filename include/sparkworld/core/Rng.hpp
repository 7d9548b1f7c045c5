// include/sparkworld/core/Rng.hpp
#pragma once
#include <cstdint>

namespace sparkworld::core {

using Seed = std::uint64_t;

// 64-bit mixing (good for turning IDs into well-scrambled seeds)
inline std::uint64_t mix64(std::uint64_t x) {
    x += 0x9E3779B97F4A7C15ull;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
    return x ^ (x >> 31);
}

// Derive a child seed from a parent seed and a stable numeric ID
inline Seed derive(Seed parent, std::uint64_t id) {
    return mix64(parent ^ mix64(id));
}

// Minimal PCG32 (XSH-RR). One 64-bit state + 64-bit stream/sequence.
//
// The whole generator is two words, so the simulation persists it verbatim
// in every snapshot and a reloaded world continues the exact same stream.
struct Pcg32 {
    std::uint64_t state = 0;
    std::uint64_t inc   = 1; // must be odd

    Pcg32() = default;
    explicit Pcg32(Seed initstate, Seed sequence = 0) { seed(initstate, sequence); }

    // sequence selects the stream; different sequences are independent
    void seed(Seed initstate, Seed sequence = 0) {
        state = 0;
        inc   = (mix64(sequence) << 1u) | 1u;
        next_u32();
        state += mix64(initstate);
        next_u32();
    }

    std::uint32_t next_u32() {
        std::uint64_t old = state;
        state = old * 6364136223846793005ull + inc;
        std::uint32_t xorshifted = static_cast<std::uint32_t>(((old >> 18u) ^ old) >> 27u);
        std::uint32_t rot        = static_cast<std::uint32_t>(old >> 59u);
        return (xorshifted >> rot) | (xorshifted << ((-static_cast<int>(rot)) & 31));
    }

    std::uint64_t next_u64() {
        std::uint64_t hi = static_cast<std::uint64_t>(next_u32());
        std::uint64_t lo = static_cast<std::uint64_t>(next_u32());
        return (hi << 32) | lo;
    }

    // [0,1)
    double next_double01() {
        return (next_u64() >> 11) * (1.0 / 9007199254740992.0);
    }

    // Uniform on [0, bound) without modulo bias (rejection method)
    std::uint32_t next_bounded(std::uint32_t bound) {
        if (bound <= 1u) return 0u;
        std::uint32_t threshold = static_cast<std::uint32_t>(-bound) % bound;
        for (;;) {
            std::uint32_t r = next_u32();
            if (r >= threshold) return r % bound;
        }
    }

    // Uniform integer on [lo, hi] (inclusive). Returns lo when hi < lo.
    int range_int(int lo, int hi) {
        if (hi <= lo) return lo;
        const auto span = static_cast<std::uint32_t>(hi - lo) + 1u;
        return lo + static_cast<int>(next_bounded(span));
    }

    friend bool operator==(const Pcg32&, const Pcg32&) = default;
};

} // namespace sparkworld::core
