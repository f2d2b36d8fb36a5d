#pragma once

#include "core/types.hpp"
#include <array>
#include <algorithm>

namespace d20 {

// ==============================================================================
// Dice Roller
// xoshiro256++ PRNG seeded through splitmix64. Every random choice a simulated
// day makes is drawn from one of these, so a seed reproduces the whole day.
// ==============================================================================

class DiceRoller {
public:
    explicit DiceRoller(u64 seed = 0) {
        init_state(seed == 0 ? DEFAULT_SEED : seed);
    }

    void seed(u64 s) { init_state(s == 0 ? DEFAULT_SEED : s); }

    // Uniform integer in [1, sides] using Lemire's multiply-shift reduction
    u32 roll(u32 sides) {
        if (sides == 0) return 0;
        return static_cast<u32>(((next() >> 32) * sides) >> 32) + 1;
    }

    // Sum of an NdS expression; dice at or below reroll_at_most are rerolled once
    i32 roll(const Dice& dice) {
        i32 total = 0;
        for (u8 i = 0; i < dice.count; ++i) {
            u32 r = roll(dice.sides);
            if (r <= dice.reroll_at_most) r = roll(dice.sides);
            total += static_cast<i32>(r);
        }
        return total;
    }

    i32 roll(u8 count, u8 sides) { return roll(Dice(count, sides)); }

    // Advantage and disadvantage cancel each other out
    u32 roll_d20(bool adv = false, bool disadv = false) {
        u32 first = roll(20);
        if (adv == disadv) return first;
        u32 second = roll(20);
        return adv ? std::max(first, second) : std::min(first, second);
    }

    // Uniform index in [0, n)
    u32 pick_index(u32 n) {
        if (n == 0) return 0;
        return static_cast<u32>(((next() >> 32) * n) >> 32);
    }

    // Uniform real in [0, 1)
    f64 uniform() {
        return static_cast<f64>(next() >> 11) * 0x1.0p-53;
    }

    bool chance(f64 p) { return uniform() < p; }

    u64 next() {
        const u64 result = rotl(state[0] + state[3], 23) + state[0];

        const u64 t = state[1] << 17;

        state[2] ^= state[0];
        state[3] ^= state[1];
        state[1] ^= state[2];
        state[0] ^= state[3];

        state[2] ^= t;
        state[3] = rotl(state[3], 45);

        return result;
    }

private:
    static constexpr u64 DEFAULT_SEED = 0x853c49e6748fea9bULL;

    std::array<u64, 4> state;

    void init_state(u64 seed) {
        u64 z = seed;
        for (int i = 0; i < 4; ++i) {
            z += 0x9e3779b97f4a7c15ULL;
            z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
            z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
            state[i] = z ^ (z >> 31);
        }
    }

    static u64 rotl(u64 x, int k) {
        return (x << k) | (x >> (64 - k));
    }
};

// ==============================================================================
// Per-Day Stream Seeds
// Day i of a run always draws from the same stream, whichever worker runs it.
// ==============================================================================

inline u64 derive_seed(u64 base_seed, u64 stream) {
    u64 z = base_seed + (stream + 1) * 0x9e3779b97f4a7c15ULL;
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}

} // namespace d20
