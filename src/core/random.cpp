/**
 * @file random.cpp
 * @brief SeededRandom implementation
 */

#include "crater/core/random.h"

namespace crater {

namespace {
    constexpr UInt64 LCG_MULTIPLIER = 6364136223846793005ULL;
    constexpr UInt64 LCG_INCREMENT  = 1442695040888963407ULL;
    constexpr UInt64 GOLDEN_GAMMA   = 0x9E3779B97F4A7C15ULL;
}

SeededRandom::SeededRandom(UInt64 seed, UInt64 call_counter) noexcept {
    reset(seed, call_counter);
}

void SeededRandom::reset(UInt64 seed, UInt64 call_counter) noexcept {
    seed_ = seed;
    counter_ = call_counter;

    // Replay from the last re-derivation point so a resumed generator
    // continues exactly where the persisted one stopped
    UInt64 base = (call_counter / RESEED_INTERVAL) * RESEED_INTERVAL;
    state_ = mix(seed_, base);
    for (UInt64 i = base; i < call_counter; ++i) {
        state_ = state_ * LCG_MULTIPLIER + LCG_INCREMENT;
    }
}

UInt64 SeededRandom::mix(UInt64 seed, UInt64 counter) noexcept {
    UInt64 rotated = (counter << 32) | (counter >> 32);
    UInt64 hashed = (seed ^ rotated) * GOLDEN_GAMMA;
    return hashed ^ (hashed >> 27);
}

UInt64 SeededRandom::next() noexcept {
    if (counter_ % RESEED_INTERVAL == 0) {
        state_ = mix(seed_, counter_);
    }
    state_ = state_ * LCG_MULTIPLIER + LCG_INCREMENT;
    ++counter_;
    return state_;
}

Real SeededRandom::next_double() noexcept {
    return static_cast<Real>(next()) / static_cast<Real>(max());
}

Real SeededRandom::next_range(Real lo, Real hi) noexcept {
    return lo + (hi - lo) * next_double();
}

SizeT SeededRandom::next_index(SizeT n) noexcept {
    if (n == 0) {
        return 0;
    }
    // High bits of an LCG are the well-distributed ones
    return static_cast<SizeT>((next() >> 11) % static_cast<UInt64>(n));
}

} // namespace crater
