#pragma once
/**
 * @file random.h
 * @brief Deterministic, resumable pseudo-random source
 *
 * SeededRandom is a 64-bit linear congruential generator whose state is
 * periodically re-derived from the (seed, call counter) pair. A host that
 * persists those two integers can reproduce the exact sequence later.
 */

#include "crater/core/types.h"

namespace crater {

class SeededRandom {
public:
    using result_type = UInt64;

    /// Draws between state re-derivations from (seed, counter)
    static constexpr UInt64 RESEED_INTERVAL = 1000;

    explicit SeededRandom(UInt64 seed = 0, UInt64 call_counter = 0) noexcept;

    /**
     * @brief Next raw 64-bit value
     */
    UInt64 next() noexcept;

    /**
     * @brief Uniform real in [0, 1]
     */
    Real next_double() noexcept;

    /**
     * @brief Uniform real in [lo, hi]
     */
    Real next_range(Real lo, Real hi) noexcept;

    /**
     * @brief Uniform index in [0, n); returns 0 when n == 0
     */
    SizeT next_index(SizeT n) noexcept;

    UInt64 seed() const noexcept { return seed_; }
    UInt64 call_counter() const noexcept { return counter_; }

    /**
     * @brief Restart the sequence from a persisted (seed, counter) pair
     */
    void reset(UInt64 seed, UInt64 call_counter = 0) noexcept;

    // UniformRandomBitGenerator interface
    static constexpr result_type min() noexcept { return 0; }
    static constexpr result_type max() noexcept { return ~UInt64{0}; }
    result_type operator()() noexcept { return next(); }

private:
    static UInt64 mix(UInt64 seed, UInt64 counter) noexcept;

    UInt64 seed_{0};
    UInt64 counter_{0};
    UInt64 state_{0};
};

} // namespace crater
