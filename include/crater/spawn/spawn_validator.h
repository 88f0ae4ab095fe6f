#pragma once
/**
 * @file spawn_validator.h
 * @brief Legal placement search on a damaged table
 *
 * A point is legal when it lies on intact Surface, is farther than the
 * clearance from every pocket edge and from every occupied position. The
 * search is bounded: preferred point, eight directional offsets, random
 * samples, then one degraded pass with reduced clearance.
 */

#include "crater/core/types.h"
#include "crater/core/random.h"
#include "crater/surface/surface_manager.h"
#include <span>

namespace crater::spawn {

// ============================================================================
// Results
// ============================================================================

enum class SpawnStatus : UInt8 {
    Found,             ///< Legal at the requested clearance
    FoundDegraded,     ///< Legal only at the reduced clearance
    Exhausted          ///< No legal point within the attempt bound
};

inline const char* spawn_status_to_string(SpawnStatus status) {
    switch (status) {
        case SpawnStatus::Found: return "Found";
        case SpawnStatus::FoundDegraded: return "FoundDegraded";
        case SpawnStatus::Exhausted: return "Exhausted";
        default: return "Unknown";
    }
}

/**
 * @brief Search stage that produced the point
 */
enum class SpawnPhase : UInt8 {
    Preferred,
    Directional,
    Random,
    DegradedRandom,
    None
};

inline const char* spawn_phase_to_string(SpawnPhase phase) {
    switch (phase) {
        case SpawnPhase::Preferred: return "Preferred";
        case SpawnPhase::Directional: return "Directional";
        case SpawnPhase::Random: return "Random";
        case SpawnPhase::DegradedRandom: return "DegradedRandom";
        case SpawnPhase::None: return "None";
        default: return "Unknown";
    }
}

struct SpawnResult {
    SpawnStatus status{SpawnStatus::Exhausted};
    Vec2 point{};                      ///< Valid only when ok()
    Int32 attempts{0};                 ///< Candidates tested
    Real clearance{0.0};               ///< Clearance the point satisfies
    SpawnPhase phase{SpawnPhase::None};

    bool ok() const noexcept { return status != SpawnStatus::Exhausted; }
};

// ============================================================================
// Configuration
// ============================================================================

struct SpawnConfig {
    Int32 max_attempts{500};               ///< Random samples per pass
    Real offset_distance{30.0};            ///< Radius of the directional probes
    Real degraded_clearance_factor{0.5};   ///< Clearance multiplier for the last pass
    bool allow_degraded{true};

    /**
     * @throws std::invalid_argument on out-of-range values
     */
    void validate() const;
};

// ============================================================================
// SpawnValidator
// ============================================================================

class SpawnValidator {
public:
    /**
     * @param surface Surface to query; must outlive the validator
     * @throws std::invalid_argument if config is invalid
     */
    explicit SpawnValidator(const surface::SurfaceManager& surface,
                            const SpawnConfig& config = {},
                            UInt64 seed = 0,
                            UInt64 call_counter = 0);

    /**
     * @brief Validity predicate for a single candidate
     */
    bool is_valid(const Vec2& p, Real clearance, std::span<const Vec2> occupied) const;

    /**
     * @brief Bounded search for a legal point near @p preferred
     * @param max_attempts Random samples per pass (<= 0 uses the configured bound)
     */
    SpawnResult find_valid_point(const Vec2& preferred, Real clearance,
                                 std::span<const Vec2> occupied, Int32 max_attempts);

    SpawnResult find_valid_point(const Vec2& preferred, Real clearance,
                                 std::span<const Vec2> occupied) {
        return find_valid_point(preferred, clearance, occupied, config_.max_attempts);
    }

    const SpawnConfig& config() const noexcept { return config_; }
    const SeededRandom& random() const noexcept { return rng_; }

private:
    bool random_search(Real clearance, std::span<const Vec2> occupied,
                       Int32 max_attempts, Vec2& out, Int32& attempts);

    const surface::SurfaceManager* surface_;
    SpawnConfig config_;
    SeededRandom rng_;
};

} // namespace crater::spawn
