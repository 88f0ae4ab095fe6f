#pragma once
/**
 * @file crater_shape.h
 * @brief Per-cell rules of the crater algorithm
 *
 * A crater has an inner zone that is always removed and an outer band where
 * each cell is scored. The score falls off with edge progress, is biased by
 * deterministic per-cell noise, and gets spikes near the inner edge and
 * notches near the outer edge. SurfaceManager::destroy_radius applies these
 * rules; they are exposed separately so they can be checked on fixed inputs.
 */

#include "crater/core/types.h"
#include <vector>

namespace crater::surface {

// ============================================================================
// Crater Parameters
// ============================================================================

/**
 * @brief Tuning constants of the crater algorithm
 *
 * Defaults are the empirically tuned values; all of them can be
 * overridden from configuration.
 */
struct CraterParams {
    Real inner_fraction{0.67};            ///< Inner zone radius as a fraction of the crater radius
    Int32 segment_count{16};              ///< Angular segments with independent perturbation
    Real perturbation{0.4};               ///< Segment perturbation drawn from [-p, +p]
    Real inner_perturbation_scale{0.5};   ///< Inner zone varies by this share of the outer perturbation
    Real spike_edge_low{0.3};             ///< Edge progress below which outward spikes may form
    Real spike_edge_high{0.7};            ///< Edge progress above which inward notches may form
    Real spike_noise_high{0.7};           ///< Noise above this grows a spike
    Real spike_noise_low{0.3};            ///< Noise below this cuts a notch
    Real spike_strength{0.4};             ///< Score added (spike) or removed (notch)
    Real destroy_threshold{0.5};          ///< Outer-zone cells go when the score exceeds this

    /**
     * @throws std::invalid_argument on out-of-range values
     */
    void validate() const;
};

// ============================================================================
// Cell Rules
// ============================================================================

/**
 * @brief Deterministic per-cell noise in [0, 1)
 *
 * fract(sin(col * 12.9898 + row * 78.233) * 43758.5453)
 */
Real position_noise(Int32 col, Int32 row) noexcept;

/**
 * @brief Circular 1-2-1 smoothing of per-segment perturbations
 *
 * smoothed[i] = (raw[i-1] + 2 raw[i] + raw[i+1]) / 4, indices wrapping.
 */
std::vector<Real> smooth_perturbation(const std::vector<Real>& raw);

/**
 * @brief Angular segment of an offset from the crater center
 *
 * Angles are mapped from [-pi, pi] onto [0, segment_count).
 */
SizeT crater_segment(const Vec2& offset, SizeT segment_count) noexcept;

/**
 * @brief Position of @p distance across the band [inner, outer], clamped to [0, 1]
 *
 * A degenerate band (outer <= inner) counts as fully at the edge.
 */
Real edge_progress(Real distance, Real inner, Real outer) noexcept;

/**
 * @brief Score of an outer-band cell; destroyed when above destroy_threshold
 *
 * 1 - edge, plus (noise - 0.5) * 2 * raggedness, plus spike_strength when
 * edge < spike_edge_low and noise > spike_noise_high, minus spike_strength
 * when edge > spike_edge_high and noise < spike_noise_low.
 */
Real crater_score(Real edge, Real noise, Real raggedness, const CraterParams& params) noexcept;

} // namespace crater::surface
