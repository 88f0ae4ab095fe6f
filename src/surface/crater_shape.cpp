/**
 * @file crater_shape.cpp
 * @brief Crater cell rules
 */

#include "crater/surface/crater_shape.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace crater::surface {

// ============================================================================
// CraterParams
// ============================================================================

void CraterParams::validate() const {
    if (!(inner_fraction > 0.0 && inner_fraction <= 1.0)) {
        throw std::invalid_argument("CraterParams: inner_fraction must be in (0, 1]");
    }
    if (segment_count < 1) {
        throw std::invalid_argument("CraterParams: segment_count must be at least 1");
    }
    if (!(perturbation >= 0.0 && perturbation < 1.0)) {
        throw std::invalid_argument("CraterParams: perturbation must be in [0, 1)");
    }
    if (inner_perturbation_scale < 0.0) {
        throw std::invalid_argument("CraterParams: inner_perturbation_scale must be non-negative");
    }
}

// ============================================================================
// Cell Rules
// ============================================================================

Real position_noise(Int32 col, Int32 row) noexcept {
    Real v = std::sin(static_cast<Real>(col) * 12.9898 + static_cast<Real>(row) * 78.233) * 43758.5453;
    return v - std::floor(v);
}

std::vector<Real> smooth_perturbation(const std::vector<Real>& raw) {
    const SizeT n = raw.size();
    std::vector<Real> smoothed(n);
    for (SizeT i = 0; i < n; ++i) {
        Real prev = raw[(i + n - 1) % n];
        Real next = raw[(i + 1) % n];
        smoothed[i] = (prev + 2.0 * raw[i] + next) * 0.25;
    }
    return smoothed;
}

SizeT crater_segment(const Vec2& offset, SizeT segment_count) noexcept {
    if (segment_count == 0) {
        return 0;
    }
    Real angle = std::atan2(offset.y, offset.x);
    Real normalized = (angle + constants::PI) / constants::TWO_PI;
    return static_cast<SizeT>(normalized * static_cast<Real>(segment_count)) % segment_count;
}

Real edge_progress(Real distance, Real inner, Real outer) noexcept {
    Real span = outer - inner;
    if (!(span > 0.0)) {
        return 1.0;
    }
    return std::clamp((distance - inner) / span, 0.0, 1.0);
}

Real crater_score(Real edge, Real noise, Real raggedness, const CraterParams& params) noexcept {
    Real score = 1.0 - edge;
    score += (noise - 0.5) * raggedness * 2.0;
    if (edge < params.spike_edge_low && noise > params.spike_noise_high) {
        score += params.spike_strength;
    } else if (edge > params.spike_edge_high && noise < params.spike_noise_low) {
        score -= params.spike_strength;
    }
    return score;
}

} // namespace crater::surface
