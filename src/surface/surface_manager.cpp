/**
 * @file surface_manager.cpp
 * @brief SurfaceManager implementation and crater generation
 */

#include "crater/surface/surface_manager.h"
#include "crater/core/log.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace crater::surface {

namespace {

bool finite(const Vec2& p) noexcept {
    return std::isfinite(p.x) && std::isfinite(p.y);
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

SurfaceManager::SurfaceManager(const TableGeometry& geometry, const CraterParams& params,
                               UInt64 seed, UInt64 call_counter)
    : geometry_(geometry)
    , grid_(SpatialGrid::from_geometry(geometry))
    , params_(params)
    , rng_(seed, call_counter) {
    params_.validate();
}

void SurfaceManager::rebuild(const TableGeometry& geometry) {
    grid_ = SpatialGrid::from_geometry(geometry);
    geometry_ = geometry;
    stats_ = {};
    log::get()->info("Surface rebuilt: {} playable cells", grid_.count(CellType::Surface));
    notify({SurfaceChangeKind::Rebuild, geometry.center, 0.0, 0});
}

// ============================================================================
// Crater Generation
// ============================================================================

Int32 SurfaceManager::destroy_radius(const Vec2& center, Real radius, Real raggedness) {
    if (!(radius > 0.0) || !std::isfinite(radius) || !finite(center)) {
        log::get()->debug("destroy_radius ignored: radius {} at ({}, {})", radius, center.x, center.y);
        return 0;
    }

    raggedness = std::isfinite(raggedness) ? std::clamp(raggedness, 0.0, 1.0) : 0.0;
    const auto n = static_cast<SizeT>(params_.segment_count);

    // Per-direction perturbation, smoothed 1-2-1 with both neighbors
    std::vector<Real> raw(n);
    for (auto& v : raw) {
        v = rng_.next_range(-params_.perturbation, params_.perturbation);
    }
    const std::vector<Real> smoothed = smooth_perturbation(raw);

    const Real inner = radius * params_.inner_fraction;
    const Real cs = grid_.cell_size();
    const Vec2& origin = grid_.origin();

    // Cell range whose centers can fall inside the circle, clamped before
    // the integer conversion so huge radii stay well-defined
    auto index_range = [&](Real c, Real o, Int32 dimension, Int32& lo, Int32& hi) {
        Real last = static_cast<Real>(dimension - 1);
        lo = static_cast<Int32>(std::clamp(std::floor((c - radius - o) / cs), 0.0, last));
        hi = static_cast<Int32>(std::clamp(std::floor((c + radius - o) / cs), -1.0, last));
    };
    Int32 col_min = 0, col_max = 0, row_min = 0, row_max = 0;
    index_range(center.x, origin.x, grid_.cols(), col_min, col_max);
    index_range(center.y, origin.y, grid_.rows(), row_min, row_max);

    Int32 destroyed = 0;
    for (Int32 row = row_min; row <= row_max; ++row) {
        for (Int32 col = col_min; col <= col_max; ++col) {
            if (grid_.cell_at(col, row) != CellType::Surface) {
                continue;
            }

            const Vec2 offset = grid_.cell_center(col, row) - center;
            const Real distance = offset.length();
            if (distance > radius) {
                continue;
            }

            bool destroy = distance <= inner;
            if (!destroy) {
                Real p = smoothed[crater_segment(offset, n)];
                Real eff_inner = inner * (1.0 + params_.inner_perturbation_scale * p);
                Real eff_outer = radius * (1.0 + p);

                if (distance <= eff_inner) {
                    destroy = true;
                } else if (distance <= eff_outer) {
                    Real edge = edge_progress(distance, eff_inner, eff_outer);
                    Real score = crater_score(edge, position_noise(col, row), raggedness, params_);
                    destroy = score > params_.destroy_threshold;
                }
            }

            if (destroy && grid_.mark_destroyed(CellIndex{col, row})) {
                ++destroyed;
            }
        }
    }

    if (destroyed > 0) {
        ++stats_.craters;
        stats_.cells_destroyed += static_cast<UInt64>(destroyed);
        log::get()->info("Crater at ({:.1f}, {:.1f}) r={:.1f}: {} cells destroyed",
                         center.x, center.y, radius, destroyed);
        notify({SurfaceChangeKind::Crater, center, radius, destroyed});
    }
    return destroyed;
}

bool SurfaceManager::mark_destroyed(const Vec2& point) {
    if (!grid_.mark_destroyed(point)) {
        log::get()->debug("mark_destroyed no-op at ({}, {}): {}", point.x, point.y,
                          cell_type_to_string(grid_.classify(point)));
        return false;
    }
    ++stats_.cells_destroyed;
    notify({SurfaceChangeKind::Point, point, 0.0, 1});
    return true;
}

// ============================================================================
// Queries
// ============================================================================

Real SurfaceManager::support_fraction(const Vec2& center, Real radius, Int32 samples) const {
    auto supported = [this](const Vec2& p) {
        CellType type = grid_.classify(p);
        return type == CellType::Surface || type == CellType::Barrier;
    };

    Int32 total = 1;
    Int32 ok = supported(center) ? 1 : 0;
    if (radius > 0.0) {
        for (Int32 i = 0; i < samples; ++i) {
            Real angle = constants::TWO_PI * static_cast<Real>(i) / static_cast<Real>(samples);
            Vec2 p{center.x + radius * std::cos(angle), center.y + radius * std::sin(angle)};
            ok += supported(p) ? 1 : 0;
            ++total;
        }
    }
    return static_cast<Real>(ok) / static_cast<Real>(total);
}

Real SurfaceManager::destroyed_fraction() const noexcept {
    SizeT destroyed = grid_.count(CellType::Destroyed);
    SizeT playable = destroyed + grid_.count(CellType::Surface);
    if (playable == 0) {
        return 0.0;
    }
    return static_cast<Real>(destroyed) / static_cast<Real>(playable);
}

// ============================================================================
// Render Trigger
// ============================================================================

bool SurfaceManager::consume_dirty() noexcept {
    bool was = dirty_;
    dirty_ = false;
    return was;
}

void SurfaceManager::notify(const SurfaceChange& change) {
    dirty_ = true;
    if (render_sink_) {
        render_sink_(change);
    }
}

} // namespace crater::surface
