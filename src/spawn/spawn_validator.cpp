/**
 * @file spawn_validator.cpp
 * @brief SpawnValidator implementation
 */

#include "crater/spawn/spawn_validator.h"
#include "crater/core/log.h"
#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>

namespace crater::spawn {

using surface::CellIndex;
using surface::CellType;

namespace {

constexpr Real DIAGONAL = 0.70710678118654752440;

// Right, left, up, down, then the four diagonals
constexpr std::array<Vec2, 8> PROBE_DIRECTIONS = {{
    { 1.0,  0.0}, {-1.0,  0.0}, { 0.0,  1.0}, { 0.0, -1.0},
    { DIAGONAL,  DIAGONAL}, {-DIAGONAL,  DIAGONAL},
    { DIAGONAL, -DIAGONAL}, {-DIAGONAL, -DIAGONAL},
}};

} // anonymous namespace

void SpawnConfig::validate() const {
    if (max_attempts < 0) {
        throw std::invalid_argument("SpawnConfig: max_attempts must be non-negative");
    }
    if (offset_distance < 0.0) {
        throw std::invalid_argument("SpawnConfig: offset_distance must be non-negative");
    }
    if (!(degraded_clearance_factor >= 0.0 && degraded_clearance_factor <= 1.0)) {
        throw std::invalid_argument("SpawnConfig: degraded_clearance_factor must be in [0, 1]");
    }
}

SpawnValidator::SpawnValidator(const surface::SurfaceManager& surface, const SpawnConfig& config,
                               UInt64 seed, UInt64 call_counter)
    : surface_(&surface)
    , config_(config)
    , rng_(seed, call_counter) {
    config_.validate();
}

bool SpawnValidator::is_valid(const Vec2& p, Real clearance, std::span<const Vec2> occupied) const {
    if (!surface_->is_walkable(p)) {
        return false;
    }
    if (!(surface_->geometry().distance_to_pocket_edge(p) > clearance)) {
        return false;
    }
    return std::all_of(occupied.begin(), occupied.end(),
        [&](const Vec2& o) { return p.distance_to(o) > clearance; });
}

SpawnResult SpawnValidator::find_valid_point(const Vec2& preferred, Real clearance,
                                             std::span<const Vec2> occupied, Int32 max_attempts) {
    clearance = std::max(clearance, 0.0);
    if (max_attempts <= 0) {
        max_attempts = config_.max_attempts;
    }

    SpawnResult result;
    result.clearance = clearance;

    // 1. Preferred point
    ++result.attempts;
    if (is_valid(preferred, clearance, occupied)) {
        result.status = SpawnStatus::Found;
        result.point = preferred;
        result.phase = SpawnPhase::Preferred;
        return result;
    }

    // 2. Directional probes
    for (const Vec2& dir : PROBE_DIRECTIONS) {
        Vec2 candidate = preferred + dir * config_.offset_distance;
        ++result.attempts;
        if (is_valid(candidate, clearance, occupied)) {
            result.status = SpawnStatus::Found;
            result.point = candidate;
            result.phase = SpawnPhase::Directional;
            return result;
        }
    }

    // 3. Random samples
    Vec2 point;
    if (random_search(clearance, occupied, max_attempts, point, result.attempts)) {
        result.status = SpawnStatus::Found;
        result.point = point;
        result.phase = SpawnPhase::Random;
        return result;
    }

    // 4. One more pass at reduced clearance
    if (config_.allow_degraded && clearance > 0.0) {
        Real reduced = clearance * config_.degraded_clearance_factor;
        if (random_search(reduced, occupied, max_attempts, point, result.attempts)) {
            log::get()->warn("Spawn near ({:.1f}, {:.1f}) degraded: clearance {} -> {}",
                             preferred.x, preferred.y, clearance, reduced);
            result.status = SpawnStatus::FoundDegraded;
            result.point = point;
            result.clearance = reduced;
            result.phase = SpawnPhase::DegradedRandom;
            return result;
        }
    }

    log::get()->warn("Spawn near ({:.1f}, {:.1f}) exhausted after {} attempts ({:.0f}% destroyed)",
                     preferred.x, preferred.y, result.attempts,
                     surface_->destroyed_fraction() * 100.0);
    result.status = SpawnStatus::Exhausted;
    result.phase = SpawnPhase::None;
    return result;
}

bool SpawnValidator::random_search(Real clearance, std::span<const Vec2> occupied,
                                   Int32 max_attempts, Vec2& out, Int32& attempts) {
    const auto& grid = surface_->grid();
    // Samples are drawn over intact cells; nothing else can be valid
    std::vector<CellIndex> cells = grid.collect(CellType::Surface);
    if (cells.empty()) {
        return false;
    }

    for (Int32 i = 0; i < max_attempts; ++i) {
        const CellIndex& cell = cells[rng_.next_index(cells.size())];
        Vec2 candidate = grid.cell_center(cell);
        ++attempts;
        if (is_valid(candidate, clearance, occupied)) {
            out = candidate;
            return true;
        }
    }
    return false;
}

} // namespace crater::spawn
