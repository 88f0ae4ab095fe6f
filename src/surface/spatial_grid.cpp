/**
 * @file spatial_grid.cpp
 * @brief SpatialGrid implementation
 */

#include "crater/surface/spatial_grid.h"
#include "crater/core/log.h"
#include <cmath>
#include <stdexcept>

namespace crater::surface {

namespace {

// Floor a world coordinate into [0, dimension); false when out of range or NaN
bool to_index(Real coord, Real origin, Real cell_size, Int32 dimension, Int32& out) noexcept {
    Real f = std::floor((coord - origin) / cell_size);
    if (!(f >= 0.0 && f < static_cast<Real>(dimension))) {
        return false;
    }
    out = static_cast<Int32>(f);
    return true;
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

SpatialGrid::SpatialGrid(Int32 cols, Int32 rows, Real cell_size, const Vec2& origin,
                         CellType fill)
    : cols_(cols), rows_(rows), cell_size_(cell_size), origin_(origin) {
    if (cols <= 0 || rows <= 0) {
        throw std::invalid_argument("SpatialGrid: dimensions must be positive");
    }
    if (!(cell_size > 0.0) || !std::isfinite(cell_size)) {
        throw std::invalid_argument("SpatialGrid: cell_size must be positive and finite");
    }
    cells_.assign(static_cast<SizeT>(cols) * static_cast<SizeT>(rows), fill);
    counts_[static_cast<SizeT>(fill)] = cells_.size();
}

SpatialGrid SpatialGrid::from_geometry(const TableGeometry& geometry) {
    geometry.validate();

    const Real cs = geometry.cell_size;
    const auto cols = static_cast<Int32>(std::lround(geometry.width / cs));
    const auto rows = static_cast<Int32>(std::lround(geometry.height / cs));
    const Vec2 origin{geometry.center.x - cols * cs * 0.5,
                      geometry.center.y - rows * cs * 0.5};

    SpatialGrid grid(cols, rows, cs, origin, CellType::Empty);
    const Rect playable = geometry.playable();

    for (Int32 row = 0; row < rows; ++row) {
        for (Int32 col = 0; col < cols; ++col) {
            Vec2 p = grid.cell_center(col, row);

            CellType type;
            if (!geometry.contains(p)) {
                type = CellType::Empty;
            } else if (geometry.in_pocket(p)) {
                type = CellType::Pocket;
            } else if (playable.contains(p)) {
                type = CellType::Surface;
            } else {
                type = CellType::Barrier;
            }
            grid.set_cell(col, row, type);
        }
    }

    log::get()->debug("SpatialGrid built: {}x{} cells of {}, {} surface, {} pocket, {} barrier",
                      cols, rows, cs,
                      grid.count(CellType::Surface),
                      grid.count(CellType::Pocket),
                      grid.count(CellType::Barrier));
    return grid;
}

// ============================================================================
// Queries
// ============================================================================

std::optional<CellIndex> SpatialGrid::world_to_cell(const Vec2& world) const noexcept {
    CellIndex index;
    if (!to_index(world.x, origin_.x, cell_size_, cols_, index.col) ||
        !to_index(world.y, origin_.y, cell_size_, rows_, index.row)) {
        return std::nullopt;
    }
    return index;
}

CellType SpatialGrid::classify(const Vec2& world) const noexcept {
    auto index = world_to_cell(world);
    if (!index) {
        return CellType::Empty;
    }
    return cells_[linear(index->col, index->row)];
}

bool SpatialGrid::is_open_hazard(const Vec2& world) const noexcept {
    CellType type = classify(world);
    return type == CellType::Pocket || type == CellType::Destroyed;
}

bool SpatialGrid::is_walkable(const Vec2& world) const noexcept {
    return classify(world) == CellType::Surface;
}

CellType SpatialGrid::cell_at(Int32 col, Int32 row) const noexcept {
    if (!in_bounds(col, row)) {
        return CellType::Empty;
    }
    return cells_[linear(col, row)];
}

Vec2 SpatialGrid::cell_center(Int32 col, Int32 row) const noexcept {
    return {origin_.x + (static_cast<Real>(col) + 0.5) * cell_size_,
            origin_.y + (static_cast<Real>(row) + 0.5) * cell_size_};
}

SizeT SpatialGrid::count(CellType type) const noexcept {
    auto slot = static_cast<SizeT>(type);
    return slot < counts_.size() ? counts_[slot] : 0;
}

std::vector<CellIndex> SpatialGrid::collect(CellType type) const {
    std::vector<CellIndex> out;
    out.reserve(count(type));
    for (Int32 row = 0; row < rows_; ++row) {
        for (Int32 col = 0; col < cols_; ++col) {
            if (cells_[linear(col, row)] == type) {
                out.push_back({col, row});
            }
        }
    }
    return out;
}

Rect SpatialGrid::bounds() const noexcept {
    return {origin_, {origin_.x + cols_ * cell_size_, origin_.y + rows_ * cell_size_}};
}

// ============================================================================
// Mutation
// ============================================================================

bool SpatialGrid::mark_destroyed(const Vec2& world) noexcept {
    auto index = world_to_cell(world);
    if (!index) {
        return false;
    }
    return mark_destroyed(*index);
}

bool SpatialGrid::mark_destroyed(const CellIndex& index) noexcept {
    if (!in_bounds(index.col, index.row)) {
        return false;
    }
    if (cells_[linear(index.col, index.row)] != CellType::Surface) {
        return false;
    }
    set_cell(index.col, index.row, CellType::Destroyed);
    return true;
}

void SpatialGrid::set_cell(Int32 col, Int32 row, CellType type) noexcept {
    CellType& cell = cells_[linear(col, row)];
    --counts_[static_cast<SizeT>(cell)];
    cell = type;
    ++counts_[static_cast<SizeT>(type)];
}

} // namespace crater::surface
