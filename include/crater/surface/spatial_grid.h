#pragma once
/**
 * @file spatial_grid.h
 * @brief Classified cell grid covering the table
 *
 * The SpatialGrid is the single source of truth for what occupies a
 * location on the table. Dimensions, cell size and origin are fixed at
 * construction. The only cell transition allowed afterwards is
 * Surface -> Destroyed; anything else requires building a new grid.
 */

#include "crater/core/types.h"
#include "crater/surface/table_geometry.h"
#include <array>
#include <optional>
#include <vector>

namespace crater::surface {

// ============================================================================
// Cell Classification
// ============================================================================

/**
 * @brief Classification of a single grid cell
 */
enum class CellType : UInt8 {
    Empty     = 0,   ///< Outside the playable bounds
    Surface   = 1,   ///< Intact playable terrain
    Barrier   = 2,   ///< Fixed obstruction, never mutates
    Pocket    = 3,   ///< Permanent sink region
    Destroyed = 4,   ///< Former Surface removed by damage

    Count
};

inline const char* cell_type_to_string(CellType type) {
    switch (type) {
        case CellType::Empty: return "Empty";
        case CellType::Surface: return "Surface";
        case CellType::Barrier: return "Barrier";
        case CellType::Pocket: return "Pocket";
        case CellType::Destroyed: return "Destroyed";
        default: return "Unknown";
    }
}

/**
 * @brief Integer cell coordinates
 */
struct CellIndex {
    Int32 col{0};
    Int32 row{0};

    constexpr bool operator==(const CellIndex& other) const noexcept {
        return col == other.col && row == other.row;
    }
};

// ============================================================================
// SpatialGrid
// ============================================================================

class SpatialGrid {
public:
    /**
     * @brief Create a grid with every cell set to @p fill
     * @throws std::invalid_argument if cols or rows is not positive, or
     *         cell_size is not a positive finite number
     */
    SpatialGrid(Int32 cols, Int32 rows, Real cell_size, const Vec2& origin,
                CellType fill = CellType::Empty);

    /**
     * @brief Build and classify a grid from table geometry
     *
     * Each cell is classified by its center: outside the rounded outer
     * rectangle is Empty, inside a pocket circle is Pocket, inside the
     * playable rectangle is Surface, any other in-bounds cell is Barrier.
     *
     * @throws std::invalid_argument if the geometry is invalid
     */
    static SpatialGrid from_geometry(const TableGeometry& geometry);

    // ========================================================================
    // Queries
    // ========================================================================

    /**
     * @brief Cell under a world point; Empty when out of bounds
     */
    CellType classify(const Vec2& world) const noexcept;

    /// Pocket or Destroyed (the point falls through)
    bool is_open_hazard(const Vec2& world) const noexcept;

    /// Exactly Surface
    bool is_walkable(const Vec2& world) const noexcept;

    /**
     * @brief Grid indices of a world point, floor((coord - origin) / cell_size)
     * @return std::nullopt when outside [0, cols) x [0, rows)
     */
    std::optional<CellIndex> world_to_cell(const Vec2& world) const noexcept;

    bool in_bounds(Int32 col, Int32 row) const noexcept {
        return col >= 0 && col < cols_ && row >= 0 && row < rows_;
    }

    /// Cell by indices; Empty when out of range
    CellType cell_at(Int32 col, Int32 row) const noexcept;
    CellType cell_at(const CellIndex& index) const noexcept { return cell_at(index.col, index.row); }

    /// World position of a cell center
    Vec2 cell_center(Int32 col, Int32 row) const noexcept;
    Vec2 cell_center(const CellIndex& index) const noexcept { return cell_center(index.col, index.row); }

    /// Number of cells of a type, O(1)
    SizeT count(CellType type) const noexcept;

    /// Indices of every cell of a type, row-major order
    std::vector<CellIndex> collect(CellType type) const;

    // ========================================================================
    // Mutation
    // ========================================================================

    /**
     * @brief Destroy the Surface cell under a world point
     * @return true if a cell transitioned; false for any other cell or out of bounds
     */
    bool mark_destroyed(const Vec2& world) noexcept;

    /**
     * @brief Destroy a Surface cell by index
     */
    bool mark_destroyed(const CellIndex& index) noexcept;

    // ========================================================================
    // Dimensions
    // ========================================================================

    Int32 cols() const noexcept { return cols_; }
    Int32 rows() const noexcept { return rows_; }
    SizeT cell_count() const noexcept { return cells_.size(); }
    Real cell_size() const noexcept { return cell_size_; }
    const Vec2& origin() const noexcept { return origin_; }
    Rect bounds() const noexcept;

private:
    SizeT linear(Int32 col, Int32 row) const noexcept {
        return static_cast<SizeT>(row) * static_cast<SizeT>(cols_) + static_cast<SizeT>(col);
    }
    void set_cell(Int32 col, Int32 row, CellType type) noexcept;

    Int32 cols_{0};
    Int32 rows_{0};
    Real cell_size_{0.0};
    Vec2 origin_{};
    std::vector<CellType> cells_;
    std::array<SizeT, static_cast<SizeT>(CellType::Count)> counts_{};
};

} // namespace crater::surface
