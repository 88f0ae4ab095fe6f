#pragma once
/**
 * @file table_geometry.h
 * @brief World-space description of the table used to build the grid
 *
 * The geometry is supplied once per round by the host. It is the only
 * input to the initial grid classification.
 */

#include "crater/core/types.h"
#include <vector>

namespace crater::surface {

/**
 * @brief Table bounds, barriers and pockets in world coordinates
 */
struct TableGeometry {
    Vec2 center{0.0, 0.0};
    Real width{0.0};                 ///< Outer width including barriers
    Real height{0.0};                ///< Outer height including barriers
    Real corner_radius{0.0};         ///< Rounding of the outer rectangle
    Real barrier_thickness{0.0};     ///< Rail band between outer edge and playable area
    Real pocket_radius{0.0};
    std::vector<Vec2> pocket_centers;
    Real cell_size{5.0};             ///< Grid cell edge length

    /// Outer rectangle (ignores corner rounding)
    Rect bounds() const noexcept;

    /// Playable rectangle: bounds inset by the barrier thickness
    Rect playable() const noexcept;

    /// Inside the rounded outer rectangle
    bool contains(const Vec2& p) const noexcept;

    /// Inside any pocket circle (boundary inclusive)
    bool in_pocket(const Vec2& p) const noexcept;

    /// Distance from p to the nearest pocket boundary; negative inside a pocket
    Real distance_to_pocket_edge(const Vec2& p) const noexcept;

    /**
     * @brief Check dimensional invariants
     * @throws std::invalid_argument on non-positive size, cell size or
     *         a barrier that swallows the playable area
     */
    void validate() const;

    /**
     * @brief Standard six-pocket table of the given outer height
     *
     * Width is 1.7x the height. Outer size and barrier thickness are
     * snapped to whole cells. Corner pockets sit on the playable corners,
     * side pockets at mid-width just beyond the long playable edges.
     */
    static TableGeometry standard(const Vec2& center, Real table_height,
                                  Real cell_size = 5.0);
};

} // namespace crater::surface
