/**
 * @file table_geometry.cpp
 * @brief TableGeometry implementation
 */

#include "crater/surface/table_geometry.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace crater::surface {

namespace {
    // Reference table proportions (fractions of the outer height)
    constexpr Real ASPECT_RATIO = 1.7;
    constexpr Real BARRIER_FRACTION = 0.14;
    constexpr Real POCKET_FRACTION = 0.057;
    constexpr Real SIDE_POCKET_INSET = 0.45;   // of the pocket radius
}

Rect TableGeometry::bounds() const noexcept {
    return Rect::from_center(center, width, height);
}

Rect TableGeometry::playable() const noexcept {
    return bounds().inset(barrier_thickness);
}

bool TableGeometry::contains(const Vec2& p) const noexcept {
    Real half_w = width * 0.5;
    Real half_h = height * 0.5;
    Real r = std::max(0.0, std::min(corner_radius, std::min(half_w, half_h)));
    Real dx = std::abs(p.x - center.x);
    Real dy = std::abs(p.y - center.y);

    if (dx > half_w || dy > half_h) return false;
    if (dx <= half_w - r || dy <= half_h - r) return true;

    // Corner arc
    Real lx = dx - (half_w - r);
    Real ly = dy - (half_h - r);
    return lx * lx + ly * ly <= r * r;
}

bool TableGeometry::in_pocket(const Vec2& p) const noexcept {
    return std::any_of(pocket_centers.begin(), pocket_centers.end(),
        [&](const Vec2& c) { return p.distance_to(c) <= pocket_radius; });
}

Real TableGeometry::distance_to_pocket_edge(const Vec2& p) const noexcept {
    Real nearest = std::numeric_limits<Real>::infinity();
    for (const auto& c : pocket_centers) {
        nearest = std::min(nearest, p.distance_to(c) - pocket_radius);
    }
    return nearest;
}

void TableGeometry::validate() const {
    if (!(width > 0.0) || !(height > 0.0)) {
        throw std::invalid_argument("TableGeometry: width and height must be positive");
    }
    if (!(cell_size > 0.0)) {
        throw std::invalid_argument("TableGeometry: cell_size must be positive");
    }
    if (barrier_thickness < 0.0 || pocket_radius < 0.0 || corner_radius < 0.0) {
        throw std::invalid_argument("TableGeometry: negative barrier, pocket or corner radius");
    }
    if (2.0 * barrier_thickness >= std::min(width, height)) {
        throw std::invalid_argument("TableGeometry: barrier leaves no playable area");
    }
}

TableGeometry TableGeometry::standard(const Vec2& center, Real table_height, Real cell_size) {
    if (!(table_height > 0.0) || !(cell_size > 0.0)) {
        throw std::invalid_argument("TableGeometry::standard: height and cell size must be positive");
    }

    TableGeometry g;
    g.center = center;
    g.cell_size = cell_size;

    Real cols = std::round(table_height * ASPECT_RATIO / cell_size);
    Real rows = std::round(table_height / cell_size);
    g.width = cols * cell_size;
    g.height = rows * cell_size;

    Real rail = table_height * BARRIER_FRACTION;
    g.barrier_thickness = std::round(rail / cell_size) * cell_size;
    g.corner_radius = rail;
    g.pocket_radius = table_height * POCKET_FRACTION;

    Rect felt = g.playable();
    Real half_fw = felt.width() * 0.5;
    Real half_fh = felt.height() * 0.5;
    Real side_offset = half_fh + g.pocket_radius * SIDE_POCKET_INSET;

    g.pocket_centers = {
        {center.x - half_fw, center.y + half_fh},
        {center.x + half_fw, center.y + half_fh},
        {center.x - half_fw, center.y - half_fh},
        {center.x + half_fw, center.y - half_fh},
        {center.x, center.y + side_offset},
        {center.x, center.y - side_offset},
    };

    g.validate();
    return g;
}

} // namespace crater::surface
