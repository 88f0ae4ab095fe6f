/**
 * @file vector.cpp
 * @brief Vec2 out-of-line operations
 */

#include "crater/core/types.h"
#include <cmath>

namespace crater {

Real Vec2::length() const noexcept {
    return std::sqrt(length_squared());
}

Vec2 Vec2::normalized() const noexcept {
    Real len = length();
    if (len < 1e-12) {
        return Vec2::Zero();
    }
    return *this / len;
}

Real Vec2::distance_to(const Vec2& other) const noexcept {
    return std::hypot(x - other.x, y - other.y);
}

} // namespace crater
