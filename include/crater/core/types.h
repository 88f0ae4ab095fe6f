#pragma once
/**
 * @file types.h
 * @brief Core type definitions for crater
 *
 * This file defines fundamental types used throughout the library,
 * including numeric types, object identifiers and the planar vector.
 */

#include <cstdint>
#include <cstddef>
#include <limits>

namespace crater {

// ============================================================================
// Numeric Types
// ============================================================================

/**
 * @brief Primary floating-point type for geometry and damage calculations
 */
using Real = double;

// Integer types
using Int8   = std::int8_t;
using Int16  = std::int16_t;
using Int32  = std::int32_t;
using Int64  = std::int64_t;
using UInt8  = std::uint8_t;
using UInt16 = std::uint16_t;
using UInt32 = std::uint32_t;
using UInt64 = std::uint64_t;
using SizeT  = std::size_t;

// ============================================================================
// Object Identifiers
// ============================================================================

/**
 * @brief Host-assigned identifier of a damageable object
 */
using ObjectId = UInt32;

/**
 * @brief Invalid object ID constant
 */
constexpr ObjectId INVALID_OBJECT_ID = std::numeric_limits<ObjectId>::max();

/**
 * @brief Category tag of a damageable object (index into the kind profiles)
 */
using KindId = UInt8;

/**
 * @brief The player-controlled kind
 */
constexpr KindId PRIMARY_KIND = 0;

/**
 * @brief Marks damage with no originating object kind (area effects, scripts)
 */
constexpr KindId NO_KIND = std::numeric_limits<KindId>::max();

/**
 * @brief Maximum number of distinct kinds
 */
constexpr SizeT MAX_KINDS = 16;

// ============================================================================
// Math Structures
// ============================================================================

/**
 * @brief 2D vector (table-plane position, offset, direction)
 */
struct Vec2 {
    Real x{0.0};
    Real y{0.0};

    constexpr Vec2() noexcept = default;
    constexpr Vec2(Real x_, Real y_) noexcept : x(x_), y(y_) {}

    constexpr Vec2 operator+(const Vec2& other) const noexcept {
        return {x + other.x, y + other.y};
    }
    constexpr Vec2 operator-(const Vec2& other) const noexcept {
        return {x - other.x, y - other.y};
    }
    constexpr Vec2 operator*(Real scalar) const noexcept {
        return {x * scalar, y * scalar};
    }
    constexpr Vec2 operator/(Real scalar) const noexcept {
        return {x / scalar, y / scalar};
    }
    constexpr Vec2 operator-() const noexcept {
        return {-x, -y};
    }
    constexpr Vec2& operator+=(const Vec2& other) noexcept {
        x += other.x; y += other.y;
        return *this;
    }
    constexpr Vec2& operator-=(const Vec2& other) noexcept {
        x -= other.x; y -= other.y;
        return *this;
    }
    friend constexpr Vec2 operator*(Real scalar, const Vec2& v) noexcept {
        return {v.x * scalar, v.y * scalar};
    }

    constexpr bool operator==(const Vec2& other) const noexcept {
        return x == other.x && y == other.y;
    }
    constexpr bool operator!=(const Vec2& other) const noexcept {
        return !(*this == other);
    }

    constexpr Real dot(const Vec2& other) const noexcept {
        return x * other.x + y * other.y;
    }

    // Magnitude squared (avoid sqrt when possible)
    constexpr Real length_squared() const noexcept {
        return x*x + y*y;
    }

    Real length() const noexcept;
    Vec2 normalized() const noexcept;

    // Distance to another point
    Real distance_to(const Vec2& other) const noexcept;

    // Static factory methods
    static constexpr Vec2 Zero() noexcept { return {0.0, 0.0}; }
    static constexpr Vec2 UnitX() noexcept { return {1.0, 0.0}; }
    static constexpr Vec2 UnitY() noexcept { return {0.0, 1.0}; }
};

/**
 * @brief Axis-aligned rectangle in world space
 */
struct Rect {
    Vec2 min{};
    Vec2 max{};

    constexpr Real width() const noexcept { return max.x - min.x; }
    constexpr Real height() const noexcept { return max.y - min.y; }
    constexpr Vec2 center() const noexcept {
        return {(min.x + max.x) * 0.5, (min.y + max.y) * 0.5};
    }
    constexpr bool contains(const Vec2& p) const noexcept {
        return p.x >= min.x && p.x <= max.x && p.y >= min.y && p.y <= max.y;
    }
    constexpr Rect inset(Real amount) const noexcept {
        return {{min.x + amount, min.y + amount}, {max.x - amount, max.y - amount}};
    }

    static constexpr Rect from_center(const Vec2& c, Real w, Real h) noexcept {
        return {{c.x - w * 0.5, c.y - h * 0.5}, {c.x + w * 0.5, c.y + h * 0.5}};
    }
};

// ============================================================================
// Constants
// ============================================================================

namespace constants {
    constexpr Real PI = 3.14159265358979323846;
    constexpr Real TWO_PI = 2.0 * PI;
}

} // namespace crater
