#pragma once

/// @file math_types.hpp
/// @brief 2D/3D vector and quaternion value types for unit transforms.
///
/// The arena plays on a plane: positions and sprite sizes are Vector2,
/// while Transform keeps a Vector3 so the z component can carry the
/// drawing layer.

#include <cmath>
#include <compare>

namespace dad::game {

struct Vector2 {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Vector2() = default;
    constexpr Vector2(float x, float y) : x(x), y(y) {}

    constexpr Vector2 operator+(const Vector2& rhs) const noexcept { return {x + rhs.x, y + rhs.y}; }
    constexpr Vector2 operator-(const Vector2& rhs) const noexcept { return {x - rhs.x, y - rhs.y}; }
    constexpr Vector2 operator*(float scalar) const noexcept { return {x * scalar, y * scalar}; }

    [[nodiscard]] constexpr float LengthSquared() const noexcept { return x * x + y * y; }
    [[nodiscard]] float Length() const noexcept { return std::sqrt(LengthSquared()); }

    /// True when both components are finite (no NaN / infinity).
    [[nodiscard]] bool IsFinite() const noexcept { return std::isfinite(x) && std::isfinite(y); }

    [[nodiscard]] static constexpr Vector2 Zero() noexcept { return {}; }

    constexpr auto operator<=>(const Vector2&) const = default;
};

struct Vector3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Vector3() = default;
    constexpr Vector3(float x, float y, float z) : x(x), y(y), z(z) {}

    /// Lift a plane position onto drawing layer @p z.
    constexpr Vector3(const Vector2& xy, float z) : x(xy.x), y(xy.y), z(z) {}

    constexpr Vector3 operator+(const Vector3& rhs) const noexcept {
        return {x + rhs.x, y + rhs.y, z + rhs.z};
    }
    constexpr Vector3 operator*(float scalar) const noexcept {
        return {x * scalar, y * scalar, z * scalar};
    }

    [[nodiscard]] constexpr Vector2 XY() const noexcept { return {x, y}; }

    /// (s, s, s).
    [[nodiscard]] static constexpr Vector3 Splat(float s) noexcept { return {s, s, s}; }
    [[nodiscard]] static constexpr Vector3 One() noexcept { return Splat(1.0f); }

    constexpr auto operator<=>(const Vector3&) const = default;
};

/// Rotation as (w, x, y, z); defaults to identity.
struct Quaternion {
    float w = 1.0f;
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    [[nodiscard]] static constexpr Quaternion Identity() noexcept { return {}; }

    constexpr auto operator<=>(const Quaternion&) const = default;
};

} // namespace dad::game
