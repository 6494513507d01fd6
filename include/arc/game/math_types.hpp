#pragma once

/// @file math_types.hpp
/// @brief Vector3 value type for positions and directions handed to and
///        received from the targeting and rendering collaborators.

#include <cmath>

namespace arc::game {

/// Three-component floating-point vector.
struct Vector3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Vector3() = default;
    constexpr Vector3(float x, float y, float z) : x(x), y(y), z(z) {}

    constexpr Vector3 operator+(const Vector3& rhs) const noexcept {
        return {x + rhs.x, y + rhs.y, z + rhs.z};
    }
    constexpr Vector3 operator-(const Vector3& rhs) const noexcept {
        return {x - rhs.x, y - rhs.y, z - rhs.z};
    }
    constexpr Vector3 operator*(float scalar) const noexcept {
        return {x * scalar, y * scalar, z * scalar};
    }

    constexpr Vector3& operator+=(const Vector3& rhs) noexcept {
        x += rhs.x;
        y += rhs.y;
        z += rhs.z;
        return *this;
    }

    [[nodiscard]] constexpr float Dot(const Vector3& rhs) const noexcept {
        return x * rhs.x + y * rhs.y + z * rhs.z;
    }

    [[nodiscard]] constexpr float LengthSquared() const noexcept { return Dot(*this); }

    [[nodiscard]] float Length() const noexcept { return std::sqrt(LengthSquared()); }

    /// Unit-length copy, or the zero vector when the length is near zero.
    [[nodiscard]] Vector3 Normalized() const noexcept {
        const float len = Length();
        if (len < 1e-6f) {
            return {};
        }
        return {x / len, y / len, z / len};
    }

    [[nodiscard]] float DistanceTo(const Vector3& other) const noexcept {
        return (other - *this).Length();
    }

    /// Copy with y zeroed; targeting and teleports work on the ground plane.
    [[nodiscard]] constexpr Vector3 Flattened() const noexcept { return {x, 0.0f, z}; }

    [[nodiscard]] static constexpr Vector3 Zero() noexcept { return {}; }

    /// Default facing when a character has never moved.
    [[nodiscard]] static constexpr Vector3 Forward() noexcept { return {0.0f, 0.0f, 1.0f}; }

    constexpr bool operator==(const Vector3&) const = default;
};

} // namespace arc::game
