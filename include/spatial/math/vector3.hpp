#pragma once

/// @file vector3.hpp
/// @brief Generic-precision 3D vector for spatial_math

#include "scalar.hpp"

#include <array>
#include <string>
#include <utility>

namespace spatial_math {

// =============================================================================
// Vector3
// =============================================================================

/// 3D vector over any Scalar
///
/// Plain value type with no unit-length invariant. normalize() divides by
/// the length unconditionally: a zero vector yields non-finite components,
/// so callers check is_zero() / is_nearly_zero() first when that matters.
template<Scalar T>
struct Vector3 {
    T x{};
    T y{};
    T z{};

    // =========================================================================
    // Constants
    // =========================================================================

    static Vector3 ZERO() { return {T(0), T(0), T(0)}; }
    static Vector3 ONE() { return {T(1), T(1), T(1)}; }
    static Vector3 UNIT_X() { return {T(1), T(0), T(0)}; }
    static Vector3 UNIT_Y() { return {T(0), T(1), T(0)}; }
    static Vector3 UNIT_Z() { return {T(0), T(0), T(1)}; }

    // =========================================================================
    // Constructors
    // =========================================================================

    constexpr Vector3() = default;

    constexpr Vector3(T x_, T y_, T z_)
        : x(std::move(x_)), y(std::move(y_)), z(std::move(z_)) {}

    static Vector3 splat(const T& v) {
        return Vector3(v, v, v);
    }

    static Vector3 from_array(const std::array<T, 3>& arr) {
        return Vector3(arr[0], arr[1], arr[2]);
    }

    [[nodiscard]] std::array<T, 3> to_array() const {
        return {x, y, z};
    }

    // =========================================================================
    // Vector Operations
    // =========================================================================

    [[nodiscard]] T dot(const Vector3& other) const {
        return x * other.x + y * other.y + z * other.z;
    }

    /// Right-handed cross product
    [[nodiscard]] Vector3 cross(const Vector3& other) const {
        return Vector3(
            y * other.z - z * other.y,
            z * other.x - x * other.z,
            x * other.y - y * other.x
        );
    }

    [[nodiscard]] T length_squared() const {
        return dot(*this);
    }

    [[nodiscard]] T length() const {
        return num::sqrt(length_squared());
    }

    [[nodiscard]] T distance(const Vector3& other) const {
        return (*this - other).length();
    }

    [[nodiscard]] T distance_squared(const Vector3& other) const {
        return (*this - other).length_squared();
    }

    [[nodiscard]] Vector3 normalize() const {
        return *this / length();
    }

    [[nodiscard]] Vector3 lerp(const Vector3& other, const T& t) const {
        return *this + (other - *this) * t;
    }

    [[nodiscard]] Vector3 min(const Vector3& other) const {
        return Vector3(num::min(x, other.x), num::min(y, other.y), num::min(z, other.z));
    }

    [[nodiscard]] Vector3 max(const Vector3& other) const {
        return Vector3(num::max(x, other.x), num::max(y, other.y), num::max(z, other.z));
    }

    [[nodiscard]] Vector3 abs() const {
        return Vector3(num::abs(x), num::abs(y), num::abs(z));
    }

    /// Exactly the zero vector
    [[nodiscard]] bool is_zero() const {
        return x == T(0) && y == T(0) && z == T(0);
    }

    [[nodiscard]] bool is_finite() const {
        return num::is_finite(x) && num::is_finite(y) && num::is_finite(z);
    }

    // =========================================================================
    // Operators
    // =========================================================================

    Vector3 operator+(const Vector3& o) const { return Vector3(x + o.x, y + o.y, z + o.z); }
    Vector3 operator-(const Vector3& o) const { return Vector3(x - o.x, y - o.y, z - o.z); }
    Vector3 operator*(const Vector3& o) const { return Vector3(x * o.x, y * o.y, z * o.z); }
    Vector3 operator/(const Vector3& o) const { return Vector3(x / o.x, y / o.y, z / o.z); }
    Vector3 operator*(const T& s) const { return Vector3(x * s, y * s, z * s); }
    Vector3 operator/(const T& s) const { return Vector3(x / s, y / s, z / s); }
    Vector3 operator-() const { return Vector3(-x, -y, -z); }

    Vector3& operator+=(const Vector3& o) { x += o.x; y += o.y; z += o.z; return *this; }
    Vector3& operator-=(const Vector3& o) { x -= o.x; y -= o.y; z -= o.z; return *this; }
    Vector3& operator*=(const T& s) { x *= s; y *= s; z *= s; return *this; }
    Vector3& operator/=(const T& s) { x /= s; y /= s; z /= s; return *this; }

    bool operator==(const Vector3& o) const { return x == o.x && y == o.y && z == o.z; }
    bool operator!=(const Vector3& o) const { return !(*this == o); }
};

template<Scalar T>
[[nodiscard]] inline Vector3<T> operator*(const T& s, const Vector3<T>& v) {
    return v * s;
}

// =============================================================================
// Free Functions
// =============================================================================

template<Scalar T>
[[nodiscard]] inline T dot(const Vector3<T>& a, const Vector3<T>& b) { return a.dot(b); }

template<Scalar T>
[[nodiscard]] inline Vector3<T> cross(const Vector3<T>& a, const Vector3<T>& b) { return a.cross(b); }

template<Scalar T>
[[nodiscard]] inline T length(const Vector3<T>& v) { return v.length(); }

template<Scalar T>
[[nodiscard]] inline T length_squared(const Vector3<T>& v) { return v.length_squared(); }

template<Scalar T>
[[nodiscard]] inline T distance(const Vector3<T>& a, const Vector3<T>& b) { return a.distance(b); }

template<Scalar T>
[[nodiscard]] inline T distance_squared(const Vector3<T>& a, const Vector3<T>& b) { return a.distance_squared(b); }

template<Scalar T>
[[nodiscard]] inline Vector3<T> normalize(const Vector3<T>& v) { return v.normalize(); }

template<Scalar T>
[[nodiscard]] inline Vector3<T> lerp(const Vector3<T>& a, const Vector3<T>& b, const T& t) { return a.lerp(b, t); }

template<Scalar T>
[[nodiscard]] inline Vector3<T> min(const Vector3<T>& a, const Vector3<T>& b) { return a.min(b); }

template<Scalar T>
[[nodiscard]] inline Vector3<T> max(const Vector3<T>& a, const Vector3<T>& b) { return a.max(b); }

template<Scalar T>
[[nodiscard]] inline Vector3<T> abs(const Vector3<T>& v) { return v.abs(); }

template<Scalar T>
[[nodiscard]] inline Vector3<T> clamp(const Vector3<T>& v, const Vector3<T>& lo, const Vector3<T>& hi) {
    return v.max(lo).min(hi);
}

template<Scalar T>
[[nodiscard]] inline Vector3<T> square_root(const Vector3<T>& v) {
    return Vector3<T>(num::sqrt(v.x), num::sqrt(v.y), num::sqrt(v.z));
}

/// Reflect v about the plane with normal n (n expected unit length)
template<Scalar T>
[[nodiscard]] inline Vector3<T> reflect(const Vector3<T>& v, const Vector3<T>& n) {
    return v - n * (num::two<T>() * dot(v, n));
}

/// Unsigned angle between two vectors in radians, stable near 0 and π
template<Scalar T>
[[nodiscard]] inline T angle(const Vector3<T>& a, const Vector3<T>& b) {
    return num::atan2(length(cross(a, b)), dot(a, b));
}

/// All components nearly zero
template<Scalar T>
[[nodiscard]] inline bool is_nearly_zero(const Vector3<T>& v) {
    return is_nearly_zero(v.x) && is_nearly_zero(v.y) && is_nearly_zero(v.z);
}

/// Component-wise nearly equal
template<Scalar T>
[[nodiscard]] inline bool is_nearly_equal(const Vector3<T>& a, const Vector3<T>& b) {
    return is_nearly_equal(a.x, b.x) && is_nearly_equal(a.y, b.y) && is_nearly_equal(a.z, b.z);
}

/// Parallel or anti-parallel; strict mode requires an exactly zero cross product
template<Scalar T>
[[nodiscard]] inline bool are_parallel(const Vector3<T>& a, const Vector3<T>& b, bool allow_small_error = true) {
    auto c = cross(a, b);
    return allow_small_error ? is_nearly_zero(c) : c.is_zero();
}

template<Scalar T>
[[nodiscard]] inline std::string to_string(const Vector3<T>& v) {
    return "(" + num::to_string(v.x) + ", " + num::to_string(v.y) + ", " + num::to_string(v.z) + ")";
}

} // namespace spatial_math
