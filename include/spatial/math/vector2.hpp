#pragma once

/// @file vector2.hpp
/// @brief Generic-precision 2D vector for spatial_math

#include "scalar.hpp"

#include <array>
#include <string>
#include <utility>

namespace spatial_math {

// =============================================================================
// Vector2
// =============================================================================

/// 2D vector over any Scalar
template<Scalar T>
struct Vector2 {
    T x{};
    T y{};

    // =========================================================================
    // Constants
    // =========================================================================

    static Vector2 ZERO() { return {T(0), T(0)}; }
    static Vector2 ONE() { return {T(1), T(1)}; }
    static Vector2 UNIT_X() { return {T(1), T(0)}; }
    static Vector2 UNIT_Y() { return {T(0), T(1)}; }

    // =========================================================================
    // Constructors
    // =========================================================================

    constexpr Vector2() = default;

    constexpr Vector2(T x_, T y_)
        : x(std::move(x_)), y(std::move(y_)) {}

    static Vector2 splat(const T& v) {
        return Vector2(v, v);
    }

    static Vector2 from_array(const std::array<T, 2>& arr) {
        return Vector2(arr[0], arr[1]);
    }

    [[nodiscard]] std::array<T, 2> to_array() const {
        return {x, y};
    }

    // =========================================================================
    // Vector Operations
    // =========================================================================

    [[nodiscard]] T dot(const Vector2& other) const {
        return x * other.x + y * other.y;
    }

    /// Z component of the cross product of (x, y, 0) and (other.x, other.y, 0)
    [[nodiscard]] T cross(const Vector2& other) const {
        return x * other.y - y * other.x;
    }

    [[nodiscard]] T length_squared() const { return dot(*this); }
    [[nodiscard]] T length() const { return num::sqrt(length_squared()); }

    [[nodiscard]] T distance(const Vector2& other) const {
        return (*this - other).length();
    }

    [[nodiscard]] T distance_squared(const Vector2& other) const {
        return (*this - other).length_squared();
    }

    [[nodiscard]] Vector2 normalize() const {
        return *this / length();
    }

    [[nodiscard]] Vector2 lerp(const Vector2& other, const T& t) const {
        return *this + (other - *this) * t;
    }

    [[nodiscard]] Vector2 min(const Vector2& other) const {
        return Vector2(num::min(x, other.x), num::min(y, other.y));
    }

    [[nodiscard]] Vector2 max(const Vector2& other) const {
        return Vector2(num::max(x, other.x), num::max(y, other.y));
    }

    [[nodiscard]] Vector2 abs() const {
        return Vector2(num::abs(x), num::abs(y));
    }

    [[nodiscard]] bool is_zero() const {
        return x == T(0) && y == T(0);
    }

    // =========================================================================
    // Operators
    // =========================================================================

    Vector2 operator+(const Vector2& o) const { return Vector2(x + o.x, y + o.y); }
    Vector2 operator-(const Vector2& o) const { return Vector2(x - o.x, y - o.y); }
    Vector2 operator*(const Vector2& o) const { return Vector2(x * o.x, y * o.y); }
    Vector2 operator/(const Vector2& o) const { return Vector2(x / o.x, y / o.y); }
    Vector2 operator*(const T& s) const { return Vector2(x * s, y * s); }
    Vector2 operator/(const T& s) const { return Vector2(x / s, y / s); }
    Vector2 operator-() const { return Vector2(-x, -y); }

    Vector2& operator+=(const Vector2& o) { x += o.x; y += o.y; return *this; }
    Vector2& operator-=(const Vector2& o) { x -= o.x; y -= o.y; return *this; }
    Vector2& operator*=(const T& s) { x *= s; y *= s; return *this; }
    Vector2& operator/=(const T& s) { x /= s; y /= s; return *this; }

    bool operator==(const Vector2& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Vector2& o) const { return !(*this == o); }
};

template<Scalar T>
[[nodiscard]] inline Vector2<T> operator*(const T& s, const Vector2<T>& v) {
    return v * s;
}

// =============================================================================
// Free Functions
// =============================================================================

template<Scalar T>
[[nodiscard]] inline T dot(const Vector2<T>& a, const Vector2<T>& b) { return a.dot(b); }

template<Scalar T>
[[nodiscard]] inline T length(const Vector2<T>& v) { return v.length(); }

template<Scalar T>
[[nodiscard]] inline T length_squared(const Vector2<T>& v) { return v.length_squared(); }

template<Scalar T>
[[nodiscard]] inline T distance(const Vector2<T>& a, const Vector2<T>& b) { return a.distance(b); }

template<Scalar T>
[[nodiscard]] inline T distance_squared(const Vector2<T>& a, const Vector2<T>& b) { return a.distance_squared(b); }

template<Scalar T>
[[nodiscard]] inline Vector2<T> normalize(const Vector2<T>& v) { return v.normalize(); }

template<Scalar T>
[[nodiscard]] inline Vector2<T> lerp(const Vector2<T>& a, const Vector2<T>& b, const T& t) { return a.lerp(b, t); }

template<Scalar T>
[[nodiscard]] inline Vector2<T> min(const Vector2<T>& a, const Vector2<T>& b) { return a.min(b); }

template<Scalar T>
[[nodiscard]] inline Vector2<T> max(const Vector2<T>& a, const Vector2<T>& b) { return a.max(b); }

template<Scalar T>
[[nodiscard]] inline Vector2<T> abs(const Vector2<T>& v) { return v.abs(); }

template<Scalar T>
[[nodiscard]] inline Vector2<T> clamp(const Vector2<T>& v, const Vector2<T>& lo, const Vector2<T>& hi) {
    return v.max(lo).min(hi);
}

template<Scalar T>
[[nodiscard]] inline Vector2<T> square_root(const Vector2<T>& v) {
    return Vector2<T>(num::sqrt(v.x), num::sqrt(v.y));
}

template<Scalar T>
[[nodiscard]] inline Vector2<T> reflect(const Vector2<T>& v, const Vector2<T>& n) {
    return v - n * (num::two<T>() * dot(v, n));
}

/// Counter-clockwise rotation by angle radians
template<Scalar T>
[[nodiscard]] inline Vector2<T> rotate(const Vector2<T>& v, const T& angle) {
    const T c = num::cos(angle);
    const T s = num::sin(angle);
    return Vector2<T>(v.x * c - v.y * s, v.x * s + v.y * c);
}

/// Unsigned angle between two vectors in radians
template<Scalar T>
[[nodiscard]] inline T angle(const Vector2<T>& a, const Vector2<T>& b) {
    return num::atan2(num::abs(a.cross(b)), dot(a, b));
}

template<Scalar T>
[[nodiscard]] inline bool is_nearly_zero(const Vector2<T>& v) {
    return is_nearly_zero(v.x) && is_nearly_zero(v.y);
}

template<Scalar T>
[[nodiscard]] inline bool is_nearly_equal(const Vector2<T>& a, const Vector2<T>& b) {
    return is_nearly_equal(a.x, b.x) && is_nearly_equal(a.y, b.y);
}

template<Scalar T>
[[nodiscard]] inline bool are_parallel(const Vector2<T>& a, const Vector2<T>& b, bool allow_small_error = true) {
    const T c = a.cross(b);
    return allow_small_error ? is_nearly_zero(c) : c == T(0);
}

template<Scalar T>
[[nodiscard]] inline std::string to_string(const Vector2<T>& v) {
    return "(" + num::to_string(v.x) + ", " + num::to_string(v.y) + ")";
}

} // namespace spatial_math
