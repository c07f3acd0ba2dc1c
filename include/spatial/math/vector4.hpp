#pragma once

/// @file vector4.hpp
/// @brief Generic-precision 4D vector for spatial_math

#include "vector2.hpp"
#include "vector3.hpp"

#include <array>
#include <string>
#include <utility>

namespace spatial_math {

/// 4D vector over any Scalar (homogeneous coordinates, plane equations)
template<Scalar T>
struct Vector4 {
    T x{};
    T y{};
    T z{};
    T w{};

    static Vector4 ZERO() { return {T(0), T(0), T(0), T(0)}; }
    static Vector4 ONE() { return {T(1), T(1), T(1), T(1)}; }
    static Vector4 UNIT_X() { return {T(1), T(0), T(0), T(0)}; }
    static Vector4 UNIT_Y() { return {T(0), T(1), T(0), T(0)}; }
    static Vector4 UNIT_Z() { return {T(0), T(0), T(1), T(0)}; }
    static Vector4 UNIT_W() { return {T(0), T(0), T(0), T(1)}; }

    constexpr Vector4() = default;

    constexpr Vector4(T x_, T y_, T z_, T w_)
        : x(std::move(x_)), y(std::move(y_)), z(std::move(z_)), w(std::move(w_)) {}

    Vector4(const Vector2<T>& v, T z_, T w_)
        : x(v.x), y(v.y), z(std::move(z_)), w(std::move(w_)) {}

    Vector4(const Vector3<T>& v, T w_)
        : x(v.x), y(v.y), z(v.z), w(std::move(w_)) {}

    static Vector4 splat(const T& v) {
        return Vector4(v, v, v, v);
    }

    static Vector4 from_array(const std::array<T, 4>& arr) {
        return Vector4(arr[0], arr[1], arr[2], arr[3]);
    }

    [[nodiscard]] std::array<T, 4> to_array() const {
        return {x, y, z, w};
    }

    [[nodiscard]] Vector3<T> xyz() const {
        return Vector3<T>(x, y, z);
    }

    [[nodiscard]] T dot(const Vector4& o) const {
        return x * o.x + y * o.y + z * o.z + w * o.w;
    }

    [[nodiscard]] T length_squared() const { return dot(*this); }
    [[nodiscard]] T length() const { return num::sqrt(length_squared()); }

    [[nodiscard]] T distance(const Vector4& other) const {
        return (*this - other).length();
    }

    [[nodiscard]] T distance_squared(const Vector4& other) const {
        return (*this - other).length_squared();
    }

    [[nodiscard]] Vector4 normalize() const {
        return *this / length();
    }

    [[nodiscard]] Vector4 lerp(const Vector4& other, const T& t) const {
        return *this + (other - *this) * t;
    }

    [[nodiscard]] Vector4 min(const Vector4& o) const {
        return Vector4(num::min(x, o.x), num::min(y, o.y), num::min(z, o.z), num::min(w, o.w));
    }

    [[nodiscard]] Vector4 max(const Vector4& o) const {
        return Vector4(num::max(x, o.x), num::max(y, o.y), num::max(z, o.z), num::max(w, o.w));
    }

    [[nodiscard]] Vector4 abs() const {
        return Vector4(num::abs(x), num::abs(y), num::abs(z), num::abs(w));
    }

    [[nodiscard]] bool is_zero() const {
        return x == T(0) && y == T(0) && z == T(0) && w == T(0);
    }

    Vector4 operator+(const Vector4& o) const { return Vector4(x + o.x, y + o.y, z + o.z, w + o.w); }
    Vector4 operator-(const Vector4& o) const { return Vector4(x - o.x, y - o.y, z - o.z, w - o.w); }
    Vector4 operator*(const Vector4& o) const { return Vector4(x * o.x, y * o.y, z * o.z, w * o.w); }
    Vector4 operator/(const Vector4& o) const { return Vector4(x / o.x, y / o.y, z / o.z, w / o.w); }
    Vector4 operator*(const T& s) const { return Vector4(x * s, y * s, z * s, w * s); }
    Vector4 operator/(const T& s) const { return Vector4(x / s, y / s, z / s, w / s); }
    Vector4 operator-() const { return Vector4(-x, -y, -z, -w); }

    Vector4& operator+=(const Vector4& o) { x += o.x; y += o.y; z += o.z; w += o.w; return *this; }
    Vector4& operator-=(const Vector4& o) { x -= o.x; y -= o.y; z -= o.z; w -= o.w; return *this; }
    Vector4& operator*=(const T& s) { x *= s; y *= s; z *= s; w *= s; return *this; }
    Vector4& operator/=(const T& s) { x /= s; y /= s; z /= s; w /= s; return *this; }

    bool operator==(const Vector4& o) const { return x == o.x && y == o.y && z == o.z && w == o.w; }
    bool operator!=(const Vector4& o) const { return !(*this == o); }
};

template<Scalar T>
[[nodiscard]] inline Vector4<T> operator*(const T& s, const Vector4<T>& v) {
    return v * s;
}

template<Scalar T>
[[nodiscard]] inline T dot(const Vector4<T>& a, const Vector4<T>& b) { return a.dot(b); }

template<Scalar T>
[[nodiscard]] inline T length(const Vector4<T>& v) { return v.length(); }

template<Scalar T>
[[nodiscard]] inline T length_squared(const Vector4<T>& v) { return v.length_squared(); }

template<Scalar T>
[[nodiscard]] inline T distance(const Vector4<T>& a, const Vector4<T>& b) { return a.distance(b); }

template<Scalar T>
[[nodiscard]] inline T distance_squared(const Vector4<T>& a, const Vector4<T>& b) { return a.distance_squared(b); }

template<Scalar T>
[[nodiscard]] inline Vector4<T> normalize(const Vector4<T>& v) { return v.normalize(); }

template<Scalar T>
[[nodiscard]] inline Vector4<T> lerp(const Vector4<T>& a, const Vector4<T>& b, const T& t) { return a.lerp(b, t); }

template<Scalar T>
[[nodiscard]] inline Vector4<T> min(const Vector4<T>& a, const Vector4<T>& b) { return a.min(b); }

template<Scalar T>
[[nodiscard]] inline Vector4<T> max(const Vector4<T>& a, const Vector4<T>& b) { return a.max(b); }

template<Scalar T>
[[nodiscard]] inline Vector4<T> abs(const Vector4<T>& v) { return v.abs(); }

template<Scalar T>
[[nodiscard]] inline Vector4<T> clamp(const Vector4<T>& v, const Vector4<T>& lo, const Vector4<T>& hi) {
    return v.max(lo).min(hi);
}

template<Scalar T>
[[nodiscard]] inline Vector4<T> square_root(const Vector4<T>& v) {
    return Vector4<T>(num::sqrt(v.x), num::sqrt(v.y), num::sqrt(v.z), num::sqrt(v.w));
}

template<Scalar T>
[[nodiscard]] inline bool is_nearly_zero(const Vector4<T>& v) {
    return is_nearly_zero(v.x) && is_nearly_zero(v.y) && is_nearly_zero(v.z) && is_nearly_zero(v.w);
}

template<Scalar T>
[[nodiscard]] inline bool is_nearly_equal(const Vector4<T>& a, const Vector4<T>& b) {
    return is_nearly_equal(a.x, b.x) && is_nearly_equal(a.y, b.y)
        && is_nearly_equal(a.z, b.z) && is_nearly_equal(a.w, b.w);
}

template<Scalar T>
[[nodiscard]] inline std::string to_string(const Vector4<T>& v) {
    return "(" + num::to_string(v.x) + ", " + num::to_string(v.y) + ", "
        + num::to_string(v.z) + ", " + num::to_string(v.w) + ")";
}

} // namespace spatial_math
