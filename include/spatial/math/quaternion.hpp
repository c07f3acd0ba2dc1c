#pragma once

/// @file quaternion.hpp
/// @brief Generic-precision rotation quaternion for spatial_math
///
/// Multiplication is the Hamilton product: rotating a vector by (a * b)
/// applies b first, then a. concatenate(a, b) is the "a, then b" spelling
/// of the same thing and equals b * a.

#include "constants.hpp"
#include "vector4.hpp"

#include <string>
#include <utility>

namespace spatial_math {

// =============================================================================
// Quaternion
// =============================================================================

/// Rotation quaternion (x, y, z) vector part, w scalar part
///
/// Unit length is a soft contract: composition drifts slightly and
/// normalize() restores it. Default construction gives the identity.
template<Scalar T>
struct Quaternion {
    T x{0};
    T y{0};
    T z{0};
    T w{1};

    static Quaternion IDENTITY() { return {T(0), T(0), T(0), T(1)}; }

    constexpr Quaternion() = default;

    constexpr Quaternion(T x_, T y_, T z_, T w_)
        : x(std::move(x_)), y(std::move(y_)), z(std::move(z_)), w(std::move(w_)) {}

    Quaternion(const Vector3<T>& vector_part, T scalar_part)
        : x(vector_part.x), y(vector_part.y), z(vector_part.z), w(std::move(scalar_part)) {}

    // =========================================================================
    // Creation
    // =========================================================================

    /// Rotation of angle radians about a unit axis
    static Quaternion from_axis_angle(const Vector3<T>& axis, const T& angle) {
        const T half = angle * num::half<T>();
        const T s = num::sin(half);
        return Quaternion(axis.x * s, axis.y * s, axis.z * s, num::cos(half));
    }

    /// Yaw about Y, pitch about X, roll about Z (applied roll, pitch, yaw)
    static Quaternion from_yaw_pitch_roll(const T& yaw, const T& pitch, const T& roll) {
        const T h = num::half<T>();
        const T sr = num::sin(roll * h);
        const T cr = num::cos(roll * h);
        const T sp = num::sin(pitch * h);
        const T cp = num::cos(pitch * h);
        const T sy = num::sin(yaw * h);
        const T cy = num::cos(yaw * h);

        return Quaternion(
            cy * sp * cr + sy * cp * sr,
            sy * cp * cr - cy * sp * sr,
            cy * cp * sr - sy * sp * cr,
            cy * cp * cr + sy * sp * sr);
    }

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] Vector3<T> vector_part() const { return Vector3<T>(x, y, z); }

    [[nodiscard]] bool is_identity() const {
        return x == T(0) && y == T(0) && z == T(0) && w == T(1);
    }

    // =========================================================================
    // Operations
    // =========================================================================

    [[nodiscard]] T dot(const Quaternion& o) const {
        return x * o.x + y * o.y + z * o.z + w * o.w;
    }

    [[nodiscard]] T length_squared() const { return dot(*this); }
    [[nodiscard]] T length() const { return num::sqrt(length_squared()); }

    /// Unit quaternion; a zero quaternion yields all-NaN components
    [[nodiscard]] Quaternion normalize() const {
        const T len = length();
        if (len == T(0)) {
            const T nan = num::nan<T>();
            return Quaternion(nan, nan, nan, nan);
        }
        return Quaternion(x / len, y / len, z / len, w / len);
    }

    [[nodiscard]] Quaternion conjugate() const {
        return Quaternion(-x, -y, -z, w);
    }

    [[nodiscard]] Quaternion inverse() const {
        const T inv = num::one<T>() / length_squared();
        return Quaternion(-x * inv, -y * inv, -z * inv, w * inv);
    }

    // =========================================================================
    // Operators
    // =========================================================================

    /// Hamilton product
    Quaternion operator*(const Quaternion& q) const {
        const T cx = y * q.z - z * q.y;
        const T cy = z * q.x - x * q.z;
        const T cz = x * q.y - y * q.x;
        const T d = x * q.x + y * q.y + z * q.z;

        return Quaternion(
            x * q.w + q.x * w + cx,
            y * q.w + q.y * w + cy,
            z * q.w + q.z * w + cz,
            w * q.w - d);
    }

    Quaternion operator/(const Quaternion& q) const { return *this * q.inverse(); }
    Quaternion operator+(const Quaternion& q) const { return Quaternion(x + q.x, y + q.y, z + q.z, w + q.w); }
    Quaternion operator-(const Quaternion& q) const { return Quaternion(x - q.x, y - q.y, z - q.z, w - q.w); }
    Quaternion operator*(const T& s) const { return Quaternion(x * s, y * s, z * s, w * s); }
    Quaternion operator-() const { return Quaternion(-x, -y, -z, -w); }

    Quaternion& operator*=(const Quaternion& q) { *this = *this * q; return *this; }

    bool operator==(const Quaternion& q) const { return x == q.x && y == q.y && z == q.z && w == q.w; }
    bool operator!=(const Quaternion& q) const { return !(*this == q); }
};

// =============================================================================
// Free Functions
// =============================================================================

template<Scalar T>
[[nodiscard]] inline T dot(const Quaternion<T>& a, const Quaternion<T>& b) { return a.dot(b); }

template<Scalar T>
[[nodiscard]] inline T length(const Quaternion<T>& q) { return q.length(); }

template<Scalar T>
[[nodiscard]] inline Quaternion<T> normalize(const Quaternion<T>& q) { return q.normalize(); }

template<Scalar T>
[[nodiscard]] inline Quaternion<T> conjugate(const Quaternion<T>& q) { return q.conjugate(); }

template<Scalar T>
[[nodiscard]] inline Quaternion<T> inverse(const Quaternion<T>& q) { return q.inverse(); }

/// Rotation a followed by rotation b
template<Scalar T>
[[nodiscard]] inline Quaternion<T> concatenate(const Quaternion<T>& a, const Quaternion<T>& b) {
    return b * a;
}

/// Normalized linear blend along the shorter arc
template<Scalar T>
[[nodiscard]] inline Quaternion<T> lerp(const Quaternion<T>& a, const Quaternion<T>& b, const T& t) {
    const T t1 = num::one<T>() - t;
    Quaternion<T> r = dot(a, b) >= T(0)
        ? a * t1 + b * t
        : a * t1 - b * t;
    return r.normalize();
}

/// Spherical interpolation along the shorter arc
template<Scalar T>
[[nodiscard]] inline Quaternion<T> slerp(const Quaternion<T>& a, const Quaternion<T>& b, const T& t) {
    T cos_omega = dot(a, b);
    bool flip = false;
    if (cos_omega < T(0)) {
        flip = true;
        cos_omega = -cos_omega;
    }

    if (cos_omega > num::one<T>() - consts::slerp_epsilon<T>()) {
        // Nearly identical: linear blend
        const T s1 = num::one<T>() - t;
        const T s2 = flip ? -t : t;
        return (a * s1 + b * s2).normalize();
    }

    const T omega = num::acos(cos_omega);
    const T inv_sin = num::one<T>() / num::sin(omega);
    const T s1 = num::sin((num::one<T>() - t) * omega) * inv_sin;
    const T s2 = num::sin(t * omega) * inv_sin;
    return a * s1 + b * (flip ? -s2 : s2);
}

/// Axis and angle (radians) of a rotation; the identity reports (UNIT_X, 0)
template<Scalar T>
[[nodiscard]] inline std::pair<Vector3<T>, T> to_axis_angle(const Quaternion<T>& q) {
    const Quaternion<T> n = q.w < T(0) ? -q.normalize() : q.normalize();
    const T w = num::clamp(n.w, T(-1), T(1));
    const T s = num::sqrt(num::one<T>() - w * w);
    if (is_nearly_zero(s)) {
        return {Vector3<T>::UNIT_X(), T(0)};
    }
    return {n.vector_part() / s, num::two<T>() * num::acos(w)};
}

// =============================================================================
// Vector Rotation
// =============================================================================

/// Rotate v by q (q v q*, q expected unit length)
template<Scalar T>
[[nodiscard]] inline Vector3<T> transform(const Vector3<T>& v, const Quaternion<T>& q) {
    const T x2 = q.x + q.x;
    const T y2 = q.y + q.y;
    const T z2 = q.z + q.z;

    const T wx2 = q.w * x2;
    const T wy2 = q.w * y2;
    const T wz2 = q.w * z2;
    const T xx2 = q.x * x2;
    const T xy2 = q.x * y2;
    const T xz2 = q.x * z2;
    const T yy2 = q.y * y2;
    const T yz2 = q.y * z2;
    const T zz2 = q.z * z2;
    const T one = num::one<T>();

    return Vector3<T>(
        v.x * (one - yy2 - zz2) + v.y * (xy2 - wz2) + v.z * (xz2 + wy2),
        v.x * (xy2 + wz2) + v.y * (one - xx2 - zz2) + v.z * (yz2 - wx2),
        v.x * (xz2 - wy2) + v.y * (yz2 + wx2) + v.z * (one - xx2 - yy2));
}

/// Rotate a point in the XY plane by q; the result keeps z = 0 dropped
template<Scalar T>
[[nodiscard]] inline Vector2<T> transform(const Vector2<T>& v, const Quaternion<T>& q) {
    auto r = transform(Vector3<T>(v.x, v.y, T(0)), q);
    return Vector2<T>(r.x, r.y);
}

/// Rotate the xyz part of v by q, w unchanged
template<Scalar T>
[[nodiscard]] inline Vector4<T> transform(const Vector4<T>& v, const Quaternion<T>& q) {
    return Vector4<T>(transform(v.xyz(), q), v.w);
}

/// Shortest rotation taking the direction of from onto the direction of to
///
/// A zero vector has no direction; the identity is returned for it.
template<Scalar T>
[[nodiscard]] inline Quaternion<T> rotation_to(const Vector3<T>& from, const Vector3<T>& to) {
    if (from == to || from.is_zero() || to.is_zero()) {
        return Quaternion<T>::IDENTITY();
    }

    if (are_parallel(from, to)) {
        // No unique axis for the direct formula: route through a helper
        // axis perpendicular enough to both.
        const Vector3<T> helper = are_parallel(from, Vector3<T>::UNIT_X())
            ? Vector3<T>::UNIT_Y()
            : Vector3<T>::UNIT_X();
        return rotation_to(helper, to) * rotation_to(from, helper);
    }

    const T w = num::sqrt(from.length_squared() * to.length_squared()) + dot(from, to);
    return Quaternion<T>(cross(from, to), w).normalize();
}

template<Scalar T>
[[nodiscard]] inline bool is_nearly_equal(const Quaternion<T>& a, const Quaternion<T>& b) {
    return is_nearly_equal(a.x, b.x) && is_nearly_equal(a.y, b.y)
        && is_nearly_equal(a.z, b.z) && is_nearly_equal(a.w, b.w);
}

template<Scalar T>
[[nodiscard]] inline std::string to_string(const Quaternion<T>& q) {
    return "(" + num::to_string(q.x) + ", " + num::to_string(q.y) + ", "
        + num::to_string(q.z) + ", " + num::to_string(q.w) + ")";
}

} // namespace spatial_math
