#pragma once

/// @file plane.hpp
/// @brief Plane in Hessian form for spatial_math
///
/// A point p lies on the plane when dot(normal, p) + d == 0. The transform
/// by a Matrix4x4 lives in matrix4x4.hpp.

#include "quaternion.hpp"

#include <string>
#include <utility>

namespace spatial_math {

template<Scalar T>
struct Plane {
    Vector3<T> normal;
    T d{};

    constexpr Plane() = default;

    Plane(const Vector3<T>& normal_, T d_)
        : normal(normal_), d(std::move(d_)) {}

    Plane(T x, T y, T z, T d_)
        : normal(std::move(x), std::move(y), std::move(z)), d(std::move(d_)) {}

    explicit Plane(const Vector4<T>& v)
        : normal(v.x, v.y, v.z), d(v.w) {}

    /// Plane through three points, normal following the right-hand winding a, b, c
    static Plane create_from_vertices(const Vector3<T>& a, const Vector3<T>& b, const Vector3<T>& c) {
        const Vector3<T> n = normalize(cross(b - a, c - a));
        return Plane(n, -dot(n, a));
    }

    bool operator==(const Plane& o) const { return normal == o.normal && d == o.d; }
    bool operator!=(const Plane& o) const { return !(*this == o); }
};

/// Dot product with a homogeneous point
template<Scalar T>
[[nodiscard]] inline T dot(const Plane<T>& plane, const Vector4<T>& v) {
    return plane.normal.x * v.x + plane.normal.y * v.y + plane.normal.z * v.z + plane.d * v.w;
}

/// Signed distance of a point when the plane is normalized
template<Scalar T>
[[nodiscard]] inline T dot_coordinate(const Plane<T>& plane, const Vector3<T>& v) {
    return dot(plane.normal, v) + plane.d;
}

template<Scalar T>
[[nodiscard]] inline T dot_normal(const Plane<T>& plane, const Vector3<T>& v) {
    return dot(plane.normal, v);
}

/// Scale so the normal has unit length; already-normalized planes are returned as is
template<Scalar T>
[[nodiscard]] inline Plane<T> normalize(const Plane<T>& plane) {
    const T len_sq = plane.normal.length_squared();
    if (is_nearly_zero(len_sq - num::one<T>())) {
        return plane;
    }
    const T len = num::sqrt(len_sq);
    return Plane<T>(plane.normal / len, plane.d / len);
}

/// Rotate the plane about the origin
template<Scalar T>
[[nodiscard]] inline Plane<T> transform(const Plane<T>& plane, const Quaternion<T>& rotation) {
    return Plane<T>(transform(plane.normal, rotation), plane.d);
}

template<Scalar T>
[[nodiscard]] inline bool is_nearly_equal(const Plane<T>& a, const Plane<T>& b) {
    return is_nearly_equal(a.normal, b.normal) && is_nearly_equal(a.d, b.d);
}

template<Scalar T>
[[nodiscard]] inline std::string to_string(const Plane<T>& p) {
    return "{normal: " + to_string(p.normal) + ", d: " + num::to_string(p.d) + "}";
}

} // namespace spatial_math
