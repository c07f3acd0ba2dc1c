#pragma once

/// @file geometry.hpp
/// @brief Closest-point queries and helpers shared by the shape kinds

#include "fwd.hpp"

#include <spatial/math/quaternion.hpp>
#include <spatial/core/error.hpp>
#include <spatial/core/log.hpp>

#include <string>

namespace spatial_shapes {

using spatial_math::Quaternion;
using spatial_math::Vector3;

namespace detail {

namespace num = spatial_math::num;

// =============================================================================
// Scaling
// =============================================================================

/// Error for a negative scale factor, logged on the shapes logger
template<Scalar T>
[[nodiscard]] spatial_core::Error negative_factor_error(const char* shape_name, const T& factor) {
    spatial_core::Error error(spatial_core::ShapeError::negative_factor(shape_name, num::to_string(factor)));
    spatial_core::shapes_logger()->warn("Rejected scale: {}", spatial_core::error_report(error));
    return error;
}

/// Square root of the square root
template<Scalar T>
[[nodiscard]] inline T fourth_root(const T& v) {
    return num::sqrt(num::sqrt(v));
}

// =============================================================================
// Frames
// =============================================================================

/// Unit-length direction of v, or zero when v has no length
template<Scalar T>
[[nodiscard]] inline Vector3<T> safe_normalize(const Vector3<T>& v) {
    const T len = v.length();
    if (!(len > num::zero<T>())) {
        return Vector3<T>::ZERO();
    }
    return v / len;
}

/// Unit-length direction of v, or zero when v is negligible next to `reference`
///
/// For a v left over from cancelling terms of magnitude `reference`.
template<Scalar T>
[[nodiscard]] inline Vector3<T> safe_normalize(const Vector3<T>& v, const T& reference) {
    const T len = v.length();
    if (!(len > num::epsilon<T>() * reference)) {
        return Vector3<T>::ZERO();
    }
    return v / len;
}

/// Offset of length `radius` from an axis toward world up
///
/// Zero when the axis is vertical; the highest rim point of a disc
/// perpendicular to the axis is then the disc centre itself.
template<Scalar T>
[[nodiscard]] inline Vector3<T> upward_offset(const Vector3<T>& axis_normal, const T& radius) {
    const Vector3<T> up = Vector3<T>::UNIT_Y();
    const Vector3<T> perpendicular = up - axis_normal * spatial_math::dot(up, axis_normal);
    return safe_normalize(perpendicular, num::one<T>()) * radius;
}

/// World point expressed in a frame at `position` rotated by `rotation`
template<Scalar T>
[[nodiscard]] inline Vector3<T> to_local(const Vector3<T>& point, const Vector3<T>& position,
                                         const Quaternion<T>& rotation) {
    return spatial_math::transform(point - position, spatial_math::conjugate(rotation));
}

/// Strict lexicographic order on components
template<Scalar T>
[[nodiscard]] inline bool vector_less(const Vector3<T>& a, const Vector3<T>& b) {
    if (a.x != b.x) return a.x < b.x;
    if (a.y != b.y) return a.y < b.y;
    return a.z < b.z;
}

// =============================================================================
// Segments
// =============================================================================

/// Closest point to p on segment [a, b]
template<Scalar T>
[[nodiscard]] Vector3<T> closest_point_on_segment(const Vector3<T>& p, const Vector3<T>& a,
                                                  const Vector3<T>& b) {
    const Vector3<T> ab = b - a;
    const T len_sq = ab.length_squared();
    if (len_sq == num::zero<T>()) {
        return a;
    }
    const T t = num::clamp(spatial_math::dot(p - a, ab) / len_sq, num::zero<T>(), num::one<T>());
    return a + ab * t;
}

/// Distance from p to segment [a, b]
template<Scalar T>
[[nodiscard]] inline T point_segment_distance(const Vector3<T>& p, const Vector3<T>& a,
                                              const Vector3<T>& b) {
    return spatial_math::distance(p, closest_point_on_segment(p, a, b));
}

/// Squared distance between segments [p1, q1] and [p2, q2]
///
/// Clamped closest-point solution; degenerate segments reduce to points.
template<Scalar T>
[[nodiscard]] T segment_segment_distance_squared(const Vector3<T>& p1, const Vector3<T>& q1,
                                                 const Vector3<T>& p2, const Vector3<T>& q2) {
    const T zero = num::zero<T>();
    const T one = num::one<T>();
    const Vector3<T> d1 = q1 - p1;
    const Vector3<T> d2 = q2 - p2;
    const Vector3<T> r = p1 - p2;
    const T a = d1.length_squared();
    const T e = d2.length_squared();
    const T f = spatial_math::dot(d2, r);

    T s = zero;
    T t = zero;
    if (a == zero && e == zero) {
        return r.length_squared();
    }
    if (a == zero) {
        t = num::clamp(f / e, zero, one);
    } else {
        const T c = spatial_math::dot(d1, r);
        if (e == zero) {
            s = num::clamp(-c / a, zero, one);
        } else {
            const T b = spatial_math::dot(d1, d2);
            const T denom = a * e - b * b;
            // Parallel segments (sine of the angle below epsilon): any s works, start from p1
            const T eps = num::epsilon<T>();
            s = denom <= eps * eps * a * e ? zero : num::clamp((b * f - c * e) / denom, zero, one);
            t = (b * s + f) / e;
            if (t < zero) {
                t = zero;
                s = num::clamp(-c / a, zero, one);
            } else if (t > one) {
                t = one;
                s = num::clamp((b - c) / a, zero, one);
            }
        }
    }
    const Vector3<T> c1 = p1 + d1 * s;
    const Vector3<T> c2 = p2 + d2 * t;
    return (c1 - c2).length_squared();
}

/// Segment [start, end] against a sphere
///
/// Works on the segment centre and half length: with diff = centre - sphere
/// centre, the quadratic in the parameter along the unit direction has
/// a0 = |diff|^2 - r^2 and a1 = dir . diff, and the discriminant a1^2 - a0
/// decides whether the infinite line reaches the sphere at all. The ball is
/// solid, so a segment lying entirely inside it intersects.
template<Scalar T>
[[nodiscard]] bool segment_intersects_sphere(const Vector3<T>& start, const Vector3<T>& end,
                                             const Vector3<T>& center, const T& radius) {
    const Vector3<T> path = end - start;
    const T length = path.length();
    const Vector3<T> mid = start + path / num::two<T>();
    if (length == num::zero<T>()) {
        return spatial_math::distance(mid, center) <= radius;
    }
    const Vector3<T> dir = path / length;
    const Vector3<T> diff = mid - center;
    const T a0 = spatial_math::dot(diff, diff) - radius * radius;
    const T a1 = spatial_math::dot(dir, diff);
    const T discriminant = a1 * a1 - a0;
    if (discriminant < num::zero<T>()) {
        return false;
    }

    const T extent = length / num::two<T>();
    const T tmp0 = extent * extent + a0;
    const T tmp1 = num::two<T>() * a1 * extent;
    const T qm = tmp0 - tmp1;
    const T qp = tmp0 + tmp1;
    if (qm * qp <= num::zero<T>()) {
        return true;
    }
    // Both endpoints inside the ball
    if (qm < num::zero<T>()) {
        return true;
    }
    return qm > num::zero<T>() && num::abs(a1) < extent;
}

} // namespace detail

} // namespace spatial_shapes
