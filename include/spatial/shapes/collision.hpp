#pragma once

/// @file collision.hpp
/// @brief Pairwise intersection dispatch and swept collision
///
/// Every unordered pair of shape kinds has exactly one owner: the kind
/// with the lower dispatch rank. intersects(a, b) routes to the owner's
/// rule whichever way round the arguments are given, so the result is
/// symmetric. Pairs without a closed-form rule fall back to GJK when both
/// kinds are convex; a pair with neither does not compile.

#include "single_point.hpp"
#include "line.hpp"
#include "sphere.hpp"
#include "hollow_sphere.hpp"
#include "capsule.hpp"
#include "cuboid.hpp"
#include "cylinder.hpp"
#include "cone.hpp"
#include "ellipsoid.hpp"
#include "frustum.hpp"
#include "torus.hpp"
#include "gjk.hpp"

#include <spatial/math/matrix4x4.hpp>

#include <array>
#include <concepts>
#include <optional>
#include <type_traits>

namespace spatial_shapes {

/// One of the concrete shape kinds
template<typename S>
concept ShapeKind = requires(const S& shape) {
    typename S::value_type;
    { S::k_type } -> std::convertible_to<ShapeType>;
    { shape.position() } -> std::convertible_to<Vector3<typename S::value_type>>;
    { shape.containing_radius() } -> std::convertible_to<typename S::value_type>;
};

template<ShapeKind A, ShapeKind B>
    requires std::same_as<typename A::value_type, typename B::value_type>
[[nodiscard]] bool intersects(const A& a, const B& b);

namespace detail {

namespace num = spatial_math::num;

/// Lower rank owns the pair
[[nodiscard]] constexpr int dispatch_rank(ShapeType type) {
    switch (type) {
        case ShapeType::SinglePoint: return 0;
        case ShapeType::HollowSphere: return 1;
        case ShapeType::Torus: return 2;
        case ShapeType::Cylinder: return 3;
        case ShapeType::Line: return 4;
        case ShapeType::Sphere: return 5;
        case ShapeType::Capsule: return 6;
        case ShapeType::Cuboid: return 7;
        case ShapeType::Ellipsoid: return 8;
        case ShapeType::Cone: return 9;
        case ShapeType::Frustum: return 10;
        case ShapeType::None: break;
    }
    return 11;
}

template<typename>
inline constexpr bool k_no_rule = false;

/// Deterministic order for two shapes of the same kind
template<ShapeKind S>
[[nodiscard]] bool canonical_less(const S& a, const S& b) {
    if (a.position() != b.position()) {
        return vector_less(a.position(), b.position());
    }
    if (a.containing_radius() != b.containing_radius()) {
        return a.containing_radius() < b.containing_radius();
    }
    return a.volume() < b.volume();
}

/// Bounding spheres are disjoint
template<ShapeKind A, ShapeKind B>
[[nodiscard]] bool bounds_disjoint(const A& a, const B& b) {
    return spatial_math::distance(a.position(), b.position()) > a.containing_radius() + b.containing_radius();
}

// =============================================================================
// Fallback
// =============================================================================

template<ShapeKind A, ShapeKind B>
[[nodiscard]] bool intersect_owned(const A& a, const B& b) {
    if constexpr (SupportMapped<A> && SupportMapped<B>) {
        if (bounds_disjoint(a, b)) {
            return false;
        }
        return gjk::intersects(a, b);
    } else {
        static_assert(k_no_rule<A>, "no intersection rule for this shape pair");
        return false;
    }
}

// =============================================================================
// Point
// =============================================================================

template<Scalar T, ShapeKind B>
[[nodiscard]] bool intersect_owned(const SinglePoint<T>& point, const B& other) {
    return other.is_point_within(point.position());
}

template<Scalar T>
[[nodiscard]] bool intersect_owned(const SinglePoint<T>& a, const SinglePoint<T>& b) {
    return a.position() == b.position();
}

// =============================================================================
// Hollow sphere
// =============================================================================

/// The other shape is taken as its containing ball
template<Scalar T, ShapeKind B>
[[nodiscard]] bool intersect_owned(const HollowSphere<T>& shell, const B& other) {
    const T d = spatial_math::distance(shell.position(), other.position());
    const T r = other.containing_radius();
    return d - r <= shell.outer_radius() && d + r >= shell.inner_radius();
}

/// Reaches the outer ball without lying wholly inside the hole
template<Scalar T>
[[nodiscard]] bool intersect_owned(const HollowSphere<T>& shell, const Line<T>& line) {
    if (!segment_intersects_sphere(line.start(), line.end(), shell.position(), shell.outer_radius())) {
        return false;
    }
    return !(spatial_math::distance(line.start(), shell.position()) < shell.inner_radius()
        && spatial_math::distance(line.end(), shell.position()) < shell.inner_radius());
}

/// Shells overlap unless apart, or one sits entirely inside the other's hole
template<Scalar T>
[[nodiscard]] bool intersect_owned(const HollowSphere<T>& a, const HollowSphere<T>& b) {
    const T d = spatial_math::distance(a.position(), b.position());
    return d <= a.outer_radius() + b.outer_radius()
        && d + b.outer_radius() >= a.inner_radius()
        && d + a.outer_radius() >= b.inner_radius();
}

// =============================================================================
// Torus
// =============================================================================

/// Approximated by the cylinder enclosing the ring
template<Scalar T, ShapeKind B>
[[nodiscard]] bool intersect_owned(const Torus<T>& torus, const B& other) {
    if (bounds_disjoint(torus, other)) {
        return false;
    }
    const Cylinder<T> hull(torus.symmetry_axis() * (torus.minor_radius() * num::two<T>()),
                           torus.major_radius() + torus.minor_radius(), torus.position());
    return intersects(hull, other);
}

// =============================================================================
// Line
// =============================================================================

template<Scalar T>
[[nodiscard]] bool intersect_owned(const Line<T>& a, const Line<T>& b) {
    const T dist_sq = segment_segment_distance_squared(a.start(), a.end(), b.start(), b.end());
    return num::sqrt(dist_sq) <= num::epsilon<T>() * num::max(a.length(), b.length());
}

template<Scalar T>
[[nodiscard]] bool intersect_owned(const Line<T>& line, const Sphere<T>& sphere) {
    return segment_intersects_sphere(line.start(), line.end(), sphere.position(), sphere.radius());
}

template<Scalar T>
[[nodiscard]] bool intersect_owned(const Line<T>& line, const Capsule<T>& capsule) {
    if (bounds_disjoint(line, capsule)) {
        return false;
    }
    const T dist_sq = segment_segment_distance_squared(line.start(), line.end(), capsule.start(), capsule.end());
    return num::sqrt(dist_sq) <= capsule.radius();
}

/// Separating-axis test of a segment against an oriented box
template<Scalar T>
[[nodiscard]] bool intersect_owned(const Line<T>& line, const Cuboid<T>& cuboid) {
    if (bounds_disjoint(line, cuboid)) {
        return false;
    }
    const Vector3<T> c = cuboid.to_local(line.position());
    const Vector3<T> half = line.path() / num::two<T>();
    const auto& basis = cuboid.basis();
    const Vector3<T> w(spatial_math::dot(half, basis[0]), spatial_math::dot(half, basis[1]),
                       spatial_math::dot(half, basis[2]));
    const Vector3<T> aw = w.abs();
    const Vector3<T>& e = cuboid.half_extents();

    if (num::abs(c.x) > e.x + aw.x) return false;
    if (num::abs(c.y) > e.y + aw.y) return false;
    if (num::abs(c.z) > e.z + aw.z) return false;

    if (num::abs(c.y * w.z - c.z * w.y) > e.y * aw.z + e.z * aw.y) return false;
    if (num::abs(c.z * w.x - c.x * w.z) > e.x * aw.z + e.z * aw.x) return false;
    if (num::abs(c.x * w.y - c.y * w.x) > e.x * aw.y + e.y * aw.x) return false;
    return true;
}

/// Maps the segment into the space where the ellipsoid is the unit sphere
template<Scalar T>
[[nodiscard]] bool intersect_owned(const Line<T>& line, const Ellipsoid<T>& ellipsoid) {
    using spatial_math::Matrix4x4;
    if (bounds_disjoint(line, ellipsoid)) {
        return false;
    }
    const Matrix4x4<T> to_world = Matrix4x4<T>::create_scale(ellipsoid.axis_x(), ellipsoid.axis_y(), ellipsoid.axis_z())
        * Matrix4x4<T>::create_from_quaternion(ellipsoid.rotation())
        * Matrix4x4<T>::create_translation(ellipsoid.position());
    const auto [to_unit, invertible] = spatial_math::invert(to_world);
    if (!invertible) {
        return gjk::intersects(line, ellipsoid);
    }
    return segment_intersects_sphere(spatial_math::transform(line.start(), to_unit),
                                     spatial_math::transform(line.end(), to_unit),
                                     Vector3<T>::ZERO(), num::one<T>());
}

// =============================================================================
// Sphere
// =============================================================================

template<Scalar T>
[[nodiscard]] bool intersect_owned(const Sphere<T>& a, const Sphere<T>& b) {
    return spatial_math::distance(a.position(), b.position()) <= a.radius() + b.radius();
}

template<Scalar T>
[[nodiscard]] bool intersect_owned(const Sphere<T>& sphere, const Capsule<T>& capsule) {
    if (bounds_disjoint(sphere, capsule)) {
        return false;
    }
    return point_segment_distance(sphere.position(), capsule.start(), capsule.end())
        <= sphere.radius() + capsule.radius();
}

template<Scalar T>
[[nodiscard]] bool intersect_owned(const Sphere<T>& sphere, const Cuboid<T>& cuboid) {
    if (bounds_disjoint(sphere, cuboid)) {
        return false;
    }
    return spatial_math::distance(cuboid.closest_point(sphere.position()), sphere.position()) <= sphere.radius();
}

// =============================================================================
// Capsule
// =============================================================================

template<Scalar T>
[[nodiscard]] bool intersect_owned(const Capsule<T>& a, const Capsule<T>& b) {
    if (bounds_disjoint(a, b)) {
        return false;
    }
    const T dist_sq = segment_segment_distance_squared(a.start(), a.end(), b.start(), b.end());
    return num::sqrt(dist_sq) <= a.radius() + b.radius();
}

// =============================================================================
// Cuboid
// =============================================================================

/// Separating-axis test over the 15 candidate axes of two oriented boxes
template<Scalar T>
[[nodiscard]] bool intersect_owned(const Cuboid<T>& a, const Cuboid<T>& b) {
    if (bounds_disjoint(a, b)) {
        return false;
    }
    const auto& axes_a = a.basis();
    const auto& axes_b = b.basis();
    const std::array<T, 3> ea = {a.half_extents().x, a.half_extents().y, a.half_extents().z};
    const std::array<T, 3> eb = {b.half_extents().x, b.half_extents().y, b.half_extents().z};
    const T eps = num::epsilon<T>();

    std::array<std::array<T, 3>, 3> r;
    std::array<std::array<T, 3>, 3> abs_r;
    for (std::size_t i = 0; i < 3; ++i) {
        for (std::size_t j = 0; j < 3; ++j) {
            r[i][j] = spatial_math::dot(axes_a[i], axes_b[j]);
            // Epsilon guards the cross axes when edges are parallel
            abs_r[i][j] = num::abs(r[i][j]) + eps;
        }
    }

    const Vector3<T> d = b.position() - a.position();
    const std::array<T, 3> t = {spatial_math::dot(d, axes_a[0]), spatial_math::dot(d, axes_a[1]),
                                spatial_math::dot(d, axes_a[2])};

    for (std::size_t i = 0; i < 3; ++i) {
        const T rb = eb[0] * abs_r[i][0] + eb[1] * abs_r[i][1] + eb[2] * abs_r[i][2];
        if (num::abs(t[i]) > ea[i] + rb) return false;
    }
    for (std::size_t j = 0; j < 3; ++j) {
        const T ra = ea[0] * abs_r[0][j] + ea[1] * abs_r[1][j] + ea[2] * abs_r[2][j];
        if (num::abs(t[0] * r[0][j] + t[1] * r[1][j] + t[2] * r[2][j]) > ra + eb[j]) return false;
    }

    // A0 x B0..B2
    if (num::abs(t[2] * r[1][0] - t[1] * r[2][0]) > ea[1] * abs_r[2][0] + ea[2] * abs_r[1][0] + eb[1] * abs_r[0][2] + eb[2] * abs_r[0][1]) return false;
    if (num::abs(t[2] * r[1][1] - t[1] * r[2][1]) > ea[1] * abs_r[2][1] + ea[2] * abs_r[1][1] + eb[0] * abs_r[0][2] + eb[2] * abs_r[0][0]) return false;
    if (num::abs(t[2] * r[1][2] - t[1] * r[2][2]) > ea[1] * abs_r[2][2] + ea[2] * abs_r[1][2] + eb[0] * abs_r[0][1] + eb[1] * abs_r[0][0]) return false;
    // A1 x B0..B2
    if (num::abs(t[0] * r[2][0] - t[2] * r[0][0]) > ea[0] * abs_r[2][0] + ea[2] * abs_r[0][0] + eb[1] * abs_r[1][2] + eb[2] * abs_r[1][1]) return false;
    if (num::abs(t[0] * r[2][1] - t[2] * r[0][1]) > ea[0] * abs_r[2][1] + ea[2] * abs_r[0][1] + eb[0] * abs_r[1][2] + eb[2] * abs_r[1][0]) return false;
    if (num::abs(t[0] * r[2][2] - t[2] * r[0][2]) > ea[0] * abs_r[2][2] + ea[2] * abs_r[0][2] + eb[0] * abs_r[1][1] + eb[1] * abs_r[1][0]) return false;
    // A2 x B0..B2
    if (num::abs(t[1] * r[0][0] - t[0] * r[1][0]) > ea[0] * abs_r[1][0] + ea[1] * abs_r[0][0] + eb[1] * abs_r[2][2] + eb[2] * abs_r[2][1]) return false;
    if (num::abs(t[1] * r[0][1] - t[0] * r[1][1]) > ea[0] * abs_r[1][1] + ea[1] * abs_r[0][1] + eb[0] * abs_r[2][2] + eb[2] * abs_r[2][0]) return false;
    if (num::abs(t[1] * r[0][2] - t[0] * r[1][2]) > ea[0] * abs_r[1][2] + ea[1] * abs_r[0][2] + eb[0] * abs_r[2][1] + eb[1] * abs_r[2][0]) return false;

    return true;
}

// =============================================================================
// Swept Distances
// =============================================================================

/// First travel distance at which a sphere of `radius` moving from start
/// along unit `dir` touches a ball of `target_radius` around `center`
template<Scalar T>
[[nodiscard]] std::optional<T> sweep_sphere(const Vector3<T>& start, const Vector3<T>& dir, const T& max_distance,
                                            const T& radius, const Vector3<T>& center, const T& target_radius) {
    const T reach = radius + target_radius;
    const Vector3<T> m = start - center;
    const T c = m.length_squared() - reach * reach;
    if (c <= num::zero<T>()) {
        return num::zero<T>();
    }
    const T b = spatial_math::dot(m, dir);
    const T discriminant = b * b - c;
    if (discriminant < num::zero<T>()) {
        return std::nullopt;
    }
    const T s = -b - num::sqrt(discriminant);
    if (s < num::zero<T>() || s > max_distance) {
        return std::nullopt;
    }
    return s;
}

/// Swept sphere against the rounded segment [p0, p1]: the side of the
/// infinite cylinder within the segment, then either end cap
template<Scalar T>
[[nodiscard]] std::optional<T> sweep_segment(const Vector3<T>& start, const Vector3<T>& dir, const T& max_distance,
                                             const T& radius, const Vector3<T>& p0, const Vector3<T>& p1,
                                             const T& target_radius) {
    const T zero = num::zero<T>();
    const T reach = radius + target_radius;
    if (point_segment_distance(start, p0, p1) <= reach) {
        return zero;
    }

    std::optional<T> best = sweep_sphere(start, dir, max_distance, radius, p0, target_radius);
    const auto keep_earliest = [&best](const std::optional<T>& candidate) {
        if (candidate && (!best || *candidate < *best)) {
            best = candidate;
        }
    };
    keep_earliest(sweep_sphere(start, dir, max_distance, radius, p1, target_radius));

    const Vector3<T> e = p1 - p0;
    const T ee = e.length_squared();
    if (ee == zero) {
        return best;
    }
    const Vector3<T> m = start - p0;
    const Vector3<T> m_perp = m - e * (spatial_math::dot(m, e) / ee);
    const Vector3<T> d_perp = dir - e * (spatial_math::dot(dir, e) / ee);
    const T a = d_perp.length_squared();
    if (spatial_math::is_nearly_zero(a)) {
        // Moving parallel to the segment: only the caps can be hit
        return best;
    }
    const T b = spatial_math::dot(m_perp, d_perp);
    const T c = m_perp.length_squared() - reach * reach;
    const T discriminant = b * b - a * c;
    if (discriminant >= zero) {
        const T s = (-b - num::sqrt(discriminant)) / a;
        if (s >= zero && s <= max_distance) {
            const T t = spatial_math::dot(m + dir * s, e) / ee;
            if (t >= zero && t <= num::one<T>()) {
                keep_earliest(s);
            }
        }
    }
    return best;
}

/// Bisection iterations for the box sweep
constexpr int k_sweep_iterations = 96;

/// Swept sphere against an oriented box
///
/// The distance from the moving centre to the solid box is convex in the
/// travel distance, so a ternary search finds its minimum and a bisection
/// the first crossing before it.
template<Scalar T>
[[nodiscard]] std::optional<T> sweep_cuboid(const Vector3<T>& start, const Vector3<T>& dir, const T& max_distance,
                                            const T& radius, const Cuboid<T>& cuboid) {
    const T zero = num::zero<T>();
    const auto gap = [&](const T& s) {
        const Vector3<T> center = start + dir * s;
        return spatial_math::distance(cuboid.closest_point(center), center) - radius;
    };
    if (gap(zero) <= zero) {
        return zero;
    }
    if (max_distance == zero) {
        return std::nullopt;
    }

    const T three = T(3);
    T lo = zero;
    T hi = max_distance;
    for (int i = 0; i < k_sweep_iterations; ++i) {
        const T m1 = lo + (hi - lo) / three;
        const T m2 = hi - (hi - lo) / three;
        if (gap(m1) <= gap(m2)) {
            hi = m2;
        } else {
            lo = m1;
        }
    }
    T closest = (lo + hi) / num::two<T>();
    if (gap(closest) > zero) {
        return std::nullopt;
    }

    lo = zero;
    for (int i = 0; i < k_sweep_iterations; ++i) {
        const T mid = (lo + closest) / num::two<T>();
        if (gap(mid) <= zero) {
            closest = mid;
        } else {
            lo = mid;
        }
    }
    return closest;
}

/// Any other target is replaced by its containing ball
template<Scalar T, ShapeKind S>
[[nodiscard]] std::optional<T> sweep_distance(const Capsule<T>& sweep, const S& target) {
    return sweep_sphere(sweep.start(), safe_normalize(sweep.axis()), sweep.path_length(), sweep.radius(),
                        target.position(), target.containing_radius());
}

template<Scalar T>
[[nodiscard]] std::optional<T> sweep_distance(const Capsule<T>& sweep, const SinglePoint<T>& point) {
    return sweep_sphere(sweep.start(), safe_normalize(sweep.axis()), sweep.path_length(), sweep.radius(),
                        point.position(), num::zero<T>());
}

template<Scalar T>
[[nodiscard]] std::optional<T> sweep_distance(const Capsule<T>& sweep, const Sphere<T>& sphere) {
    return sweep_sphere(sweep.start(), safe_normalize(sweep.axis()), sweep.path_length(), sweep.radius(),
                        sphere.position(), sphere.radius());
}

template<Scalar T>
[[nodiscard]] std::optional<T> sweep_distance(const Capsule<T>& sweep, const Line<T>& line) {
    return sweep_segment(sweep.start(), safe_normalize(sweep.axis()), sweep.path_length(), sweep.radius(),
                         line.start(), line.end(), num::zero<T>());
}

template<Scalar T>
[[nodiscard]] std::optional<T> sweep_distance(const Capsule<T>& sweep, const Capsule<T>& capsule) {
    return sweep_segment(sweep.start(), safe_normalize(sweep.axis()), sweep.path_length(), sweep.radius(),
                         capsule.start(), capsule.end(), capsule.radius());
}

template<Scalar T>
[[nodiscard]] std::optional<T> sweep_distance(const Capsule<T>& sweep, const Cuboid<T>& cuboid) {
    return sweep_cuboid(sweep.start(), safe_normalize(sweep.axis()), sweep.path_length(), sweep.radius(), cuboid);
}

} // namespace detail

// =============================================================================
// Intersection
// =============================================================================

/// True when the two shapes share at least one point
///
/// Symmetric: intersects(a, b) == intersects(b, a) for every pair of kinds.
template<ShapeKind A, ShapeKind B>
    requires std::same_as<typename A::value_type, typename B::value_type>
bool intersects(const A& a, const B& b) {
    if constexpr (std::is_same_v<A, B>) {
        if (detail::canonical_less(b, a)) {
            return detail::intersect_owned(b, a);
        }
        return detail::intersect_owned(a, b);
    } else if constexpr (detail::dispatch_rank(A::k_type) < detail::dispatch_rank(B::k_type)) {
        return detail::intersect_owned(a, b);
    } else {
        return detail::intersect_owned(b, a);
    }
}

// =============================================================================
// Swept Collision
// =============================================================================

/// Treating `sweep` as a sphere travelling along its axis, the centre of
/// that sphere when it first touches `target`
template<Scalar T, ShapeKind S>
[[nodiscard]] std::optional<Vector3<T>> swept_collision_point(const Capsule<T>& sweep, const S& target) {
    const std::optional<T> distance = detail::sweep_distance(sweep, target);
    if (!distance) {
        return std::nullopt;
    }
    return sweep.start() + detail::safe_normalize(sweep.axis()) * *distance;
}

/// Where `moving` first touches `target` when translated along `path`
///
/// The moving shape is approximated by its containing ball, so the swept
/// volume is the capsule of that radius around the path. Shapes that are
/// not spheres can report a collision their real outline would miss.
template<typename M, typename S>
[[nodiscard]] auto collision_point(const M& moving, const Vector3<typename M::value_type>& path, const S& target)
    -> std::optional<Vector3<typename M::value_type>> {
    using T = typename M::value_type;
    const Capsule<T> sweep(path, moving.containing_radius(), moving.position() + path / spatial_math::num::two<T>());
    return swept_collision_point(sweep, target);
}

} // namespace spatial_shapes
