#pragma once

/// @file gjk.hpp
/// @brief Boolean GJK (Gilbert-Johnson-Keerthi) overlap test
///
/// Works on any pair of convex shapes exposing `support(direction)`, the
/// farthest point of the shape along a direction.

#include "geometry.hpp"

#include <spatial/core/log.hpp>

#include <array>
#include <concepts>

namespace spatial_shapes {

/// Convex shape with a support mapping
template<typename S>
concept SupportMapped = requires(const S& shape, const Vector3<typename S::value_type>& dir) {
    { shape.support(dir) } -> std::convertible_to<Vector3<typename S::value_type>>;
};

namespace gjk {

/// Maximum GJK iterations
constexpr int k_max_iterations = 64;

// Search directions handed back by the simplex cases are dimensionless:
// unit length, or the sine of the angle between the origin and the
// simplex edge. The "origin on simplex" test therefore does not depend
// on how large the shapes are.

// =============================================================================
// Simplex
// =============================================================================

/// Support point with Minkowski difference tracking
template<Scalar T>
struct SupportPoint {
    Vector3<T> point;      ///< Point in Minkowski difference
    Vector3<T> support_a;  ///< Support point on shape A
    Vector3<T> support_b;  ///< Support point on shape B
};

/// GJK Simplex (1-4 vertices, newest first)
template<Scalar T>
class Simplex {
public:
    Simplex() = default;

    /// Add a point to the simplex
    void push_front(const SupportPoint<T>& point) {
        m_points[3] = m_points[2];
        m_points[2] = m_points[1];
        m_points[1] = m_points[0];
        m_points[0] = point;
        m_size = m_size < 4 ? m_size + 1 : 4;
    }

    [[nodiscard]] const SupportPoint<T>& operator[](int i) const { return m_points[i]; }

    [[nodiscard]] int size() const { return m_size; }

    void set_point(const SupportPoint<T>& a) {
        m_points[0] = a;
        m_size = 1;
    }

    void set_line(const SupportPoint<T>& a, const SupportPoint<T>& b) {
        m_points[0] = a;
        m_points[1] = b;
        m_size = 2;
    }

    void set_triangle(const SupportPoint<T>& a, const SupportPoint<T>& b, const SupportPoint<T>& c) {
        m_points[0] = a;
        m_points[1] = b;
        m_points[2] = c;
        m_size = 3;
    }

private:
    std::array<SupportPoint<T>, 4> m_points;
    int m_size = 0;
};

/// Result of a GJK run
template<Scalar T>
struct Result {
    bool intersecting = false;  ///< Shapes overlap (touching counts)
    Simplex<T> simplex;         ///< Final simplex
    Vector3<T> direction;       ///< Last search direction
    int iterations = 0;         ///< Iterations used
};

namespace detail {

template<Scalar T, typename A, typename B>
[[nodiscard]] SupportPoint<T> get_support(const A& shape_a, const B& shape_b, const Vector3<T>& direction) {
    SupportPoint<T> sp;
    sp.support_a = shape_a.support(direction);
    sp.support_b = shape_b.support(-direction);
    sp.point = sp.support_a - sp.support_b;
    return sp;
}

/// Line simplex
template<Scalar T>
[[nodiscard]] bool do_simplex_line(Simplex<T>& simplex, Vector3<T>& direction) {
    const SupportPoint<T> a = simplex[0];
    const SupportPoint<T> b = simplex[1];
    const Vector3<T> ab = b.point - a.point;
    const Vector3<T> ao = -a.point;

    if (spatial_math::dot(ab, ao) > spatial_math::num::zero<T>()) {
        // Origin is between a and b; length is the sine of the angle at a
        const Vector3<T> ab_n = spatial_shapes::detail::safe_normalize(ab);
        const Vector3<T> ao_n = spatial_shapes::detail::safe_normalize(ao);
        direction = spatial_math::cross(spatial_math::cross(ab_n, ao_n), ab_n);
    } else {
        // Origin is beyond a
        simplex.set_point(a);
        direction = spatial_shapes::detail::safe_normalize(ao);
    }
    return false;
}

/// Triangle simplex
template<Scalar T>
[[nodiscard]] bool do_simplex_triangle(Simplex<T>& simplex, Vector3<T>& direction) {
    const SupportPoint<T> a = simplex[0];
    const SupportPoint<T> b = simplex[1];
    const SupportPoint<T> c = simplex[2];

    const Vector3<T> ab = b.point - a.point;
    const Vector3<T> ac = c.point - a.point;
    const Vector3<T> ao = -a.point;
    const Vector3<T> abc = spatial_math::cross(ab, ac);
    const T zero = spatial_math::num::zero<T>();

    // Collinear points span no triangle: sine of the angle at a below epsilon
    const T eps = spatial_math::num::epsilon<T>();
    const T area_sq = abc.length_squared();
    if (!(area_sq > eps * eps * ab.length_squared() * ac.length_squared())) {
        simplex.set_line(a, b);
        return do_simplex_line(simplex, direction);
    }

    if (spatial_math::dot(spatial_math::cross(abc, ac), ao) > zero) {
        if (spatial_math::dot(ac, ao) > zero) {
            simplex.set_line(a, c);
            return do_simplex_line(simplex, direction);
        } else {
            simplex.set_line(a, b);
            return do_simplex_line(simplex, direction);
        }
    } else if (spatial_math::dot(spatial_math::cross(ab, abc), ao) > zero) {
        simplex.set_line(a, b);
        return do_simplex_line(simplex, direction);
    } else if (spatial_math::dot(abc, ao) > zero) {
        direction = abc / spatial_math::num::sqrt(area_sq);
    } else {
        simplex.set_triangle(a, c, b);
        direction = -abc / spatial_math::num::sqrt(area_sq);
    }
    return false;
}

/// Tetrahedron simplex
template<Scalar T>
[[nodiscard]] bool do_simplex_tetrahedron(Simplex<T>& simplex, Vector3<T>& direction) {
    const SupportPoint<T> a = simplex[0];
    const SupportPoint<T> b = simplex[1];
    const SupportPoint<T> c = simplex[2];
    const SupportPoint<T> d = simplex[3];

    const Vector3<T> ab = b.point - a.point;
    const Vector3<T> ac = c.point - a.point;
    const Vector3<T> ad = d.point - a.point;
    const Vector3<T> ao = -a.point;
    const T zero = spatial_math::num::zero<T>();

    if (spatial_math::dot(spatial_math::cross(ab, ac), ao) > zero) {
        simplex.set_triangle(a, b, c);
        return do_simplex_triangle(simplex, direction);
    }
    if (spatial_math::dot(spatial_math::cross(ac, ad), ao) > zero) {
        simplex.set_triangle(a, c, d);
        return do_simplex_triangle(simplex, direction);
    }
    if (spatial_math::dot(spatial_math::cross(ad, ab), ao) > zero) {
        simplex.set_triangle(a, d, b);
        return do_simplex_triangle(simplex, direction);
    }

    // Origin is inside tetrahedron
    return true;
}

/// Process simplex and update search direction; true if it encloses the origin
template<Scalar T>
[[nodiscard]] bool do_simplex(Simplex<T>& simplex, Vector3<T>& direction) {
    switch (simplex.size()) {
        case 2: return do_simplex_line(simplex, direction);
        case 3: return do_simplex_triangle(simplex, direction);
        case 4: return do_simplex_tetrahedron(simplex, direction);
        default: return false;
    }
}

} // namespace detail

// =============================================================================
// GJK Algorithm
// =============================================================================

/// Run GJK on the Minkowski difference A - B
template<Scalar T, typename A, typename B>
[[nodiscard]] Result<T> run(const A& shape_a, const B& shape_b) {
    Result<T> result;
    result.direction = spatial_shapes::detail::safe_normalize(shape_b.position() - shape_a.position());
    if (result.direction.is_zero()) {
        result.direction = Vector3<T>::UNIT_X();
    }

    SupportPoint<T> support = detail::get_support(shape_a, shape_b, result.direction);
    result.simplex.push_front(support);
    result.direction = spatial_shapes::detail::safe_normalize(-support.point);

    for (int i = 0; i < k_max_iterations; ++i) {
        result.iterations = i + 1;

        const T dir_len = result.direction.length();
        if (spatial_math::is_nearly_zero(dir_len)) {
            // Origin on simplex
            result.intersecting = true;
            return result;
        }
        result.direction = result.direction / dir_len;

        support = detail::get_support(shape_a, shape_b, result.direction);

        // Newest support point did not pass the origin
        if (spatial_math::dot(support.point, result.direction) < spatial_math::num::zero<T>()) {
            result.intersecting = false;
            return result;
        }

        result.simplex.push_front(support);

        if (detail::do_simplex(result.simplex, result.direction)) {
            result.intersecting = true;
            return result;
        }
    }

    spatial_core::shapes_logger()->debug("GJK did not converge after {} iterations", k_max_iterations);
    result.intersecting = false;
    return result;
}

/// True when two convex shapes overlap
template<typename A, typename B>
    requires SupportMapped<A> && SupportMapped<B>
[[nodiscard]] bool intersects(const A& shape_a, const B& shape_b) {
    return run<typename A::value_type>(shape_a, shape_b).intersecting;
}

} // namespace gjk

} // namespace spatial_shapes
