#pragma once

/// @file frustum.hpp
/// @brief Truncated rectangular pyramid (view frustum)

#include "shape_type.hpp"
#include "geometry.hpp"

#include <spatial/math/plane.hpp>

#include <array>
#include <cstddef>

namespace spatial_shapes {

/// View frustum with its apex at `position`
///
/// `axis` runs from the apex to the centre of the far plane and is turned
/// by `rotation`. At distance z from the apex the cross-section has half
/// height tan(field_of_view_angle) * z and half width aspect_ratio times
/// that. The solid lies between the near plane and the far plane.
template<Scalar T>
class Frustum {
public:
    using value_type = T;

    static constexpr ShapeType k_type = ShapeType::Frustum;
    static constexpr const char* k_name = "Frustum";

    Frustum()
        : Frustum(spatial_math::num::zero<T>(), Vector3<T>::ZERO(), spatial_math::num::zero<T>(),
                  spatial_math::num::zero<T>()) {}

    Frustum(const T& aspect_ratio, const Vector3<T>& axis, const T& field_of_view_angle,
            const T& near_plane_distance, const Vector3<T>& position = Vector3<T>::ZERO(),
            const Quaternion<T>& rotation = Quaternion<T>::IDENTITY())
        : m_aspect_ratio(aspect_ratio)
        , m_axis(axis)
        , m_field_of_view_angle(field_of_view_angle)
        , m_near_plane_distance(near_plane_distance)
        , m_position(position)
        , m_rotation(rotation) {
        namespace num = spatial_math::num;
        const T one = num::one<T>();
        const T two = num::two<T>();

        const T far_sq = m_axis.length_squared();
        m_far_plane_distance = num::sqrt(far_sq);
        const T near = m_near_plane_distance;
        const T far = m_far_plane_distance;

        const T tan = num::tan(m_field_of_view_angle);
        const T tan_sq4 = tan * tan * T(4);
        m_volume = tan_sq4 * m_aspect_ratio * (far_sq * far - near * near * near) / T(3);
        m_smallest_dimension = m_aspect_ratio <= one
            ? two * tan * m_aspect_ratio * near
            : two * tan * near;
        m_containing_radius = far * num::sqrt(one + tan * tan * (one + m_aspect_ratio * m_aspect_ratio));

        build_frame();

        const T near_half_h = tan * near;
        const T far_half_h = tan * far;
        const Vector3<T> near_center = m_position + m_forward * near;
        const Vector3<T> far_center = m_position + m_forward * far;
        const Vector3<T> near_x = m_right * (near_half_h * m_aspect_ratio);
        const Vector3<T> near_y = m_up * near_half_h;
        const Vector3<T> far_x = m_right * (far_half_h * m_aspect_ratio);
        const Vector3<T> far_y = m_up * far_half_h;
        m_corners = {
            near_center - near_x - near_y,
            near_center + near_x - near_y,
            near_center + near_x + near_y,
            near_center - near_x + near_y,
            far_center - far_x - far_y,
            far_center + far_x - far_y,
            far_center + far_x + far_y,
            far_center - far_x + far_y,
        };

        m_highest = m_corners[0];
        m_lowest = m_corners[0];
        for (std::size_t i = 1; i < m_corners.size(); ++i) {
            if (m_corners[i].y > m_highest.y) {
                m_highest = m_corners[i];
            }
            if (m_corners[i].y < m_lowest.y) {
                m_lowest = m_corners[i];
            }
        }

        m_degenerate = !(far - near > spatial_math::num::epsilon<T>() * far) || spatial_math::is_nearly_zero(tan)
            || spatial_math::is_nearly_zero(m_aspect_ratio);
        if (!m_degenerate) {
            build_planes((near_center + far_center) / two);
        }
    }

    [[nodiscard]] ShapeType type() const noexcept { return k_type; }

    [[nodiscard]] const T& aspect_ratio() const noexcept { return m_aspect_ratio; }
    [[nodiscard]] const Vector3<T>& axis() const noexcept { return m_axis; }
    [[nodiscard]] const T& field_of_view_angle() const noexcept { return m_field_of_view_angle; }
    [[nodiscard]] const T& near_plane_distance() const noexcept { return m_near_plane_distance; }
    [[nodiscard]] const T& far_plane_distance() const noexcept { return m_far_plane_distance; }
    /// Near face first (0-3), then the far face (4-7)
    [[nodiscard]] const std::array<Vector3<T>, 8>& corners() const noexcept { return m_corners; }
    /// Inward-facing planes: near, far, then the four sides
    [[nodiscard]] const std::array<spatial_math::Plane<T>, 6>& planes() const noexcept { return m_planes; }

    [[nodiscard]] const T& containing_radius() const noexcept { return m_containing_radius; }
    [[nodiscard]] const Vector3<T>& highest_point() const noexcept { return m_highest; }
    [[nodiscard]] const Vector3<T>& lowest_point() const noexcept { return m_lowest; }
    [[nodiscard]] const Vector3<T>& position() const noexcept { return m_position; }
    [[nodiscard]] const Quaternion<T>& rotation() const noexcept { return m_rotation; }
    [[nodiscard]] const T& volume() const noexcept { return m_volume; }
    [[nodiscard]] const T& smallest_dimension() const noexcept { return m_smallest_dimension; }

    /// On the inner side of all six planes; a flat frustum contains no points
    [[nodiscard]] bool is_point_within(const Vector3<T>& point) const {
        if (m_degenerate) {
            return false;
        }
        if (spatial_math::distance(point, m_position) > m_containing_radius) {
            return false;
        }
        for (const auto& plane : m_planes) {
            if (spatial_math::dot_coordinate(plane, point) < spatial_math::num::zero<T>()) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] Frustum with_position(const Vector3<T>& position) const {
        return Frustum(m_aspect_ratio, m_axis, m_field_of_view_angle, m_near_plane_distance, position, m_rotation);
    }

    [[nodiscard]] Frustum with_rotation(const Quaternion<T>& rotation) const {
        return Frustum(m_aspect_ratio, m_axis, m_field_of_view_angle, m_near_plane_distance, m_position, rotation);
    }

    [[nodiscard]] spatial_core::Result<Frustum> scale_by_dimension(const T& factor) const {
        if (factor < spatial_math::num::zero<T>()) {
            return detail::negative_factor_error(k_name, factor);
        }
        return Frustum(m_aspect_ratio, m_axis * factor, m_field_of_view_angle,
                       m_near_plane_distance * factor, m_position, m_rotation);
    }

    /// Angles and aspect are kept; both plane distances grow by the cube root
    [[nodiscard]] spatial_core::Result<Frustum> scale_volume(const T& factor) const {
        if (factor < spatial_math::num::zero<T>()) {
            return detail::negative_factor_error(k_name, factor);
        }
        const T k = spatial_math::num::cbrt(factor);
        return Frustum(m_aspect_ratio, m_axis * k, m_field_of_view_angle,
                       m_near_plane_distance * k, m_position, m_rotation);
    }

    [[nodiscard]] Vector3<T> support(const Vector3<T>& direction) const {
        std::size_t best = 0;
        T best_dot = spatial_math::dot(m_corners[0], direction);
        for (std::size_t i = 1; i < m_corners.size(); ++i) {
            const T d = spatial_math::dot(m_corners[i], direction);
            if (d > best_dot) {
                best_dot = d;
                best = i;
            }
        }
        return m_corners[best];
    }

    bool operator==(const Frustum& o) const {
        return m_aspect_ratio == o.m_aspect_ratio && m_axis == o.m_axis
            && m_field_of_view_angle == o.m_field_of_view_angle
            && m_near_plane_distance == o.m_near_plane_distance
            && m_position == o.m_position && m_rotation == o.m_rotation;
    }
    bool operator!=(const Frustum& o) const { return !(*this == o); }

private:
    /// Orthonormal forward/right/up frame from the rotated axis
    void build_frame() {
        m_forward = detail::safe_normalize(spatial_math::transform(m_axis, m_rotation));
        if (m_forward.is_zero()) {
            m_forward = spatial_math::transform(Vector3<T>::UNIT_Z(), m_rotation);
        }
        Vector3<T> up_hint = spatial_math::transform(Vector3<T>::UNIT_Y(), m_rotation);
        if (spatial_math::are_parallel(up_hint, m_forward)) {
            up_hint = spatial_math::transform(Vector3<T>::UNIT_Z(), m_rotation);
        }
        m_right = detail::safe_normalize(spatial_math::cross(up_hint, m_forward), spatial_math::num::one<T>());
        m_up = spatial_math::cross(m_forward, m_right);
    }

    /// Side planes use one near corner and two far corners so that a zero
    /// near distance (all near corners at the apex) still spans each face
    void build_planes(const Vector3<T>& inside) {
        using spatial_math::Plane;
        const auto oriented = [&inside](const Plane<T>& plane) {
            if (spatial_math::dot_coordinate(plane, inside) < spatial_math::num::zero<T>()) {
                return Plane<T>(-plane.normal, -plane.d);
            }
            return plane;
        };
        m_planes = {
            oriented(Plane<T>(m_forward, -spatial_math::dot(m_forward, m_corners[0]))),
            oriented(Plane<T>(-m_forward, spatial_math::dot(m_forward, m_corners[4]))),
            oriented(Plane<T>::create_from_vertices(m_corners[0], m_corners[4], m_corners[5])),
            oriented(Plane<T>::create_from_vertices(m_corners[1], m_corners[5], m_corners[6])),
            oriented(Plane<T>::create_from_vertices(m_corners[2], m_corners[6], m_corners[7])),
            oriented(Plane<T>::create_from_vertices(m_corners[3], m_corners[7], m_corners[4])),
        };
    }

    T m_aspect_ratio;
    Vector3<T> m_axis;
    T m_field_of_view_angle;
    T m_near_plane_distance;
    Vector3<T> m_position;
    Quaternion<T> m_rotation;

    T m_far_plane_distance;
    T m_volume;
    T m_smallest_dimension;
    T m_containing_radius;
    Vector3<T> m_forward;
    Vector3<T> m_right;
    Vector3<T> m_up;
    std::array<Vector3<T>, 8> m_corners;
    std::array<spatial_math::Plane<T>, 6> m_planes;
    Vector3<T> m_highest;
    Vector3<T> m_lowest;
    bool m_degenerate = false;
};

} // namespace spatial_shapes
