#pragma once

/// @file cylinder.hpp
/// @brief Right circular cylinder

#include "shape_type.hpp"
#include "geometry.hpp"

#include <spatial/math/constants.hpp>

namespace spatial_shapes {

/// Cylinder of `radius` around the segment `axis` centred on `position`
template<Scalar T>
class Cylinder {
public:
    using value_type = T;

    static constexpr ShapeType k_type = ShapeType::Cylinder;
    static constexpr const char* k_name = "Cylinder";

    Cylinder() : Cylinder(Vector3<T>::ZERO(), spatial_math::num::zero<T>(), Vector3<T>::ZERO()) {}

    Cylinder(const Vector3<T>& axis, const T& radius, const Vector3<T>& position = Vector3<T>::ZERO())
        : m_axis(axis)
        , m_radius(radius)
        , m_position(position) {
        namespace num = spatial_math::num;
        const T two = num::two<T>();
        m_length = m_axis.length();
        const T half_height = m_length / two;
        m_containing_radius = num::sqrt(half_height * half_height + m_radius * m_radius);

        m_start = m_position - m_axis / two;
        m_end = m_start + m_axis;
        m_axis_normal = detail::safe_normalize(m_axis);

        const Vector3<T> h = detail::upward_offset(m_axis_normal, m_radius);
        if (m_end.y >= m_start.y) {
            m_highest = m_end + h;
            m_lowest = m_start - h;
        } else {
            m_highest = m_start + h;
            m_lowest = m_end - h;
        }

        m_smallest_dimension = num::min(m_length, m_radius * two);
        m_volume = spatial_math::consts::pi<T>() * m_radius * m_radius * m_length;
    }

    [[nodiscard]] ShapeType type() const noexcept { return k_type; }

    [[nodiscard]] const Vector3<T>& axis() const noexcept { return m_axis; }
    [[nodiscard]] const T& radius() const noexcept { return m_radius; }
    [[nodiscard]] const T& length() const noexcept { return m_length; }
    [[nodiscard]] const Vector3<T>& start() const noexcept { return m_start; }
    [[nodiscard]] const Vector3<T>& end() const noexcept { return m_end; }

    [[nodiscard]] const T& containing_radius() const noexcept { return m_containing_radius; }
    [[nodiscard]] const Vector3<T>& highest_point() const noexcept { return m_highest; }
    [[nodiscard]] const Vector3<T>& lowest_point() const noexcept { return m_lowest; }
    [[nodiscard]] const Vector3<T>& position() const noexcept { return m_position; }
    [[nodiscard]] Quaternion<T> rotation() const { return Quaternion<T>::IDENTITY(); }
    [[nodiscard]] const T& volume() const noexcept { return m_volume; }
    [[nodiscard]] const T& smallest_dimension() const noexcept { return m_smallest_dimension; }

    [[nodiscard]] bool is_point_within(const Vector3<T>& point) const {
        const Vector3<T> dp = point - m_start;
        const T length_sq = m_axis.length_squared();
        const T along = spatial_math::dot(dp, m_axis);
        if (along < spatial_math::num::zero<T>() || along > length_sq) {
            return false;
        }
        if (length_sq == spatial_math::num::zero<T>()) {
            return dp.length_squared() <= m_radius * m_radius;
        }
        const T radial_sq = spatial_math::dot(dp, dp) - along * along / length_sq;
        return radial_sq <= m_radius * m_radius;
    }

    [[nodiscard]] Cylinder with_position(const Vector3<T>& position) const {
        return Cylinder(m_axis, m_radius, position);
    }

    /// Rotates the axis about the cylinder centre
    [[nodiscard]] Cylinder with_rotation(const Quaternion<T>& rotation) const {
        return Cylinder(spatial_math::transform(m_axis, rotation), m_radius, m_position);
    }

    [[nodiscard]] spatial_core::Result<Cylinder> scale_by_dimension(const T& factor) const {
        if (factor < spatial_math::num::zero<T>()) {
            return detail::negative_factor_error(k_name, factor);
        }
        return Cylinder(m_axis * factor, m_radius * factor, m_position);
    }

    [[nodiscard]] spatial_core::Result<Cylinder> scale_volume(const T& factor) const {
        if (factor < spatial_math::num::zero<T>()) {
            return detail::negative_factor_error(k_name, factor);
        }
        return Cylinder(m_axis * spatial_math::num::sqrt(factor),
                        m_radius * detail::fourth_root(factor), m_position);
    }

    /// Farthest cap centre plus the rim offset perpendicular to the axis
    [[nodiscard]] Vector3<T> support(const Vector3<T>& direction) const {
        const Vector3<T>& cap = spatial_math::dot(m_end, direction) >= spatial_math::dot(m_start, direction)
            ? m_end : m_start;
        const Vector3<T> radial = direction - m_axis_normal * spatial_math::dot(direction, m_axis_normal);
        return cap + detail::safe_normalize(radial, direction.length()) * m_radius;
    }

    bool operator==(const Cylinder& o) const {
        return m_axis == o.m_axis && m_radius == o.m_radius && m_position == o.m_position;
    }
    bool operator!=(const Cylinder& o) const { return !(*this == o); }

private:
    Vector3<T> m_axis;
    T m_radius;
    Vector3<T> m_position;

    T m_length;
    T m_containing_radius;
    Vector3<T> m_start;
    Vector3<T> m_end;
    Vector3<T> m_axis_normal;
    Vector3<T> m_highest;
    Vector3<T> m_lowest;
    T m_smallest_dimension;
    T m_volume;
};

} // namespace spatial_shapes
