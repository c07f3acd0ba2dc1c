#pragma once

/// @file cone.hpp
/// @brief Right circular cone

#include "shape_type.hpp"
#include "geometry.hpp"

#include <spatial/math/constants.hpp>

namespace spatial_shapes {

/// Cone with its apex at the start of `axis` and its base disc at the end
///
/// `position` is the midpoint of the axis.
template<Scalar T>
class Cone {
public:
    using value_type = T;

    static constexpr ShapeType k_type = ShapeType::Cone;
    static constexpr const char* k_name = "Cone";

    Cone() : Cone(Vector3<T>::ZERO(), spatial_math::num::zero<T>(), Vector3<T>::ZERO()) {}

    Cone(const Vector3<T>& axis, const T& radius, const Vector3<T>& position = Vector3<T>::ZERO())
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
        const Vector3<T> base_top = m_end + h;
        const Vector3<T> base_bottom = m_end - h;
        m_highest = base_top.y >= m_start.y ? base_top : m_start;
        m_lowest = base_bottom.y < m_start.y ? base_bottom : m_start;

        m_smallest_dimension = num::min(m_length, m_radius * two);
        m_volume = spatial_math::consts::pi<T>() * m_radius * m_radius * m_length / T(3);
    }

    /// Cone from its apex, the apex-to-base vector and the full opening angle
    [[nodiscard]] static Cone from_apex(const Vector3<T>& origin, const Vector3<T>& orientation, const T& angle) {
        namespace num = spatial_math::num;
        const T length = orientation.length();
        const T radius = num::tan(angle / num::two<T>()) * length;
        return Cone(orientation, radius, origin + orientation / num::two<T>());
    }

    [[nodiscard]] ShapeType type() const noexcept { return k_type; }

    [[nodiscard]] const Vector3<T>& axis() const noexcept { return m_axis; }
    [[nodiscard]] const T& radius() const noexcept { return m_radius; }
    [[nodiscard]] const T& length() const noexcept { return m_length; }
    [[nodiscard]] const Vector3<T>& apex() const noexcept { return m_start; }
    [[nodiscard]] const Vector3<T>& base_center() const noexcept { return m_end; }

    [[nodiscard]] const T& containing_radius() const noexcept { return m_containing_radius; }
    [[nodiscard]] const Vector3<T>& highest_point() const noexcept { return m_highest; }
    [[nodiscard]] const Vector3<T>& lowest_point() const noexcept { return m_lowest; }
    [[nodiscard]] const Vector3<T>& position() const noexcept { return m_position; }
    [[nodiscard]] Quaternion<T> rotation() const { return Quaternion<T>::IDENTITY(); }
    [[nodiscard]] const T& volume() const noexcept { return m_volume; }
    [[nodiscard]] const T& smallest_dimension() const noexcept { return m_smallest_dimension; }

    /// Inside when the radial distance is within the radius at that height
    [[nodiscard]] bool is_point_within(const Vector3<T>& point) const {
        const Vector3<T> dp = point - m_start;
        const T along = spatial_math::dot(dp, m_axis_normal);
        const T radial_sq = dp.length_squared() - along * along;
        if (m_length == spatial_math::num::zero<T>()) {
            return along == spatial_math::num::zero<T>() && radial_sq <= m_radius * m_radius;
        }
        if (along < spatial_math::num::zero<T>() || along > m_length) {
            return false;
        }
        const T allowed = m_radius * along / m_length;
        return radial_sq <= allowed * allowed;
    }

    [[nodiscard]] Cone with_position(const Vector3<T>& position) const {
        return Cone(m_axis, m_radius, position);
    }

    /// Rotates the axis about the cone's midpoint
    [[nodiscard]] Cone with_rotation(const Quaternion<T>& rotation) const {
        return Cone(spatial_math::transform(m_axis, rotation), m_radius, m_position);
    }

    [[nodiscard]] spatial_core::Result<Cone> scale_by_dimension(const T& factor) const {
        if (factor < spatial_math::num::zero<T>()) {
            return detail::negative_factor_error(k_name, factor);
        }
        return Cone(m_axis * factor, m_radius * factor, m_position);
    }

    [[nodiscard]] spatial_core::Result<Cone> scale_volume(const T& factor) const {
        if (factor < spatial_math::num::zero<T>()) {
            return detail::negative_factor_error(k_name, factor);
        }
        return Cone(m_axis * spatial_math::num::sqrt(factor),
                    m_radius * detail::fourth_root(factor), m_position);
    }

    /// Apex or the farthest point of the base rim
    [[nodiscard]] Vector3<T> support(const Vector3<T>& direction) const {
        const Vector3<T> radial = direction - m_axis_normal * spatial_math::dot(direction, m_axis_normal);
        const Vector3<T> rim = m_end + detail::safe_normalize(radial, direction.length()) * m_radius;
        return spatial_math::dot(rim, direction) >= spatial_math::dot(m_start, direction) ? rim : m_start;
    }

    bool operator==(const Cone& o) const {
        return m_axis == o.m_axis && m_radius == o.m_radius && m_position == o.m_position;
    }
    bool operator!=(const Cone& o) const { return !(*this == o); }

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
