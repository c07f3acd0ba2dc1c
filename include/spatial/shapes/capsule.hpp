#pragma once

/// @file capsule.hpp
/// @brief Capsule (swept sphere along a segment)

#include "shape_type.hpp"
#include "geometry.hpp"

#include <spatial/math/constants.hpp>

namespace spatial_shapes {

/// All points within `radius` of the segment `axis` centred on `position`
///
/// Also models the volume swept by a sphere of `radius` moving along
/// `axis`, which is how swept collision queries use it.
template<Scalar T>
class Capsule {
public:
    using value_type = T;

    static constexpr ShapeType k_type = ShapeType::Capsule;
    static constexpr const char* k_name = "Capsule";

    Capsule() : Capsule(Vector3<T>::ZERO(), spatial_math::num::zero<T>(), Vector3<T>::ZERO()) {}

    Capsule(const Vector3<T>& axis, const T& radius, const Vector3<T>& position = Vector3<T>::ZERO())
        : m_axis(axis)
        , m_radius(radius)
        , m_position(position) {
        namespace num = spatial_math::num;
        const T two = num::two<T>();
        m_path_length = m_axis.length();
        m_length = m_path_length + m_radius * two;
        m_containing_radius = m_path_length / two + m_radius;

        m_start = m_position - m_axis / two;
        m_end = m_start + m_axis;

        const Vector3<T> y = Vector3<T>::UNIT_Y() * m_radius;
        if (m_end.y >= m_start.y) {
            m_highest = m_end + y;
            m_lowest = m_start - y;
        } else {
            m_highest = m_start + y;
            m_lowest = m_end - y;
        }

        m_smallest_dimension = num::min(m_length, m_radius * two);
        m_volume = spatial_math::consts::pi<T>() * m_radius * m_radius * m_path_length
            + spatial_math::consts::four_thirds_pi<T>() * m_radius * m_radius * m_radius;
    }

    [[nodiscard]] ShapeType type() const noexcept { return k_type; }

    [[nodiscard]] const Vector3<T>& axis() const noexcept { return m_axis; }
    [[nodiscard]] const T& radius() const noexcept { return m_radius; }
    /// Overall length including both caps
    [[nodiscard]] const T& length() const noexcept { return m_length; }
    [[nodiscard]] const T& path_length() const noexcept { return m_path_length; }
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
        return detail::point_segment_distance(point, m_start, m_end) <= m_radius;
    }

    [[nodiscard]] Capsule with_position(const Vector3<T>& position) const {
        return Capsule(m_axis, m_radius, position);
    }

    /// Rotates the axis about the capsule centre
    [[nodiscard]] Capsule with_rotation(const Quaternion<T>& rotation) const {
        return Capsule(spatial_math::transform(m_axis, rotation), m_radius, m_position);
    }

    [[nodiscard]] spatial_core::Result<Capsule> scale_by_dimension(const T& factor) const {
        if (factor < spatial_math::num::zero<T>()) {
            return detail::negative_factor_error(k_name, factor);
        }
        return Capsule(m_axis * factor, m_radius * factor, m_position);
    }

    [[nodiscard]] spatial_core::Result<Capsule> scale_volume(const T& factor) const {
        if (factor < spatial_math::num::zero<T>()) {
            return detail::negative_factor_error(k_name, factor);
        }
        return Capsule(m_axis * spatial_math::num::sqrt(factor),
                       m_radius * detail::fourth_root(factor), m_position);
    }

    [[nodiscard]] Vector3<T> support(const Vector3<T>& direction) const {
        const Vector3<T>& tip = spatial_math::dot(m_end, direction) >= spatial_math::dot(m_start, direction)
            ? m_end : m_start;
        return tip + detail::safe_normalize(direction) * m_radius;
    }

    bool operator==(const Capsule& o) const {
        return m_axis == o.m_axis && m_radius == o.m_radius && m_position == o.m_position;
    }
    bool operator!=(const Capsule& o) const { return !(*this == o); }

private:
    Vector3<T> m_axis;
    T m_radius;
    Vector3<T> m_position;

    T m_path_length;
    T m_length;
    T m_containing_radius;
    Vector3<T> m_start;
    Vector3<T> m_end;
    Vector3<T> m_highest;
    Vector3<T> m_lowest;
    T m_smallest_dimension;
    T m_volume;
};

} // namespace spatial_shapes
