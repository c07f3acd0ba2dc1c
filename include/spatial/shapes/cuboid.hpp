#pragma once

/// @file cuboid.hpp
/// @brief Oriented rectangular box

#include "shape_type.hpp"
#include "geometry.hpp"

#include <array>
#include <cstddef>

namespace spatial_shapes {

/// Box with full edge lengths along its local axes, rotated about its centre
template<Scalar T>
class Cuboid {
public:
    using value_type = T;

    static constexpr ShapeType k_type = ShapeType::Cuboid;
    static constexpr const char* k_name = "Cuboid";

    Cuboid()
        : Cuboid(spatial_math::num::zero<T>(), spatial_math::num::zero<T>(), spatial_math::num::zero<T>()) {}

    Cuboid(const T& axis_x, const T& axis_y, const T& axis_z,
           const Vector3<T>& position = Vector3<T>::ZERO(),
           const Quaternion<T>& rotation = Quaternion<T>::IDENTITY())
        : m_axis_x(axis_x)
        , m_axis_y(axis_y)
        , m_axis_z(axis_z)
        , m_position(position)
        , m_rotation(rotation) {
        namespace num = spatial_math::num;
        const T two = num::two<T>();
        m_containing_radius = num::sqrt(m_axis_x * m_axis_x + m_axis_y * m_axis_y + m_axis_z * m_axis_z) / two;
        m_smallest_dimension = num::min(m_axis_x, num::min(m_axis_y, m_axis_z));
        m_volume = m_axis_x * m_axis_y * m_axis_z;

        m_half_extents = Vector3<T>(m_axis_x / two, m_axis_y / two, m_axis_z / two);
        m_basis = {
            spatial_math::transform(Vector3<T>::UNIT_X(), m_rotation),
            spatial_math::transform(Vector3<T>::UNIT_Y(), m_rotation),
            spatial_math::transform(Vector3<T>::UNIT_Z(), m_rotation),
        };

        const Vector3<T> x = m_basis[0] * m_half_extents.x;
        const Vector3<T> y = m_basis[1] * m_half_extents.y;
        const Vector3<T> z = m_basis[2] * m_half_extents.z;
        m_corners = {
            m_position + x + y + z,
            m_position + x - y + z,
            m_position + x - y - z,
            m_position + x + y - z,
            m_position - x + y - z,
            m_position - x - y - z,
            m_position - x - y + z,
            m_position - x + y + z,
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
    }

    [[nodiscard]] ShapeType type() const noexcept { return k_type; }

    [[nodiscard]] const T& axis_x() const noexcept { return m_axis_x; }
    [[nodiscard]] const T& axis_y() const noexcept { return m_axis_y; }
    [[nodiscard]] const T& axis_z() const noexcept { return m_axis_z; }
    [[nodiscard]] const Vector3<T>& half_extents() const noexcept { return m_half_extents; }
    /// World directions of the local X, Y and Z axes
    [[nodiscard]] const std::array<Vector3<T>, 3>& basis() const noexcept { return m_basis; }
    [[nodiscard]] const std::array<Vector3<T>, 8>& corners() const noexcept { return m_corners; }

    [[nodiscard]] const T& containing_radius() const noexcept { return m_containing_radius; }
    [[nodiscard]] const Vector3<T>& highest_point() const noexcept { return m_highest; }
    [[nodiscard]] const Vector3<T>& lowest_point() const noexcept { return m_lowest; }
    [[nodiscard]] const Vector3<T>& position() const noexcept { return m_position; }
    [[nodiscard]] const Quaternion<T>& rotation() const noexcept { return m_rotation; }
    [[nodiscard]] const T& volume() const noexcept { return m_volume; }
    [[nodiscard]] const T& smallest_dimension() const noexcept { return m_smallest_dimension; }

    /// Point in box space, centred on the box
    [[nodiscard]] Vector3<T> to_local(const Vector3<T>& point) const {
        const Vector3<T> d = point - m_position;
        return Vector3<T>(spatial_math::dot(d, m_basis[0]),
                          spatial_math::dot(d, m_basis[1]),
                          spatial_math::dot(d, m_basis[2]));
    }

    /// Closest point of the solid box to point
    [[nodiscard]] Vector3<T> closest_point(const Vector3<T>& point) const {
        const Vector3<T> local = spatial_math::clamp(to_local(point), -m_half_extents, m_half_extents);
        return m_position + m_basis[0] * local.x + m_basis[1] * local.y + m_basis[2] * local.z;
    }

    [[nodiscard]] bool is_point_within(const Vector3<T>& point) const {
        namespace num = spatial_math::num;
        const Vector3<T> local = to_local(point);
        return num::abs(local.x) <= m_half_extents.x
            && num::abs(local.y) <= m_half_extents.y
            && num::abs(local.z) <= m_half_extents.z;
    }

    [[nodiscard]] Cuboid with_position(const Vector3<T>& position) const {
        return Cuboid(m_axis_x, m_axis_y, m_axis_z, position, m_rotation);
    }

    [[nodiscard]] Cuboid with_rotation(const Quaternion<T>& rotation) const {
        return Cuboid(m_axis_x, m_axis_y, m_axis_z, m_position, rotation);
    }

    [[nodiscard]] spatial_core::Result<Cuboid> scale_by_dimension(const T& factor) const {
        if (factor < spatial_math::num::zero<T>()) {
            return detail::negative_factor_error(k_name, factor);
        }
        return Cuboid(m_axis_x * factor, m_axis_y * factor, m_axis_z * factor, m_position, m_rotation);
    }

    [[nodiscard]] spatial_core::Result<Cuboid> scale_volume(const T& factor) const {
        if (factor < spatial_math::num::zero<T>()) {
            return detail::negative_factor_error(k_name, factor);
        }
        const T k = spatial_math::num::cbrt(factor);
        return Cuboid(m_axis_x * k, m_axis_y * k, m_axis_z * k, m_position, m_rotation);
    }

    [[nodiscard]] Vector3<T> support(const Vector3<T>& direction) const {
        Vector3<T> result = m_position;
        for (std::size_t i = 0; i < 3; ++i) {
            const T extent = i == 0 ? m_half_extents.x : (i == 1 ? m_half_extents.y : m_half_extents.z);
            const Vector3<T> offset = m_basis[i] * extent;
            result += spatial_math::dot(direction, m_basis[i]) >= spatial_math::num::zero<T>() ? offset : -offset;
        }
        return result;
    }

    bool operator==(const Cuboid& o) const {
        return m_axis_x == o.m_axis_x && m_axis_y == o.m_axis_y && m_axis_z == o.m_axis_z
            && m_position == o.m_position && m_rotation == o.m_rotation;
    }
    bool operator!=(const Cuboid& o) const { return !(*this == o); }

private:
    T m_axis_x;
    T m_axis_y;
    T m_axis_z;
    Vector3<T> m_position;
    Quaternion<T> m_rotation;

    T m_containing_radius;
    T m_smallest_dimension;
    T m_volume;
    Vector3<T> m_half_extents;
    std::array<Vector3<T>, 3> m_basis;
    std::array<Vector3<T>, 8> m_corners;
    Vector3<T> m_highest;
    Vector3<T> m_lowest;
};

} // namespace spatial_shapes
