#pragma once

/// @file ellipsoid.hpp
/// @brief Oriented ellipsoid

#include "shape_type.hpp"
#include "geometry.hpp"

#include <spatial/math/constants.hpp>

namespace spatial_shapes {

/// Ellipsoid with semi-axes along its local X, Y and Z, rotated about its centre
template<Scalar T>
class Ellipsoid {
public:
    using value_type = T;

    static constexpr ShapeType k_type = ShapeType::Ellipsoid;
    static constexpr const char* k_name = "Ellipsoid";

    Ellipsoid()
        : Ellipsoid(spatial_math::num::zero<T>(), spatial_math::num::zero<T>(), spatial_math::num::zero<T>()) {}

    Ellipsoid(const T& axis_x, const T& axis_y, const T& axis_z,
              const Vector3<T>& position = Vector3<T>::ZERO(),
              const Quaternion<T>& rotation = Quaternion<T>::IDENTITY())
        : m_axis_x(axis_x)
        , m_axis_y(axis_y)
        , m_axis_z(axis_z)
        , m_position(position)
        , m_rotation(rotation) {
        namespace num = spatial_math::num;
        m_containing_radius = num::max(m_axis_x, num::max(m_axis_y, m_axis_z));
        m_smallest_dimension = num::min(m_axis_x, num::min(m_axis_y, m_axis_z));
        m_volume = spatial_math::consts::four_thirds_pi<T>() * m_axis_x * m_axis_y * m_axis_z;
        m_highest = support(Vector3<T>::UNIT_Y());
        m_lowest = support(-Vector3<T>::UNIT_Y());
    }

    [[nodiscard]] ShapeType type() const noexcept { return k_type; }

    [[nodiscard]] const T& axis_x() const noexcept { return m_axis_x; }
    [[nodiscard]] const T& axis_y() const noexcept { return m_axis_y; }
    [[nodiscard]] const T& axis_z() const noexcept { return m_axis_z; }

    [[nodiscard]] const T& containing_radius() const noexcept { return m_containing_radius; }
    [[nodiscard]] const Vector3<T>& highest_point() const noexcept { return m_highest; }
    [[nodiscard]] const Vector3<T>& lowest_point() const noexcept { return m_lowest; }
    [[nodiscard]] const Vector3<T>& position() const noexcept { return m_position; }
    [[nodiscard]] const Quaternion<T>& rotation() const noexcept { return m_rotation; }
    [[nodiscard]] const T& volume() const noexcept { return m_volume; }
    [[nodiscard]] const T& smallest_dimension() const noexcept { return m_smallest_dimension; }

    /// Sum of squared normalised local coordinates at most one
    ///
    /// A flattened ellipsoid (some semi-axis zero) only contains its centre.
    [[nodiscard]] bool is_point_within(const Vector3<T>& point) const {
        if (m_smallest_dimension == spatial_math::num::zero<T>()) {
            return point == m_position;
        }
        const Vector3<T> local = detail::to_local(point, m_position, m_rotation);
        const T nx = local.x / m_axis_x;
        const T ny = local.y / m_axis_y;
        const T nz = local.z / m_axis_z;
        return nx * nx + ny * ny + nz * nz <= spatial_math::num::one<T>();
    }

    [[nodiscard]] Ellipsoid with_position(const Vector3<T>& position) const {
        return Ellipsoid(m_axis_x, m_axis_y, m_axis_z, position, m_rotation);
    }

    [[nodiscard]] Ellipsoid with_rotation(const Quaternion<T>& rotation) const {
        return Ellipsoid(m_axis_x, m_axis_y, m_axis_z, m_position, rotation);
    }

    [[nodiscard]] spatial_core::Result<Ellipsoid> scale_by_dimension(const T& factor) const {
        if (factor < spatial_math::num::zero<T>()) {
            return detail::negative_factor_error(k_name, factor);
        }
        return Ellipsoid(m_axis_x * factor, m_axis_y * factor, m_axis_z * factor, m_position, m_rotation);
    }

    [[nodiscard]] spatial_core::Result<Ellipsoid> scale_volume(const T& factor) const {
        if (factor < spatial_math::num::zero<T>()) {
            return detail::negative_factor_error(k_name, factor);
        }
        const T k = spatial_math::num::cbrt(factor);
        return Ellipsoid(m_axis_x * k, m_axis_y * k, m_axis_z * k, m_position, m_rotation);
    }

    /// Surface point whose normal is `direction`
    ///
    /// In local space that point is (a^2 dx, b^2 dy, c^2 dz) / |(a dx, b dy, c dz)|.
    [[nodiscard]] Vector3<T> support(const Vector3<T>& direction) const {
        const Vector3<T> d = spatial_math::transform(direction, spatial_math::conjugate(m_rotation));
        const Vector3<T> scaled(m_axis_x * d.x, m_axis_y * d.y, m_axis_z * d.z);
        const T len = scaled.length();
        if (!(len > spatial_math::num::zero<T>())) {
            return m_position;
        }
        const Vector3<T> local(m_axis_x * scaled.x / len, m_axis_y * scaled.y / len, m_axis_z * scaled.z / len);
        return m_position + spatial_math::transform(local, m_rotation);
    }

    bool operator==(const Ellipsoid& o) const {
        return m_axis_x == o.m_axis_x && m_axis_y == o.m_axis_y && m_axis_z == o.m_axis_z
            && m_position == o.m_position && m_rotation == o.m_rotation;
    }
    bool operator!=(const Ellipsoid& o) const { return !(*this == o); }

private:
    T m_axis_x;
    T m_axis_y;
    T m_axis_z;
    Vector3<T> m_position;
    Quaternion<T> m_rotation;

    T m_containing_radius;
    T m_smallest_dimension;
    T m_volume;
    Vector3<T> m_highest;
    Vector3<T> m_lowest;
};

} // namespace spatial_shapes
