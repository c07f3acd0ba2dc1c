#pragma once

/// @file torus.hpp
/// @brief Ring torus

#include "shape_type.hpp"
#include "geometry.hpp"

#include <spatial/math/constants.hpp>

#include <stdexcept>

namespace spatial_shapes {

/// Torus whose ring lies in the local XZ plane around the local Y axis
template<Scalar T>
class Torus {
public:
    using value_type = T;

    static constexpr ShapeType k_type = ShapeType::Torus;
    static constexpr const char* k_name = "Torus";

    Torus()
        : Torus(spatial_math::num::zero<T>(), spatial_math::num::zero<T>()) {}

    /// @throws std::invalid_argument if major_radius < minor_radius
    Torus(const T& major_radius, const T& minor_radius,
          const Vector3<T>& position = Vector3<T>::ZERO(),
          const Quaternion<T>& rotation = Quaternion<T>::IDENTITY())
        : m_major_radius(major_radius)
        , m_minor_radius(minor_radius)
        , m_position(position)
        , m_rotation(rotation) {
        if (m_major_radius < m_minor_radius) {
            throw std::invalid_argument("Torus major radius cannot be smaller than its minor radius");
        }
        namespace num = spatial_math::num;
        m_containing_radius = m_major_radius + m_minor_radius;
        m_symmetry_axis = spatial_math::transform(Vector3<T>::UNIT_Y(), m_rotation);

        const Vector3<T> h = detail::upward_offset(m_symmetry_axis, m_major_radius);
        const Vector3<T> y = Vector3<T>::UNIT_Y() * m_minor_radius;
        m_highest = m_position + h + y;
        m_lowest = m_position - h - y;

        m_smallest_dimension = num::min(m_major_radius, m_minor_radius);
        m_volume = spatial_math::consts::two_pi_squared<T>() * m_major_radius * m_minor_radius * m_minor_radius;
    }

    /// Validating factory
    [[nodiscard]] static spatial_core::Result<Torus> create(
        const T& major_radius, const T& minor_radius,
        const Vector3<T>& position = Vector3<T>::ZERO(),
        const Quaternion<T>& rotation = Quaternion<T>::IDENTITY()) {
        if (major_radius < minor_radius) {
            return spatial_core::Error(spatial_core::ShapeError::invalid_dimensions(
                k_name, "major radius " + spatial_math::num::to_string(major_radius)
                    + " is smaller than minor radius " + spatial_math::num::to_string(minor_radius)));
        }
        return Torus(major_radius, minor_radius, position, rotation);
    }

    [[nodiscard]] ShapeType type() const noexcept { return k_type; }

    [[nodiscard]] const T& major_radius() const noexcept { return m_major_radius; }
    [[nodiscard]] const T& minor_radius() const noexcept { return m_minor_radius; }
    /// World direction of the axis the ring winds around
    [[nodiscard]] const Vector3<T>& symmetry_axis() const noexcept { return m_symmetry_axis; }

    [[nodiscard]] const T& containing_radius() const noexcept { return m_containing_radius; }
    [[nodiscard]] const Vector3<T>& highest_point() const noexcept { return m_highest; }
    [[nodiscard]] const Vector3<T>& lowest_point() const noexcept { return m_lowest; }
    [[nodiscard]] const Vector3<T>& position() const noexcept { return m_position; }
    [[nodiscard]] const Quaternion<T>& rotation() const noexcept { return m_rotation; }
    [[nodiscard]] const T& volume() const noexcept { return m_volume; }
    [[nodiscard]] const T& smallest_dimension() const noexcept { return m_smallest_dimension; }

    /// (sqrt(x^2 + z^2) - R)^2 + y^2 <= r^2 in local space
    [[nodiscard]] bool is_point_within(const Vector3<T>& point) const {
        namespace num = spatial_math::num;
        const Vector3<T> local = detail::to_local(point, m_position, m_rotation);
        const T ring = num::sqrt(local.x * local.x + local.z * local.z) - m_major_radius;
        return ring * ring + local.y * local.y <= m_minor_radius * m_minor_radius;
    }

    [[nodiscard]] Torus with_position(const Vector3<T>& position) const {
        return Torus(m_major_radius, m_minor_radius, position, m_rotation);
    }

    [[nodiscard]] Torus with_rotation(const Quaternion<T>& rotation) const {
        return Torus(m_major_radius, m_minor_radius, m_position, rotation);
    }

    [[nodiscard]] spatial_core::Result<Torus> scale_by_dimension(const T& factor) const {
        if (factor < spatial_math::num::zero<T>()) {
            return detail::negative_factor_error(k_name, factor);
        }
        return Torus(m_major_radius * factor, m_minor_radius * factor, m_position, m_rotation);
    }

    /// Fails when the scaled minor radius overtakes the major radius
    [[nodiscard]] spatial_core::Result<Torus> scale_volume(const T& factor) const {
        if (factor < spatial_math::num::zero<T>()) {
            return detail::negative_factor_error(k_name, factor);
        }
        return create(m_major_radius * spatial_math::num::sqrt(factor),
                      m_minor_radius * detail::fourth_root(factor), m_position, m_rotation);
    }

    bool operator==(const Torus& o) const {
        return m_major_radius == o.m_major_radius && m_minor_radius == o.m_minor_radius
            && m_position == o.m_position && m_rotation == o.m_rotation;
    }
    bool operator!=(const Torus& o) const { return !(*this == o); }

private:
    T m_major_radius;
    T m_minor_radius;
    Vector3<T> m_position;
    Quaternion<T> m_rotation;

    T m_containing_radius;
    Vector3<T> m_symmetry_axis;
    Vector3<T> m_highest;
    Vector3<T> m_lowest;
    T m_smallest_dimension;
    T m_volume;
};

} // namespace spatial_shapes
