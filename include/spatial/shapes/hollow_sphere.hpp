#pragma once

/// @file hollow_sphere.hpp
/// @brief Spherical shell between an inner and an outer radius

#include "shape_type.hpp"
#include "geometry.hpp"

#include <spatial/math/constants.hpp>

namespace spatial_shapes {

/// Spherical shell; points closer than the inner radius are outside
template<Scalar T>
class HollowSphere {
public:
    using value_type = T;

    static constexpr ShapeType k_type = ShapeType::HollowSphere;
    static constexpr const char* k_name = "HollowSphere";

    HollowSphere()
        : HollowSphere(spatial_math::num::zero<T>(), spatial_math::num::zero<T>(), Vector3<T>::ZERO()) {}

    HollowSphere(const T& inner_radius, const T& outer_radius, const Vector3<T>& position = Vector3<T>::ZERO())
        : m_inner_radius(inner_radius)
        , m_outer_radius(outer_radius)
        , m_position(position) {
        m_highest = m_position + Vector3<T>::UNIT_Y() * m_outer_radius;
        m_lowest = m_position - Vector3<T>::UNIT_Y() * m_outer_radius;
        const T outer_cubed = m_outer_radius * m_outer_radius * m_outer_radius;
        const T inner_cubed = m_inner_radius * m_inner_radius * m_inner_radius;
        m_volume = spatial_math::consts::four_thirds_pi<T>() * (outer_cubed - inner_cubed);
    }

    [[nodiscard]] ShapeType type() const noexcept { return k_type; }

    [[nodiscard]] const T& inner_radius() const noexcept { return m_inner_radius; }
    [[nodiscard]] const T& outer_radius() const noexcept { return m_outer_radius; }

    [[nodiscard]] const T& containing_radius() const noexcept { return m_outer_radius; }
    [[nodiscard]] const Vector3<T>& highest_point() const noexcept { return m_highest; }
    [[nodiscard]] const Vector3<T>& lowest_point() const noexcept { return m_lowest; }
    [[nodiscard]] const Vector3<T>& position() const noexcept { return m_position; }
    [[nodiscard]] Quaternion<T> rotation() const { return Quaternion<T>::IDENTITY(); }
    [[nodiscard]] const T& volume() const noexcept { return m_volume; }
    [[nodiscard]] const T& smallest_dimension() const noexcept { return m_outer_radius; }

    /// Within the shell, both radii inclusive
    [[nodiscard]] bool is_point_within(const Vector3<T>& point) const {
        const T d = spatial_math::distance(point, m_position);
        return d <= m_outer_radius && d >= m_inner_radius;
    }

    [[nodiscard]] HollowSphere with_position(const Vector3<T>& position) const {
        return HollowSphere(m_inner_radius, m_outer_radius, position);
    }

    [[nodiscard]] HollowSphere with_rotation(const Quaternion<T>&) const { return *this; }

    [[nodiscard]] spatial_core::Result<HollowSphere> scale_by_dimension(const T& factor) const {
        if (factor < spatial_math::num::zero<T>()) {
            return detail::negative_factor_error(k_name, factor);
        }
        return HollowSphere(m_inner_radius * factor, m_outer_radius * factor, m_position);
    }

    /// Both radii grow by the cube root, which scales the shell volume by factor
    [[nodiscard]] spatial_core::Result<HollowSphere> scale_volume(const T& factor) const {
        if (factor < spatial_math::num::zero<T>()) {
            return detail::negative_factor_error(k_name, factor);
        }
        const T k = spatial_math::num::cbrt(factor);
        return HollowSphere(m_inner_radius * k, m_outer_radius * k, m_position);
    }

    bool operator==(const HollowSphere& o) const {
        return m_inner_radius == o.m_inner_radius && m_outer_radius == o.m_outer_radius
            && m_position == o.m_position;
    }
    bool operator!=(const HollowSphere& o) const { return !(*this == o); }

private:
    T m_inner_radius;
    T m_outer_radius;
    Vector3<T> m_position;

    Vector3<T> m_highest;
    Vector3<T> m_lowest;
    T m_volume;
};

} // namespace spatial_shapes
