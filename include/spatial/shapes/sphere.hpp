#pragma once

/// @file sphere.hpp
/// @brief Solid sphere

#include "shape_type.hpp"
#include "geometry.hpp"

#include <spatial/math/constants.hpp>

namespace spatial_shapes {

/// Solid ball of `radius` around `position`
template<Scalar T>
class Sphere {
public:
    using value_type = T;

    static constexpr ShapeType k_type = ShapeType::Sphere;
    static constexpr const char* k_name = "Sphere";

    Sphere() : Sphere(spatial_math::num::zero<T>(), Vector3<T>::ZERO()) {}

    explicit Sphere(const T& radius, const Vector3<T>& position = Vector3<T>::ZERO())
        : m_radius(radius)
        , m_position(position) {
        m_highest = m_position + Vector3<T>::UNIT_Y() * m_radius;
        m_lowest = m_position - Vector3<T>::UNIT_Y() * m_radius;
        m_volume = spatial_math::consts::four_thirds_pi<T>() * m_radius * m_radius * m_radius;
    }

    [[nodiscard]] ShapeType type() const noexcept { return k_type; }

    [[nodiscard]] const T& radius() const noexcept { return m_radius; }

    [[nodiscard]] const T& containing_radius() const noexcept { return m_radius; }
    [[nodiscard]] const Vector3<T>& highest_point() const noexcept { return m_highest; }
    [[nodiscard]] const Vector3<T>& lowest_point() const noexcept { return m_lowest; }
    [[nodiscard]] const Vector3<T>& position() const noexcept { return m_position; }
    [[nodiscard]] Quaternion<T> rotation() const { return Quaternion<T>::IDENTITY(); }
    [[nodiscard]] const T& volume() const noexcept { return m_volume; }
    [[nodiscard]] const T& smallest_dimension() const noexcept { return m_radius; }

    /// Boundary inclusive
    [[nodiscard]] bool is_point_within(const Vector3<T>& point) const {
        return spatial_math::distance(point, m_position) <= m_radius;
    }

    [[nodiscard]] Sphere with_position(const Vector3<T>& position) const { return Sphere(m_radius, position); }
    [[nodiscard]] Sphere with_rotation(const Quaternion<T>&) const { return *this; }

    [[nodiscard]] spatial_core::Result<Sphere> scale_by_dimension(const T& factor) const {
        if (factor < spatial_math::num::zero<T>()) {
            return detail::negative_factor_error(k_name, factor);
        }
        return Sphere(m_radius * factor, m_position);
    }

    [[nodiscard]] spatial_core::Result<Sphere> scale_volume(const T& factor) const {
        if (factor < spatial_math::num::zero<T>()) {
            return detail::negative_factor_error(k_name, factor);
        }
        return Sphere(m_radius * spatial_math::num::cbrt(factor), m_position);
    }

    [[nodiscard]] Vector3<T> support(const Vector3<T>& direction) const {
        return m_position + detail::safe_normalize(direction) * m_radius;
    }

    bool operator==(const Sphere& o) const { return m_radius == o.m_radius && m_position == o.m_position; }
    bool operator!=(const Sphere& o) const { return !(*this == o); }

private:
    T m_radius;
    Vector3<T> m_position;

    Vector3<T> m_highest;
    Vector3<T> m_lowest;
    T m_volume;
};

} // namespace spatial_shapes
