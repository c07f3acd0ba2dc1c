#pragma once

/// @file single_point.hpp
/// @brief Zero-size shape occupying a single position

#include "shape_type.hpp"
#include "geometry.hpp"

namespace spatial_shapes {

/// A single point in space
template<Scalar T>
class SinglePoint {
public:
    using value_type = T;

    static constexpr ShapeType k_type = ShapeType::SinglePoint;
    static constexpr const char* k_name = "SinglePoint";

    SinglePoint() = default;

    explicit SinglePoint(const Vector3<T>& position)
        : m_position(position) {}

    [[nodiscard]] ShapeType type() const noexcept { return k_type; }

    [[nodiscard]] T containing_radius() const { return spatial_math::num::zero<T>(); }
    [[nodiscard]] const Vector3<T>& highest_point() const noexcept { return m_position; }
    [[nodiscard]] const Vector3<T>& lowest_point() const noexcept { return m_position; }
    [[nodiscard]] const Vector3<T>& position() const noexcept { return m_position; }
    [[nodiscard]] Quaternion<T> rotation() const { return Quaternion<T>::IDENTITY(); }
    [[nodiscard]] T volume() const { return spatial_math::num::zero<T>(); }
    [[nodiscard]] T smallest_dimension() const { return spatial_math::num::zero<T>(); }

    [[nodiscard]] bool is_point_within(const Vector3<T>& point) const { return point == m_position; }

    [[nodiscard]] SinglePoint with_position(const Vector3<T>& position) const { return SinglePoint(position); }
    [[nodiscard]] SinglePoint with_rotation(const Quaternion<T>&) const { return *this; }

    /// A point has no extent; only the factor is validated
    [[nodiscard]] spatial_core::Result<SinglePoint> scale_by_dimension(const T& factor) const {
        if (factor < spatial_math::num::zero<T>()) {
            return detail::negative_factor_error(k_name, factor);
        }
        return *this;
    }

    [[nodiscard]] spatial_core::Result<SinglePoint> scale_volume(const T& factor) const {
        return scale_by_dimension(factor);
    }

    [[nodiscard]] Vector3<T> support(const Vector3<T>&) const { return m_position; }

    bool operator==(const SinglePoint& o) const { return m_position == o.m_position; }
    bool operator!=(const SinglePoint& o) const { return !(*this == o); }

private:
    Vector3<T> m_position{};
};

} // namespace spatial_shapes
