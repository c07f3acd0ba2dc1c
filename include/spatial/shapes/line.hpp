#pragma once

/// @file line.hpp
/// @brief Finite line segment centred on its position

#include "shape_type.hpp"
#include "geometry.hpp"

namespace spatial_shapes {

/// Line segment of direction and length `path`, centred on `position`
template<Scalar T>
class Line {
public:
    using value_type = T;

    static constexpr ShapeType k_type = ShapeType::Line;
    static constexpr const char* k_name = "Line";

    Line() : Line(Vector3<T>::ZERO(), Vector3<T>::ZERO()) {}

    Line(const Vector3<T>& path, const Vector3<T>& position)
        : m_path(path)
        , m_position(position) {
        m_length = m_path.length();
        m_start = m_position - m_path / spatial_math::num::two<T>();
        m_end = m_start + m_path;
        if (m_end.y >= m_start.y) {
            m_highest = m_end;
            m_lowest = m_start;
        } else {
            m_highest = m_start;
            m_lowest = m_end;
        }
    }

    /// Segment running from start to end
    [[nodiscard]] static Line create(const Vector3<T>& start, const Vector3<T>& end) {
        const Vector3<T> path = end - start;
        return Line(path, start + path / spatial_math::num::two<T>());
    }

    [[nodiscard]] ShapeType type() const noexcept { return k_type; }

    [[nodiscard]] const Vector3<T>& path() const noexcept { return m_path; }
    [[nodiscard]] const T& length() const noexcept { return m_length; }
    [[nodiscard]] const Vector3<T>& start() const noexcept { return m_start; }
    [[nodiscard]] const Vector3<T>& end() const noexcept { return m_end; }

    /// Segment length, so the bound reaches both endpoints from the centre
    [[nodiscard]] const T& containing_radius() const noexcept { return m_length; }
    [[nodiscard]] const Vector3<T>& highest_point() const noexcept { return m_highest; }
    [[nodiscard]] const Vector3<T>& lowest_point() const noexcept { return m_lowest; }
    [[nodiscard]] const Vector3<T>& position() const noexcept { return m_position; }
    [[nodiscard]] Quaternion<T> rotation() const { return Quaternion<T>::IDENTITY(); }
    [[nodiscard]] T volume() const { return spatial_math::num::zero<T>(); }
    [[nodiscard]] T smallest_dimension() const { return spatial_math::num::zero<T>(); }

    /// Distance from point to a point on the segment
    [[nodiscard]] T distance_to(const Vector3<T>& point) const {
        return detail::point_segment_distance(point, m_start, m_end);
    }

    [[nodiscard]] Vector3<T> closest_point(const Vector3<T>& point) const {
        return detail::closest_point_on_segment(point, m_start, m_end);
    }

    /// On the segment, within epsilon of its length
    [[nodiscard]] bool is_point_within(const Vector3<T>& point) const {
        return distance_to(point) <= spatial_math::num::epsilon<T>() * m_length;
    }

    [[nodiscard]] Line with_position(const Vector3<T>& position) const { return Line(m_path, position); }

    /// Rotates the path about the segment centre
    [[nodiscard]] Line with_rotation(const Quaternion<T>& rotation) const {
        return Line(spatial_math::transform(m_path, rotation), m_position);
    }

    [[nodiscard]] spatial_core::Result<Line> scale_by_dimension(const T& factor) const {
        if (factor < spatial_math::num::zero<T>()) {
            return detail::negative_factor_error(k_name, factor);
        }
        return Line(m_path * factor, m_position);
    }

    /// A segment has no volume to scale
    [[nodiscard]] spatial_core::Result<Line> scale_volume(const T& factor) const {
        if (factor < spatial_math::num::zero<T>()) {
            return detail::negative_factor_error(k_name, factor);
        }
        return *this;
    }

    [[nodiscard]] Vector3<T> support(const Vector3<T>& direction) const {
        return spatial_math::dot(m_end, direction) >= spatial_math::dot(m_start, direction) ? m_end : m_start;
    }

    bool operator==(const Line& o) const { return m_path == o.m_path && m_position == o.m_position; }
    bool operator!=(const Line& o) const { return !(*this == o); }

private:
    Vector3<T> m_path;
    Vector3<T> m_position;

    T m_length;
    Vector3<T> m_start;
    Vector3<T> m_end;
    Vector3<T> m_highest;
    Vector3<T> m_lowest;
};

} // namespace spatial_shapes
