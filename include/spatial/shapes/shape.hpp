#pragma once

/// @file shape.hpp
/// @brief Closed sum type over the eleven shape kinds

#include "collision.hpp"

#include <type_traits>
#include <utility>
#include <variant>

namespace spatial_shapes {

/// Any shape of scalar type T
///
/// Forwards the capability contract of the held kind and takes part in
/// intersects() and collision_point() like a concrete kind.
template<Scalar T>
class Shape {
public:
    using value_type = T;

    using Variant = std::variant<
        SinglePoint<T>,
        Line<T>,
        Sphere<T>,
        HollowSphere<T>,
        Capsule<T>,
        Cuboid<T>,
        Cylinder<T>,
        Cone<T>,
        Ellipsoid<T>,
        Frustum<T>,
        Torus<T>
    >;

    Shape() = default;

    template<typename K>
        requires std::is_constructible_v<Variant, K&&> && (!std::is_same_v<std::decay_t<K>, Shape>)
    Shape(K&& kind) : m_shape(std::forward<K>(kind)) {}

    [[nodiscard]] ShapeType type() const {
        return std::visit([](const auto& s) { return s.type(); }, m_shape);
    }

    [[nodiscard]] T containing_radius() const {
        return std::visit([](const auto& s) -> T { return s.containing_radius(); }, m_shape);
    }

    [[nodiscard]] Vector3<T> highest_point() const {
        return std::visit([](const auto& s) -> Vector3<T> { return s.highest_point(); }, m_shape);
    }

    [[nodiscard]] Vector3<T> lowest_point() const {
        return std::visit([](const auto& s) -> Vector3<T> { return s.lowest_point(); }, m_shape);
    }

    [[nodiscard]] Vector3<T> position() const {
        return std::visit([](const auto& s) -> Vector3<T> { return s.position(); }, m_shape);
    }

    [[nodiscard]] Quaternion<T> rotation() const {
        return std::visit([](const auto& s) -> Quaternion<T> { return s.rotation(); }, m_shape);
    }

    [[nodiscard]] T volume() const {
        return std::visit([](const auto& s) -> T { return s.volume(); }, m_shape);
    }

    [[nodiscard]] T smallest_dimension() const {
        return std::visit([](const auto& s) -> T { return s.smallest_dimension(); }, m_shape);
    }

    [[nodiscard]] bool is_point_within(const Vector3<T>& point) const {
        return std::visit([&point](const auto& s) { return s.is_point_within(point); }, m_shape);
    }

    [[nodiscard]] Shape with_position(const Vector3<T>& position) const {
        return std::visit([&position](const auto& s) { return Shape(s.with_position(position)); }, m_shape);
    }

    [[nodiscard]] Shape with_rotation(const Quaternion<T>& rotation) const {
        return std::visit([&rotation](const auto& s) { return Shape(s.with_rotation(rotation)); }, m_shape);
    }

    [[nodiscard]] spatial_core::Result<Shape> scale_by_dimension(const T& factor) const {
        return std::visit([&factor](const auto& s) -> spatial_core::Result<Shape> {
            auto scaled = s.scale_by_dimension(factor);
            if (!scaled) {
                return scaled.error();
            }
            return Shape(std::move(scaled).value());
        }, m_shape);
    }

    [[nodiscard]] spatial_core::Result<Shape> scale_volume(const T& factor) const {
        return std::visit([&factor](const auto& s) -> spatial_core::Result<Shape> {
            auto scaled = s.scale_volume(factor);
            if (!scaled) {
                return scaled.error();
            }
            return Shape(std::move(scaled).value());
        }, m_shape);
    }

    /// Check held kind
    template<typename K>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<K>(m_shape);
    }

    /// Get held kind, or nullptr
    template<typename K>
    [[nodiscard]] const K* as() const {
        return std::get_if<K>(&m_shape);
    }

    [[nodiscard]] const Variant& variant() const noexcept { return m_shape; }

    bool operator==(const Shape& o) const { return m_shape == o.m_shape; }
    bool operator!=(const Shape& o) const { return !(*this == o); }

private:
    Variant m_shape;
};

// =============================================================================
// Dispatch on held kinds
// =============================================================================

template<Scalar T>
[[nodiscard]] bool intersects(const Shape<T>& a, const Shape<T>& b) {
    return std::visit([](const auto& x, const auto& y) { return intersects(x, y); }, a.variant(), b.variant());
}

template<Scalar T, ShapeKind B>
    requires std::same_as<T, typename B::value_type>
[[nodiscard]] bool intersects(const Shape<T>& a, const B& b) {
    return std::visit([&b](const auto& x) { return intersects(x, b); }, a.variant());
}

template<ShapeKind A, Scalar T>
    requires std::same_as<T, typename A::value_type>
[[nodiscard]] bool intersects(const A& a, const Shape<T>& b) {
    return std::visit([&a](const auto& y) { return intersects(a, y); }, b.variant());
}

template<Scalar T>
[[nodiscard]] std::optional<Vector3<T>> swept_collision_point(const Capsule<T>& sweep, const Shape<T>& target) {
    return std::visit([&sweep](const auto& s) { return swept_collision_point(sweep, s); }, target.variant());
}

} // namespace spatial_shapes
