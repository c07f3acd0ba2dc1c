#pragma once

/// @file shape_type.hpp
/// @brief Stable integer tags identifying each shape kind
///
/// The numeric values are persisted by the JSON codec and must never be
/// renumbered.

#include "fwd.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace spatial_shapes {

/// Shape kind discriminator
enum class ShapeType : std::uint8_t {
    None = 0,
    Capsule = 1,
    Cone = 2,
    Cuboid = 3,
    Cylinder = 4,
    Ellipsoid = 5,
    Frustum = 6,
    HollowSphere = 7,
    Line = 8,
    SinglePoint = 9,
    Sphere = 10,
    Torus = 11,
};

/// Highest valid tag value
constexpr std::uint8_t k_max_shape_type = static_cast<std::uint8_t>(ShapeType::Torus);

/// Get shape type name
[[nodiscard]] const char* to_string(ShapeType type) noexcept;

/// Parse a shape type name (case-sensitive, as produced by to_string)
[[nodiscard]] std::optional<ShapeType> shape_type_from_string(const std::string& name);

/// Map a persisted integer tag back to a ShapeType
[[nodiscard]] std::optional<ShapeType> shape_type_from_int(std::int64_t value);

} // namespace spatial_shapes
