/// @file shape_type.cpp
/// @brief ShapeType name tables

#include <spatial/shapes/shape_type.hpp>

#include <array>
#include <utility>

namespace spatial_shapes {

namespace {

constexpr std::array<std::pair<ShapeType, const char*>, 12> k_type_names = {{
    {ShapeType::None, "None"},
    {ShapeType::Capsule, "Capsule"},
    {ShapeType::Cone, "Cone"},
    {ShapeType::Cuboid, "Cuboid"},
    {ShapeType::Cylinder, "Cylinder"},
    {ShapeType::Ellipsoid, "Ellipsoid"},
    {ShapeType::Frustum, "Frustum"},
    {ShapeType::HollowSphere, "HollowSphere"},
    {ShapeType::Line, "Line"},
    {ShapeType::SinglePoint, "SinglePoint"},
    {ShapeType::Sphere, "Sphere"},
    {ShapeType::Torus, "Torus"},
}};

} // anonymous namespace

const char* to_string(ShapeType type) noexcept {
    for (const auto& [value, name] : k_type_names) {
        if (value == type) {
            return name;
        }
    }
    return "Unknown";
}

std::optional<ShapeType> shape_type_from_string(const std::string& name) {
    for (const auto& [value, type_name] : k_type_names) {
        if (name == type_name) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<ShapeType> shape_type_from_int(std::int64_t value) {
    if (value < 0 || value > k_max_shape_type) {
        return std::nullopt;
    }
    return static_cast<ShapeType>(value);
}

} // namespace spatial_shapes
