#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for spatial_shapes types

#include <spatial/math/fwd.hpp>

#include <cstdint>

namespace spatial_shapes {

using spatial_math::Scalar;

enum class ShapeType : std::uint8_t;

template<Scalar T> class SinglePoint;
template<Scalar T> class Line;
template<Scalar T> class Sphere;
template<Scalar T> class HollowSphere;
template<Scalar T> class Capsule;
template<Scalar T> class Cuboid;
template<Scalar T> class Cylinder;
template<Scalar T> class Cone;
template<Scalar T> class Ellipsoid;
template<Scalar T> class Frustum;
template<Scalar T> class Torus;

template<Scalar T> class Shape;

} // namespace spatial_shapes
