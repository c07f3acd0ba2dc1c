#pragma once

/// @file shapes.hpp
/// @brief Main include file for spatial_shapes module

#include "fwd.hpp"
#include "shape_type.hpp"

// Kinds, dispatch and the sum type
#include "shape.hpp"

// JSON codec
#include "serialize.hpp"

/// @namespace spatial_shapes
/// @brief Solid shapes with intersection and swept collision queries
///
/// Eleven immutable shape kinds share one capability contract. Any two
/// kinds of the same scalar type can be tested with intersects(), and
/// swept_collision_point() / collision_point() report where a moving
/// shape first touches a stationary one.
///
/// Example usage:
/// @code
/// #include <spatial/shapes/shapes.hpp>
///
/// using namespace spatial_shapes;
/// using spatial_math::Vector3d;
///
/// Sphere<double> a(5.0);
/// Sphere<double> b(3.0, Vector3d(7.0, 0.0, 0.0));
/// bool hit = intersects(a, b);  // true
///
/// auto contact = collision_point(b, Vector3d(-20.0, 0.0, 0.0), Cuboid<double>(1.0, 1.0, 1.0));
/// @endcode
