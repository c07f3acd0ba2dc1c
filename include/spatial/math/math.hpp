#pragma once

/// @file math.hpp
/// @brief Main include file for spatial_math module
///
/// This header includes the spatial_math types in dependency order.
/// glm_interop.hpp is not included here; include it explicitly where GLM
/// conversions are wanted.

// Numeric contract
#include "scalar.hpp"
#include "constants.hpp"
#include "fwd.hpp"

// Vectors
#include "vector2.hpp"
#include "vector3.hpp"
#include "vector4.hpp"

// Rotations
#include "quaternion.hpp"

// Matrices and planes
#include "matrix3x2.hpp"
#include "plane.hpp"
#include "matrix4x4.hpp"

// Precision conversions
#include "convert.hpp"

/// @namespace spatial_math
/// @brief Generic-precision vector, quaternion and matrix algebra
///
/// All types are templates over a Scalar (float, double, Decimal or
/// HugeNumber). Matrices use the row-vector convention (v * M).
///
/// Example usage:
/// @code
/// #include <spatial/math/math.hpp>
///
/// using namespace spatial_math;
///
/// auto q = Quaternion<double>::from_axis_angle(Vector3<double>::UNIT_Z(), consts::half_pi<double>());
/// Vector3<double> v = transform(Vector3<double>::UNIT_X(), q);  // (0, 1, 0)
/// @endcode
