#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for spatial_math types

#include "scalar.hpp"

namespace spatial_math {

// =============================================================================
// Generic Types
// =============================================================================

template<Scalar T> struct Vector2;
template<Scalar T> struct Vector3;
template<Scalar T> struct Vector4;
template<Scalar T> struct Quaternion;
template<Scalar T> struct Matrix3x2;
template<Scalar T> struct Matrix4x4;
template<Scalar T> struct Plane;
template<Scalar T> struct Decomposition;

// =============================================================================
// Precision Aliases
// =============================================================================

using Vector2f = Vector2<float>;
using Vector3f = Vector3<float>;
using Vector4f = Vector4<float>;
using Quaternionf = Quaternion<float>;
using Matrix3x2f = Matrix3x2<float>;
using Matrix4x4f = Matrix4x4<float>;
using Planef = Plane<float>;

using Vector2d = Vector2<double>;
using Vector3d = Vector3<double>;
using Vector4d = Vector4<double>;
using Quaterniond = Quaternion<double>;
using Matrix3x2d = Matrix3x2<double>;
using Matrix4x4d = Matrix4x4<double>;
using Planed = Plane<double>;

} // namespace spatial_math
