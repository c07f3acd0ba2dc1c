/// @file instantiations.cpp
/// @brief Explicit template instantiations for spatial_math
///
/// The math types are header-only templates and every including unit still
/// instantiates what it uses. Instantiating every member here for each
/// supported scalar checks that the scalar satisfies everything the generic
/// code asks of it, including members no caller happens to use.

#include <spatial/math/math.hpp>

namespace spatial_math {

// =============================================================================
// float
// =============================================================================

template struct Vector2<float>;
template struct Vector3<float>;
template struct Vector4<float>;
template struct Quaternion<float>;
template struct Matrix3x2<float>;
template struct Matrix4x4<float>;
template struct Plane<float>;

// =============================================================================
// double
// =============================================================================

template struct Vector2<double>;
template struct Vector3<double>;
template struct Vector4<double>;
template struct Quaternion<double>;
template struct Matrix3x2<double>;
template struct Matrix4x4<double>;
template struct Plane<double>;

// =============================================================================
// Decimal
// =============================================================================

template struct Vector2<Decimal>;
template struct Vector3<Decimal>;
template struct Vector4<Decimal>;
template struct Quaternion<Decimal>;
template struct Matrix3x2<Decimal>;
template struct Matrix4x4<Decimal>;
template struct Plane<Decimal>;

// =============================================================================
// HugeNumber
// =============================================================================

template struct Vector2<HugeNumber>;
template struct Vector3<HugeNumber>;
template struct Vector4<HugeNumber>;
template struct Quaternion<HugeNumber>;
template struct Matrix3x2<HugeNumber>;
template struct Matrix4x4<HugeNumber>;
template struct Plane<HugeNumber>;

} // namespace spatial_math
