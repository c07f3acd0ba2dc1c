#pragma once

/// @file constants.hpp
/// @brief Mathematical constants for spatial_math at any scalar precision

#include "scalar.hpp"

namespace spatial_math {

/// Mathematical constants
namespace consts {

/// Pi (π)
template<Scalar T>
[[nodiscard]] inline T pi() { return ScalarTraits<T>::pi(); }

/// Tau (2π)
template<Scalar T>
[[nodiscard]] inline T tau() { return pi<T>() * num::two<T>(); }

/// Half Pi (π/2)
template<Scalar T>
[[nodiscard]] inline T half_pi() { return pi<T>() / num::two<T>(); }

/// 4/3 π, the sphere volume factor
template<Scalar T>
[[nodiscard]] inline T four_thirds_pi() { return pi<T>() * T(4) / T(3); }

/// 2π², the torus volume factor
template<Scalar T>
[[nodiscard]] inline T two_pi_squared() { return num::two<T>() * pi<T>() * pi<T>(); }

/// Degrees to radians conversion factor
template<Scalar T>
[[nodiscard]] inline T deg_to_rad() { return pi<T>() / T(180); }

/// Radians to degrees conversion factor
template<Scalar T>
[[nodiscard]] inline T rad_to_deg() { return T(180) / pi<T>(); }

/// Threshold above which slerp falls back to linear blending
template<Scalar T>
[[nodiscard]] inline T slerp_epsilon() { return T(1) / T(1000000); }

} // namespace consts

/// Degrees to radians
template<Scalar T>
[[nodiscard]] inline T radians(const T& degrees) { return degrees * consts::deg_to_rad<T>(); }

/// Radians to degrees
template<Scalar T>
[[nodiscard]] inline T degrees(const T& radians) { return radians * consts::rad_to_deg<T>(); }

} // namespace spatial_math
