#pragma once

/// @file convert.hpp
/// @brief Explicit precision conversions between scalar types
///
/// widen<U>() only compiles when U carries at least as many decimal digits
/// as the source type and cannot fail. narrow<U>() may lose digits and
/// reports a ConversionError when a component is not finite in U (for
/// example a HugeNumber beyond the double range).

#include "matrix4x4.hpp"

#include <spatial/core/error.hpp>
#include <spatial/core/log.hpp>

#include <type_traits>

namespace spatial_math {

/// U represents every value of T without losing significant digits
template<typename U, typename T>
concept WideningConversion = Scalar<U> && Scalar<T>
    && (ScalarTraits<U>::digits10 >= ScalarTraits<T>::digits10);

namespace detail {

template<Scalar U, Scalar T>
[[nodiscard]] inline U convert_scalar(const T& v) {
    if constexpr (std::is_same_v<U, T>) {
        return v;
    } else {
        return static_cast<U>(v);
    }
}

template<Scalar U, Scalar T>
[[nodiscard]] inline Vector2<U> rebind(const Vector2<T>& v) {
    return Vector2<U>(convert_scalar<U>(v.x), convert_scalar<U>(v.y));
}

template<Scalar U, Scalar T>
[[nodiscard]] inline Vector3<U> rebind(const Vector3<T>& v) {
    return Vector3<U>(convert_scalar<U>(v.x), convert_scalar<U>(v.y), convert_scalar<U>(v.z));
}

template<Scalar U, Scalar T>
[[nodiscard]] inline Vector4<U> rebind(const Vector4<T>& v) {
    return Vector4<U>(convert_scalar<U>(v.x), convert_scalar<U>(v.y),
                      convert_scalar<U>(v.z), convert_scalar<U>(v.w));
}

template<Scalar U, Scalar T>
[[nodiscard]] inline Quaternion<U> rebind(const Quaternion<T>& q) {
    return Quaternion<U>(convert_scalar<U>(q.x), convert_scalar<U>(q.y),
                         convert_scalar<U>(q.z), convert_scalar<U>(q.w));
}

template<Scalar U, Scalar T>
[[nodiscard]] inline Plane<U> rebind(const Plane<T>& p) {
    return Plane<U>(rebind<U>(p.normal), convert_scalar<U>(p.d));
}

template<Scalar U, Scalar T>
[[nodiscard]] inline Matrix3x2<U> rebind(const Matrix3x2<T>& m) {
    return Matrix3x2<U>(convert_scalar<U>(m.m11), convert_scalar<U>(m.m12),
                        convert_scalar<U>(m.m21), convert_scalar<U>(m.m22),
                        convert_scalar<U>(m.m31), convert_scalar<U>(m.m32));
}

template<Scalar U, Scalar T>
[[nodiscard]] inline Matrix4x4<U> rebind(const Matrix4x4<T>& m) {
    const auto src = m.to_array();
    std::array<U, 16> dst;
    for (std::size_t i = 0; i < src.size(); ++i) {
        dst[i] = convert_scalar<U>(src[i]);
    }
    return Matrix4x4<U>::from_array(dst);
}

template<Scalar T>
[[nodiscard]] inline bool all_finite(const Vector2<T>& v) {
    return num::is_finite(v.x) && num::is_finite(v.y);
}

template<Scalar T>
[[nodiscard]] inline bool all_finite(const Vector3<T>& v) {
    return v.is_finite();
}

template<Scalar T>
[[nodiscard]] inline bool all_finite(const Vector4<T>& v) {
    return v.xyz().is_finite() && num::is_finite(v.w);
}

template<Scalar T>
[[nodiscard]] inline bool all_finite(const Quaternion<T>& q) {
    return q.vector_part().is_finite() && num::is_finite(q.w);
}

template<Scalar T>
[[nodiscard]] inline bool all_finite(const Plane<T>& p) {
    return p.normal.is_finite() && num::is_finite(p.d);
}

template<Scalar T>
[[nodiscard]] inline bool all_finite(const Matrix3x2<T>& m) {
    return num::is_finite(m.m11) && num::is_finite(m.m12) && num::is_finite(m.m21)
        && num::is_finite(m.m22) && num::is_finite(m.m31) && num::is_finite(m.m32);
}

template<Scalar T>
[[nodiscard]] inline bool all_finite(const Matrix4x4<T>& m) {
    for (const auto& v : m.to_array()) {
        if (!num::is_finite(v)) {
            return false;
        }
    }
    return true;
}

/// Shared narrowing path: convert, then reject non-finite results
template<Scalar U, Scalar T, typename Value>
[[nodiscard]] inline auto checked_narrow(const Value& value) -> spatial_core::Result<decltype(rebind<U>(value))> {
    auto converted = rebind<U>(value);
    if (!all_finite(converted) && all_finite(value)) {
        spatial_core::math_logger()->debug("Narrowing {} -> {} overflowed",
            ScalarTraits<T>::name(), ScalarTraits<U>::name());
        return spatial_core::Error(spatial_core::ConversionError::not_representable(
            ScalarTraits<T>::name(), ScalarTraits<U>::name()));
    }
    return converted;
}

} // namespace detail

// =============================================================================
// Widening (infallible)
// =============================================================================

template<Scalar U, Scalar T> requires WideningConversion<U, T>
[[nodiscard]] inline Vector2<U> widen(const Vector2<T>& v) { return detail::rebind<U>(v); }

template<Scalar U, Scalar T> requires WideningConversion<U, T>
[[nodiscard]] inline Vector3<U> widen(const Vector3<T>& v) { return detail::rebind<U>(v); }

template<Scalar U, Scalar T> requires WideningConversion<U, T>
[[nodiscard]] inline Vector4<U> widen(const Vector4<T>& v) { return detail::rebind<U>(v); }

template<Scalar U, Scalar T> requires WideningConversion<U, T>
[[nodiscard]] inline Quaternion<U> widen(const Quaternion<T>& q) { return detail::rebind<U>(q); }

template<Scalar U, Scalar T> requires WideningConversion<U, T>
[[nodiscard]] inline Plane<U> widen(const Plane<T>& p) { return detail::rebind<U>(p); }

template<Scalar U, Scalar T> requires WideningConversion<U, T>
[[nodiscard]] inline Matrix3x2<U> widen(const Matrix3x2<T>& m) { return detail::rebind<U>(m); }

template<Scalar U, Scalar T> requires WideningConversion<U, T>
[[nodiscard]] inline Matrix4x4<U> widen(const Matrix4x4<T>& m) { return detail::rebind<U>(m); }

// =============================================================================
// Narrowing (fallible)
// =============================================================================

/// Convert to U, failing when a finite component does not fit in U
///
/// Components that were already NaN or infinite are carried over as such;
/// only finite values that overflow the target are reported.
template<Scalar U, Scalar T>
[[nodiscard]] inline spatial_core::Result<Vector2<U>> narrow(const Vector2<T>& v) {
    return detail::checked_narrow<U, T>(v);
}

template<Scalar U, Scalar T>
[[nodiscard]] inline spatial_core::Result<Vector3<U>> narrow(const Vector3<T>& v) {
    return detail::checked_narrow<U, T>(v);
}

template<Scalar U, Scalar T>
[[nodiscard]] inline spatial_core::Result<Vector4<U>> narrow(const Vector4<T>& v) {
    return detail::checked_narrow<U, T>(v);
}

template<Scalar U, Scalar T>
[[nodiscard]] inline spatial_core::Result<Quaternion<U>> narrow(const Quaternion<T>& q) {
    return detail::checked_narrow<U, T>(q);
}

template<Scalar U, Scalar T>
[[nodiscard]] inline spatial_core::Result<Plane<U>> narrow(const Plane<T>& p) {
    return detail::checked_narrow<U, T>(p);
}

template<Scalar U, Scalar T>
[[nodiscard]] inline spatial_core::Result<Matrix3x2<U>> narrow(const Matrix3x2<T>& m) {
    return detail::checked_narrow<U, T>(m);
}

template<Scalar U, Scalar T>
[[nodiscard]] inline spatial_core::Result<Matrix4x4<U>> narrow(const Matrix4x4<T>& m) {
    return detail::checked_narrow<U, T>(m);
}

/// Scalar narrowing with the same rule
template<Scalar U, Scalar T>
[[nodiscard]] inline spatial_core::Result<U> narrow_scalar(const T& v) {
    U converted = detail::convert_scalar<U>(v);
    if (!num::is_finite(converted) && num::is_finite(v)) {
        return spatial_core::Error(spatial_core::ConversionError::not_representable(
            ScalarTraits<T>::name(), ScalarTraits<U>::name()));
    }
    return converted;
}

} // namespace spatial_math
