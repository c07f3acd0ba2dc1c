#pragma once

/// @file matrix3x2.hpp
/// @brief 2D affine transform matrix for spatial_math
///
/// Row-vector convention: v' = v * M, the third row (M31, M32) is the
/// translation and the implicit third column is (0, 0, 1).

#include "constants.hpp"
#include "vector2.hpp"

#include <spatial/core/log.hpp>

#include <string>
#include <utility>

namespace spatial_math {

template<Scalar T>
struct Matrix3x2 {
    T m11{1}, m12{0};
    T m21{0}, m22{1};
    T m31{0}, m32{0};

    static Matrix3x2 IDENTITY() {
        return Matrix3x2(T(1), T(0), T(0), T(1), T(0), T(0));
    }

    constexpr Matrix3x2() = default;

    constexpr Matrix3x2(T m11_, T m12_, T m21_, T m22_, T m31_, T m32_)
        : m11(std::move(m11_)), m12(std::move(m12_))
        , m21(std::move(m21_)), m22(std::move(m22_))
        , m31(std::move(m31_)), m32(std::move(m32_)) {}

    // =========================================================================
    // Properties
    // =========================================================================

    [[nodiscard]] Vector2<T> translation() const { return Vector2<T>(m31, m32); }

    [[nodiscard]] bool is_identity() const { return *this == IDENTITY(); }

    [[nodiscard]] T determinant() const {
        return m11 * m22 - m21 * m12;
    }

    // =========================================================================
    // Factories
    // =========================================================================

    static Matrix3x2 create_translation(const Vector2<T>& position) {
        return create_translation(position.x, position.y);
    }

    static Matrix3x2 create_translation(const T& x, const T& y) {
        Matrix3x2 m;
        m.m31 = x;
        m.m32 = y;
        return m;
    }

    static Matrix3x2 create_scale(const T& sx, const T& sy) {
        Matrix3x2 m;
        m.m11 = sx;
        m.m22 = sy;
        return m;
    }

    static Matrix3x2 create_scale(const T& sx, const T& sy, const Vector2<T>& center) {
        Matrix3x2 m = create_scale(sx, sy);
        m.m31 = center.x * (num::one<T>() - sx);
        m.m32 = center.y * (num::one<T>() - sy);
        return m;
    }

    static Matrix3x2 create_scale(const Vector2<T>& scales) {
        return create_scale(scales.x, scales.y);
    }

    static Matrix3x2 create_scale(const Vector2<T>& scales, const Vector2<T>& center) {
        return create_scale(scales.x, scales.y, center);
    }

    static Matrix3x2 create_scale(const T& scale) {
        return create_scale(scale, scale);
    }

    static Matrix3x2 create_scale(const T& scale, const Vector2<T>& center) {
        return create_scale(scale, scale, center);
    }

    static Matrix3x2 create_skew(const T& radians_x, const T& radians_y) {
        Matrix3x2 m;
        m.m12 = num::tan(radians_y);
        m.m21 = num::tan(radians_x);
        return m;
    }

    static Matrix3x2 create_skew(const T& radians_x, const T& radians_y, const Vector2<T>& center) {
        Matrix3x2 m = create_skew(radians_x, radians_y);
        m.m31 = -center.y * m.m21;
        m.m32 = -center.x * m.m12;
        return m;
    }

    /// Counter-clockwise rotation; quarter turns produce exact 0 / ±1 entries
    static Matrix3x2 create_rotation(const T& radians) {
        auto [c, s] = exact_cos_sin(radians);
        return Matrix3x2(c, s, -s, c, T(0), T(0));
    }

    static Matrix3x2 create_rotation(const T& radians, const Vector2<T>& center) {
        auto [c, s] = exact_cos_sin(radians);
        const T one = num::one<T>();
        return Matrix3x2(c, s, -s, c,
            center.x * (one - c) + center.y * s,
            center.y * (one - c) - center.x * s);
    }

    // =========================================================================
    // Operators
    // =========================================================================

    Matrix3x2 operator*(const Matrix3x2& b) const {
        return Matrix3x2(
            m11 * b.m11 + m12 * b.m21,
            m11 * b.m12 + m12 * b.m22,
            m21 * b.m11 + m22 * b.m21,
            m21 * b.m12 + m22 * b.m22,
            m31 * b.m11 + m32 * b.m21 + b.m31,
            m31 * b.m12 + m32 * b.m22 + b.m32);
    }

    Matrix3x2 operator*(const T& s) const {
        return Matrix3x2(m11 * s, m12 * s, m21 * s, m22 * s, m31 * s, m32 * s);
    }

    Matrix3x2 operator+(const Matrix3x2& b) const {
        return Matrix3x2(m11 + b.m11, m12 + b.m12, m21 + b.m21, m22 + b.m22, m31 + b.m31, m32 + b.m32);
    }

    Matrix3x2 operator-(const Matrix3x2& b) const {
        return Matrix3x2(m11 - b.m11, m12 - b.m12, m21 - b.m21, m22 - b.m22, m31 - b.m31, m32 - b.m32);
    }

    Matrix3x2 operator-() const {
        return Matrix3x2(-m11, -m12, -m21, -m22, -m31, -m32);
    }

    bool operator==(const Matrix3x2& b) const {
        return m11 == b.m11 && m12 == b.m12 && m21 == b.m21
            && m22 == b.m22 && m31 == b.m31 && m32 == b.m32;
    }

    bool operator!=(const Matrix3x2& b) const { return !(*this == b); }

private:
    static std::pair<T, T> exact_cos_sin(const T& radians) {
        const T eps = consts::deg_to_rad<T>() / T(1000);
        const T half_pi = consts::half_pi<T>();
        const T pi = consts::pi<T>();

        if (radians > -eps && radians < eps) {
            return {T(1), T(0)};
        }
        if (radians > half_pi - eps && radians < half_pi + eps) {
            return {T(0), T(1)};
        }
        if (radians < -pi + eps || radians > pi - eps) {
            return {T(-1), T(0)};
        }
        if (radians > -half_pi - eps && radians < -half_pi + eps) {
            return {T(0), T(-1)};
        }
        return {num::cos(radians), num::sin(radians)};
    }
};

// =============================================================================
// Free Functions
// =============================================================================

/// Inverse; singular input (|det| nearly zero) yields {IDENTITY, false}
template<Scalar T>
[[nodiscard]] inline std::pair<Matrix3x2<T>, bool> invert(const Matrix3x2<T>& m) {
    const T det = m.determinant();
    if (is_nearly_zero(det)) {
        spatial_core::math_logger()->trace("Matrix3x2 not invertible (det = {})", num::to_string(det));
        return {Matrix3x2<T>::IDENTITY(), false};
    }

    const T inv = num::one<T>() / det;
    return {Matrix3x2<T>(
        m.m22 * inv,
        -m.m12 * inv,
        -m.m21 * inv,
        m.m11 * inv,
        (m.m21 * m.m32 - m.m31 * m.m22) * inv,
        (m.m31 * m.m12 - m.m11 * m.m32) * inv), true};
}

template<Scalar T>
[[nodiscard]] inline Matrix3x2<T> lerp(const Matrix3x2<T>& a, const Matrix3x2<T>& b, const T& t) {
    return a + (b - a) * t;
}

template<Scalar T>
[[nodiscard]] inline Vector2<T> transform(const Vector2<T>& v, const Matrix3x2<T>& m) {
    return Vector2<T>(
        v.x * m.m11 + v.y * m.m21 + m.m31,
        v.x * m.m12 + v.y * m.m22 + m.m32);
}

/// Transform ignoring translation
template<Scalar T>
[[nodiscard]] inline Vector2<T> transform_normal(const Vector2<T>& v, const Matrix3x2<T>& m) {
    return Vector2<T>(
        v.x * m.m11 + v.y * m.m21,
        v.x * m.m12 + v.y * m.m22);
}

template<Scalar T>
[[nodiscard]] inline bool is_nearly_equal(const Matrix3x2<T>& a, const Matrix3x2<T>& b) {
    return is_nearly_equal(a.m11, b.m11) && is_nearly_equal(a.m12, b.m12)
        && is_nearly_equal(a.m21, b.m21) && is_nearly_equal(a.m22, b.m22)
        && is_nearly_equal(a.m31, b.m31) && is_nearly_equal(a.m32, b.m32);
}

} // namespace spatial_math
