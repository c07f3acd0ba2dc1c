#pragma once

/// @file matrix4x4.hpp
/// @brief 4x4 transform matrix for spatial_math
///
/// Row-vector convention throughout: v' = v * M, translation in M41..M43,
/// and A * B applies A first. Projection factories follow the right-handed
/// clip-space convention (camera looks down -Z, depth in [0, 1]).

#include "matrix3x2.hpp"
#include "plane.hpp"

#include <spatial/core/error.hpp>
#include <spatial/core/log.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace spatial_math {

template<Scalar T>
struct Matrix4x4 {
    T m11{1}, m12{0}, m13{0}, m14{0};
    T m21{0}, m22{1}, m23{0}, m24{0};
    T m31{0}, m32{0}, m33{1}, m34{0};
    T m41{0}, m42{0}, m43{0}, m44{1};

    static Matrix4x4 IDENTITY() { return Matrix4x4(); }

    /// All entries zero (projection factories start from here)
    static Matrix4x4 ZERO() {
        Matrix4x4 m;
        m.m11 = T(0);
        m.m22 = T(0);
        m.m33 = T(0);
        m.m44 = T(0);
        return m;
    }

    constexpr Matrix4x4() = default;

    Matrix4x4(T m11_, T m12_, T m13_, T m14_,
              T m21_, T m22_, T m23_, T m24_,
              T m31_, T m32_, T m33_, T m34_,
              T m41_, T m42_, T m43_, T m44_)
        : m11(std::move(m11_)), m12(std::move(m12_)), m13(std::move(m13_)), m14(std::move(m14_))
        , m21(std::move(m21_)), m22(std::move(m22_)), m23(std::move(m23_)), m24(std::move(m24_))
        , m31(std::move(m31_)), m32(std::move(m32_)), m33(std::move(m33_)), m34(std::move(m34_))
        , m41(std::move(m41_)), m42(std::move(m42_)), m43(std::move(m43_)), m44(std::move(m44_)) {}

    /// Embed a 2D affine transform (Z passes through unchanged)
    explicit Matrix4x4(const Matrix3x2<T>& m) {
        m11 = m.m11; m12 = m.m12;
        m21 = m.m21; m22 = m.m22;
        m41 = m.m31; m42 = m.m32;
    }

    // =========================================================================
    // Properties
    // =========================================================================

    [[nodiscard]] Vector3<T> translation() const { return Vector3<T>(m41, m42, m43); }

    [[nodiscard]] bool is_identity() const { return *this == IDENTITY(); }

    [[nodiscard]] T determinant() const {
        const T& a = m11; const T& b = m12; const T& c = m13; const T& d = m14;
        const T& e = m21; const T& f = m22; const T& g = m23; const T& h = m24;
        const T& i = m31; const T& j = m32; const T& k = m33; const T& l = m34;
        const T& m = m41; const T& n = m42; const T& o = m43; const T& p = m44;

        const T kp_lo = k * p - l * o;
        const T jp_ln = j * p - l * n;
        const T jo_kn = j * o - k * n;
        const T ip_lm = i * p - l * m;
        const T io_km = i * o - k * m;
        const T in_jm = i * n - j * m;

        return a * (f * kp_lo - g * jp_ln + h * jo_kn)
             - b * (e * kp_lo - g * ip_lm + h * io_km)
             + c * (e * jp_ln - f * ip_lm + h * in_jm)
             - d * (e * jo_kn - f * io_km + g * in_jm);
    }

    // =========================================================================
    // Affine Factories
    // =========================================================================

    static Matrix4x4 create_translation(const Vector3<T>& position) {
        Matrix4x4 r;
        r.m41 = position.x;
        r.m42 = position.y;
        r.m43 = position.z;
        return r;
    }

    static Matrix4x4 create_translation(const T& x, const T& y, const T& z) {
        return create_translation(Vector3<T>(x, y, z));
    }

    static Matrix4x4 create_scale(const T& sx, const T& sy, const T& sz) {
        Matrix4x4 r;
        r.m11 = sx;
        r.m22 = sy;
        r.m33 = sz;
        return r;
    }

    static Matrix4x4 create_scale(const T& sx, const T& sy, const T& sz, const Vector3<T>& center) {
        Matrix4x4 r = create_scale(sx, sy, sz);
        const T one = num::one<T>();
        r.m41 = center.x * (one - sx);
        r.m42 = center.y * (one - sy);
        r.m43 = center.z * (one - sz);
        return r;
    }

    static Matrix4x4 create_scale(const Vector3<T>& scales) {
        return create_scale(scales.x, scales.y, scales.z);
    }

    static Matrix4x4 create_scale(const Vector3<T>& scales, const Vector3<T>& center) {
        return create_scale(scales.x, scales.y, scales.z, center);
    }

    static Matrix4x4 create_scale(const T& scale) {
        return create_scale(scale, scale, scale);
    }

    static Matrix4x4 create_scale(const T& scale, const Vector3<T>& center) {
        return create_scale(scale, scale, scale, center);
    }

    static Matrix4x4 create_rotation_x(const T& radians) {
        const T c = num::cos(radians);
        const T s = num::sin(radians);
        Matrix4x4 r;
        r.m22 = c;  r.m23 = s;
        r.m32 = -s; r.m33 = c;
        return r;
    }

    static Matrix4x4 create_rotation_x(const T& radians, const Vector3<T>& center) {
        Matrix4x4 r = create_rotation_x(radians);
        const T one = num::one<T>();
        r.m42 = center.y * (one - r.m22) + center.z * r.m23;
        r.m43 = center.z * (one - r.m22) - center.y * r.m23;
        return r;
    }

    static Matrix4x4 create_rotation_y(const T& radians) {
        const T c = num::cos(radians);
        const T s = num::sin(radians);
        Matrix4x4 r;
        r.m11 = c; r.m13 = -s;
        r.m31 = s; r.m33 = c;
        return r;
    }

    static Matrix4x4 create_rotation_y(const T& radians, const Vector3<T>& center) {
        Matrix4x4 r = create_rotation_y(radians);
        const T one = num::one<T>();
        r.m41 = center.x * (one - r.m11) - center.z * r.m31;
        r.m43 = center.z * (one - r.m11) + center.x * r.m31;
        return r;
    }

    static Matrix4x4 create_rotation_z(const T& radians) {
        const T c = num::cos(radians);
        const T s = num::sin(radians);
        Matrix4x4 r;
        r.m11 = c;  r.m12 = s;
        r.m21 = -s; r.m22 = c;
        return r;
    }

    static Matrix4x4 create_rotation_z(const T& radians, const Vector3<T>& center) {
        Matrix4x4 r = create_rotation_z(radians);
        const T one = num::one<T>();
        r.m41 = center.x * (one - r.m11) + center.y * r.m12;
        r.m42 = center.y * (one - r.m11) - center.x * r.m12;
        return r;
    }

    /// Rotation of angle radians about a unit axis
    static Matrix4x4 create_from_axis_angle(const Vector3<T>& axis, const T& angle) {
        const T& x = axis.x;
        const T& y = axis.y;
        const T& z = axis.z;
        const T sa = num::sin(angle);
        const T ca = num::cos(angle);
        const T xx = x * x, yy = y * y, zz = z * z;
        const T xy = x * y, xz = x * z, yz = y * z;
        const T one = num::one<T>();

        Matrix4x4 r;
        r.m11 = xx + ca * (one - xx);
        r.m12 = xy - ca * xy + sa * z;
        r.m13 = xz - ca * xz - sa * y;

        r.m21 = xy - ca * xy - sa * z;
        r.m22 = yy + ca * (one - yy);
        r.m23 = yz - ca * yz + sa * x;

        r.m31 = xz - ca * xz + sa * y;
        r.m32 = yz - ca * yz - sa * x;
        r.m33 = zz + ca * (one - zz);
        return r;
    }

    static Matrix4x4 create_from_quaternion(const Quaternion<T>& q) {
        const T xx = q.x * q.x, yy = q.y * q.y, zz = q.z * q.z;
        const T xy = q.x * q.y, wz = q.z * q.w, xz = q.z * q.x;
        const T wy = q.y * q.w, yz = q.y * q.z, wx = q.x * q.w;
        const T one = num::one<T>();
        const T two = num::two<T>();

        Matrix4x4 r;
        r.m11 = one - two * (yy + zz);
        r.m12 = two * (xy + wz);
        r.m13 = two * (xz - wy);

        r.m21 = two * (xy - wz);
        r.m22 = one - two * (zz + xx);
        r.m23 = two * (yz + wx);

        r.m31 = two * (xz + wy);
        r.m32 = two * (yz - wx);
        r.m33 = one - two * (yy + xx);
        return r;
    }

    static Matrix4x4 create_from_yaw_pitch_roll(const T& yaw, const T& pitch, const T& roll) {
        return create_from_quaternion(Quaternion<T>::from_yaw_pitch_roll(yaw, pitch, roll));
    }

    /// View matrix for a camera at camera_position looking at target
    static Matrix4x4 create_look_at(const Vector3<T>& camera_position, const Vector3<T>& target,
                                    const Vector3<T>& up) {
        const Vector3<T> zaxis = normalize(camera_position - target);
        const Vector3<T> xaxis = normalize(cross(up, zaxis));
        const Vector3<T> yaxis = cross(zaxis, xaxis);

        Matrix4x4 r;
        r.m11 = xaxis.x; r.m12 = yaxis.x; r.m13 = zaxis.x;
        r.m21 = xaxis.y; r.m22 = yaxis.y; r.m23 = zaxis.y;
        r.m31 = xaxis.z; r.m32 = yaxis.z; r.m33 = zaxis.z;
        r.m41 = -dot(xaxis, camera_position);
        r.m42 = -dot(yaxis, camera_position);
        r.m43 = -dot(zaxis, camera_position);
        return r;
    }

    /// World matrix placing an object at position facing forward
    static Matrix4x4 create_world(const Vector3<T>& position, const Vector3<T>& forward, const Vector3<T>& up) {
        const Vector3<T> zaxis = normalize(-forward);
        const Vector3<T> xaxis = normalize(cross(up, zaxis));
        const Vector3<T> yaxis = cross(zaxis, xaxis);
        return from_rows(xaxis, yaxis, zaxis, position);
    }

    /// Spherical billboard rotating about object_position to face the camera
    static Matrix4x4 create_billboard(const Vector3<T>& object_position, const Vector3<T>& camera_position,
                                      const Vector3<T>& camera_up, const Vector3<T>& camera_forward) {
        Vector3<T> zaxis = object_position - camera_position;
        const T norm = zaxis.length_squared();
        if (norm < billboard_epsilon()) {
            zaxis = -camera_forward;
        } else {
            zaxis = zaxis * (num::one<T>() / num::sqrt(norm));
        }

        const Vector3<T> xaxis = normalize(cross(camera_up, zaxis));
        const Vector3<T> yaxis = cross(zaxis, xaxis);
        return from_rows(xaxis, yaxis, zaxis, object_position);
    }

    /// Cylindrical billboard rotating about rotate_axis to face the camera
    static Matrix4x4 create_constrained_billboard(const Vector3<T>& object_position,
                                                  const Vector3<T>& camera_position,
                                                  const Vector3<T>& rotate_axis,
                                                  const Vector3<T>& camera_forward,
                                                  const Vector3<T>& object_forward) {
        // cos(0.1 degree)
        const T min_angle = num::one<T>() - T(1) / T(10) * consts::deg_to_rad<T>();

        Vector3<T> face_dir = object_position - camera_position;
        const T norm = face_dir.length_squared();
        if (norm < billboard_epsilon()) {
            face_dir = -camera_forward;
        } else {
            face_dir = face_dir * (num::one<T>() / num::sqrt(norm));
        }

        const Vector3<T> yaxis = rotate_axis;
        Vector3<T> xaxis;
        Vector3<T> zaxis;

        if (num::abs(dot(rotate_axis, face_dir)) > min_angle) {
            zaxis = object_forward;
            if (num::abs(dot(rotate_axis, zaxis)) > min_angle) {
                zaxis = num::abs(rotate_axis.z) > min_angle
                    ? Vector3<T>::UNIT_X()
                    : Vector3<T>(T(0), T(0), T(-1));
            }
            xaxis = normalize(cross(rotate_axis, zaxis));
            zaxis = normalize(cross(xaxis, rotate_axis));
        } else {
            xaxis = normalize(cross(rotate_axis, face_dir));
            zaxis = normalize(cross(xaxis, yaxis));
        }

        return from_rows(xaxis, yaxis, zaxis, object_position);
    }

    /// Flattens geometry onto plane along the light direction
    static Matrix4x4 create_shadow(const Vector3<T>& light_direction, const Plane<T>& plane) {
        const Plane<T> p = normalize(plane);
        const T d = dot(p.normal, light_direction);
        const T a = -p.normal.x;
        const T b = -p.normal.y;
        const T c = -p.normal.z;
        const T e = -p.d;
        const Vector3<T>& l = light_direction;

        return Matrix4x4(
            a * l.x + d, a * l.y,     a * l.z,     T(0),
            b * l.x,     b * l.y + d, b * l.z,     T(0),
            c * l.x,     c * l.y,     c * l.z + d, T(0),
            e * l.x,     e * l.y,     e * l.z,     d);
    }

    /// Mirror about plane
    static Matrix4x4 create_reflection(const Plane<T>& plane) {
        const Plane<T> p = normalize(plane);
        const T& a = p.normal.x;
        const T& b = p.normal.y;
        const T& c = p.normal.z;
        const T fa = T(-2) * a;
        const T fb = T(-2) * b;
        const T fc = T(-2) * c;
        const T one = num::one<T>();

        return Matrix4x4(
            fa * a + one, fb * a,       fc * a,       T(0),
            fa * b,       fb * b + one, fc * b,       T(0),
            fa * c,       fb * c,       fc * c + one, T(0),
            fa * p.d,     fb * p.d,     fc * p.d,     one);
    }

    // =========================================================================
    // Projection Factories
    // =========================================================================

    static spatial_core::Result<Matrix4x4> create_perspective_field_of_view(
        const T& field_of_view, const T& aspect_ratio, const T& near_plane, const T& far_plane)
    {
        if (field_of_view <= T(0) || field_of_view >= consts::pi<T>()) {
            return projection_error("field of view must be in (0, pi)");
        }
        if (auto err = check_depth_range(near_plane, far_plane)) {
            return *err;
        }

        const T y_scale = num::one<T>() / num::tan(field_of_view * num::half<T>());
        const T x_scale = y_scale / aspect_ratio;

        Matrix4x4 r = ZERO();
        r.m11 = x_scale;
        r.m22 = y_scale;
        r.m33 = far_plane / (near_plane - far_plane);
        r.m34 = T(-1);
        r.m43 = near_plane * far_plane / (near_plane - far_plane);
        return r;
    }

    static spatial_core::Result<Matrix4x4> create_perspective(
        const T& width, const T& height, const T& near_plane, const T& far_plane)
    {
        if (auto err = check_depth_range(near_plane, far_plane)) {
            return *err;
        }

        Matrix4x4 r = ZERO();
        r.m11 = num::two<T>() * near_plane / width;
        r.m22 = num::two<T>() * near_plane / height;
        r.m33 = far_plane / (near_plane - far_plane);
        r.m34 = T(-1);
        r.m43 = near_plane * far_plane / (near_plane - far_plane);
        return r;
    }

    static spatial_core::Result<Matrix4x4> create_perspective_off_center(
        const T& left, const T& right, const T& bottom, const T& top,
        const T& near_plane, const T& far_plane)
    {
        if (auto err = check_depth_range(near_plane, far_plane)) {
            return *err;
        }

        const T two = num::two<T>();
        Matrix4x4 r = ZERO();
        r.m11 = two * near_plane / (right - left);
        r.m22 = two * near_plane / (top - bottom);
        r.m31 = (left + right) / (right - left);
        r.m32 = (top + bottom) / (top - bottom);
        r.m33 = far_plane / (near_plane - far_plane);
        r.m34 = T(-1);
        r.m43 = near_plane * far_plane / (near_plane - far_plane);
        return r;
    }

    static Matrix4x4 create_orthographic(const T& width, const T& height,
                                         const T& z_near, const T& z_far) {
        Matrix4x4 r;
        r.m11 = num::two<T>() / width;
        r.m22 = num::two<T>() / height;
        r.m33 = num::one<T>() / (z_near - z_far);
        r.m43 = z_near / (z_near - z_far);
        return r;
    }

    static Matrix4x4 create_orthographic_off_center(const T& left, const T& right,
                                                    const T& bottom, const T& top,
                                                    const T& z_near, const T& z_far) {
        Matrix4x4 r;
        r.m11 = num::two<T>() / (right - left);
        r.m22 = num::two<T>() / (top - bottom);
        r.m33 = num::one<T>() / (z_near - z_far);
        r.m41 = (left + right) / (left - right);
        r.m42 = (top + bottom) / (bottom - top);
        r.m43 = z_near / (z_near - z_far);
        return r;
    }

    // =========================================================================
    // Operators
    // =========================================================================

    Matrix4x4 operator*(const Matrix4x4& b) const {
        return Matrix4x4(
            m11 * b.m11 + m12 * b.m21 + m13 * b.m31 + m14 * b.m41,
            m11 * b.m12 + m12 * b.m22 + m13 * b.m32 + m14 * b.m42,
            m11 * b.m13 + m12 * b.m23 + m13 * b.m33 + m14 * b.m43,
            m11 * b.m14 + m12 * b.m24 + m13 * b.m34 + m14 * b.m44,

            m21 * b.m11 + m22 * b.m21 + m23 * b.m31 + m24 * b.m41,
            m21 * b.m12 + m22 * b.m22 + m23 * b.m32 + m24 * b.m42,
            m21 * b.m13 + m22 * b.m23 + m23 * b.m33 + m24 * b.m43,
            m21 * b.m14 + m22 * b.m24 + m23 * b.m34 + m24 * b.m44,

            m31 * b.m11 + m32 * b.m21 + m33 * b.m31 + m34 * b.m41,
            m31 * b.m12 + m32 * b.m22 + m33 * b.m32 + m34 * b.m42,
            m31 * b.m13 + m32 * b.m23 + m33 * b.m33 + m34 * b.m43,
            m31 * b.m14 + m32 * b.m24 + m33 * b.m34 + m34 * b.m44,

            m41 * b.m11 + m42 * b.m21 + m43 * b.m31 + m44 * b.m41,
            m41 * b.m12 + m42 * b.m22 + m43 * b.m32 + m44 * b.m42,
            m41 * b.m13 + m42 * b.m23 + m43 * b.m33 + m44 * b.m43,
            m41 * b.m14 + m42 * b.m24 + m43 * b.m34 + m44 * b.m44);
    }

    Matrix4x4 operator*(const T& s) const {
        return map([&s](const T& v) { return v * s; });
    }

    Matrix4x4 operator+(const Matrix4x4& b) const {
        return zip(b, [](const T& l, const T& r) { return l + r; });
    }

    Matrix4x4 operator-(const Matrix4x4& b) const {
        return zip(b, [](const T& l, const T& r) { return l - r; });
    }

    Matrix4x4 operator-() const {
        return map([](const T& v) { return -v; });
    }

    bool operator==(const Matrix4x4& b) const {
        return m11 == b.m11 && m12 == b.m12 && m13 == b.m13 && m14 == b.m14
            && m21 == b.m21 && m22 == b.m22 && m23 == b.m23 && m24 == b.m24
            && m31 == b.m31 && m32 == b.m32 && m33 == b.m33 && m34 == b.m34
            && m41 == b.m41 && m42 == b.m42 && m43 == b.m43 && m44 == b.m44;
    }

    bool operator!=(const Matrix4x4& b) const { return !(*this == b); }

    /// Entries in row-major order
    [[nodiscard]] std::array<T, 16> to_array() const {
        return {m11, m12, m13, m14, m21, m22, m23, m24,
                m31, m32, m33, m34, m41, m42, m43, m44};
    }

    static Matrix4x4 from_array(const std::array<T, 16>& a) {
        return Matrix4x4(a[0], a[1], a[2], a[3], a[4], a[5], a[6], a[7],
                         a[8], a[9], a[10], a[11], a[12], a[13], a[14], a[15]);
    }

private:
    static T billboard_epsilon() { return T(1) / T(10000); }

    static Matrix4x4 from_rows(const Vector3<T>& x, const Vector3<T>& y,
                               const Vector3<T>& z, const Vector3<T>& w) {
        return Matrix4x4(
            x.x, x.y, x.z, T(0),
            y.x, y.y, y.z, T(0),
            z.x, z.y, z.z, T(0),
            w.x, w.y, w.z, T(1));
    }

    static spatial_core::Error projection_error(const std::string& reason) {
        spatial_core::math_logger()->debug("Rejected projection parameters: {}", reason);
        return spatial_core::Error(spatial_core::MatrixError::invalid_projection(reason));
    }

    static std::optional<spatial_core::Error> check_depth_range(const T& near_plane, const T& far_plane) {
        if (near_plane <= T(0)) {
            return projection_error("near plane distance must be positive");
        }
        if (far_plane <= T(0)) {
            return projection_error("far plane distance must be positive");
        }
        if (near_plane >= far_plane) {
            return projection_error("near plane must be closer than far plane");
        }
        return std::nullopt;
    }

    template<typename F>
    Matrix4x4 map(F&& f) const {
        return from_array(apply_each(to_array(), std::forward<F>(f)));
    }

    template<typename F>
    Matrix4x4 zip(const Matrix4x4& b, F&& f) const {
        auto l = to_array();
        const auto r = b.to_array();
        for (std::size_t i = 0; i < l.size(); ++i) {
            l[i] = f(l[i], r[i]);
        }
        return from_array(l);
    }

    template<typename F>
    static std::array<T, 16> apply_each(std::array<T, 16> a, F&& f) {
        for (auto& v : a) {
            v = f(v);
        }
        return a;
    }
};

// =============================================================================
// Free Functions
// =============================================================================

/// Decomposed affine transform
template<Scalar T>
struct Decomposition {
    Vector3<T> scale;
    Quaternion<T> rotation;
    Vector3<T> translation;
};

/// Inverse; singular input (|det| nearly zero) yields {IDENTITY, false}
template<Scalar T>
[[nodiscard]] inline std::pair<Matrix4x4<T>, bool> invert(const Matrix4x4<T>& mat) {
    const T& a = mat.m11; const T& b = mat.m12; const T& c = mat.m13; const T& d = mat.m14;
    const T& e = mat.m21; const T& f = mat.m22; const T& g = mat.m23; const T& h = mat.m24;
    const T& i = mat.m31; const T& j = mat.m32; const T& k = mat.m33; const T& l = mat.m34;
    const T& m = mat.m41; const T& n = mat.m42; const T& o = mat.m43; const T& p = mat.m44;

    const T kp_lo = k * p - l * o;
    const T jp_ln = j * p - l * n;
    const T jo_kn = j * o - k * n;
    const T ip_lm = i * p - l * m;
    const T io_km = i * o - k * m;
    const T in_jm = i * n - j * m;

    const T a11 = f * kp_lo - g * jp_ln + h * jo_kn;
    const T a12 = -(e * kp_lo - g * ip_lm + h * io_km);
    const T a13 = e * jp_ln - f * ip_lm + h * in_jm;
    const T a14 = -(e * jo_kn - f * io_km + g * in_jm);

    const T det = a * a11 + b * a12 + c * a13 + d * a14;
    if (is_nearly_zero(det)) {
        spatial_core::math_logger()->trace("Matrix4x4 not invertible (det = {})", num::to_string(det));
        return {Matrix4x4<T>::IDENTITY(), false};
    }

    const T inv = num::one<T>() / det;

    const T gp_ho = g * p - h * o;
    const T fp_hn = f * p - h * n;
    const T fo_gn = f * o - g * n;
    const T ep_hm = e * p - h * m;
    const T eo_gm = e * o - g * m;
    const T en_fm = e * n - f * m;

    const T gl_hk = g * l - h * k;
    const T fl_hj = f * l - h * j;
    const T fk_gj = f * k - g * j;
    const T el_hi = e * l - h * i;
    const T ek_gi = e * k - g * i;
    const T ej_fi = e * j - f * i;

    Matrix4x4<T> r;
    r.m11 = a11 * inv;
    r.m21 = a12 * inv;
    r.m31 = a13 * inv;
    r.m41 = a14 * inv;

    r.m12 = -(b * kp_lo - c * jp_ln + d * jo_kn) * inv;
    r.m22 = (a * kp_lo - c * ip_lm + d * io_km) * inv;
    r.m32 = -(a * jp_ln - b * ip_lm + d * in_jm) * inv;
    r.m42 = (a * jo_kn - b * io_km + c * in_jm) * inv;

    r.m13 = (b * gp_ho - c * fp_hn + d * fo_gn) * inv;
    r.m23 = -(a * gp_ho - c * ep_hm + d * eo_gm) * inv;
    r.m33 = (a * fp_hn - b * ep_hm + d * en_fm) * inv;
    r.m43 = -(a * fo_gn - b * eo_gm + c * en_fm) * inv;

    r.m14 = -(b * gl_hk - c * fl_hj + d * fk_gj) * inv;
    r.m24 = (a * gl_hk - c * el_hi + d * ek_gi) * inv;
    r.m34 = -(a * fl_hj - b * el_hi + d * ej_fi) * inv;
    r.m44 = (a * fk_gj - b * ek_gi + c * ej_fi) * inv;

    return {r, true};
}

template<Scalar T>
[[nodiscard]] inline Matrix4x4<T> transpose(const Matrix4x4<T>& m) {
    return Matrix4x4<T>(
        m.m11, m.m21, m.m31, m.m41,
        m.m12, m.m22, m.m32, m.m42,
        m.m13, m.m23, m.m33, m.m43,
        m.m14, m.m24, m.m34, m.m44);
}

template<Scalar T>
[[nodiscard]] inline Matrix4x4<T> lerp(const Matrix4x4<T>& a, const Matrix4x4<T>& b, const T& t) {
    return a + (b - a) * t;
}

/// Apply rotation after the transform m
template<Scalar T>
[[nodiscard]] inline Matrix4x4<T> transform(const Matrix4x4<T>& m, const Quaternion<T>& rotation) {
    return m * Matrix4x4<T>::create_from_quaternion(rotation);
}

/// Rotation part of a pure rotation matrix as a quaternion
template<Scalar T>
[[nodiscard]] inline Quaternion<T> quaternion_from_rotation_matrix(const Matrix4x4<T>& m) {
    const T half = num::half<T>();
    const T one = num::one<T>();
    const T trace = m.m11 + m.m22 + m.m33;

    if (trace > T(0)) {
        const T s = num::sqrt(trace + one);
        const T inv = half / s;
        return Quaternion<T>(
            (m.m23 - m.m32) * inv,
            (m.m31 - m.m13) * inv,
            (m.m12 - m.m21) * inv,
            s * half);
    }
    if (m.m11 >= m.m22 && m.m11 >= m.m33) {
        const T s = num::sqrt(one + m.m11 - m.m22 - m.m33);
        const T inv = half / s;
        return Quaternion<T>(
            half * s,
            (m.m12 + m.m21) * inv,
            (m.m13 + m.m31) * inv,
            (m.m23 - m.m32) * inv);
    }
    if (m.m22 > m.m33) {
        const T s = num::sqrt(one + m.m22 - m.m11 - m.m33);
        const T inv = half / s;
        return Quaternion<T>(
            (m.m21 + m.m12) * inv,
            half * s,
            (m.m32 + m.m23) * inv,
            (m.m31 - m.m13) * inv);
    }
    const T s = num::sqrt(one + m.m33 - m.m11 - m.m22);
    const T inv = half / s;
    return Quaternion<T>(
        (m.m31 + m.m13) * inv,
        (m.m32 + m.m23) * inv,
        half * s,
        (m.m12 - m.m21) * inv);
}

/// Split an affine matrix into scale, rotation and translation
///
/// Fails (std::nullopt) when any row of the 3x3 part is nearly zero, since
/// no rotation can be recovered from a collapsed axis. A negative
/// determinant is attributed to the X scale.
template<Scalar T>
[[nodiscard]] inline std::optional<Decomposition<T>> decompose(const Matrix4x4<T>& m) {
    Vector3<T> row_x(m.m11, m.m12, m.m13);
    Vector3<T> row_y(m.m21, m.m22, m.m23);
    Vector3<T> row_z(m.m31, m.m32, m.m33);

    Vector3<T> scale(row_x.length(), row_y.length(), row_z.length());
    if (is_nearly_zero(scale.x) || is_nearly_zero(scale.y) || is_nearly_zero(scale.z)) {
        spatial_core::math_logger()->trace("Matrix4x4 decompose failed: degenerate scale {}", to_string(scale));
        return std::nullopt;
    }

    row_x /= scale.x;
    row_y /= scale.y;
    row_z /= scale.z;

    if (dot(cross(row_x, row_y), row_z) < T(0)) {
        scale.x = -scale.x;
        row_x = -row_x;
    }

    Matrix4x4<T> rotation;
    rotation.m11 = row_x.x; rotation.m12 = row_x.y; rotation.m13 = row_x.z;
    rotation.m21 = row_y.x; rotation.m22 = row_y.y; rotation.m23 = row_y.z;
    rotation.m31 = row_z.x; rotation.m32 = row_z.y; rotation.m33 = row_z.z;

    return Decomposition<T>{scale, quaternion_from_rotation_matrix(rotation).normalize(), m.translation()};
}

// =============================================================================
// Vector / Plane Transforms
// =============================================================================

template<Scalar T>
[[nodiscard]] inline Vector2<T> transform(const Vector2<T>& v, const Matrix4x4<T>& m) {
    return Vector2<T>(
        v.x * m.m11 + v.y * m.m21 + m.m41,
        v.x * m.m12 + v.y * m.m22 + m.m42);
}

template<Scalar T>
[[nodiscard]] inline Vector2<T> transform_normal(const Vector2<T>& v, const Matrix4x4<T>& m) {
    return Vector2<T>(
        v.x * m.m11 + v.y * m.m21,
        v.x * m.m12 + v.y * m.m22);
}

/// Transform a point (w = 1), no perspective divide
template<Scalar T>
[[nodiscard]] inline Vector3<T> transform(const Vector3<T>& v, const Matrix4x4<T>& m) {
    return Vector3<T>(
        v.x * m.m11 + v.y * m.m21 + v.z * m.m31 + m.m41,
        v.x * m.m12 + v.y * m.m22 + v.z * m.m32 + m.m42,
        v.x * m.m13 + v.y * m.m23 + v.z * m.m33 + m.m43);
}

/// Transform a direction (w = 0)
template<Scalar T>
[[nodiscard]] inline Vector3<T> transform_normal(const Vector3<T>& v, const Matrix4x4<T>& m) {
    return Vector3<T>(
        v.x * m.m11 + v.y * m.m21 + v.z * m.m31,
        v.x * m.m12 + v.y * m.m22 + v.z * m.m32,
        v.x * m.m13 + v.y * m.m23 + v.z * m.m33);
}

template<Scalar T>
[[nodiscard]] inline Vector4<T> transform(const Vector4<T>& v, const Matrix4x4<T>& m) {
    return Vector4<T>(
        v.x * m.m11 + v.y * m.m21 + v.z * m.m31 + v.w * m.m41,
        v.x * m.m12 + v.y * m.m22 + v.z * m.m32 + v.w * m.m42,
        v.x * m.m13 + v.y * m.m23 + v.z * m.m33 + v.w * m.m43,
        v.x * m.m14 + v.y * m.m24 + v.z * m.m34 + v.w * m.m44);
}

/// Homogeneous transform of a point (w = 1)
template<Scalar T>
[[nodiscard]] inline Vector4<T> transform_to_vector4(const Vector3<T>& v, const Matrix4x4<T>& m) {
    return transform(Vector4<T>(v, num::one<T>()), m);
}

/// Plane through the transformed points (multiplies by the inverse transpose)
template<Scalar T>
[[nodiscard]] inline Plane<T> transform(const Plane<T>& plane, const Matrix4x4<T>& matrix) {
    const auto [m, ok] = invert(matrix);
    if (!ok) {
        spatial_core::math_logger()->debug("Plane transform by a singular matrix");
    }

    const T& x = plane.normal.x;
    const T& y = plane.normal.y;
    const T& z = plane.normal.z;
    const T& w = plane.d;

    return Plane<T>(
        x * m.m11 + y * m.m12 + z * m.m13 + w * m.m14,
        x * m.m21 + y * m.m22 + z * m.m23 + w * m.m24,
        x * m.m31 + y * m.m32 + z * m.m33 + w * m.m34,
        x * m.m41 + y * m.m42 + z * m.m43 + w * m.m44);
}

template<Scalar T>
[[nodiscard]] inline bool is_nearly_equal(const Matrix4x4<T>& a, const Matrix4x4<T>& b) {
    const auto l = a.to_array();
    const auto r = b.to_array();
    for (std::size_t i = 0; i < l.size(); ++i) {
        if (!is_nearly_equal(l[i], r[i])) {
            return false;
        }
    }
    return true;
}

} // namespace spatial_math
