#pragma once

/// @file glm_interop.hpp
/// @brief Conversions between spatial_math and GLM types (float and double)
///
/// spatial_math matrices use row vectors (v * M), GLM uses column vectors
/// (M * v) stored column-major. Row r of a Matrix4x4 therefore becomes
/// column r of the glm::mat, and glm_matrix * v reproduces v * M.

#include "matrix4x4.hpp"

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include <type_traits>

namespace spatial_math {

/// Scalars GLM can store
template<typename T>
concept GlmScalar = std::is_same_v<T, float> || std::is_same_v<T, double>;

template<GlmScalar T>
[[nodiscard]] inline glm::vec<2, T> to_glm(const Vector2<T>& v) { return {v.x, v.y}; }

template<GlmScalar T>
[[nodiscard]] inline glm::vec<3, T> to_glm(const Vector3<T>& v) { return {v.x, v.y, v.z}; }

template<GlmScalar T>
[[nodiscard]] inline glm::vec<4, T> to_glm(const Vector4<T>& v) { return {v.x, v.y, v.z, v.w}; }

/// glm::qua constructor order is (w, x, y, z)
template<GlmScalar T>
[[nodiscard]] inline glm::qua<T> to_glm(const Quaternion<T>& q) { return glm::qua<T>(q.w, q.x, q.y, q.z); }

template<GlmScalar T>
[[nodiscard]] inline glm::mat<4, 4, T> to_glm(const Matrix4x4<T>& m) {
    glm::mat<4, 4, T> g;
    g[0] = glm::vec<4, T>(m.m11, m.m12, m.m13, m.m14);
    g[1] = glm::vec<4, T>(m.m21, m.m22, m.m23, m.m24);
    g[2] = glm::vec<4, T>(m.m31, m.m32, m.m33, m.m34);
    g[3] = glm::vec<4, T>(m.m41, m.m42, m.m43, m.m44);
    return g;
}

template<GlmScalar T>
[[nodiscard]] inline Vector2<T> from_glm(const glm::vec<2, T>& v) { return Vector2<T>(v.x, v.y); }

template<GlmScalar T>
[[nodiscard]] inline Vector3<T> from_glm(const glm::vec<3, T>& v) { return Vector3<T>(v.x, v.y, v.z); }

template<GlmScalar T>
[[nodiscard]] inline Vector4<T> from_glm(const glm::vec<4, T>& v) { return Vector4<T>(v.x, v.y, v.z, v.w); }

template<GlmScalar T>
[[nodiscard]] inline Quaternion<T> from_glm(const glm::qua<T>& q) { return Quaternion<T>(q.x, q.y, q.z, q.w); }

template<GlmScalar T>
[[nodiscard]] inline Matrix4x4<T> from_glm(const glm::mat<4, 4, T>& g) {
    return Matrix4x4<T>(
        g[0][0], g[0][1], g[0][2], g[0][3],
        g[1][0], g[1][1], g[1][2], g[1][3],
        g[2][0], g[2][1], g[2][2], g[2][3],
        g[3][0], g[3][1], g[3][2], g[3][3]);
}

} // namespace spatial_math
