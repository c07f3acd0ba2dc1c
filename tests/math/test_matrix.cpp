// spatial_math matrix tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <spatial/math/math.hpp>

using namespace spatial_math;
using Catch::Matchers::WithinAbs;

namespace {

bool same_vector(const Vector3d& a, const Vector3d& b, double tolerance = 1e-9) {
    return is_nearly_equal(a.x, b.x, tolerance)
        && is_nearly_equal(a.y, b.y, tolerance)
        && is_nearly_equal(a.z, b.z, tolerance);
}

/// q and -q are the same rotation
bool same_rotation(const Quaterniond& a, const Quaterniond& b, double tolerance = 1e-9) {
    return std::abs(std::abs(dot(a, b)) - 1.0) < tolerance;
}

} // anonymous namespace

// =============================================================================
// Matrix3x2 Tests
// =============================================================================

TEST_CASE("Matrix3x2 identity", "[math][matrix3x2]") {
    Matrix3x2d m;
    REQUIRE(m.is_identity());
    REQUIRE(m == Matrix3x2d::IDENTITY());
    REQUIRE(transform(Vector2d(2.0, -3.0), m) == Vector2d(2.0, -3.0));
}

TEST_CASE("Matrix3x2 invert", "[math][matrix3x2]") {
    SECTION("singular matrix reports failure with identity") {
        auto [inverse, ok] = invert(Matrix3x2d::create_scale(0.0));
        REQUIRE_FALSE(ok);
        REQUIRE(inverse == Matrix3x2d::IDENTITY());
    }

    SECTION("determinant below epsilon is singular") {
        auto [inverse, ok] = invert(Matrix3x2d::create_scale(1.0e-8, 1.0e-8));
        REQUIRE_FALSE(ok);
        REQUIRE(inverse.is_identity());
    }

    SECTION("inverse undoes the transform") {
        Matrix3x2d m = Matrix3x2d::create_rotation(0.7) * Matrix3x2d::create_translation(3.0, -1.0);
        auto [inverse, ok] = invert(m);
        REQUIRE(ok);
        REQUIRE(is_nearly_equal(m * inverse, Matrix3x2d::IDENTITY()));

        Vector2d p(1.5, 2.5);
        Vector2d back = transform(transform(p, m), inverse);
        REQUIRE_THAT(back.x, WithinAbs(p.x, 1e-12));
        REQUIRE_THAT(back.y, WithinAbs(p.y, 1e-12));
    }
}

TEST_CASE("Matrix3x2 row-vector composition", "[math][matrix3x2]") {
    Matrix3x2d rotate = Matrix3x2d::create_rotation(consts::half_pi<double>());
    Matrix3x2d translate = Matrix3x2d::create_translation(10.0, 0.0);
    Vector2d p(1.0, 0.0);

    SECTION("product applies left operand first") {
        REQUIRE(transform(p, rotate * translate) == transform(transform(p, rotate), translate));
        REQUIRE(transform(p, rotate * translate) == Vector2d(10.0, 1.0));
    }

    SECTION("reversed order differs") {
        REQUIRE(transform(p, translate * rotate) == Vector2d(0.0, 11.0));
    }

    SECTION("quarter turns are exact") {
        REQUIRE(rotate.m11 == 0.0);
        REQUIRE(rotate.m12 == 1.0);
    }

    SECTION("translation ignored for normals") {
        REQUIRE(transform_normal(p, translate) == p);
    }
}

TEST_CASE("Matrix3x2 scale about center", "[math][matrix3x2]") {
    Vector2d center(2.0, 2.0);
    Matrix3x2d m = Matrix3x2d::create_scale(3.0, center);
    REQUIRE(transform(center, m) == center);
    REQUIRE(transform(Vector2d(3.0, 2.0), m) == Vector2d(5.0, 2.0));
    REQUIRE_THAT(m.determinant(), WithinAbs(9.0, 1e-12));
}

// =============================================================================
// Matrix4x4 Tests
// =============================================================================

TEST_CASE("Matrix4x4 invert", "[math][matrix4x4]") {
    SECTION("singular matrix") {
        auto [inverse, ok] = invert(Matrix4x4d::ZERO());
        REQUIRE_FALSE(ok);
        REQUIRE(inverse.is_identity());
    }

    SECTION("affine inverse") {
        Matrix4x4d m = Matrix4x4d::create_scale(2.0, 3.0, 4.0)
            * Matrix4x4d::create_rotation_y(0.3)
            * Matrix4x4d::create_translation(1.0, 2.0, 3.0);
        auto [inverse, ok] = invert(m);
        REQUIRE(ok);
        REQUIRE(is_nearly_equal(m * inverse, Matrix4x4d::IDENTITY()));
        REQUIRE_THAT(m.determinant(), WithinAbs(24.0, 1e-9));
    }
}

TEST_CASE("Matrix4x4 row-vector composition", "[math][matrix4x4]") {
    Matrix4x4d rotate = Matrix4x4d::create_rotation_z(consts::half_pi<double>());
    Matrix4x4d translate = Matrix4x4d::create_translation(10.0, 0.0, 0.0);
    Vector3d p(1.0, 0.0, 0.0);

    REQUIRE(same_vector(transform(p, rotate * translate), Vector3d(10.0, 1.0, 0.0)));
    REQUIRE(same_vector(transform(p, translate * rotate), Vector3d(0.0, 11.0, 0.0)));
    REQUIRE(same_vector(transform_normal(p, translate), p));
}

TEST_CASE("Matrix4x4 agrees with quaternion rotation", "[math][matrix4x4]") {
    auto q = Quaterniond::from_axis_angle(normalize(Vector3d(1.0, 2.0, -1.0)), 1.1);
    Matrix4x4d m = Matrix4x4d::create_from_quaternion(q);
    Vector3d v(0.5, -2.0, 3.0);
    REQUIRE(same_vector(transform(v, m), transform(v, q)));
    REQUIRE(same_vector(transform(v, transform(Matrix4x4d::IDENTITY(), q)), transform(v, q)));
}

TEST_CASE("Quaternion from rotation matrix", "[math][matrix4x4]") {
    const Quaterniond rotations[] = {
        Quaterniond::from_axis_angle(Vector3d::UNIT_Z(), 0.5),          // positive trace
        Quaterniond::from_axis_angle(Vector3d::UNIT_X(), consts::pi<double>()),  // M11 pivot
        Quaterniond::from_axis_angle(Vector3d::UNIT_Y(), consts::pi<double>()),  // M22 pivot
        Quaterniond::from_axis_angle(Vector3d::UNIT_Z(), consts::pi<double>()),  // M33 pivot
        Quaterniond::from_axis_angle(normalize(Vector3d(1.0, 1.0, 1.0)), 3.0),
    };

    for (const auto& q : rotations) {
        auto recovered = quaternion_from_rotation_matrix(Matrix4x4d::create_from_quaternion(q));
        REQUIRE(num::is_finite(recovered.w));
        REQUIRE_THAT(length(recovered), WithinAbs(1.0, 1e-9));
        REQUIRE(same_rotation(recovered, q));
    }
}

TEST_CASE("Matrix4x4 decompose", "[math][matrix4x4]") {
    SECTION("scale, rotation and translation") {
        auto q = Quaterniond::from_axis_angle(Vector3d::UNIT_Y(), 0.8);
        Matrix4x4d m = Matrix4x4d::create_scale(2.0, 3.0, 4.0)
            * Matrix4x4d::create_from_quaternion(q)
            * Matrix4x4d::create_translation(5.0, 6.0, 7.0);

        auto parts = decompose(m);
        REQUIRE(parts.has_value());
        REQUIRE(same_vector(parts->scale, Vector3d(2.0, 3.0, 4.0)));
        REQUIRE(same_vector(parts->translation, Vector3d(5.0, 6.0, 7.0)));
        REQUIRE(same_rotation(parts->rotation, q));
    }

    SECTION("collapsed axis") {
        REQUIRE_FALSE(decompose(Matrix4x4d::create_scale(1.0, 0.0, 1.0)).has_value());
    }

    SECTION("mirrored axis is reported as negative X scale") {
        auto parts = decompose(Matrix4x4d::create_scale(-2.0, 1.0, 1.0));
        REQUIRE(parts.has_value());
        REQUIRE_THAT(parts->scale.x, WithinAbs(-2.0, 1e-12));
        REQUIRE(parts->rotation.is_identity());
    }
}

TEST_CASE("Matrix4x4 projections", "[math][matrix4x4]") {
    SECTION("perspective field of view") {
        auto m = Matrix4x4d::create_perspective_field_of_view(consts::half_pi<double>(), 2.0, 1.0, 100.0);
        REQUIRE(m.is_ok());
        REQUIRE_THAT(m->m22, WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(m->m11, WithinAbs(0.5, 1e-12));
        REQUIRE(m->m34 == -1.0);
    }

    SECTION("invalid field of view") {
        auto m = Matrix4x4d::create_perspective_field_of_view(consts::pi<double>(), 1.0, 1.0, 10.0);
        REQUIRE(m.is_err());
        REQUIRE(m.error().is<spatial_core::MatrixError>());
    }

    SECTION("depth range") {
        REQUIRE(Matrix4x4d::create_perspective(1.0, 1.0, 0.0, 10.0).is_err());
        REQUIRE(Matrix4x4d::create_perspective(1.0, 1.0, 5.0, 1.0).is_err());
        REQUIRE(Matrix4x4d::create_perspective(1.0, 1.0, 1.0, 10.0).is_ok());
    }
}

TEST_CASE("Matrix4x4 look at", "[math][matrix4x4]") {
    Matrix4x4d view = Matrix4x4d::create_look_at(Vector3d(0.0, 0.0, 5.0), Vector3d::ZERO(), Vector3d::UNIT_Y());
    REQUIRE(same_vector(transform(Vector3d::ZERO(), view), Vector3d(0.0, 0.0, -5.0)));
}

TEST_CASE("Matrix4x4 array layout", "[math][matrix4x4]") {
    Matrix4x4d m = Matrix4x4d::create_translation(1.0, 2.0, 3.0);
    auto a = m.to_array();
    REQUIRE(a[12] == 1.0);
    REQUIRE(a[13] == 2.0);
    REQUIRE(a[14] == 3.0);
    REQUIRE(Matrix4x4d::from_array(a) == m);
    REQUIRE(transpose(transpose(m)) == m);
}
