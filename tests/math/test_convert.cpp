// spatial_math precision conversion and GLM interop tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <spatial/math/math.hpp>
#include <spatial/math/glm_interop.hpp>

using namespace spatial_math;
using Catch::Matchers::WithinAbs;

// =============================================================================
// Widening
// =============================================================================

TEST_CASE("Widening conversions", "[math][convert]") {
    SECTION("float to double") {
        Vector3d v = widen<double>(Vector3f(1.5f, -2.0f, 0.25f));
        REQUIRE(v == Vector3d(1.5, -2.0, 0.25));
    }

    SECTION("double to decimal") {
        Vector2<Decimal> v = widen<Decimal>(Vector2d(0.5, 4.0));
        REQUIRE(v.x == Decimal("0.5"));
        REQUIRE(v.y == Decimal(4));
    }

    SECTION("quaternion and matrix") {
        auto q = widen<HugeNumber>(Quaterniond::IDENTITY());
        REQUIRE(q.is_identity());
        auto m = widen<double>(Matrix4x4f::create_translation(1.0f, 2.0f, 3.0f));
        REQUIRE(m.translation() == Vector3d(1.0, 2.0, 3.0));
    }

    SECTION("widening only compiles toward more digits") {
        STATIC_REQUIRE(WideningConversion<double, float>);
        STATIC_REQUIRE(WideningConversion<Decimal, double>);
        STATIC_REQUIRE_FALSE(WideningConversion<float, double>);
    }
}

// =============================================================================
// Narrowing
// =============================================================================

TEST_CASE("Narrowing conversions", "[math][convert]") {
    SECTION("in range values narrow") {
        auto v = narrow<float>(Vector3d(1.0, 2.0, 3.0));
        REQUIRE(v.is_ok());
        REQUIRE(v.value() == Vector3f(1.0f, 2.0f, 3.0f));
    }

    SECTION("huge magnitude does not fit in double") {
        Vector3<HugeNumber> big(HugeNumber("1e400"), HugeNumber(1), HugeNumber(2));
        auto v = narrow<double>(big);
        REQUIRE(v.is_err());
        REQUIRE(v.error().is<spatial_core::ConversionError>());
        REQUIRE(v.error().code() == spatial_core::ErrorCode::OutOfRange);
    }

    SECTION("double overflow into float") {
        REQUIRE(narrow_scalar<float>(1.0e300).is_err());
        REQUIRE(narrow_scalar<float>(1.0e3).is_ok());
    }

    SECTION("existing non-finite values pass through") {
        auto v = narrow<float>(Vector2d(num::nan<double>(), 1.0));
        REQUIRE(v.is_ok());
        REQUIRE_FALSE(num::is_finite(v.value().x));
    }

    SECTION("decimal to double keeps the value") {
        auto m = narrow<double>(Matrix3x2<Decimal>::create_translation(Decimal("2.5"), Decimal(-1)));
        REQUIRE(m.is_ok());
        REQUIRE(m.value().translation() == Vector2d(2.5, -1.0));
    }
}

// =============================================================================
// GLM Interop
// =============================================================================

TEST_CASE("GLM interop", "[math][convert][glm]") {
    SECTION("vectors") {
        Vector3f v(1.0f, 2.0f, 3.0f);
        glm::vec3 g = to_glm(v);
        REQUIRE(g.x == 1.0f);
        REQUIRE(g.z == 3.0f);
        REQUIRE(from_glm(g) == v);
    }

    SECTION("quaternion component order") {
        Quaterniond q(0.1, 0.2, 0.3, 0.9);
        glm::dquat g = to_glm(q);
        REQUIRE(g.w == 0.9);
        REQUIRE(g.x == 0.1);
        REQUIRE(from_glm(g) == q);
    }

    SECTION("row-vector matrix becomes column-vector matrix") {
        Matrix4x4d m = Matrix4x4d::create_rotation_z(0.4) * Matrix4x4d::create_translation(1.0, -2.0, 3.0);
        glm::dmat4 g = to_glm(m);
        Vector3d p(0.5, 1.5, -1.0);

        Vector3d expected = transform(p, m);
        glm::dvec4 actual = g * glm::dvec4(p.x, p.y, p.z, 1.0);
        REQUIRE_THAT(actual.x, WithinAbs(expected.x, 1e-12));
        REQUIRE_THAT(actual.y, WithinAbs(expected.y, 1e-12));
        REQUIRE_THAT(actual.z, WithinAbs(expected.z, 1e-12));
        REQUIRE(from_glm(g) == m);
    }
}
