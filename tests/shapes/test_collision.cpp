// spatial_shapes swept collision tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <spatial/shapes/shape.hpp>

#include <cmath>

using namespace spatial_shapes;
using spatial_math::Vector3d;
using Catch::Matchers::WithinAbs;

namespace {

/// Unit sphere travelling ten units along +X from the origin
Capsule<double> sweep_along_x() {
    return Capsule<double>(Vector3d(10.0, 0.0, 0.0), 1.0, Vector3d(5.0, 0.0, 0.0));
}

void require_near(const Vector3d& actual, const Vector3d& expected, double tolerance = 1e-9) {
    REQUIRE_THAT(actual.x, WithinAbs(expected.x, tolerance));
    REQUIRE_THAT(actual.y, WithinAbs(expected.y, tolerance));
    REQUIRE_THAT(actual.z, WithinAbs(expected.z, tolerance));
}

} // anonymous namespace

TEST_CASE("Sweep against a sphere", "[shapes][collision]") {
    const auto sweep = sweep_along_x();

    SECTION("first contact") {
        auto hit = swept_collision_point(sweep, Sphere<double>(1.0, Vector3d(6.0, 0.0, 0.0)));
        REQUIRE(hit.has_value());
        require_near(*hit, Vector3d(4.0, 0.0, 0.0));
    }

    SECTION("glancing contact off the path") {
        auto hit = swept_collision_point(sweep, Sphere<double>(1.0, Vector3d(6.0, 1.0, 0.0)));
        REQUIRE(hit.has_value());
        require_near(*hit, Vector3d(6.0 - std::sqrt(3.0), 0.0, 0.0));
    }

    SECTION("passing beside") {
        REQUIRE_FALSE(swept_collision_point(sweep, Sphere<double>(1.0, Vector3d(6.0, 3.0, 0.0))).has_value());
    }

    SECTION("beyond the end of the path") {
        REQUIRE_FALSE(swept_collision_point(sweep, Sphere<double>(1.0, Vector3d(15.0, 0.0, 0.0))).has_value());
    }

    SECTION("behind the start") {
        REQUIRE_FALSE(swept_collision_point(sweep, Sphere<double>(1.0, Vector3d(-5.0, 0.0, 0.0))).has_value());
    }

    SECTION("already touching at the start") {
        auto hit = swept_collision_point(sweep, Sphere<double>(1.5, Vector3d(1.0, 1.0, 0.0)));
        REQUIRE(hit.has_value());
        require_near(*hit, Vector3d::ZERO());
    }
}

TEST_CASE("Sweep against a point", "[shapes][collision]") {
    auto hit = swept_collision_point(sweep_along_x(), SinglePoint<double>(Vector3d(5.0, 0.5, 0.0)));
    REQUIRE(hit.has_value());
    require_near(*hit, Vector3d(5.0 - std::sqrt(0.75), 0.0, 0.0));
}

TEST_CASE("Sweep against a segment", "[shapes][collision]") {
    const auto sweep = sweep_along_x();

    SECTION("crossing the path side-on") {
        auto hit = swept_collision_point(sweep, Line<double>::create(Vector3d(6.0, -2.0, 0.0), Vector3d(6.0, 2.0, 0.0)));
        REQUIRE(hit.has_value());
        require_near(*hit, Vector3d(5.0, 0.0, 0.0));
    }

    SECTION("end cap hit") {
        auto hit = swept_collision_point(sweep, Line<double>::create(Vector3d(6.0, 1.0, 0.0), Vector3d(6.0, 5.0, 0.0)));
        REQUIRE(hit.has_value());
        require_near(*hit, Vector3d(6.0, 0.0, 0.0));
    }

    SECTION("parallel segment ahead") {
        auto hit = swept_collision_point(sweep, Line<double>::create(Vector3d(7.0, 0.0, 0.0), Vector3d(9.0, 0.0, 0.0)));
        REQUIRE(hit.has_value());
        require_near(*hit, Vector3d(6.0, 0.0, 0.0));
    }

    SECTION("out of reach") {
        auto miss = swept_collision_point(sweep, Line<double>::create(Vector3d(6.0, 2.0, -1.0), Vector3d(6.0, 2.0, 1.0)));
        REQUIRE_FALSE(miss.has_value());
    }
}

TEST_CASE("Sweep against a capsule", "[shapes][collision]") {
    auto hit = swept_collision_point(sweep_along_x(),
                                     Capsule<double>(Vector3d(0.0, 4.0, 0.0), 0.5, Vector3d(6.0, 0.0, 0.0)));
    REQUIRE(hit.has_value());
    require_near(*hit, Vector3d(4.5, 0.0, 0.0));
}

TEST_CASE("Sweep against a box", "[shapes][collision]") {
    const auto sweep = sweep_along_x();

    SECTION("face contact") {
        auto hit = swept_collision_point(sweep, Cuboid<double>(2.0, 2.0, 2.0, Vector3d(6.0, 0.0, 0.0)));
        REQUIRE(hit.has_value());
        require_near(*hit, Vector3d(4.0, 0.0, 0.0), 1e-6);
    }

    SECTION("passing over the top") {
        REQUIRE_FALSE(swept_collision_point(sweep, Cuboid<double>(2.0, 2.0, 2.0, Vector3d(6.0, 2.5, 0.0))).has_value());
    }
}

TEST_CASE("Other targets use their containing ball", "[shapes][collision]") {
    auto hit = swept_collision_point(sweep_along_x(), Ellipsoid<double>(2.0, 1.0, 1.0, Vector3d(6.0, 0.0, 0.0)));
    REQUIRE(hit.has_value());
    require_near(*hit, Vector3d(3.0, 0.0, 0.0));

    Shape<double> target = Torus<double>(1.5, 0.5, Vector3d(8.0, 0.0, 0.0));
    auto torus_hit = swept_collision_point(sweep_along_x(), target);
    REQUIRE(torus_hit.has_value());
    require_near(*torus_hit, Vector3d(5.0, 0.0, 0.0));
}

TEST_CASE("collision_point sweeps the moving shape's containing ball", "[shapes][collision]") {
    const Vector3d path(10.0, 0.0, 0.0);

    SECTION("moving sphere") {
        auto hit = collision_point(Sphere<double>(1.0), path, Sphere<double>(1.0, Vector3d(6.0, 0.0, 0.0)));
        REQUIRE(hit.has_value());
        require_near(*hit, Vector3d(4.0, 0.0, 0.0));
    }

    SECTION("moving shape wrapped in Shape") {
        Shape<double> moving = Sphere<double>(1.0, Vector3d(0.0, 0.0, 2.0));
        Shape<double> target = Sphere<double>(1.0, Vector3d(6.0, 0.0, 2.0));
        auto hit = collision_point(moving, path, target);
        REQUIRE(hit.has_value());
        require_near(*hit, Vector3d(4.0, 0.0, 2.0));
    }

    SECTION("a thin mover reports contact its outline would miss") {
        // Containing radius of this rod is its length, 3
        auto rod = Line<double>::create(Vector3d(-1.5, 0.0, 0.0), Vector3d(1.5, 0.0, 0.0));
        auto hit = collision_point(rod, Vector3d(0.0, 0.0, 10.0), SinglePoint<double>(Vector3d(0.0, 2.5, 5.0)));
        REQUIRE(hit.has_value());
    }

    SECTION("nothing along the path") {
        REQUIRE_FALSE(collision_point(Sphere<double>(1.0), path, Sphere<double>(1.0, Vector3d(6.0, 5.0, 0.0))).has_value());
    }
}
