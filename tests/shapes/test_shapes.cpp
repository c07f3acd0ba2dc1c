// spatial_shapes shape kind tests

#include <catch2/catch_template_test_macros.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <spatial/shapes/shape.hpp>

#include <cmath>
#include <stdexcept>
#include <string>

using namespace spatial_shapes;
using spatial_core::ErrorCode;
using spatial_core::ShapeError;
using spatial_math::Decimal;
using spatial_math::HugeNumber;
using spatial_math::Quaterniond;
using spatial_math::Vector3d;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

constexpr double k_pi = 3.14159265358979323846;

Quaterniond quarter_turn(const Vector3d& axis) {
    return Quaterniond::from_axis_angle(axis, k_pi / 2.0);
}

} // anonymous namespace

// =============================================================================
// Derived fields
// =============================================================================

TEST_CASE("SinglePoint", "[shapes][point]") {
    SinglePoint<double> p(Vector3d(1.0, 2.0, 3.0));
    REQUIRE(p.type() == ShapeType::SinglePoint);
    REQUIRE(p.containing_radius() == 0.0);
    REQUIRE(p.volume() == 0.0);
    REQUIRE(p.highest_point() == Vector3d(1.0, 2.0, 3.0));
    REQUIRE(p.is_point_within(Vector3d(1.0, 2.0, 3.0)));
    REQUIRE_FALSE(p.is_point_within(Vector3d(1.0, 2.0, 3.001)));
}

TEST_CASE("Line", "[shapes][line]") {
    auto line = Line<double>::create(Vector3d(0.0, 0.0, 0.0), Vector3d(4.0, 0.0, 0.0));

    SECTION("derived fields") {
        REQUIRE(line.position() == Vector3d(2.0, 0.0, 0.0));
        REQUIRE(line.path() == Vector3d(4.0, 0.0, 0.0));
        REQUIRE(line.start() == Vector3d(0.0, 0.0, 0.0));
        REQUIRE(line.end() == Vector3d(4.0, 0.0, 0.0));
        REQUIRE_THAT(line.length(), WithinAbs(4.0, 1e-12));
        REQUIRE_THAT(line.containing_radius(), WithinAbs(4.0, 1e-12));
        REQUIRE(line.volume() == 0.0);
    }

    SECTION("distance and closest point") {
        REQUIRE_THAT(line.distance_to(Vector3d(2.0, 3.0, 0.0)), WithinAbs(3.0, 1e-12));
        REQUIRE_THAT(line.distance_to(Vector3d(-3.0, 4.0, 0.0)), WithinAbs(5.0, 1e-12));
        REQUIRE(line.closest_point(Vector3d(9.0, 1.0, 0.0)) == Vector3d(4.0, 0.0, 0.0));
    }

    SECTION("containment") {
        REQUIRE(line.is_point_within(Vector3d(1.5, 0.0, 0.0)));
        REQUIRE_FALSE(line.is_point_within(Vector3d(1.5, 0.01, 0.0)));
        REQUIRE_FALSE(line.is_point_within(Vector3d(4.5, 0.0, 0.0)));
    }

    SECTION("highest and lowest follow the endpoints") {
        auto rising = Line<double>::create(Vector3d(0.0, 5.0, 0.0), Vector3d(0.0, -1.0, 0.0));
        REQUIRE(rising.highest_point() == Vector3d(0.0, 5.0, 0.0));
        REQUIRE(rising.lowest_point() == Vector3d(0.0, -1.0, 0.0));
    }
}

TEST_CASE("Sphere", "[shapes][sphere]") {
    Sphere<double> s(2.0, Vector3d(1.0, 0.0, 0.0));
    REQUIRE(s.type() == ShapeType::Sphere);
    REQUIRE_THAT(s.volume(), WithinRel(4.0 / 3.0 * k_pi * 8.0, 1e-12));
    REQUIRE(s.containing_radius() == 2.0);
    REQUIRE(s.smallest_dimension() == 2.0);
    REQUIRE(s.highest_point() == Vector3d(1.0, 2.0, 0.0));
    REQUIRE(s.lowest_point() == Vector3d(1.0, -2.0, 0.0));
    REQUIRE(s.is_point_within(Vector3d(3.0, 0.0, 0.0)));
    REQUIRE_FALSE(s.is_point_within(Vector3d(3.01, 0.0, 0.0)));
}

TEST_CASE("HollowSphere", "[shapes][hollow_sphere]") {
    HollowSphere<double> h(1.0, 2.0);
    REQUIRE_THAT(h.volume(), WithinRel(4.0 / 3.0 * k_pi * 7.0, 1e-12));
    REQUIRE(h.containing_radius() == 2.0);
    REQUIRE(h.is_point_within(Vector3d(1.5, 0.0, 0.0)));
    REQUIRE(h.is_point_within(Vector3d(0.0, 1.0, 0.0)));
    REQUIRE_FALSE(h.is_point_within(Vector3d(0.5, 0.0, 0.0)));
    REQUIRE_FALSE(h.is_point_within(Vector3d(0.0, 0.0, 2.5)));
}

TEST_CASE("Capsule", "[shapes][capsule]") {
    Capsule<double> c(Vector3d(0.0, 10.0, 0.0), 1.0);

    REQUIRE(c.start() == Vector3d(0.0, -5.0, 0.0));
    REQUIRE(c.end() == Vector3d(0.0, 5.0, 0.0));
    REQUIRE_THAT(c.path_length(), WithinAbs(10.0, 1e-12));
    REQUIRE_THAT(c.length(), WithinAbs(12.0, 1e-12));
    REQUIRE_THAT(c.containing_radius(), WithinAbs(6.0, 1e-12));
    REQUIRE_THAT(c.volume(), WithinRel(k_pi * 10.0 + 4.0 / 3.0 * k_pi, 1e-12));
    REQUIRE(c.highest_point() == Vector3d(0.0, 6.0, 0.0));
    REQUIRE(c.lowest_point() == Vector3d(0.0, -6.0, 0.0));

    REQUIRE(c.is_point_within(Vector3d(0.9, 0.0, 0.0)));
    REQUIRE(c.is_point_within(Vector3d(0.0, 5.9, 0.0)));
    REQUIRE_FALSE(c.is_point_within(Vector3d(0.9, 5.9, 0.0)));
    REQUIRE_FALSE(c.is_point_within(Vector3d(1.1, 0.0, 0.0)));
}

TEST_CASE("Cylinder", "[shapes][cylinder]") {
    Cylinder<double> c(Vector3d(0.0, 0.0, 6.0), 4.0, Vector3d(0.0, 1.0, 0.0));

    REQUIRE_THAT(c.containing_radius(), WithinAbs(5.0, 1e-12));
    REQUIRE_THAT(c.volume(), WithinRel(k_pi * 16.0 * 6.0, 1e-12));
    REQUIRE_THAT(c.smallest_dimension(), WithinAbs(6.0, 1e-12));

    SECTION("a horizontal axis puts the highest point on the rim") {
        REQUIRE_THAT(c.highest_point().y, WithinAbs(5.0, 1e-12));
        REQUIRE_THAT(c.lowest_point().y, WithinAbs(-3.0, 1e-12));
    }

    SECTION("flat end faces") {
        REQUIRE(c.is_point_within(Vector3d(0.0, 1.0, 2.9)));
        REQUIRE(c.is_point_within(Vector3d(3.9, 1.0, -2.9)));
        REQUIRE_FALSE(c.is_point_within(Vector3d(0.0, 1.0, 3.1)));
        REQUIRE_FALSE(c.is_point_within(Vector3d(4.1, 1.0, 0.0)));
    }
}

TEST_CASE("Cone", "[shapes][cone]") {
    Cone<double> cone(Vector3d(0.0, -4.0, 0.0), 2.0, Vector3d(0.0, 2.0, 0.0));

    SECTION("apex sits at the start of the axis") {
        REQUIRE(cone.apex() == Vector3d(0.0, 4.0, 0.0));
        REQUIRE(cone.base_center() == Vector3d(0.0, 0.0, 0.0));
        REQUIRE(cone.highest_point() == Vector3d(0.0, 4.0, 0.0));
        REQUIRE_THAT(cone.volume(), WithinRel(k_pi * 4.0 * 4.0 / 3.0, 1e-12));
    }

    SECTION("containment narrows toward the apex") {
        REQUIRE(cone.is_point_within(Vector3d(1.9, 0.0, 0.0)));
        REQUIRE(cone.is_point_within(Vector3d(0.0, 3.9, 0.0)));
        REQUIRE_FALSE(cone.is_point_within(Vector3d(1.9, 3.0, 0.0)));
        REQUIRE_FALSE(cone.is_point_within(Vector3d(0.0, -0.1, 0.0)));
    }

    SECTION("from apex and opening angle") {
        auto c = Cone<double>::from_apex(Vector3d(0.0, 0.0, 0.0), Vector3d(0.0, 0.0, 3.0), k_pi / 2.0);
        REQUIRE_THAT(c.radius(), WithinAbs(3.0, 1e-12));
        REQUIRE(c.apex() == Vector3d(0.0, 0.0, 0.0));
        REQUIRE(c.position() == Vector3d(0.0, 0.0, 1.5));
    }
}

TEST_CASE("Cuboid", "[shapes][cuboid]") {
    SECTION("axis-aligned") {
        Cuboid<double> box(2.0, 4.0, 6.0);
        REQUIRE(box.volume() == 48.0);
        REQUIRE_THAT(box.containing_radius(), WithinAbs(std::sqrt(56.0) / 2.0, 1e-12));
        REQUIRE(box.smallest_dimension() == 2.0);
        REQUIRE(box.half_extents() == Vector3d(1.0, 2.0, 3.0));
        REQUIRE_THAT(box.highest_point().y, WithinAbs(2.0, 1e-12));
        REQUIRE(box.is_point_within(Vector3d(0.9, -1.9, 2.9)));
        REQUIRE_FALSE(box.is_point_within(Vector3d(1.1, 0.0, 0.0)));
        REQUIRE(spatial_math::is_nearly_equal(box.closest_point(Vector3d(5.0, 0.5, -9.0)), Vector3d(1.0, 0.5, -3.0)));
    }

    SECTION("rotation turns the box") {
        Cuboid<double> box(10.0, 1.0, 1.0, Vector3d::ZERO(), quarter_turn(Vector3d::UNIT_Z()));
        REQUIRE(box.is_point_within(Vector3d(0.0, 4.5, 0.0)));
        REQUIRE_FALSE(box.is_point_within(Vector3d(4.5, 0.0, 0.0)));
        REQUIRE_THAT(box.highest_point().y, WithinAbs(5.0, 1e-12));

        const Vector3d local = box.to_local(Vector3d(0.0, 3.0, 0.0));
        REQUIRE_THAT(local.x, WithinAbs(3.0, 1e-12));
        REQUIRE_THAT(local.y, WithinAbs(0.0, 1e-12));
    }
}

TEST_CASE("Ellipsoid", "[shapes][ellipsoid]") {
    Ellipsoid<double> e(3.0, 2.0, 1.0, Vector3d(0.0, 1.0, 0.0));

    REQUIRE_THAT(e.volume(), WithinRel(4.0 / 3.0 * k_pi * 6.0, 1e-12));
    REQUIRE(e.containing_radius() == 3.0);
    REQUIRE(e.smallest_dimension() == 1.0);
    REQUIRE_THAT(e.highest_point().y, WithinAbs(3.0, 1e-12));
    REQUIRE_THAT(e.lowest_point().y, WithinAbs(-1.0, 1e-12));
    REQUIRE(e.is_point_within(Vector3d(2.9, 1.0, 0.0)));
    REQUIRE_FALSE(e.is_point_within(Vector3d(0.0, 1.0, 1.1)));

    SECTION("rotated semi-axes") {
        auto turned = e.with_rotation(quarter_turn(Vector3d::UNIT_Z()));
        REQUIRE(turned.is_point_within(Vector3d(0.0, 3.9, 0.0)));
        REQUIRE_FALSE(turned.is_point_within(Vector3d(2.9, 1.0, 0.0)));
    }

    SECTION("a flattened ellipsoid only holds its centre") {
        Ellipsoid<double> flat(3.0, 0.0, 1.0);
        REQUIRE(flat.volume() == 0.0);
        REQUIRE(flat.is_point_within(Vector3d::ZERO()));
        REQUIRE_FALSE(flat.is_point_within(Vector3d(1.0, 0.0, 0.0)));
    }
}

TEST_CASE("Frustum", "[shapes][frustum]") {
    Frustum<double> f(1.0, Vector3d(0.0, 0.0, 10.0), k_pi / 4.0, 1.0);

    SECTION("derived fields") {
        REQUIRE_THAT(f.far_plane_distance(), WithinAbs(10.0, 1e-12));
        REQUIRE_THAT(f.volume(), WithinRel(4.0 * 999.0 / 3.0, 1e-9));
        REQUIRE_THAT(f.containing_radius(), WithinRel(10.0 * std::sqrt(3.0), 1e-9));
        REQUIRE_THAT(f.corners()[6].x, WithinAbs(10.0, 1e-9));
        REQUIRE_THAT(f.corners()[6].y, WithinAbs(10.0, 1e-9));
        REQUIRE_THAT(f.corners()[6].z, WithinAbs(10.0, 1e-9));
        REQUIRE_THAT(f.highest_point().y, WithinAbs(10.0, 1e-9));
    }

    SECTION("containment between near and far planes") {
        REQUIRE(f.is_point_within(Vector3d(0.0, 0.0, 5.0)));
        REQUIRE(f.is_point_within(Vector3d(4.0, -4.0, 5.0)));
        REQUIRE_FALSE(f.is_point_within(Vector3d(6.0, 0.0, 5.0)));
        REQUIRE_FALSE(f.is_point_within(Vector3d(0.0, 0.0, 0.5)));
        REQUIRE_FALSE(f.is_point_within(Vector3d(0.0, 0.0, 10.5)));
    }

    SECTION("aspect ratio widens horizontally") {
        Frustum<double> wide(2.0, Vector3d(0.0, 0.0, 10.0), k_pi / 4.0, 1.0);
        REQUIRE(wide.is_point_within(Vector3d(8.0, 0.0, 5.0)));
        REQUIRE_FALSE(wide.is_point_within(Vector3d(0.0, 6.0, 5.0)));
    }

    SECTION("a zero field of view contains nothing") {
        Frustum<double> flat(1.0, Vector3d(0.0, 0.0, 10.0), 0.0, 1.0);
        REQUIRE(flat.volume() == 0.0);
        REQUIRE_FALSE(flat.is_point_within(Vector3d(0.0, 0.0, 5.0)));
    }
}

TEST_CASE("Torus", "[shapes][torus]") {
    Torus<double> t(3.0, 1.0);

    SECTION("derived fields") {
        REQUIRE_THAT(t.volume(), WithinRel(2.0 * k_pi * k_pi * 3.0, 1e-12));
        REQUIRE(t.containing_radius() == 4.0);
        REQUIRE(t.smallest_dimension() == 1.0);
        REQUIRE_THAT(t.highest_point().y, WithinAbs(1.0, 1e-12));
    }

    SECTION("the ring holds points, the hole does not") {
        REQUIRE(t.is_point_within(Vector3d(3.0, 0.0, 0.0)));
        REQUIRE(t.is_point_within(Vector3d(0.0, 0.5, -3.5)));
        REQUIRE_FALSE(t.is_point_within(Vector3d::ZERO()));
        REQUIRE_FALSE(t.is_point_within(Vector3d(3.0, 1.5, 0.0)));
    }

    SECTION("rotation tips the ring") {
        auto tipped = t.with_rotation(quarter_turn(Vector3d::UNIT_X()));
        REQUIRE(tipped.is_point_within(Vector3d(0.0, 3.0, 0.0)));
        REQUIRE_FALSE(tipped.is_point_within(Vector3d(0.0, 0.0, 3.0)));
        REQUIRE_THAT(tipped.highest_point().y, WithinAbs(4.0, 1e-9));
    }

    SECTION("major radius below minor radius is rejected") {
        REQUIRE_THROWS_AS(Torus<double>(1.0, 2.0), std::invalid_argument);

        auto created = Torus<double>::create(1.0, 2.0);
        REQUIRE(created.is_err());
        REQUIRE(created.error().code() == ErrorCode::InvalidArgument);
        REQUIRE(created.error().as<ShapeError>()->kind == ShapeError::Kind::InvalidDimensions);
    }
}

// =============================================================================
// Transforms and scaling
// =============================================================================

TEST_CASE("with_position and with_rotation", "[shapes][transform]") {
    SECTION("position moves derived points") {
        Capsule<double> c(Vector3d(0.0, 2.0, 0.0), 1.0);
        auto moved = c.with_position(Vector3d(5.0, 0.0, 0.0));
        REQUIRE(moved.start() == Vector3d(5.0, -1.0, 0.0));
        REQUIRE(moved.radius() == 1.0);
        REQUIRE(c.position() == Vector3d::ZERO());
    }

    SECTION("rotation turns the axis of axial kinds") {
        Cylinder<double> c(Vector3d(0.0, 4.0, 0.0), 1.0);
        auto turned = c.with_rotation(quarter_turn(Vector3d::UNIT_Z()));
        REQUIRE_THAT(turned.axis().x, WithinAbs(-4.0, 1e-12));
        REQUIRE_THAT(turned.axis().y, WithinAbs(0.0, 1e-12));
    }

    SECTION("rotation is ignored by spheres") {
        Sphere<double> s(1.0);
        REQUIRE(s.with_rotation(quarter_turn(Vector3d::UNIT_X())) == s);
    }
}

TEST_CASE("scale_by_dimension", "[shapes][scale]") {
    SECTION("every linear size scales") {
        auto box = Cuboid<double>(1.0, 2.0, 3.0).scale_by_dimension(2.0);
        REQUIRE(box.is_ok());
        REQUIRE(box->axis_x() == 2.0);
        REQUIRE(box->axis_z() == 6.0);
        REQUIRE(box->volume() == 48.0);
    }

    SECTION("zero collapses the shape") {
        auto s = Sphere<double>(3.0).scale_by_dimension(0.0);
        REQUIRE(s.is_ok());
        REQUIRE(s->radius() == 0.0);
        REQUIRE(s->volume() == 0.0);
    }

    SECTION("negative factors are rejected") {
        auto s = Sphere<double>(3.0).scale_by_dimension(-1.0);
        REQUIRE(s.is_err());
        REQUIRE(s.error().code() == ErrorCode::InvalidArgument);
        const auto* shape_error = s.error().as<ShapeError>();
        REQUIRE(shape_error != nullptr);
        REQUIRE(shape_error->kind == ShapeError::Kind::NegativeFactor);
        REQUIRE(shape_error->shape == "Sphere");
    }
}

TEST_CASE("scale_volume", "[shapes][scale]") {
    SECTION("volume scales by the factor") {
        auto s = Sphere<double>(1.0).scale_volume(8.0);
        REQUIRE(s.is_ok());
        REQUIRE_THAT(s->radius(), WithinAbs(2.0, 1e-12));

        auto e = Ellipsoid<double>(1.0, 2.0, 3.0).scale_volume(27.0);
        REQUIRE(e.is_ok());
        REQUIRE_THAT(e->volume(), WithinRel(27.0 * 4.0 / 3.0 * k_pi * 6.0, 1e-12));

        auto t = Torus<double>(4.0, 1.0).scale_volume(16.0);
        REQUIRE(t.is_ok());
        REQUIRE_THAT(t->volume(), WithinRel(16.0 * 2.0 * k_pi * k_pi * 4.0, 1e-12));
    }

    SECTION("a torus can shrink past its own hole") {
        auto t = Torus<double>(3.0, 2.0).scale_volume(0.01);
        REQUIRE(t.is_err());
        REQUIRE(t.error().as<ShapeError>()->kind == ShapeError::Kind::InvalidDimensions);
    }

    SECTION("negative factors are rejected") {
        REQUIRE(Capsule<double>(Vector3d::UNIT_Y(), 1.0).scale_volume(-2.0).is_err());
        REQUIRE(Line<double>(Vector3d::UNIT_Y(), Vector3d::ZERO()).scale_volume(-2.0).is_err());
    }
}

TEMPLATE_TEST_CASE("Sphere volume for every scalar", "[shapes][scalar]", float, double, Decimal, HugeNumber) {
    using T = TestType;
    using V = spatial_math::Vector3<T>;

    Sphere<T> s(T(3), V::ZERO());
    const T expected = spatial_math::consts::four_thirds_pi<T>() * T(27);
    REQUIRE(spatial_math::is_nearly_equal(s.volume(), expected));
    REQUIRE(s.is_point_within(V(T(0), T(3), T(0))));
    REQUIRE_FALSE(s.is_point_within(V(T(0), T(3.5), T(0))));

    auto doubled = s.scale_by_dimension(T(2));
    REQUIRE(doubled.is_ok());
    REQUIRE(doubled->radius() == T(6));
}

// =============================================================================
// Shape
// =============================================================================

TEST_CASE("Shape forwards the held kind", "[shapes][shape]") {
    Shape<double> shape = Sphere<double>(2.0, Vector3d(1.0, 0.0, 0.0));

    REQUIRE(shape.type() == ShapeType::Sphere);
    REQUIRE(shape.is<Sphere<double>>());
    REQUIRE_FALSE(shape.is<Cuboid<double>>());
    REQUIRE(shape.as<Cuboid<double>>() == nullptr);
    REQUIRE(shape.as<Sphere<double>>()->radius() == 2.0);
    REQUIRE(shape.containing_radius() == 2.0);
    REQUIRE(shape.position() == Vector3d(1.0, 0.0, 0.0));
    REQUIRE(shape.is_point_within(Vector3d(2.5, 0.0, 0.0)));

    SECTION("transforms keep the kind") {
        Shape<double> moved = shape.with_position(Vector3d::ZERO());
        REQUIRE(moved.is<Sphere<double>>());
        REQUIRE(moved.position() == Vector3d::ZERO());
        REQUIRE(moved != shape);
    }

    SECTION("scaling errors pass through") {
        auto scaled = shape.scale_by_dimension(-3.0);
        REQUIRE(scaled.is_err());
        REQUIRE(scaled.error().is<ShapeError>());

        auto grown = shape.scale_volume(8.0);
        REQUIRE(grown.is_ok());
        REQUIRE_THAT(grown->containing_radius(), WithinAbs(4.0, 1e-12));
    }

    SECTION("default shape is a point at the origin") {
        Shape<double> empty;
        REQUIRE(empty.type() == ShapeType::SinglePoint);
        REQUIRE(empty.position() == Vector3d::ZERO());
    }
}

TEST_CASE("ShapeType tags", "[shapes][shape_type]") {
    REQUIRE(static_cast<int>(ShapeType::Capsule) == 1);
    REQUIRE(static_cast<int>(ShapeType::Sphere) == 10);
    REQUIRE(static_cast<int>(ShapeType::Torus) == 11);

    REQUIRE(std::string(to_string(ShapeType::HollowSphere)) == "HollowSphere");
    REQUIRE(shape_type_from_string("Frustum") == ShapeType::Frustum);
    REQUIRE_FALSE(shape_type_from_string("frustum").has_value());

    REQUIRE(shape_type_from_int(0) == ShapeType::None);
    REQUIRE(shape_type_from_int(8) == ShapeType::Line);
    REQUIRE_FALSE(shape_type_from_int(12).has_value());
    REQUIRE_FALSE(shape_type_from_int(-1).has_value());

    REQUIRE(Cone<double>::k_type == ShapeType::Cone);
    REQUIRE(Shape<double>(Torus<double>(2.0, 1.0)).type() == ShapeType::Torus);
}
