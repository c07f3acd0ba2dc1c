// spatial_shapes JSON codec tests

#include <catch2/catch_test_macros.hpp>
#include <spatial/shapes/serialize.hpp>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

using namespace spatial_shapes;
using spatial_core::ErrorCode;
using spatial_core::SerializationError;
using spatial_math::Decimal;
using spatial_math::HugeNumber;
using spatial_math::Quaterniond;
using spatial_math::Vector3d;

namespace {

std::vector<Shape<double>> every_kind() {
    const Quaterniond tilt = Quaterniond::from_axis_angle(Vector3d(1.0, 1.0, 0.0).normalize(), 0.7);
    return {
        SinglePoint<double>(Vector3d(0.25, -1.5, 3.0)),
        Line<double>(Vector3d(1.0, 2.0, 3.0), Vector3d(-4.0, 0.0, 0.5)),
        Sphere<double>(5.0, Vector3d(1.0, 2.0, 3.0)),
        HollowSphere<double>(0.5, 1.25, Vector3d(0.0, 1.0, 0.0)),
        Capsule<double>(Vector3d(0.0, 3.0, 0.0), 0.75, Vector3d(2.0, 0.0, 0.0)),
        Cuboid<double>(1.0, 2.0, 3.0, Vector3d(0.1, 0.2, 0.3), tilt),
        Cylinder<double>(Vector3d(0.0, 0.0, 4.0), 1.5),
        Cone<double>(Vector3d(1.0, 1.0, 0.0), 0.3, Vector3d(9.0, 9.0, 9.0)),
        Ellipsoid<double>(3.0, 2.0, 1.0, Vector3d(-1.0, -2.0, -3.0), tilt),
        Frustum<double>(1.7777, Vector3d(0.0, 0.0, 100.0), 0.6, 0.1, Vector3d(1.0, 0.0, 0.0), tilt),
        Torus<double>(3.0, 0.5, Vector3d(0.0, 0.0, 1.0), tilt),
    };
}

const SerializationError& require_serialization_error(const spatial_core::Result<Shape<double>>& result,
                                                      SerializationError::Kind kind) {
    REQUIRE(result.is_err());
    const auto* err = result.error().as<SerializationError>();
    REQUIRE(err != nullptr);
    REQUIRE(err->kind == kind);
    return *err;
}

} // anonymous namespace

// =============================================================================
// Encoding
// =============================================================================

TEST_CASE("Canonical shape text", "[shapes][serialize]") {
    Shape<double> sphere = Sphere<double>(5.0, Vector3d(1.0, 2.0, 3.0));
    REQUIRE(to_json_string(sphere) == R"({"type":10,"radius":5.0,"position":[1.0,2.0,3.0]})");

    Shape<double> point = SinglePoint<double>(Vector3d(0.0, 0.0, 0.0));
    REQUIRE(to_json_string(point) == R"({"type":9,"position":[0.0,0.0,0.0]})");
}

TEST_CASE("Type tag comes first and fields keep their order", "[shapes][serialize]") {
    SECTION("box layout") {
        const ShapeJson j = to_json(Shape<double>(Cuboid<double>(1.0, 2.0, 3.0)));
        std::vector<std::string> keys;
        for (const auto& item : j.items()) {
            keys.push_back(item.key());
        }
        REQUIRE(keys == std::vector<std::string>{"type", "axis_x", "axis_y", "axis_z", "position", "rotation"});
        REQUIRE(j["rotation"] == ShapeJson::array({0.0, 0.0, 0.0, 1.0}));
    }

    SECTION("frustum layout") {
        const ShapeJson j = to_json(Shape<double>(Frustum<double>(1.0, Vector3d(0.0, 0.0, 10.0), 0.5, 1.0)));
        std::vector<std::string> keys;
        for (const auto& item : j.items()) {
            keys.push_back(item.key());
        }
        REQUIRE(keys == std::vector<std::string>{"type", "aspect_ratio", "axis", "field_of_view_angle",
                                                 "near_plane_distance", "position", "rotation"});
    }

    SECTION("every kind leads with its tag") {
        for (const auto& shape : every_kind()) {
            const ShapeJson j = to_json(shape);
            REQUIRE(j.begin().key() == "type");
            REQUIRE(j["type"] == static_cast<int>(shape.type()));
        }
    }
}

// =============================================================================
// Round trip
// =============================================================================

TEST_CASE("Every kind survives a round trip", "[shapes][serialize]") {
    for (const auto& shape : every_kind()) {
        INFO(to_string(shape.type()));

        auto from_object = shape_from_json<double>(to_json(shape));
        REQUIRE(from_object.is_ok());
        REQUIRE(*from_object == shape);

        auto from_text = shape_from_json_string<double>(to_json_string(shape, 2));
        REQUIRE(from_text.is_ok());
        REQUIRE(*from_text == shape);
    }
}

TEST_CASE("Zero-size shapes survive a round trip", "[shapes][serialize]") {
    const std::vector<Shape<double>> shapes = {
        Sphere<double>(0.0),
        Cuboid<double>(0.0, 0.0, 0.0),
        Capsule<double>(Vector3d::ZERO(), 0.0),
        Torus<double>(0.0, 0.0),
        Frustum<double>(),
    };
    for (const auto& shape : shapes) {
        INFO(to_string(shape.type()));
        auto decoded = shape_from_json<double>(to_json(shape));
        REQUIRE(decoded.is_ok());
        REQUIRE(*decoded == shape);
    }
}

TEST_CASE("Scalar representations", "[shapes][serialize][scalar]") {
    SECTION("float keeps its exact value") {
        Shape<float> sphere = Sphere<float>(0.1f, spatial_math::Vector3f(1.0f / 3.0f, 0.0f, -2.5f));
        auto decoded = shape_from_json_string<float>(to_json_string(sphere));
        REQUIRE(decoded.is_ok());
        REQUIRE(*decoded == sphere);
    }

    SECTION("extreme doubles") {
        Shape<double> tiny = Sphere<double>(std::numeric_limits<double>::denorm_min());
        Shape<double> huge = Sphere<double>(std::numeric_limits<double>::max());
        REQUIRE(*shape_from_json<double>(to_json(tiny)) == tiny);
        REQUIRE(*shape_from_json<double>(to_json(huge)) == huge);
    }

    SECTION("non-finite values are written as text") {
        Shape<double> sphere = Sphere<double>(std::numeric_limits<double>::infinity());
        const ShapeJson j = to_json(sphere);
        REQUIRE(j["radius"].is_string());

        auto decoded = shape_from_json<double>(j);
        REQUIRE(decoded.is_ok());
        REQUIRE(std::isinf(decoded->as<Sphere<double>>()->radius()));
    }

    SECTION("decimal values are written as text") {
        Shape<Decimal> sphere = Sphere<Decimal>(Decimal("0.1"), spatial_math::Vector3<Decimal>(
            Decimal("0.2"), Decimal("0.3"), Decimal("-12345678901234567890.123")));
        const ShapeJson j = to_json(sphere);
        REQUIRE(j["radius"].is_string());
        REQUIRE(j["position"][2].is_string());

        auto decoded = shape_from_json<Decimal>(j);
        REQUIRE(decoded.is_ok());
        REQUIRE(*decoded == sphere);
    }

    SECTION("decimal accepts plain numbers on input") {
        auto decoded = shape_from_json_string<Decimal>(R"({"type":10,"radius":2.5,"position":[0,1,0]})");
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded->as<Sphere<Decimal>>()->radius() == Decimal("2.5"));
        REQUIRE(decoded->position().y == Decimal(1));
    }

    SECTION("huge numbers beyond double range") {
        Shape<HugeNumber> torus = Torus<HugeNumber>(HugeNumber("1e400"), HugeNumber("1e399"));
        auto decoded = shape_from_json_string<HugeNumber>(to_json_string(torus));
        REQUIRE(decoded.is_ok());
        REQUIRE(*decoded == torus);
    }
}

// =============================================================================
// Decoding errors
// =============================================================================

TEST_CASE("Malformed input", "[shapes][serialize][error]") {
    SECTION("unparseable text") {
        auto result = shape_from_json_string<double>("{\"type\": 10,");
        require_serialization_error(result, SerializationError::Kind::MalformedJson);
        REQUIRE(result.error().code() == ErrorCode::ParseError);
    }

    SECTION("not an object") {
        auto result = shape_from_json_string<double>("[10, 5.0]");
        require_serialization_error(result, SerializationError::Kind::MalformedJson);
    }
}

TEST_CASE("Type discriminator errors", "[shapes][serialize][error]") {
    SECTION("missing") {
        auto result = shape_from_json_string<double>(R"({"radius":5.0,"position":[0,0,0]})");
        const auto& err = require_serialization_error(result, SerializationError::Kind::MissingDiscriminator);
        REQUIRE(err.field == "type");
        REQUIRE(result.error().code() == ErrorCode::ValidationError);
    }

    SECTION("not an integer") {
        auto result = shape_from_json_string<double>(R"({"type":"Sphere","radius":5.0,"position":[0,0,0]})");
        const auto& err = require_serialization_error(result, SerializationError::Kind::InvalidField);
        REQUIRE(err.field == "type");
    }

    SECTION("unknown tags") {
        require_serialization_error(shape_from_json_string<double>(R"({"type":42})"),
                                    SerializationError::Kind::UnknownType);
        require_serialization_error(shape_from_json_string<double>(R"({"type":0})"),
                                    SerializationError::Kind::UnknownType);
        require_serialization_error(shape_from_json_string<double>(R"({"type":-3})"),
                                    SerializationError::Kind::UnknownType);
    }
}

TEST_CASE("Field errors", "[shapes][serialize][error]") {
    SECTION("missing scalar") {
        auto result = shape_from_json_string<double>(R"({"type":10,"position":[0,0,0]})");
        const auto& err = require_serialization_error(result, SerializationError::Kind::MissingField);
        REQUIRE(err.field == "radius");
        REQUIRE(result.error().code() == ErrorCode::ValidationError);
    }

    SECTION("failures name the shape and scalar") {
        auto result = shape_from_json_string<float>(R"({"type":10,"position":[0,0,0]})");
        REQUIRE(result.is_err());
        REQUIRE(result.error().get_context("shape") != nullptr);
        REQUIRE(*result.error().get_context("shape") == "Sphere");
        REQUIRE(*result.error().get_context("scalar") == "float");
        REQUIRE(spatial_core::error_report(result.error()).find("{field=radius}") != std::string::npos);
    }

    SECTION("missing rotation") {
        auto result = shape_from_json_string<double>(
            R"({"type":3,"axis_x":1,"axis_y":1,"axis_z":1,"position":[0,0,0]})");
        const auto& err = require_serialization_error(result, SerializationError::Kind::MissingField);
        REQUIRE(err.field == "rotation");
    }

    SECTION("vector of the wrong length") {
        auto result = shape_from_json_string<double>(R"({"type":9,"position":[1,2]})");
        const auto& err = require_serialization_error(result, SerializationError::Kind::InvalidField);
        REQUIRE(err.field == "position");
    }

    SECTION("scalar that is not a number") {
        auto result = shape_from_json_string<double>(R"({"type":10,"radius":"wide","position":[0,0,0]})");
        const auto& err = require_serialization_error(result, SerializationError::Kind::InvalidField);
        REQUIRE(err.field == "radius");
    }

    SECTION("first failure wins") {
        auto result = shape_from_json_string<double>(R"({"type":7,"outer_radius":true})");
        const auto& err = require_serialization_error(result, SerializationError::Kind::MissingField);
        REQUIRE(err.field == "inner_radius");
    }

    SECTION("torus ring thinner than its tube") {
        auto result = shape_from_json_string<double>(
            R"({"type":11,"major_radius":1,"minor_radius":2,"position":[0,0,0],"rotation":[0,0,0,1]})");
        const auto& err = require_serialization_error(result, SerializationError::Kind::InvalidField);
        REQUIRE(err.field == "minor_radius");
    }
}
