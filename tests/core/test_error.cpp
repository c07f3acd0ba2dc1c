// spatial_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <spatial/core/error.hpp>
#include <string>
#include <vector>

using namespace spatial_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err("Test error");
        REQUIRE(err.message() == "Test error");
        REQUIRE(err.code() == ErrorCode::Unknown);
        REQUIRE(err.is<std::string>());
    }

    SECTION("from code and message") {
        Error err(ErrorCode::InvalidArgument, "Bad argument");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.message() == "Bad argument");
    }

    SECTION("with context") {
        Error err = Error("Base error").with_context("key", "value");
        auto* ctx = err.get_context("key");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == "value");
        REQUIRE(err.get_context("missing") == nullptr);
    }
}

TEST_CASE("Error kinds", "[core][error]") {
    SECTION("ShapeError::negative_factor") {
        Error err = ShapeError::negative_factor("Sphere", "-2");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.is<ShapeError>());
        REQUIRE(err.as<ShapeError>()->kind == ShapeError::Kind::NegativeFactor);
        REQUIRE(err.as<ShapeError>()->shape == "Sphere");
        REQUIRE(err.message().find("-2") != std::string::npos);
    }

    SECTION("ShapeError::invalid_dimensions") {
        Error err = ShapeError::invalid_dimensions("Torus", "major radius below minor radius");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.as<ShapeError>()->kind == ShapeError::Kind::InvalidDimensions);
        REQUIRE(err.message().find("Torus") != std::string::npos);
    }

    SECTION("SerializationError kinds") {
        Error missing = SerializationError::missing_field("radius");
        REQUIRE(missing.code() == ErrorCode::ValidationError);
        REQUIRE(missing.as<SerializationError>()->field == "radius");

        Error discriminator = SerializationError::missing_discriminator();
        REQUIRE(discriminator.as<SerializationError>()->kind == SerializationError::Kind::MissingDiscriminator);

        Error unknown = SerializationError::unknown_type("42");
        REQUIRE(unknown.as<SerializationError>()->kind == SerializationError::Kind::UnknownType);
        REQUIRE(unknown.message().find("42") != std::string::npos);

        Error malformed = SerializationError::malformed_json("unexpected end");
        REQUIRE(malformed.code() == ErrorCode::ParseError);
    }

    SECTION("ConversionError::not_representable") {
        Error err = ConversionError::not_representable("huge", "double");
        REQUIRE(err.code() == ErrorCode::OutOfRange);
        REQUIRE(err.as<ConversionError>()->source_type == "huge");
        REQUIRE(err.as<ConversionError>()->target_type == "double");
    }

    SECTION("MatrixError::invalid_projection") {
        Error err = MatrixError::invalid_projection("near plane must be positive");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.as<ShapeError>() == nullptr);
        REQUIRE(err.as<MatrixError>() != nullptr);
    }
}

TEST_CASE("Error reports", "[core][error]") {
    SECTION("domain error with detail and context") {
        Error err = SerializationError::invalid_field("position", "expected an array of 3 numbers");
        err.with_context("shape", "Sphere");

        const std::string report = error_report(err);
        REQUIRE(report.rfind("[ValidationError] SerializationError: ", 0) == 0);
        REQUIRE(report.find("{field=position}") != std::string::npos);
        REQUIRE(report.find(" shape=Sphere") != std::string::npos);
    }

    SECTION("shape error lists shape and value") {
        const std::string report = error_report(ShapeError::negative_factor("Cone", "-1"));
        REQUIRE(report.find("[InvalidArgument] ShapeError:") == 0);
        REQUIRE(report.find("{shape=Cone, value=-1}") != std::string::npos);
    }

    SECTION("plain message") {
        REQUIRE(error_report(Error(ErrorCode::IOError, "disk gone")) == "[IOError] disk gone");
    }
}

// =============================================================================
// Result<T> Tests
// =============================================================================

TEST_CASE("Result construction", "[core][result]") {
    SECTION("Ok with value") {
        Result<int> r = Ok(42);
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
        REQUIRE(r.value() == 42);
    }

    SECTION("Ok void") {
        Result<void> r = Ok();
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
    }

    SECTION("Err with message") {
        Result<int> r = Err<int>(Error("Something failed"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().message() == "Something failed");
    }

    SECTION("Err from error kind") {
        Result<double> r = Error(ShapeError::negative_factor("Sphere", "-1"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().is<ShapeError>());
    }
}

TEST_CASE("Result value access", "[core][result]") {
    SECTION("value_or on Ok") {
        Result<int> r = Ok(42);
        REQUIRE(r.value_or(0) == 42);
    }

    SECTION("value_or on Err") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE(r.value_or(0) == 0);
    }

    SECTION("unwrap on Ok") {
        Result<int> r = Ok(42);
        REQUIRE(r.unwrap() == 42);
    }

    SECTION("unwrap on Err throws") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE_THROWS_AS(r.unwrap(), std::runtime_error);
    }

    SECTION("move value out") {
        Result<std::string> r = Ok(std::string("hello"));
        std::string s = std::move(r).value();
        REQUIRE(s == "hello");
    }
}

TEST_CASE("Result map operations", "[core][result]") {
    SECTION("map on Ok") {
        Result<int> r = Ok(21);
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == 42);
    }

    SECTION("map on Err") {
        Result<int> r = Err<int>(Error("error"));
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_err());
    }

    SECTION("and_then on Ok") {
        Result<int> r = Ok(42);
        auto r2 = r.and_then([](int x) -> Result<std::vector<int>> {
            return Ok(std::vector<int>(static_cast<std::size_t>(x), 1));
        });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value().size() == 42);
    }

    SECTION("or_else on Err") {
        Result<int> r = Err<int>(Error("error"));
        auto r2 = r.or_else([](const Error& /*e*/) -> Result<int> {
            return Ok(0);
        });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == 0);
    }
}
