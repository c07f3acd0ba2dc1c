// spatial_core configuration tests

#include <catch2/catch_test_macros.hpp>
#include <spatial/core/config.hpp>
#include <filesystem>
#include <fstream>

using namespace spatial_core;

// =============================================================================
// Parsing
// =============================================================================

TEST_CASE("Config defaults", "[core][config]") {
    auto result = config_from_json_string("{}");
    REQUIRE(result.is_ok());
    REQUIRE(result->logging.level == spdlog::level::info);
    REQUIRE(result->logging.console_enabled);
    REQUIRE_FALSE(result->logging.file_enabled);
}

TEST_CASE("Config logging section", "[core][config]") {
    SECTION("all keys") {
        auto result = config_from_json_string(R"({
            "logging": {
                "level": "debug",
                "console": false,
                "file": true,
                "directory": "logs",
                "max_file_size": 2048,
                "max_files": 2
            }
        })");
        REQUIRE(result.is_ok());
        const auto& logging = result->logging;
        REQUIRE(logging.level == spdlog::level::debug);
        REQUIRE_FALSE(logging.console_enabled);
        REQUIRE(logging.file_enabled);
        REQUIRE(logging.log_directory == "logs");
        REQUIRE(logging.max_file_size == 2048);
        REQUIRE(logging.max_files == 2);
    }

    SECTION("unknown level") {
        auto result = config_from_json_string(R"({"logging": {"level": "loud"}})");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ValidationError);
    }

    SECTION("wrong value type") {
        auto result = config_from_json_string(R"({"logging": {"console": "yes"}})");
        REQUIRE(result.is_err());
    }

    SECTION("file logging needs a directory") {
        auto result = config_from_json_string(R"({"logging": {"file": true}})");
        REQUIRE(result.is_err());
        REQUIRE(result.error().message().find("directory") != std::string::npos);
    }

    SECTION("module overrides") {
        auto result = config_from_json_string(R"({"logging": {"level": "warn", "modules": {"shapes": "trace"}}})");
        REQUIRE(result.is_ok());
        REQUIRE(result->logging.level_for(LogModule::Shapes) == spdlog::level::trace);
        REQUIRE(result->logging.level_for(LogModule::Math) == spdlog::level::warn);
    }

    SECTION("unknown module") {
        auto result = config_from_json_string(R"({"logging": {"modules": {"render": "debug"}}})");
        REQUIRE(result.is_err());
        REQUIRE(result.error().message().find("render") != std::string::npos);
    }

    SECTION("malformed json") {
        auto result = config_from_json_string("{\"logging\": ");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
    }
}

TEST_CASE("Config serialization", "[core][config]") {
    SpatialConfig config;
    config.logging.level = spdlog::level::warn;
    config.logging.max_files = 7;
    config.logging.module_levels[static_cast<std::size_t>(LogModule::Math)] = spdlog::level::debug;

    auto j = config_to_json(config);
    REQUIRE(j["logging"]["level"] == "warn");
    REQUIRE(j["logging"]["modules"]["math"] == "debug");
    REQUIRE_FALSE(j["logging"]["modules"].contains("core"));

    auto parsed = config_from_json(j);
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed->logging.level == spdlog::level::warn);
    REQUIRE(parsed->logging.max_files == 7);
    REQUIRE(parsed->logging.level_for(LogModule::Math) == spdlog::level::debug);
}

// =============================================================================
// Files
// =============================================================================

TEST_CASE("Config file loading", "[core][config]") {
    SECTION("missing file") {
        auto result = load_config_file("does/not/exist/spatial.json");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::IOError);
    }

    SECTION("invalid file carries its path") {
        const auto path = std::filesystem::temp_directory_path() / "spatial_config_invalid.json";
        {
            std::ofstream file(path);
            file << R"({"logging": {"level": 3}})";
        }
        auto result = load_config_file(path);
        REQUIRE(result.is_err());
        REQUIRE(result.error().get_context("path") != nullptr);
        std::filesystem::remove(path);
    }

    SECTION("apply sets the module levels") {
        const LogConfig previous = current_log_config();
        SpatialConfig config;
        config.logging.level = spdlog::level::critical;
        config.logging.module_levels[static_cast<std::size_t>(LogModule::Shapes)] = spdlog::level::debug;
        apply_config(config);
        REQUIRE(current_log_config().level == spdlog::level::critical);
        REQUIRE(core_logger()->level() == spdlog::level::critical);
        REQUIRE(shapes_logger()->level() == spdlog::level::debug);

        configure_logging(previous);
    }
}
