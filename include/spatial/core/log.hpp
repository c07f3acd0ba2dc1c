#pragma once

/// @file log.hpp
/// @brief Per-module loggers for the spatial library
///
/// Each library module logs through its own spdlog logger so that, for
/// example, collision diagnostics can be turned up without flooding the
/// output with matrix traces.

#include <spdlog/spdlog.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace spatial_core {

/// Library module owning a logger
enum class LogModule : std::uint8_t {
    Core,
    Math,
    Shapes,
};

inline constexpr std::size_t k_log_module_count = 3;

/// Logger name of a module ("spatial_core", "spatial_math", "spatial_shapes")
[[nodiscard]] const char* log_module_name(LogModule module);

/// Module from its short name ("core", "math", "shapes")
[[nodiscard]] std::optional<LogModule> parse_log_module(const std::string& str);

/// Short name of a module, the inverse of parse_log_module
[[nodiscard]] const char* log_module_key(LogModule module);

// =============================================================================
// Configuration
// =============================================================================

/// Sinks and levels for the module loggers
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;

    /// Overrides of `level` for single modules
    std::array<std::optional<spdlog::level::level_enum>, k_log_module_count> module_levels{};

    /// Level a module logs at under this configuration
    [[nodiscard]] spdlog::level::level_enum level_for(LogModule module) const {
        const auto& override_level = module_levels[static_cast<std::size_t>(module)];
        return override_level ? *override_level : level;
    }
};

/// Rebuild sinks if they changed and apply the levels to every module logger
void configure_logging(const LogConfig& config);

/// Configuration currently in effect
[[nodiscard]] LogConfig current_log_config();

// =============================================================================
// Module Loggers
// =============================================================================

/// Logger of a module, created on first use
[[nodiscard]] std::shared_ptr<spdlog::logger> module_logger(LogModule module);

/// Errors, configuration
[[nodiscard]] std::shared_ptr<spdlog::logger> core_logger();

/// Inversions, decompositions, conversions
[[nodiscard]] std::shared_ptr<spdlog::logger> math_logger();

/// Scaling, collision, serialization
[[nodiscard]] std::shared_ptr<spdlog::logger> shapes_logger();

// =============================================================================
// Levels
// =============================================================================

/// Parse "trace", "debug", "info", "warn", "error", "critical" or "off"
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

[[nodiscard]] const char* log_level_name(spdlog::level::level_enum level);

} // namespace spatial_core
