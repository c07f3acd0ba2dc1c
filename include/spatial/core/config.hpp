#pragma once

/// @file config.hpp
/// @brief JSON configuration for the spatial library

#include "error.hpp"
#include "log.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace spatial_core {

/// Library-wide configuration
///
/// JSON layout:
/// @code
/// {
///   "logging": {
///     "level": "debug",
///     "console": true,
///     "file": false,
///     "directory": "logs",
///     "max_file_size": 1048576,
///     "max_files": 3,
///     "modules": { "shapes": "trace" }
///   }
/// }
/// @endcode
/// Every key is optional; missing keys keep their defaults.
struct SpatialConfig {
    LogConfig logging;
};

/// Parse configuration from a JSON document
[[nodiscard]] Result<SpatialConfig> config_from_json(const nlohmann::json& j);

/// Parse configuration from JSON text
[[nodiscard]] Result<SpatialConfig> config_from_json_string(const std::string& json_str);

/// Load configuration from a file
[[nodiscard]] Result<SpatialConfig> load_config_file(const std::filesystem::path& path);

/// Serialize configuration
[[nodiscard]] nlohmann::json config_to_json(const SpatialConfig& config);

/// Apply configuration (configures logging)
void apply_config(const SpatialConfig& config);

} // namespace spatial_core
