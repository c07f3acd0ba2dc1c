#pragma once

/// @file core.hpp
/// @brief Main include file for spatial_core module
///
/// This header includes all spatial_core components in dependency order.

// Forward declarations
#include "fwd.hpp"

// Error handling (no dependencies on other spatial_core headers)
#include "error.hpp"

// Logging and its JSON configuration
#include "log.hpp"
#include "config.hpp"

/// @namespace spatial_core
/// @brief Shared infrastructure for the spatial library
///
/// - **Error Handling**: Result<T> monadic error handling with typed error kinds
/// - **Logging**: named spdlog loggers for the math and shape modules
/// - **Configuration**: JSON configuration of the logging system
///
/// Example usage:
/// @code
/// #include <spatial/core/core.hpp>
///
/// using namespace spatial_core;
///
/// Result<double> checked_factor(double f) {
///     if (f < 0.0) {
///         return Err<double>(Error(ErrorCode::InvalidArgument, "negative factor"));
///     }
///     return Ok(f);
/// }
/// @endcode
