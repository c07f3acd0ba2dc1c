#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for spatial_core module

#include <cstdint>

namespace spatial_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct ShapeError;
struct SerializationError;
struct ConversionError;
struct MatrixError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging / Configuration
// =============================================================================

enum class LogModule : std::uint8_t;
struct LogConfig;
struct SpatialConfig;

} // namespace spatial_core
