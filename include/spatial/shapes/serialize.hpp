#pragma once

/// @file serialize.hpp
/// @brief JSON encoding of shapes
///
/// A shape is an object whose first member is "type" (the integer
/// ShapeType tag) followed by the kind's fields in canonical order:
///
/// @code
/// {"type": 10, "radius": 5.0, "position": [0.0, 0.0, 0.0]}
/// @endcode
///
/// Vectors are [x, y, z] and quaternions [x, y, z, w]. float and double
/// values are JSON numbers (non-finite values as strings). Decimal and
/// HugeNumber values are strings carrying every digit; numbers are
/// accepted for them on input.

#include "shape.hpp"

#include <spatial/core/error.hpp>
#include <spatial/math/scalar.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace spatial_shapes {

/// Insertion-ordered JSON, so the canonical field order survives a dump
using ShapeJson = nlohmann::ordered_json;

/// Encode a shape
template<Scalar T>
[[nodiscard]] ShapeJson to_json(const Shape<T>& shape);

/// Encode a shape as text (indent < 0 gives the compact form)
template<Scalar T>
[[nodiscard]] std::string to_json_string(const Shape<T>& shape, int indent = -1);

/// Decode a shape, choosing the kind from its "type" member
template<Scalar T>
[[nodiscard]] spatial_core::Result<Shape<T>> shape_from_json(const ShapeJson& j);

/// Parse and decode a shape
template<Scalar T>
[[nodiscard]] spatial_core::Result<Shape<T>> shape_from_json_string(const std::string& text);

// Instantiated in serialize.cpp
#define SPATIAL_SHAPES_SERIALIZE_EXTERN(T)                                                          \
    extern template ShapeJson to_json<T>(const Shape<T>&);                                        \
    extern template std::string to_json_string<T>(const Shape<T>&, int);                          \
    extern template spatial_core::Result<Shape<T>> shape_from_json<T>(const ShapeJson&);          \
    extern template spatial_core::Result<Shape<T>> shape_from_json_string<T>(const std::string&);

SPATIAL_SHAPES_SERIALIZE_EXTERN(float)
SPATIAL_SHAPES_SERIALIZE_EXTERN(double)
SPATIAL_SHAPES_SERIALIZE_EXTERN(spatial_math::Decimal)
SPATIAL_SHAPES_SERIALIZE_EXTERN(spatial_math::HugeNumber)

#undef SPATIAL_SHAPES_SERIALIZE_EXTERN

} // namespace spatial_shapes
