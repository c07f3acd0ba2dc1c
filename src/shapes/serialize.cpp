/// @file serialize.cpp
/// @brief JSON codec for shapes

#include <spatial/shapes/serialize.hpp>
#include <spatial/core/log.hpp>

#include <optional>
#include <type_traits>

namespace spatial_shapes {

namespace {

using spatial_core::Error;
using spatial_core::Result;
using spatial_core::SerializationError;

namespace num = spatial_math::num;

// =============================================================================
// Values
// =============================================================================

template<Scalar T>
ShapeJson encode_scalar(const T& value) {
    if constexpr (std::is_floating_point_v<T>) {
        if (num::is_finite(value)) {
            return value;
        }
    }
    return num::to_string(value);
}

template<Scalar T>
ShapeJson encode_vector(const Vector3<T>& v) {
    return ShapeJson::array({encode_scalar(v.x), encode_scalar(v.y), encode_scalar(v.z)});
}

template<Scalar T>
ShapeJson encode_quaternion(const Quaternion<T>& q) {
    return ShapeJson::array({encode_scalar(q.x), encode_scalar(q.y), encode_scalar(q.z), encode_scalar(q.w)});
}

/// Reads named members of one shape object, keeping the first failure
template<Scalar T>
class FieldReader {
public:
    explicit FieldReader(const ShapeJson& object) : m_object(object) {}

    T scalar(const char* name) {
        const ShapeJson* value = member(name);
        if (!value) {
            return num::zero<T>();
        }
        return decode_scalar(*value, name);
    }

    Vector3<T> vector(const char* name) {
        const ShapeJson* value = member(name);
        if (!value) {
            return Vector3<T>::ZERO();
        }
        if (!value->is_array() || value->size() != 3) {
            fail(SerializationError::invalid_field(name, "expected an array of 3 numbers"));
            return Vector3<T>::ZERO();
        }
        return Vector3<T>(decode_scalar((*value)[0], name), decode_scalar((*value)[1], name),
                          decode_scalar((*value)[2], name));
    }

    Quaternion<T> quaternion(const char* name) {
        const ShapeJson* value = member(name);
        if (!value) {
            return Quaternion<T>::IDENTITY();
        }
        if (!value->is_array() || value->size() != 4) {
            fail(SerializationError::invalid_field(name, "expected an array of 4 numbers"));
            return Quaternion<T>::IDENTITY();
        }
        return Quaternion<T>(decode_scalar((*value)[0], name), decode_scalar((*value)[1], name),
                             decode_scalar((*value)[2], name), decode_scalar((*value)[3], name));
    }

    [[nodiscard]] bool ok() const { return !m_error.has_value(); }
    [[nodiscard]] const Error& error() const { return *m_error; }

    void fail(SerializationError err) {
        if (!m_error) {
            m_error = Error(std::move(err));
        }
    }

private:
    const ShapeJson* member(const char* name) {
        auto it = m_object.find(name);
        if (it == m_object.end()) {
            fail(SerializationError::missing_field(name));
            return nullptr;
        }
        return &*it;
    }

    T decode_scalar(const ShapeJson& value, const char* name) {
        std::optional<T> parsed;
        if (value.is_string()) {
            parsed = num::from_string<T>(value.get<std::string>());
        } else if (value.is_number()) {
            if constexpr (std::is_floating_point_v<T>) {
                parsed = value.get<T>();
            } else {
                // The number's own text keeps every digit it was written with
                parsed = num::from_string<T>(value.dump());
            }
        }
        if (!parsed) {
            fail(SerializationError::invalid_field(name, "expected a number, got " + value.dump()));
            return num::zero<T>();
        }
        return *parsed;
    }

    const ShapeJson& m_object;
    std::optional<Error> m_error;
};

// =============================================================================
// Encoding
// =============================================================================

template<Scalar T>
void encode_fields(ShapeJson& j, const SinglePoint<T>& s) {
    j["position"] = encode_vector(s.position());
}

template<Scalar T>
void encode_fields(ShapeJson& j, const Line<T>& s) {
    j["path"] = encode_vector(s.path());
    j["position"] = encode_vector(s.position());
}

template<Scalar T>
void encode_fields(ShapeJson& j, const Sphere<T>& s) {
    j["radius"] = encode_scalar(s.radius());
    j["position"] = encode_vector(s.position());
}

template<Scalar T>
void encode_fields(ShapeJson& j, const HollowSphere<T>& s) {
    j["inner_radius"] = encode_scalar(s.inner_radius());
    j["outer_radius"] = encode_scalar(s.outer_radius());
    j["position"] = encode_vector(s.position());
}

/// Capsule, cylinder and cone share their field layout
template<typename S>
void encode_axial_fields(ShapeJson& j, const S& s) {
    j["axis"] = encode_vector(s.axis());
    j["radius"] = encode_scalar(s.radius());
    j["position"] = encode_vector(s.position());
}

template<Scalar T>
void encode_fields(ShapeJson& j, const Capsule<T>& s) { encode_axial_fields(j, s); }

template<Scalar T>
void encode_fields(ShapeJson& j, const Cylinder<T>& s) { encode_axial_fields(j, s); }

template<Scalar T>
void encode_fields(ShapeJson& j, const Cone<T>& s) { encode_axial_fields(j, s); }

/// Cuboid and ellipsoid share their field layout
template<typename S>
void encode_box_fields(ShapeJson& j, const S& s) {
    j["axis_x"] = encode_scalar(s.axis_x());
    j["axis_y"] = encode_scalar(s.axis_y());
    j["axis_z"] = encode_scalar(s.axis_z());
    j["position"] = encode_vector(s.position());
    j["rotation"] = encode_quaternion(s.rotation());
}

template<Scalar T>
void encode_fields(ShapeJson& j, const Cuboid<T>& s) { encode_box_fields(j, s); }

template<Scalar T>
void encode_fields(ShapeJson& j, const Ellipsoid<T>& s) { encode_box_fields(j, s); }

template<Scalar T>
void encode_fields(ShapeJson& j, const Frustum<T>& s) {
    j["aspect_ratio"] = encode_scalar(s.aspect_ratio());
    j["axis"] = encode_vector(s.axis());
    j["field_of_view_angle"] = encode_scalar(s.field_of_view_angle());
    j["near_plane_distance"] = encode_scalar(s.near_plane_distance());
    j["position"] = encode_vector(s.position());
    j["rotation"] = encode_quaternion(s.rotation());
}

template<Scalar T>
void encode_fields(ShapeJson& j, const Torus<T>& s) {
    j["major_radius"] = encode_scalar(s.major_radius());
    j["minor_radius"] = encode_scalar(s.minor_radius());
    j["position"] = encode_vector(s.position());
    j["rotation"] = encode_quaternion(s.rotation());
}

// =============================================================================
// Decoding
// =============================================================================

template<Scalar T>
Result<Shape<T>> decode_fields(ShapeType type, const ShapeJson& j) {
    FieldReader<T> r(j);
    switch (type) {
        case ShapeType::SinglePoint: {
            const auto position = r.vector("position");
            if (!r.ok()) return r.error();
            return Shape<T>(SinglePoint<T>(position));
        }
        case ShapeType::Line: {
            const auto path = r.vector("path");
            const auto position = r.vector("position");
            if (!r.ok()) return r.error();
            return Shape<T>(Line<T>(path, position));
        }
        case ShapeType::Sphere: {
            const T radius = r.scalar("radius");
            const auto position = r.vector("position");
            if (!r.ok()) return r.error();
            return Shape<T>(Sphere<T>(radius, position));
        }
        case ShapeType::HollowSphere: {
            const T inner = r.scalar("inner_radius");
            const T outer = r.scalar("outer_radius");
            const auto position = r.vector("position");
            if (!r.ok()) return r.error();
            return Shape<T>(HollowSphere<T>(inner, outer, position));
        }
        case ShapeType::Capsule:
        case ShapeType::Cylinder:
        case ShapeType::Cone: {
            const auto axis = r.vector("axis");
            const T radius = r.scalar("radius");
            const auto position = r.vector("position");
            if (!r.ok()) return r.error();
            if (type == ShapeType::Capsule) return Shape<T>(Capsule<T>(axis, radius, position));
            if (type == ShapeType::Cylinder) return Shape<T>(Cylinder<T>(axis, radius, position));
            return Shape<T>(Cone<T>(axis, radius, position));
        }
        case ShapeType::Cuboid:
        case ShapeType::Ellipsoid: {
            const T x = r.scalar("axis_x");
            const T y = r.scalar("axis_y");
            const T z = r.scalar("axis_z");
            const auto position = r.vector("position");
            const auto rotation = r.quaternion("rotation");
            if (!r.ok()) return r.error();
            if (type == ShapeType::Cuboid) return Shape<T>(Cuboid<T>(x, y, z, position, rotation));
            return Shape<T>(Ellipsoid<T>(x, y, z, position, rotation));
        }
        case ShapeType::Frustum: {
            const T aspect = r.scalar("aspect_ratio");
            const auto axis = r.vector("axis");
            const T fov = r.scalar("field_of_view_angle");
            const T near = r.scalar("near_plane_distance");
            const auto position = r.vector("position");
            const auto rotation = r.quaternion("rotation");
            if (!r.ok()) return r.error();
            return Shape<T>(Frustum<T>(aspect, axis, fov, near, position, rotation));
        }
        case ShapeType::Torus: {
            const T major = r.scalar("major_radius");
            const T minor = r.scalar("minor_radius");
            const auto position = r.vector("position");
            const auto rotation = r.quaternion("rotation");
            if (!r.ok()) return r.error();
            auto torus = Torus<T>::create(major, minor, position, rotation);
            if (!torus) {
                return Error(SerializationError::invalid_field("minor_radius", torus.error().message()));
            }
            return Shape<T>(std::move(torus).value());
        }
        case ShapeType::None:
            break;
    }
    return Error(SerializationError::unknown_type(std::to_string(static_cast<int>(type))));
}

} // anonymous namespace

// =============================================================================
// Public API
// =============================================================================

template<Scalar T>
ShapeJson to_json(const Shape<T>& shape) {
    ShapeJson j = ShapeJson::object();
    j["type"] = static_cast<int>(shape.type());
    std::visit([&j](const auto& s) { encode_fields(j, s); }, shape.variant());
    return j;
}

template<Scalar T>
std::string to_json_string(const Shape<T>& shape, int indent) {
    return to_json(shape).dump(indent);
}

template<Scalar T>
Result<Shape<T>> shape_from_json(const ShapeJson& j) {
    if (!j.is_object()) {
        return Error(SerializationError::malformed_json("shape must be a JSON object"));
    }
    auto it = j.find("type");
    if (it == j.end()) {
        return Error(SerializationError::missing_discriminator());
    }
    if (!it->is_number_integer()) {
        return Error(SerializationError::invalid_field("type", "expected an integer tag, got " + it->dump()));
    }
    const auto type = shape_type_from_int(it->get<std::int64_t>());
    if (!type || *type == ShapeType::None) {
        return Error(SerializationError::unknown_type(it->dump()));
    }

    auto result = decode_fields<T>(*type, j);
    if (!result) {
        Error error = result.error();
        error.with_context("shape", to_string(*type));
        error.with_context("scalar", spatial_math::ScalarTraits<T>::name());
        spatial_core::shapes_logger()->warn("Failed to decode shape: {}", spatial_core::error_report(error));
        return error;
    }
    return result;
}

template<Scalar T>
Result<Shape<T>> shape_from_json_string(const std::string& text) {
    ShapeJson j;
    try {
        j = ShapeJson::parse(text);
    } catch (const nlohmann::json::exception& e) {
        return Error(SerializationError::malformed_json(e.what()));
    }
    return shape_from_json<T>(j);
}

// =============================================================================
// Instantiations
// =============================================================================

#define SPATIAL_SHAPES_SERIALIZE_INSTANTIATE(T)                                              \
    template ShapeJson to_json<T>(const Shape<T>&);                                          \
    template std::string to_json_string<T>(const Shape<T>&, int);                            \
    template Result<Shape<T>> shape_from_json<T>(const ShapeJson&);                          \
    template Result<Shape<T>> shape_from_json_string<T>(const std::string&);

SPATIAL_SHAPES_SERIALIZE_INSTANTIATE(float)
SPATIAL_SHAPES_SERIALIZE_INSTANTIATE(double)
SPATIAL_SHAPES_SERIALIZE_INSTANTIATE(spatial_math::Decimal)
SPATIAL_SHAPES_SERIALIZE_INSTANTIATE(spatial_math::HugeNumber)

#undef SPATIAL_SHAPES_SERIALIZE_INSTANTIATE

} // namespace spatial_shapes
