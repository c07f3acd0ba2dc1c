#pragma once

/// @file error.hpp
/// @brief Error handling types for spatial_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace spatial_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    ValidationError,
    OutOfRange,
    NotSupported,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::OutOfRange: return "OutOfRange";
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Shape construction and scaling errors
struct ShapeError {
    enum class Kind : std::uint8_t {
        NegativeFactor,     // Scale factor below zero
        InvalidDimensions,  // Dimensions violate a shape invariant
    };

    Kind kind;
    std::string message;
    std::string shape;
    std::string value;

    /// Factory methods
    [[nodiscard]] static ShapeError negative_factor(const std::string& shape_name, const std::string& factor) {
        return ShapeError{Kind::NegativeFactor,
            "Scale factor must not be negative: " + factor, shape_name, factor};
    }

    [[nodiscard]] static ShapeError invalid_dimensions(const std::string& shape_name, const std::string& reason) {
        return ShapeError{Kind::InvalidDimensions,
            "Invalid " + shape_name + " dimensions: " + reason, shape_name, {}};
    }
};

/// Shape encoding and decoding errors
struct SerializationError {
    enum class Kind : std::uint8_t {
        MissingDiscriminator,  // No "type" member
        UnknownType,           // "type" is not a known ShapeType tag
        MissingField,          // Required field absent
        InvalidField,          // Field present but of the wrong shape or type
        MalformedJson,         // Input is not JSON
    };

    Kind kind;
    std::string message;
    std::string field;

    [[nodiscard]] static SerializationError missing_discriminator() {
        return SerializationError{Kind::MissingDiscriminator, "Missing shape type discriminator", "type"};
    }

    [[nodiscard]] static SerializationError unknown_type(const std::string& tag) {
        return SerializationError{Kind::UnknownType, "Unknown shape type: " + tag, "type"};
    }

    [[nodiscard]] static SerializationError missing_field(const std::string& name) {
        return SerializationError{Kind::MissingField, "Missing field: " + name, name};
    }

    [[nodiscard]] static SerializationError invalid_field(const std::string& name, const std::string& reason) {
        return SerializationError{Kind::InvalidField, "Invalid field '" + name + "': " + reason, name};
    }

    [[nodiscard]] static SerializationError malformed_json(const std::string& reason) {
        return SerializationError{Kind::MalformedJson, "Malformed JSON: " + reason, {}};
    }
};

/// Precision conversion errors
struct ConversionError {
    enum class Kind : std::uint8_t {
        NotRepresentable,  // Value is non-finite in the target scalar type
    };

    Kind kind;
    std::string message;
    std::string source_type;
    std::string target_type;

    [[nodiscard]] static ConversionError not_representable(const std::string& from, const std::string& to) {
        return ConversionError{Kind::NotRepresentable,
            "Value not representable when narrowing " + from + " to " + to, from, to};
    }
};

/// Matrix factory errors
struct MatrixError {
    enum class Kind : std::uint8_t {
        InvalidProjection,  // Projection parameters out of range
    };

    Kind kind;
    std::string message;

    [[nodiscard]] static MatrixError invalid_projection(const std::string& reason) {
        return MatrixError{Kind::InvalidProjection, "Invalid projection: " + reason};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        ShapeError,
        SerializationError,
        ConversionError,
        MatrixError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(ShapeError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(SerializationError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ConversionError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(MatrixError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries, ordered by key
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(ShapeError::Kind kind) {
        switch (kind) {
            case ShapeError::Kind::NegativeFactor: return ErrorCode::InvalidArgument;
            case ShapeError::Kind::InvalidDimensions: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(SerializationError::Kind kind) {
        switch (kind) {
            case SerializationError::Kind::MissingDiscriminator: return ErrorCode::ValidationError;
            case SerializationError::Kind::UnknownType: return ErrorCode::ValidationError;
            case SerializationError::Kind::MissingField: return ErrorCode::ValidationError;
            case SerializationError::Kind::InvalidField: return ErrorCode::ValidationError;
            case SerializationError::Kind::MalformedJson: return ErrorCode::ParseError;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ConversionError::Kind kind) {
        switch (kind) {
            case ConversionError::Kind::NotRepresentable: return ErrorCode::OutOfRange;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(MatrixError::Kind kind) {
        switch (kind) {
            case MatrixError::Kind::InvalidProjection: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type (similar to Rust's Result<T, E>)
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
    }

    /// Handle error case
    template<typename F>
    auto or_else(F&& func) -> Result<T, E> {
        if (m_value.has_value()) {
            return Result<T, E>(std::move(*m_value));
        }
        return func(m_error);
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    /// Static factory for success
    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    /// Get error
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_has_value; }

    /// Unwrap
    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Reporting (error.cpp)
// =============================================================================

/// One-line report: code, domain kind, message, detail fields, context
///
/// `[ValidationError] SerializationError: Missing field: radius {field=radius} shape=Sphere`
[[nodiscard]] std::string error_report(const Error& error);

} // namespace spatial_core
