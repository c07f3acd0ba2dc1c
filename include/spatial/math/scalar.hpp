#pragma once

/// @file scalar.hpp
/// @brief Numeric contract for the scalar types used by spatial_math
///
/// Every algorithm in the library is written against ScalarTraits<T>.
/// A type takes part only when ScalarTraits is specialized for it; the
/// Scalar concept rejects anything else at compile time.

#include <boost/math/constants/constants.hpp>
#include <boost/multiprecision/cpp_bin_float.hpp>
#include <boost/multiprecision/cpp_dec_float.hpp>
#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <concepts>
#include <cstdlib>
#include <ios>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace spatial_math {

// =============================================================================
// Extended Scalar Types
// =============================================================================

/// 28 significant decimal digits, base-10 representation
using Decimal = boost::multiprecision::number<
    boost::multiprecision::cpp_dec_float<28>,
    boost::multiprecision::et_off>;

/// 19 significant digits with a binary exponent range far beyond double
using HugeNumber = boost::multiprecision::number<
    boost::multiprecision::cpp_bin_float<19>,
    boost::multiprecision::et_off>;

// =============================================================================
// ScalarTraits
// =============================================================================

/// Primary template: types without a specialization are not scalars
template<typename T>
struct ScalarTraits {
    static constexpr bool is_specialized = false;
};

namespace detail {

/// Shared implementation for IEEE floating point types
template<typename F>
struct FloatingScalarTraits {
    static constexpr bool is_specialized = true;
    static constexpr int digits10 = std::numeric_limits<F>::digits10;

    [[nodiscard]] static constexpr F zero() noexcept { return F(0); }
    [[nodiscard]] static constexpr F one() noexcept { return F(1); }
    [[nodiscard]] static constexpr F two() noexcept { return F(2); }
    [[nodiscard]] static F pi() noexcept { return boost::math::constants::pi<F>(); }
    [[nodiscard]] static F quiet_nan() noexcept { return std::numeric_limits<F>::quiet_NaN(); }
    [[nodiscard]] static F max_value() noexcept { return std::numeric_limits<F>::max(); }

    [[nodiscard]] static F sqrt(F v) noexcept { return std::sqrt(v); }
    [[nodiscard]] static F cbrt(F v) noexcept { return std::cbrt(v); }
    [[nodiscard]] static F sin(F v) noexcept { return std::sin(v); }
    [[nodiscard]] static F cos(F v) noexcept { return std::cos(v); }
    [[nodiscard]] static F tan(F v) noexcept { return std::tan(v); }
    [[nodiscard]] static F atan(F v) noexcept { return std::atan(v); }
    [[nodiscard]] static F atan2(F y, F x) noexcept { return std::atan2(y, x); }
    [[nodiscard]] static F acos(F v) noexcept { return std::acos(v); }
    [[nodiscard]] static F pow(F b, F e) noexcept { return std::pow(b, e); }
    [[nodiscard]] static F abs(F v) noexcept { return std::abs(v); }
    [[nodiscard]] static bool is_finite(F v) noexcept { return std::isfinite(v); }

    /// Shortest text that parses back to the same value
    [[nodiscard]] static std::string to_string(F v) { return fmt::format("{}", v); }

    [[nodiscard]] static std::optional<F> from_string(const std::string& text) {
        if (text.empty()) {
            return std::nullopt;
        }
        char* end = nullptr;
        const double parsed = std::strtod(text.c_str(), &end);
        if (end != text.c_str() + text.size()) {
            return std::nullopt;
        }
        return static_cast<F>(parsed);
    }
};

/// Shared implementation for Boost.Multiprecision numbers
template<typename N>
struct MultiprecisionScalarTraits {
    static constexpr bool is_specialized = true;
    static constexpr int digits10 = std::numeric_limits<N>::digits10;

    [[nodiscard]] static N zero() { return N(0); }
    [[nodiscard]] static N one() { return N(1); }
    [[nodiscard]] static N two() { return N(2); }
    [[nodiscard]] static N pi() { return boost::math::constants::pi<N>(); }
    [[nodiscard]] static N quiet_nan() { return std::numeric_limits<N>::quiet_NaN(); }
    [[nodiscard]] static N max_value() { return (std::numeric_limits<N>::max)(); }

    [[nodiscard]] static N sqrt(const N& v) { return boost::multiprecision::sqrt(v); }
    [[nodiscard]] static N cbrt(const N& v) { return boost::multiprecision::cbrt(v); }
    [[nodiscard]] static N sin(const N& v) { return boost::multiprecision::sin(v); }
    [[nodiscard]] static N cos(const N& v) { return boost::multiprecision::cos(v); }
    [[nodiscard]] static N tan(const N& v) { return boost::multiprecision::tan(v); }
    [[nodiscard]] static N atan(const N& v) { return boost::multiprecision::atan(v); }
    [[nodiscard]] static N atan2(const N& y, const N& x) { return boost::multiprecision::atan2(y, x); }
    [[nodiscard]] static N acos(const N& v) { return boost::multiprecision::acos(v); }
    [[nodiscard]] static N pow(const N& b, const N& e) { return boost::multiprecision::pow(b, e); }
    [[nodiscard]] static N abs(const N& v) { return boost::multiprecision::abs(v); }
    [[nodiscard]] static bool is_finite(const N& v) { return boost::multiprecision::isfinite(v); }

    /// Full-precision scientific text
    [[nodiscard]] static std::string to_string(const N& v) {
        return v.str(std::numeric_limits<N>::max_digits10, std::ios_base::scientific);
    }

    [[nodiscard]] static std::optional<N> from_string(const std::string& text) {
        if (text.empty()) {
            return std::nullopt;
        }
        try {
            return N(text);
        } catch (const std::runtime_error&) {
            return std::nullopt;
        }
    }
};

} // namespace detail

template<>
struct ScalarTraits<float> : detail::FloatingScalarTraits<float> {
    [[nodiscard]] static constexpr const char* name() noexcept { return "float"; }
    [[nodiscard]] static constexpr float nearly_zero() noexcept { return 1e-6f; }
};

template<>
struct ScalarTraits<double> : detail::FloatingScalarTraits<double> {
    [[nodiscard]] static constexpr const char* name() noexcept { return "double"; }
    [[nodiscard]] static constexpr double nearly_zero() noexcept { return 1e-15; }
};

template<>
struct ScalarTraits<Decimal> : detail::MultiprecisionScalarTraits<Decimal> {
    [[nodiscard]] static constexpr const char* name() noexcept { return "decimal"; }
    [[nodiscard]] static Decimal nearly_zero() { return Decimal("1e-15"); }
};

template<>
struct ScalarTraits<HugeNumber> : detail::MultiprecisionScalarTraits<HugeNumber> {
    [[nodiscard]] static constexpr const char* name() noexcept { return "huge"; }
    [[nodiscard]] static HugeNumber nearly_zero() { return HugeNumber("1e-15"); }
};

// =============================================================================
// Scalar Concept
// =============================================================================

/// A numeric type usable by every spatial_math algorithm
template<typename T>
concept Scalar = ScalarTraits<T>::is_specialized && requires(const T& a, const T& b) {
    { ScalarTraits<T>::zero() } -> std::convertible_to<T>;
    { ScalarTraits<T>::one() } -> std::convertible_to<T>;
    { ScalarTraits<T>::nearly_zero() } -> std::convertible_to<T>;
    { ScalarTraits<T>::sqrt(a) } -> std::convertible_to<T>;
    { ScalarTraits<T>::atan2(a, b) } -> std::convertible_to<T>;
    { ScalarTraits<T>::is_finite(a) } -> std::same_as<bool>;
    { ScalarTraits<T>::to_string(a) } -> std::convertible_to<std::string>;
    { ScalarTraits<T>::name() } -> std::convertible_to<const char*>;
    { a + b } -> std::convertible_to<T>;
    { a - b } -> std::convertible_to<T>;
    { a * b } -> std::convertible_to<T>;
    { a / b } -> std::convertible_to<T>;
    { -a } -> std::convertible_to<T>;
    { a < b } -> std::convertible_to<bool>;
};

// =============================================================================
// Elementary Functions
// =============================================================================

/// Qualified wrappers over ScalarTraits (no ADL surprises between std and boost)
namespace num {

template<Scalar T> [[nodiscard]] inline T zero() { return ScalarTraits<T>::zero(); }
template<Scalar T> [[nodiscard]] inline T one() { return ScalarTraits<T>::one(); }
template<Scalar T> [[nodiscard]] inline T two() { return ScalarTraits<T>::two(); }
template<Scalar T> [[nodiscard]] inline T half() { return ScalarTraits<T>::one() / ScalarTraits<T>::two(); }
template<Scalar T> [[nodiscard]] inline T epsilon() { return ScalarTraits<T>::nearly_zero(); }
template<Scalar T> [[nodiscard]] inline T nan() { return ScalarTraits<T>::quiet_nan(); }
template<Scalar T> [[nodiscard]] inline T max_value() { return ScalarTraits<T>::max_value(); }

template<Scalar T> [[nodiscard]] inline T sqrt(const T& v) { return ScalarTraits<T>::sqrt(v); }
template<Scalar T> [[nodiscard]] inline T cbrt(const T& v) { return ScalarTraits<T>::cbrt(v); }
template<Scalar T> [[nodiscard]] inline T sin(const T& v) { return ScalarTraits<T>::sin(v); }
template<Scalar T> [[nodiscard]] inline T cos(const T& v) { return ScalarTraits<T>::cos(v); }
template<Scalar T> [[nodiscard]] inline T tan(const T& v) { return ScalarTraits<T>::tan(v); }
template<Scalar T> [[nodiscard]] inline T atan(const T& v) { return ScalarTraits<T>::atan(v); }
template<Scalar T> [[nodiscard]] inline T atan2(const T& y, const T& x) { return ScalarTraits<T>::atan2(y, x); }
template<Scalar T> [[nodiscard]] inline T acos(const T& v) { return ScalarTraits<T>::acos(v); }
template<Scalar T> [[nodiscard]] inline T pow(const T& b, const T& e) { return ScalarTraits<T>::pow(b, e); }
template<Scalar T> [[nodiscard]] inline T abs(const T& v) { return ScalarTraits<T>::abs(v); }
template<Scalar T> [[nodiscard]] inline bool is_finite(const T& v) { return ScalarTraits<T>::is_finite(v); }

template<Scalar T> [[nodiscard]] inline T min(const T& a, const T& b) { return b < a ? b : a; }
template<Scalar T> [[nodiscard]] inline T max(const T& a, const T& b) { return a < b ? b : a; }

template<Scalar T>
[[nodiscard]] inline T clamp(const T& v, const T& lo, const T& hi) {
    return v < lo ? lo : (hi < v ? hi : v);
}

template<Scalar T>
[[nodiscard]] inline T lerp(const T& a, const T& b, const T& t) {
    return a + (b - a) * t;
}

template<Scalar T>
[[nodiscard]] inline std::string to_string(const T& v) { return ScalarTraits<T>::to_string(v); }

template<Scalar T>
[[nodiscard]] inline std::optional<T> from_string(const std::string& text) {
    return ScalarTraits<T>::from_string(text);
}

} // namespace num

// =============================================================================
// Tolerant Comparison
// =============================================================================

/// |v| below the type's nearly-zero threshold
template<Scalar T>
[[nodiscard]] inline bool is_nearly_zero(const T& v) {
    return num::abs(v) < num::epsilon<T>();
}

/// Equal, or within a magnitude-relative epsilon of each other
template<Scalar T>
[[nodiscard]] inline bool is_nearly_equal(const T& a, const T& b) {
    if (a == b) {
        return true;
    }
    return num::abs(a - b) < num::max(num::abs(a), num::abs(b)) * num::epsilon<T>();
}

/// Equal within an explicit absolute tolerance
template<Scalar T>
[[nodiscard]] inline bool is_nearly_equal(const T& a, const T& b, const T& epsilon) {
    return a == b || num::abs(a - b) <= epsilon;
}

/// Returns target when value is nearly equal to it, value otherwise
template<Scalar T>
[[nodiscard]] inline T snap_to(const T& value, const T& target) {
    return is_nearly_equal(value, target) ? target : value;
}

/// Returns zero when value is nearly zero
template<Scalar T>
[[nodiscard]] inline T snap_to_zero(const T& value) {
    return is_nearly_zero(value) ? num::zero<T>() : value;
}

} // namespace spatial_math
