// SPDX-License-Identifier: MIT
/**
 * @file sanitize.hpp
 * @brief Conversion of numeric values into JSON-safe primitives
 *
 * Every number leaving the library passes through sanitize() exactly once,
 * at the serialization boundary. Non-finite values become null (nullopt);
 * wrapper types are converted to double.
 */

#pragma once

#include "src/core/numeric.hpp"
#include <cmath>
#include <concepts>
#include <optional>

namespace volbatch {

/// Any upstream numeric wrapper exposing a double conversion
template<typename T>
concept NumericWrapper = requires(const T& v) {
    { v.to_double() } -> std::convertible_to<double>;
};

/// Finite double or null
[[nodiscard]] inline std::optional<double> sanitize(double value) {
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] inline std::optional<double> sanitize(float value) {
    return sanitize(static_cast<double>(value));
}

[[nodiscard]] inline std::optional<double> sanitize(long double value) {
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return sanitize(static_cast<double>(value));
}

template<std::integral T>
[[nodiscard]] std::optional<double> sanitize(T value) {
    return static_cast<double>(value);
}

template<NumericWrapper T>
[[nodiscard]] std::optional<double> sanitize(const T& value) {
    return sanitize(static_cast<double>(value.to_double()));
}

/// Missing stays missing
template<typename T>
[[nodiscard]] std::optional<double> sanitize(const std::optional<T>& value) {
    if (!value) {
        return std::nullopt;
    }
    return sanitize(*value);
}

/// Round half away from zero to `decimals` fractional digits
///
/// Non-finite input is returned unchanged.
[[nodiscard]] inline double round_to(double value, int decimals) {
    if (!std::isfinite(value)) {
        return value;
    }
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

}  // namespace volbatch
