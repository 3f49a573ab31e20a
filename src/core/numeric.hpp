// SPDX-License-Identifier: MIT
/**
 * @file numeric.hpp
 * @brief Numeric value with deferred double conversion
 */

#pragma once

#include <cmath>
#include <cstdint>
#include <type_traits>
#include <variant>

namespace volbatch {

/// Numeric storage format
enum class NumericFormat {
    Double,       // Native double
    FixedPoint9,  // value * 10^9 (Databento style prices)
    Decimal       // mantissa * 10^-scale
};

/// Numeric value as delivered by an upstream collaborator
///
/// Stores values in their original representation. Conversion to double
/// happens only at the serialization boundary (see sanitize()).
class Numeric {
public:
    /// Construct from double
    explicit Numeric(double value) : value_(value) {}

    /// Construct from a scaled integer
    ///
    /// FixedPoint9 reads `value` as value * 10^9; Decimal as a mantissa with
    /// `scale` fractional digits; Double as a plain integer.
    Numeric(int64_t value, NumericFormat format, int32_t scale = 0) {
        if (format == NumericFormat::FixedPoint9) {
            value_ = FixedPoint9{value};
        } else if (format == NumericFormat::Decimal) {
            value_ = Decimal{value, scale};
        } else {
            value_ = static_cast<double>(value);
        }
    }

    /// Convert to double (deferred conversion point)
    [[nodiscard]] double to_double() const {
        return std::visit([](const auto& v) -> double {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, double>) {
                return v;
            } else if constexpr (std::is_same_v<T, FixedPoint9>) {
                return static_cast<double>(v.value) * 1e-9;
            } else {
                return static_cast<double>(v.mantissa) * std::pow(10.0, -v.scale);
            }
        }, value_);
    }

    [[nodiscard]] NumericFormat format() const {
        if (std::holds_alternative<FixedPoint9>(value_)) return NumericFormat::FixedPoint9;
        if (std::holds_alternative<Decimal>(value_)) return NumericFormat::Decimal;
        return NumericFormat::Double;
    }

private:
    struct FixedPoint9 {
        int64_t value;
    };

    struct Decimal {
        int64_t mantissa;
        int32_t scale;
    };

    std::variant<double, FixedPoint9, Decimal> value_;
};

}  // namespace volbatch
